#pragma once

// =============================================================================
// Runner — lex, parse and execute a Kuzur source string
// =============================================================================
//
// The single place where a Kuzur error becomes an exit status. Errors are
// reported once, on `err`, as the KuzurError::what() line.
//
//   0  normal completion
//   1  LexError, ParseError or any runtime error
//
// =============================================================================

#include <iostream>
#include <string>

namespace kuzur
{

    /// Run a complete program. `out`/`in` back print() and input().
    int runSource(const std::string &source, std::ostream &out, std::istream &in,
                  std::ostream &err);

    /// Lex and parse only; prints "OK" on `out` when the source is well formed.
    int checkSource(const std::string &source, std::ostream &out, std::ostream &err);

} // namespace kuzur
