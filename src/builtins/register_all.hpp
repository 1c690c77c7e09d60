#pragma once

// =============================================================================
// register_all.hpp — wire every builtin category into the interpreter
// =============================================================================
//
// Usage (from Interpreter::registerBuiltins):
//     registerAllBuiltins(builtins_, output_, out_, in_);
//
// =============================================================================

#include "builtin_registry.hpp"
#include "builtins_io.hpp"
#include "builtins_convert.hpp"

namespace kuzur
{

    /// Registers every built-in function into the given table.
    /// @param t       The interpreter's builtin table.
    /// @param output  The interpreter's captured output lines (print).
    /// @param out     Output stream (print, input prompt).
    /// @param in      Input stream (input).
    inline void registerAllBuiltins(BuiltinTable &t, std::vector<std::string> &output,
                                    std::ostream &out, std::istream &in)
    {
        registerIOBuiltins(t, output, out, in);
        registerConvertBuiltins(t);
    }

} // namespace kuzur
