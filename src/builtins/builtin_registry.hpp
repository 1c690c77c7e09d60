#pragma once

// =============================================================================
// Builtin Registry — central type definitions for Kuzur built-in functions
// =============================================================================
//
// Every built-in category (io, conversion) registers its functions into a
// BuiltinTable (unordered_map<string, BuiltinFn>).
//
// To add a new category of builtins:
//   1. Create  src/builtins/builtins_<category>.hpp
//   2. Write a free function:
//          void registerXxxBuiltins(BuiltinTable &t, <optional captures>);
//   3. Call it from  register_all.hpp → registerAllBuiltins().
//
// =============================================================================

#include "../interpreter/kobject.hpp"
#include "../lib/errors/error.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kuzur
{

    /// Signature every built-in function must match. `line` is the call site.
    using BuiltinFn = std::function<KObject(std::vector<KObject> &args, int line)>;

    /// The table the interpreter owns; categories insert into it.
    using BuiltinTable = std::unordered_map<std::string, BuiltinFn>;

    /// Throw ArityError unless exactly `expected` arguments were passed.
    inline void requireArgs(const std::string &name, const std::vector<KObject> &args,
                            size_t expected, int line)
    {
        if (args.size() != expected)
            throw ArityError(name, (int)expected, (int)args.size(), line);
    }

} // namespace kuzur
