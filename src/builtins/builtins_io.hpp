#pragma once

// =============================================================================
// IO builtins — print, input
// =============================================================================

#include "builtin_registry.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace kuzur
{

    /// Register IO builtins.
    /// @param output  The interpreter's captured output (one entry per print()).
    /// @param out     Stream print() and input() prompts are written to.
    /// @param in      Stream input() reads from.
    inline void registerIOBuiltins(BuiltinTable &t, std::vector<std::string> &output,
                                   std::ostream &out, std::istream &in)
    {
        // print(a, b, ...) — string forms joined by one space, then newline
        t["print"] = [&output, &out](std::vector<KObject> &args, int /*line*/) -> KObject
        {
            std::string line;
            for (size_t i = 0; i < args.size(); i++)
            {
                if (i > 0)
                    line += " ";
                line += args[i].toString();
            }
            output.push_back(line);
            out << line << '\n';
            return KObject::makeNone();
        };

        // input(prompt) or input() — read a line from the input stream
        t["input"] = [&out, &in](std::vector<KObject> &args, int line) -> KObject
        {
            if (args.size() > 1)
                throw ArityError("input", "0 or 1", (int)args.size(), line);

            if (args.size() == 1)
                out << args[0].toString() << std::flush;

            std::string inputLine;
            if (!std::getline(in, inputLine))
                return KObject::makeString(""); // EOF → empty string

            if (!inputLine.empty() && inputLine.back() == '\r')
                inputLine.pop_back();
            return KObject::makeString(std::move(inputLine));
        };
    }

} // namespace kuzur
