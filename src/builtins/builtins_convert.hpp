#pragma once

// =============================================================================
// Conversion builtins — len, int, str
// =============================================================================

#include "builtin_registry.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

namespace kuzur
{

    namespace detail
    {
        /// Number of UTF-8 code points (continuation bytes are not counted).
        inline size_t utf8Length(const std::string &s)
        {
            size_t count = 0;
            for (unsigned char c : s)
            {
                if ((c & 0xC0) != 0x80)
                    count++;
            }
            return count;
        }

        /// Parse an optionally signed decimal integer literal, allowing
        /// surrounding whitespace. Returns false if `text` is anything else.
        inline bool parseIntegerLiteral(const std::string &text, double &result)
        {
            size_t begin = 0;
            size_t end = text.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
                begin++;
            while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
                end--;

            std::string body = text.substr(begin, end - begin);
            size_t digitsFrom = (!body.empty() && (body[0] == '+' || body[0] == '-')) ? 1 : 0;
            if (digitsFrom == body.size())
                return false;
            for (size_t i = digitsFrom; i < body.size(); i++)
            {
                if (!std::isdigit(static_cast<unsigned char>(body[i])))
                    return false;
            }
            result = std::strtod(body.c_str(), nullptr);
            return true;
        }
    } // namespace detail

    inline void registerConvertBuiltins(BuiltinTable &t)
    {
        // len(string) — character count
        t["len"] = [](std::vector<KObject> &args, int line) -> KObject
        {
            requireArgs("len", args, 1, line);
            if (!args[0].isString())
                throw TypeError("len() expects a string, got " +
                                    std::string(ktype_name(args[0].type())),
                                line);
            return KObject::makeNumber(static_cast<double>(detail::utf8Length(args[0].asString())));
        };

        // int(string|number) — integer value, truncated toward zero
        t["int"] = [](std::vector<KObject> &args, int line) -> KObject
        {
            requireArgs("int", args, 1, line);
            const KObject &arg = args[0];

            if (arg.isNumber())
            {
                double val = arg.asNumber();
                if (!std::isfinite(val))
                    throw ValueError("cannot convert " + arg.toString() + " to an integer", line);
                return KObject::makeNumber(std::trunc(val));
            }

            if (arg.isString())
            {
                double val = 0.0;
                if (!detail::parseIntegerLiteral(arg.asString(), val))
                    throw ValueError("invalid integer literal: \"" + arg.asString() + "\"", line);
                return KObject::makeNumber(val);
            }

            throw TypeError("int() expects a string or number, got " +
                                std::string(ktype_name(arg.type())),
                            line);
        };

        // str(number|boolean|string) — string form
        t["str"] = [](std::vector<KObject> &args, int line) -> KObject
        {
            requireArgs("str", args, 1, line);
            const KObject &arg = args[0];
            if (!arg.isNumber() && !arg.isBool() && !arg.isString())
                throw TypeError("str() expects a number, boolean or string, got " +
                                    std::string(ktype_name(arg.type())),
                                line);
            return KObject::makeString(arg.toString());
        };
    }

} // namespace kuzur
