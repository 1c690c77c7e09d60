#pragma once

// =============================================================================
// Kuzur Error Hierarchy
// =============================================================================
// Every error Kuzur can produce lives here. All inherit from KuzurError, which
// inherits from std::runtime_error, so a single `catch (KuzurError&)` will
// catch any Kuzur-specific error. Each subclass carries the source position
// where the error occurred and provides a formatted `.what()` message.
// =============================================================================

#include <stdexcept>
#include <string>

namespace kuzur
{

    // ========================================================================
    // Base: KuzurError
    // ========================================================================
    // Adds a line/column and a standardised
    // "[KUZUR ERROR] Line N, Col M — Category: message" format. Column 0 means
    // the column is unknown and is left out of the message.
    // ========================================================================

    class KuzurError : public std::runtime_error
    {
    public:
        KuzurError(const std::string &category, const std::string &message,
                   int line, int column = 0)
            : std::runtime_error(formatMessage(category, message, line, column)),
              line_(line), column_(column), category_(category), detail_(message) {}

        int line() const noexcept { return line_; }
        int column() const noexcept { return column_; }
        const std::string &category() const noexcept { return category_; }
        const std::string &detail() const noexcept { return detail_; }

    private:
        int line_;
        int column_;
        std::string category_;
        std::string detail_;

        static std::string formatMessage(const std::string &category,
                                         const std::string &message,
                                         int line, int column)
        {
            std::string where = "Line " + std::to_string(line);
            if (column > 0)
                where += ", Col " + std::to_string(column);
            return "[KUZUR ERROR] " + where + " \xe2\x80\x94 " + category + ": " + message;
        }
    };

    // ========================================================================
    // 1. Lexer errors
    // ========================================================================

    /// Unexpected character, unterminated string literal.
    class LexError : public KuzurError
    {
    public:
        LexError(const std::string &message, int line, int column = 0)
            : KuzurError("LexError", message, line, column) {}
    };

    // ========================================================================
    // 2. Parse errors
    // ========================================================================

    /// Unexpected token or missing expected token. Records what the parser
    /// was looking for and what it actually saw.
    class ParseError : public KuzurError
    {
    public:
        ParseError(const std::string &expected, const std::string &found,
                   int line, int column = 0)
            : KuzurError("ParseError", "expected " + expected + " but found " + found,
                         line, column),
              expected_(expected), found_(found) {}

        const std::string &expected() const noexcept { return expected_; }
        const std::string &found() const noexcept { return found_; }

    private:
        std::string expected_;
        std::string found_;
    };

    // ========================================================================
    // 3. Runtime errors
    // ========================================================================

    // ---- 3a. Name resolution ------------------------------------------------

    /// Identifier or callee not bound in any visible scope.
    class NameError : public KuzurError
    {
    public:
        NameError(const std::string &name, int line, int column = 0)
            : KuzurError("NameError", "'" + name + "' is not defined", line, column),
              name_(name) {}

        const std::string &name() const noexcept { return name_; }

    private:
        std::string name_;
    };

    // ---- 3b. Type errors ----------------------------------------------------

    /// Operator, condition or builtin applied to an incompatible value kind.
    class TypeError : public KuzurError
    {
    public:
        TypeError(const std::string &message, int line, int column = 0)
            : KuzurError("TypeError", message, line, column) {}
    };

    // ---- 3c. Function call errors -------------------------------------------

    /// Wrong number of arguments passed to a function or builtin.
    class ArityError : public KuzurError
    {
    public:
        ArityError(const std::string &fnName, const std::string &expected, int got,
                   int line, int column = 0)
            : KuzurError("ArityError",
                         "'" + fnName + "' expects " + expected + " arg(s), got " +
                             std::to_string(got),
                         line, column) {}

        ArityError(const std::string &fnName, int expected, int got,
                   int line, int column = 0)
            : ArityError(fnName, std::to_string(expected), got, line, column) {}
    };

    /// Maximum call depth exceeded.
    class RecursionError : public KuzurError
    {
    public:
        RecursionError(int depth, int line, int column = 0)
            : KuzurError("RecursionError",
                         "maximum recursion depth (" + std::to_string(depth) + ") exceeded",
                         line, column) {}
    };

    // ---- 3d. Conversion errors ----------------------------------------------

    /// Value of the right kind but unusable content, e.g. int("abc").
    class ValueError : public KuzurError
    {
    public:
        ValueError(const std::string &message, int line, int column = 0)
            : KuzurError("ValueError", message, line, column) {}
    };

    // ---- 3e. Arithmetic -----------------------------------------------------

    /// Division (or modulo) by zero.
    class DivisionByZeroError : public KuzurError
    {
    public:
        explicit DivisionByZeroError(int line, int column = 0)
            : KuzurError("DivisionByZero", "division by zero", line, column) {}
    };

    // ---- 3f. Control flow ---------------------------------------------------

    /// break / continue / return that escaped every construct able to catch it.
    class ControlFlowError : public KuzurError
    {
    public:
        ControlFlowError(const std::string &message, int line, int column = 0)
            : KuzurError("ControlFlowError", message, line, column) {}
    };

} // namespace kuzur
