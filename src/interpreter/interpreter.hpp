#pragma once

// =============================================================================
// Interpreter — Kuzur's tree-walking evaluator
// =============================================================================
//
// Walks the AST produced by the Parser and executes it.
//
// Design choices:
//   - Lexical scoping: functions capture their defining Environment.
//   - Only the global scope and function calls create frames; block bodies
//     run in the frame that encloses them.
//   - Every statement returns an ExecResult carrying a control signal
//     (normal / return / break / continue). Loops consume break and continue,
//     calls consume return; anything that reaches the top is an error.
//   - Built-in functions live in a separate table, see src/builtins/*.hpp.
//   - print() output is written to the output stream and also captured
//     line-by-line for easy testing.
//
// =============================================================================

#include "environment.hpp"
#include "kobject.hpp"
#include "../builtins/builtin_registry.hpp"
#include "../parser/ast.hpp"
#include "../lib/errors/error.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace kuzur
{

    // ---- Control signals ----------------------------------------------------

    enum class Signal
    {
        NORMAL,
        RETURN,
        BREAK,
        CONTINUE
    };

    struct ExecResult
    {
        Signal signal = Signal::NORMAL;
        KObject value; // payload of RETURN
        int line = 0;  // statement that raised the signal
        int column = 0;
    };

    // ========================================================================
    // Interpreter
    // ========================================================================

    class Interpreter
    {
    public:
        static constexpr int MAX_CALL_DEPTH = 1000;

        explicit Interpreter(std::ostream &out = std::cout, std::istream &in = std::cin);
        ~Interpreter();

        Interpreter(const Interpreter &) = delete;
        Interpreter &operator=(const Interpreter &) = delete;

        /// Execute a complete program against the interpreter's own globals.
        /// Returns the exit status (0); errors are thrown as KuzurError.
        int run(const Program &program);

        /// Execute a complete program against the given global scope.
        int run(const Program &program, const std::shared_ptr<Environment> &globals);

        /// Captured output lines (one entry per print() call)
        const std::vector<std::string> &output() const { return output_; }

        void clearOutput() { output_.clear(); }

        /// Access to the global environment (testing)
        const std::shared_ptr<Environment> &globals() const { return globalEnv_; }

        bool hasBuiltin(const std::string &name) const { return builtins_.count(name) != 0; }

    private:
        std::ostream &out_;
        std::istream &in_;
        std::shared_ptr<Environment> globalEnv_;
        std::shared_ptr<Environment> currentEnv_;
        std::vector<std::string> output_;
        BuiltinTable builtins_;
        int callDepth_ = 0;

        void registerBuiltins();

        // ---- Statement execution -------------------------------------------

        ExecResult exec(const Stmt *stmt);
        ExecResult execBlock(const Block &block);
        ExecResult execVarAssign(const VarAssign *node);
        ExecResult execIf(const IfStmt *node);
        ExecResult execWhile(const WhileStmt *node);
        ExecResult execDoWhile(const DoWhileStmt *node);
        ExecResult execFor(const ForStmt *node);
        ExecResult execFuncDecl(const FuncDecl *node);
        ExecResult execReturn(const ReturnStmt *node);

        // ---- Expression evaluation -----------------------------------------

        KObject eval(const Expr *expr);
        KObject evalUnary(const UnaryExpr *node);
        KObject evalBinary(const BinaryExpr *node);
        KObject evalLogical(const LogicalExpr *node);
        KObject evalCall(const CallExpr *node);
        KObject evalAssign(const AssignExpr *node);

        // ---- Helpers -------------------------------------------------------

        bool evalCondition(const Expr *expr, const std::string &construct);
        double evalLoopNumber(const Expr *expr, const std::string &what);
        KObject callUserFn(const KFunction &fn, std::vector<KObject> &args, int line, int column);
        static void rejectEscapedSignal(const ExecResult &result, bool insideFunction);
        static void retireCallFrame(const std::shared_ptr<Environment> &frame);
    };

} // namespace kuzur
