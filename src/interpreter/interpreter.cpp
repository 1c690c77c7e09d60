#include "interpreter.hpp"
#include "../builtins/register_all.hpp"
#include <cmath>

namespace kuzur
{

    static ExecResult signalResult(Signal signal, const Stmt *stmt, KObject value = KObject())
    {
        ExecResult result;
        result.signal = signal;
        result.value = std::move(value);
        result.line = stmt->line;
        result.column = stmt->column;
        return result;
    }

    static std::string operandTypes(const KObject &left, const KObject &right)
    {
        return std::string(ktype_name(left.type())) + " and " + ktype_name(right.type());
    }

    // ========================================================================
    // Constructor / destructor
    // ========================================================================

    Interpreter::Interpreter(std::ostream &out, std::istream &in)
        : out_(out), in_(in),
          globalEnv_(std::make_shared<Environment>()),
          currentEnv_(globalEnv_)
    {
        registerBuiltins();
    }

    Interpreter::~Interpreter()
    {
        // Top-level functions capture the global frame they are stored in;
        // clearing it breaks that cycle.
        globalEnv_->clear();
    }

    void Interpreter::registerBuiltins()
    {
        builtins_.clear();
        registerAllBuiltins(builtins_, output_, out_, in_);
    }

    // ========================================================================
    // run — top-level entry point
    // ========================================================================

    int Interpreter::run(const Program &program)
    {
        return run(program, globalEnv_);
    }

    int Interpreter::run(const Program &program, const std::shared_ptr<Environment> &globals)
    {
        auto savedEnv = currentEnv_;
        currentEnv_ = globals;
        try
        {
            for (const auto &stmt : program.statements)
            {
                ExecResult result = exec(stmt.get());
                rejectEscapedSignal(result, false);
            }
        }
        catch (...)
        {
            currentEnv_ = savedEnv;
            throw;
        }
        currentEnv_ = savedEnv;
        return 0;
    }

    void Interpreter::rejectEscapedSignal(const ExecResult &result, bool insideFunction)
    {
        switch (result.signal)
        {
        case Signal::NORMAL:
            return;
        case Signal::BREAK:
            throw ControlFlowError("break outside loop", result.line, result.column);
        case Signal::CONTINUE:
            throw ControlFlowError("continue outside loop", result.line, result.column);
        case Signal::RETURN:
            if (!insideFunction)
                throw ControlFlowError("return outside function", result.line, result.column);
            return;
        }
    }

    // ========================================================================
    // Statements
    // ========================================================================

    ExecResult Interpreter::exec(const Stmt *stmt)
    {
        if (auto *p = dynamic_cast<const ExprStmt *>(stmt))
        {
            eval(p->expr.get());
            return ExecResult{};
        }
        if (auto *p = dynamic_cast<const VarAssign *>(stmt))
            return execVarAssign(p);
        if (auto *p = dynamic_cast<const IfStmt *>(stmt))
            return execIf(p);
        if (auto *p = dynamic_cast<const WhileStmt *>(stmt))
            return execWhile(p);
        if (auto *p = dynamic_cast<const DoWhileStmt *>(stmt))
            return execDoWhile(p);
        if (auto *p = dynamic_cast<const ForStmt *>(stmt))
            return execFor(p);
        if (auto *p = dynamic_cast<const FuncDecl *>(stmt))
            return execFuncDecl(p);
        if (auto *p = dynamic_cast<const ReturnStmt *>(stmt))
            return execReturn(p);
        if (dynamic_cast<const BreakStmt *>(stmt))
            return signalResult(Signal::BREAK, stmt);
        if (dynamic_cast<const ContinueStmt *>(stmt))
            return signalResult(Signal::CONTINUE, stmt);
        if (auto *p = dynamic_cast<const Block *>(stmt))
            return execBlock(*p);

        throw TypeError("unknown statement node", stmt->line, stmt->column);
    }

    ExecResult Interpreter::execBlock(const Block &block)
    {
        for (const auto &stmt : block.statements)
        {
            ExecResult result = exec(stmt.get());
            if (result.signal != Signal::NORMAL)
                return result;
        }
        return ExecResult{};
    }

    ExecResult Interpreter::execVarAssign(const VarAssign *node)
    {
        KObject value = eval(node->value.get());
        currentEnv_->assign(node->name, std::move(value));
        return ExecResult{};
    }

    ExecResult Interpreter::execIf(const IfStmt *node)
    {
        if (evalCondition(node->condition.get(), "if"))
            return execBlock(*node->thenBlock);

        for (const auto &elif : node->elifs)
        {
            if (evalCondition(elif.condition.get(), "elif"))
                return execBlock(*elif.body);
        }

        if (node->elseBlock)
            return execBlock(*node->elseBlock);
        return ExecResult{};
    }

    ExecResult Interpreter::execWhile(const WhileStmt *node)
    {
        while (evalCondition(node->condition.get(), "while"))
        {
            ExecResult result = execBlock(*node->body);
            if (result.signal == Signal::BREAK)
                break;
            if (result.signal == Signal::RETURN)
                return result;
        }
        return ExecResult{};
    }

    ExecResult Interpreter::execDoWhile(const DoWhileStmt *node)
    {
        do
        {
            ExecResult result = execBlock(*node->body);
            if (result.signal == Signal::BREAK)
                break;
            if (result.signal == Signal::RETURN)
                return result;
        } while (evalCondition(node->condition.get(), "do-while"));
        return ExecResult{};
    }

    // for i = start; end — inclusive, step +1. The bound and the loop
    // variable are re-read every iteration.
    ExecResult Interpreter::execFor(const ForStmt *node)
    {
        double start = evalLoopNumber(node->start.get(), "for-loop start");
        currentEnv_->assign(node->varName, KObject::makeNumber(start));

        auto loopValue = [this, node]() -> double
        {
            KObject current = currentEnv_->lookup(node->varName, node->line, node->column);
            if (!current.isNumber())
                throw TypeError("for-loop variable '" + node->varName + "' must be a number, got " +
                                    std::string(ktype_name(current.type())),
                                node->line, node->column);
            return current.asNumber();
        };

        while (true)
        {
            double end = evalLoopNumber(node->end.get(), "for-loop end");
            if (!(loopValue() <= end))
                break;

            ExecResult result = execBlock(*node->body);
            if (result.signal == Signal::BREAK)
                break;
            if (result.signal == Signal::RETURN)
                return result;

            double current = loopValue();
            double next = current + 1;
            if (next == current)
                throw ValueError("for-loop variable '" + node->varName + "' is too large to increment (" +
                                     formatNumber(current) + ")",
                                 node->line, node->column);
            currentEnv_->assign(node->varName, KObject::makeNumber(next));
        }
        return ExecResult{};
    }

    ExecResult Interpreter::execFuncDecl(const FuncDecl *node)
    {
        // Capture the current environment as the lexical closure scope
        KObject fn = KObject::makeFunction(node->name, node->params, node->body, currentEnv_);
        currentEnv_->define(node->name, std::move(fn));
        return ExecResult{};
    }

    ExecResult Interpreter::execReturn(const ReturnStmt *node)
    {
        KObject value = node->value ? eval(node->value.get()) : KObject::makeNone();
        return signalResult(Signal::RETURN, node, std::move(value));
    }

    // ========================================================================
    // Expressions
    // ========================================================================

    KObject Interpreter::eval(const Expr *expr)
    {
        // Literals
        if (auto *p = dynamic_cast<const NumberLiteral *>(expr))
            return KObject::makeNumber(p->value);
        if (auto *p = dynamic_cast<const StringLiteral *>(expr))
            return KObject::makeString(p->value);
        if (auto *p = dynamic_cast<const BoolLiteral *>(expr))
            return KObject::makeBool(p->value);

        // Identifier
        if (auto *p = dynamic_cast<const Identifier *>(expr))
            return currentEnv_->lookup(p->name, p->line, p->column);

        // Operators
        if (auto *p = dynamic_cast<const BinaryExpr *>(expr))
            return evalBinary(p);
        if (auto *p = dynamic_cast<const LogicalExpr *>(expr))
            return evalLogical(p);
        if (auto *p = dynamic_cast<const UnaryExpr *>(expr))
            return evalUnary(p);

        // Calls & assignment
        if (auto *p = dynamic_cast<const CallExpr *>(expr))
            return evalCall(p);
        if (auto *p = dynamic_cast<const AssignExpr *>(expr))
            return evalAssign(p);

        throw TypeError("unknown expression node", expr->line, expr->column);
    }

    // ---- Unary expressions -------------------------------------------------

    KObject Interpreter::evalUnary(const UnaryExpr *node)
    {
        KObject val = eval(node->operand.get());

        if (node->op == "!")
        {
            if (!val.isBool())
                throw TypeError("operator '!' requires a boolean, got " +
                                    std::string(ktype_name(val.type())),
                                node->line, node->column);
            return KObject::makeBool(!val.asBool());
        }

        if (!val.isNumber())
            throw TypeError("unary '" + node->op + "' requires a number, got " +
                                std::string(ktype_name(val.type())),
                            node->line, node->column);
        if (node->op == "-")
            return KObject::makeNumber(-val.asNumber());
        return val; // unary '+'
    }

    // ---- Binary expressions ------------------------------------------------

    KObject Interpreter::evalBinary(const BinaryExpr *node)
    {
        const std::string &op = node->op;
        KObject left = eval(node->left.get());
        KObject right = eval(node->right.get());

        // Equality / inequality (any kinds)
        if (op == "==")
            return KObject::makeBool(left.equals(right));
        if (op == "!=")
            return KObject::makeBool(!left.equals(right));

        // Addition / concatenation
        if (op == "+")
        {
            if (left.isNumber() && right.isNumber())
                return KObject::makeNumber(left.asNumber() + right.asNumber());

            // A string on either side converts a scalar on the other
            auto concatenable = [](const KObject &v)
            {
                return v.isString() || v.isNumber() || v.isBool() || v.isNone();
            };
            if ((left.isString() || right.isString()) && concatenable(left) && concatenable(right))
                return KObject::makeString(left.toString() + right.toString());

            throw TypeError("unsupported operand types for +: " + operandTypes(left, right),
                            node->line, node->column);
        }

        // Numeric-only arithmetic
        if (op == "-" || op == "*" || op == "/" || op == "%")
        {
            if (!left.isNumber() || !right.isNumber())
                throw TypeError("unsupported operand types for " + op + ": " + operandTypes(left, right),
                                node->line, node->column);

            double l = left.asNumber(), r = right.asNumber();
            if (op == "-")
                return KObject::makeNumber(l - r);
            if (op == "*")
                return KObject::makeNumber(l * r);
            if (r == 0.0)
                throw DivisionByZeroError(node->line, node->column);
            if (op == "/")
                return KObject::makeNumber(l / r);

            // % takes the sign of the divisor
            double m = std::fmod(l, r);
            if (m != 0.0 && ((m < 0.0) != (r < 0.0)))
                m += r;
            return KObject::makeNumber(m);
        }

        // Ordering: number/number or string/string
        if (op == "<" || op == "<=" || op == ">" || op == ">=")
        {
            if (left.isNumber() && right.isNumber())
            {
                double l = left.asNumber(), r = right.asNumber();
                if (op == "<")
                    return KObject::makeBool(l < r);
                if (op == "<=")
                    return KObject::makeBool(l <= r);
                if (op == ">")
                    return KObject::makeBool(l > r);
                return KObject::makeBool(l >= r);
            }
            if (left.isString() && right.isString())
            {
                int cmp = left.asString().compare(right.asString());
                if (op == "<")
                    return KObject::makeBool(cmp < 0);
                if (op == "<=")
                    return KObject::makeBool(cmp <= 0);
                if (op == ">")
                    return KObject::makeBool(cmp > 0);
                return KObject::makeBool(cmp >= 0);
            }
            throw TypeError("cannot compare " + operandTypes(left, right) + " with " + op,
                            node->line, node->column);
        }

        throw TypeError("unknown binary operator '" + op + "'", node->line, node->column);
    }

    // ---- Logical expressions (short-circuit) -------------------------------

    KObject Interpreter::evalLogical(const LogicalExpr *node)
    {
        KObject left = eval(node->left.get());
        if (!left.isBool())
            throw TypeError("left operand of " + node->op + " must be a boolean, got " +
                                std::string(ktype_name(left.type())),
                            node->line, node->column);

        if (node->op == "&&" && !left.asBool())
            return left;
        if (node->op == "||" && left.asBool())
            return left;

        KObject right = eval(node->right.get());
        if (!right.isBool())
            throw TypeError("right operand of " + node->op + " must be a boolean, got " +
                                std::string(ktype_name(right.type())),
                            node->line, node->column);
        return right;
    }

    // ---- Assignment in expression position ---------------------------------

    KObject Interpreter::evalAssign(const AssignExpr *node)
    {
        KObject value = eval(node->value.get());
        currentEnv_->assign(node->name, value);
        return value;
    }

    // ---- Function calls ----------------------------------------------------

    KObject Interpreter::evalCall(const CallExpr *node)
    {
        // A user binding of the name shadows the builtin of the same name
        if (currentEnv_->has(node->callee))
        {
            KObject fnObj = currentEnv_->lookup(node->callee, node->line, node->column);
            if (!fnObj.isFunction())
                throw TypeError("'" + node->callee + "' is not callable (it is a " +
                                    std::string(ktype_name(fnObj.type())) + ")",
                                node->line, node->column);

            std::vector<KObject> args;
            args.reserve(node->args.size());
            for (const auto &arg : node->args)
                args.push_back(eval(arg.get()));
            return callUserFn(fnObj.asFunction(), args, node->line, node->column);
        }

        auto bit = builtins_.find(node->callee);
        if (bit == builtins_.end())
            throw NameError(node->callee, node->line, node->column);

        std::vector<KObject> args;
        args.reserve(node->args.size());
        for (const auto &arg : node->args)
            args.push_back(eval(arg.get()));
        return bit->second(args, node->line);
    }

    KObject Interpreter::callUserFn(const KFunction &fn, std::vector<KObject> &args, int line, int column)
    {
        if (args.size() != fn.params.size())
            throw ArityError(fn.name, (int)fn.params.size(), (int)args.size(), line, column);

        // Recursion guard
        if (callDepth_ >= MAX_CALL_DEPTH)
            throw RecursionError(MAX_CALL_DEPTH, line, column);

        // Lexical scoping: parent = the environment where the function was *defined*
        auto fnEnv = std::make_shared<Environment>(fn.closureEnv, true);
        for (size_t i = 0; i < fn.params.size(); i++)
            fnEnv->define(fn.params[i], std::move(args[i]));

        callDepth_++;
        auto savedEnv = currentEnv_;
        currentEnv_ = fnEnv;

        ExecResult result;
        try
        {
            result = execBlock(*fn.body);
        }
        catch (...)
        {
            currentEnv_ = savedEnv;
            callDepth_--;
            retireCallFrame(fnEnv);
            throw;
        }

        currentEnv_ = savedEnv;
        callDepth_--;
        retireCallFrame(fnEnv);

        rejectEscapedSignal(result, true);
        if (result.signal == Signal::RETURN)
            return result.value;
        return KObject::makeNone();
    }

    // ========================================================================
    // Helpers
    // ========================================================================

    // A function declared inside a call is stored in the frame it captures.
    // Unless one of them escaped, nothing can reach the frame after the call.
    void Interpreter::retireCallFrame(const std::shared_ptr<Environment> &frame)
    {
        if (Environment::heldOnlyByOwnClosures(frame))
            frame->clear();
    }

    bool Interpreter::evalCondition(const Expr *expr, const std::string &construct)
    {
        KObject value = eval(expr);
        if (!value.isBool())
            throw TypeError(construct + " condition must be a boolean, got " +
                                std::string(ktype_name(value.type())),
                            expr->line, expr->column);
        return value.asBool();
    }

    double Interpreter::evalLoopNumber(const Expr *expr, const std::string &what)
    {
        KObject value = eval(expr);
        if (!value.isNumber())
            throw TypeError(what + " must be a number, got " +
                                std::string(ktype_name(value.type())),
                            expr->line, expr->column);
        return value.asNumber();
    }

} // namespace kuzur
