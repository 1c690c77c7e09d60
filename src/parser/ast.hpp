#pragma once

#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace kuzur
{

    // ============================================================
    // Forward declarations & smart-pointer aliases
    // ============================================================

    struct Expr;
    struct Stmt;
    struct Block;

    using ExprPtr = std::unique_ptr<Expr>;
    using StmtPtr = std::unique_ptr<Stmt>;
    using BlockPtr = std::unique_ptr<Block>;

    // ============================================================
    // Base classes
    // ============================================================

    struct Expr
    {
        int line = 0;
        int column = 0;
        virtual ~Expr() = default;
    };

    struct Stmt
    {
        int line = 0;
        int column = 0;
        virtual ~Stmt() = default;
    };

    // ============================================================
    // Expression nodes
    // ============================================================

    struct NumberLiteral : Expr
    {
        double value;
        explicit NumberLiteral(double v, int ln = 0, int col = 0) : value(v)
        {
            line = ln;
            column = col;
        }
    };

    struct StringLiteral : Expr
    {
        std::string value;
        explicit StringLiteral(std::string v, int ln = 0, int col = 0) : value(std::move(v))
        {
            line = ln;
            column = col;
        }
    };

    struct BoolLiteral : Expr
    {
        bool value;
        explicit BoolLiteral(bool v, int ln = 0, int col = 0) : value(v)
        {
            line = ln;
            column = col;
        }
    };

    struct Identifier : Expr
    {
        std::string name;
        explicit Identifier(std::string n, int ln = 0, int col = 0) : name(std::move(n))
        {
            line = ln;
            column = col;
        }
    };

    struct UnaryExpr : Expr
    {
        std::string op; // "!", "-", "+"
        ExprPtr operand;
        UnaryExpr(std::string o, ExprPtr operand, int ln = 0, int col = 0)
            : op(std::move(o)), operand(std::move(operand))
        {
            line = ln;
            column = col;
        }
    };

    struct BinaryExpr : Expr
    {
        ExprPtr left;
        std::string op; // +, -, *, /, %, ==, !=, <, <=, >, >=
        ExprPtr right;
        BinaryExpr(ExprPtr l, std::string o, ExprPtr r, int ln = 0, int col = 0)
            : left(std::move(l)), op(std::move(o)), right(std::move(r))
        {
            line = ln;
            column = col;
        }
    };

    // && and || — the right operand is evaluated only when needed
    struct LogicalExpr : Expr
    {
        ExprPtr left;
        std::string op; // "&&" or "||"
        ExprPtr right;
        LogicalExpr(ExprPtr l, std::string o, ExprPtr r, int ln = 0, int col = 0)
            : left(std::move(l)), op(std::move(o)), right(std::move(r))
        {
            line = ln;
            column = col;
        }
    };

    struct CallExpr : Expr
    {
        std::string callee;
        std::vector<ExprPtr> args;
        CallExpr(std::string callee, std::vector<ExprPtr> args, int ln = 0, int col = 0)
            : callee(std::move(callee)), args(std::move(args))
        {
            line = ln;
            column = col;
        }
    };

    // Assignment in expression position: print(x = 3)
    struct AssignExpr : Expr
    {
        std::string name;
        ExprPtr value;
        AssignExpr(std::string n, ExprPtr v, int ln = 0, int col = 0)
            : name(std::move(n)), value(std::move(v))
        {
            line = ln;
            column = col;
        }
    };

    // ============================================================
    // Statement nodes
    // ============================================================

    struct Block : Stmt
    {
        std::vector<StmtPtr> statements;
        explicit Block(std::vector<StmtPtr> stmts, int ln = 0, int col = 0)
            : statements(std::move(stmts))
        {
            line = ln;
            column = col;
        }
    };

    struct ExprStmt : Stmt
    {
        ExprPtr expr;
        explicit ExprStmt(ExprPtr e, int ln = 0, int col = 0) : expr(std::move(e))
        {
            line = ln;
            column = col;
        }
    };

    // name = expr  (assignment doubles as declaration)
    struct VarAssign : Stmt
    {
        std::string name;
        ExprPtr value;
        VarAssign(std::string n, ExprPtr v, int ln = 0, int col = 0)
            : name(std::move(n)), value(std::move(v))
        {
            line = ln;
            column = col;
        }
    };

    struct ElifClause
    {
        ExprPtr condition;
        BlockPtr body;
        int line = 0;
    };

    struct IfStmt : Stmt
    {
        ExprPtr condition;
        BlockPtr thenBlock;
        std::vector<ElifClause> elifs;
        BlockPtr elseBlock; // nullptr when there is no else
        IfStmt(ExprPtr cond, BlockPtr thenBlock, std::vector<ElifClause> elifs,
               BlockPtr elseBlock, int ln = 0, int col = 0)
            : condition(std::move(cond)), thenBlock(std::move(thenBlock)),
              elifs(std::move(elifs)), elseBlock(std::move(elseBlock))
        {
            line = ln;
            column = col;
        }
    };

    struct WhileStmt : Stmt
    {
        ExprPtr condition;
        BlockPtr body;
        WhileStmt(ExprPtr cond, BlockPtr body, int ln = 0, int col = 0)
            : condition(std::move(cond)), body(std::move(body))
        {
            line = ln;
            column = col;
        }
    };

    struct DoWhileStmt : Stmt
    {
        BlockPtr body;
        ExprPtr condition;
        DoWhileStmt(BlockPtr body, ExprPtr cond, int ln = 0, int col = 0)
            : body(std::move(body)), condition(std::move(cond))
        {
            line = ln;
            column = col;
        }
    };

    // for i = start; end { body }  — inclusive bound, step +1
    struct ForStmt : Stmt
    {
        std::string varName;
        ExprPtr start;
        ExprPtr end;
        BlockPtr body;
        ForStmt(std::string var, ExprPtr start, ExprPtr end, BlockPtr body,
                int ln = 0, int col = 0)
            : varName(std::move(var)), start(std::move(start)), end(std::move(end)),
              body(std::move(body))
        {
            line = ln;
            column = col;
        }
    };

    // The body is shared so function values can outlive the Program.
    struct FuncDecl : Stmt
    {
        std::string name;
        std::vector<std::string> params;
        std::shared_ptr<const Block> body;
        FuncDecl(std::string name, std::vector<std::string> params,
                 std::shared_ptr<const Block> body, int ln = 0, int col = 0)
            : name(std::move(name)), params(std::move(params)), body(std::move(body))
        {
            line = ln;
            column = col;
        }
    };

    struct ReturnStmt : Stmt
    {
        ExprPtr value; // nullptr → return none
        explicit ReturnStmt(ExprPtr v, int ln = 0, int col = 0) : value(std::move(v))
        {
            line = ln;
            column = col;
        }
    };

    struct BreakStmt : Stmt
    {
        explicit BreakStmt(int ln = 0, int col = 0)
        {
            line = ln;
            column = col;
        }
    };

    struct ContinueStmt : Stmt
    {
        explicit ContinueStmt(int ln = 0, int col = 0)
        {
            line = ln;
            column = col;
        }
    };

    // ============================================================
    // Top-level program
    // ============================================================

    struct Program
    {
        std::vector<StmtPtr> statements;
    };

} // namespace kuzur
