#include "parser.hpp"
#include "../lib/errors/error.hpp"
#include <cstdlib>
#include <unordered_set>

namespace kuzur
{

    // ============================================================
    // Constructor
    // ============================================================

    Parser::Parser(const std::vector<Token> &tokens)
        : tokens_(tokens), pos_(0)
    {
        if (tokens_.empty() || tokens_.back().type != TokenType::EOF_TOKEN)
        {
            int line = tokens_.empty() ? 1 : tokens_.back().line;
            tokens_.emplace_back(TokenType::EOF_TOKEN, "", line, 0);
        }
    }

    // ============================================================
    // Token navigation
    // ============================================================

    const Token &Parser::current() const
    {
        return tokens_[pos_];
    }

    const Token &Parser::peekToken(int offset) const
    {
        size_t idx = pos_ + offset;
        if (idx >= tokens_.size())
            return tokens_.back(); // EOF
        return tokens_[idx];
    }

    bool Parser::check(TokenType type) const
    {
        return current().type == type;
    }

    bool Parser::isAtEnd() const
    {
        return current().type == TokenType::EOF_TOKEN;
    }

    Token Parser::advance()
    {
        Token tok = current();
        if (!isAtEnd())
            pos_++;
        return tok;
    }

    Token Parser::consume(TokenType type, const std::string &expected)
    {
        if (check(type))
            return advance();
        throw ParseError(expected, describe(current()), current().line, current().column);
    }

    // True when the current token is the first on its line
    bool Parser::startsNewLine() const
    {
        return pos_ > 0 && current().line != tokens_[pos_ - 1].line;
    }

    Parser::NestingGuard::NestingGuard(Parser &parser) : parser_(parser)
    {
        if (parser_.depth_ >= MAX_NESTING_DEPTH)
        {
            const Token &tok = parser_.current();
            throw ParseError("shallower nesting",
                             "nesting deeper than " + std::to_string(MAX_NESTING_DEPTH) + " levels",
                             tok.line, tok.column);
        }
        parser_.depth_++;
    }

    void Parser::skipSeparators()
    {
        while (check(TokenType::SEMICOLON))
            advance();
    }

    std::string Parser::describe(const Token &tok)
    {
        switch (tok.type)
        {
        case TokenType::EOF_TOKEN:
            return "end of input";
        case TokenType::STRING:
            return "string \"" + tok.value + "\"";
        case TokenType::NUMBER:
            return "number " + tok.value;
        default:
            return "'" + tok.value + "'";
        }
    }

    // ============================================================
    // Top-level parse
    // ============================================================

    Program Parser::parse()
    {
        Program program;
        skipSeparators();
        while (!isAtEnd())
        {
            program.statements.push_back(parseStatement());
            skipSeparators();
        }
        return program;
    }

    // ============================================================
    // Block: '{' statement* '}'
    // ============================================================

    BlockPtr Parser::parseBlock()
    {
        Token open = consume(TokenType::LBRACE, "'{' to open block");
        std::vector<StmtPtr> stmts;
        skipSeparators();
        while (!check(TokenType::RBRACE) && !isAtEnd())
        {
            stmts.push_back(parseStatement());
            skipSeparators();
        }
        consume(TokenType::RBRACE, "'}' to close block opened at line " + std::to_string(open.line));
        return std::make_unique<Block>(std::move(stmts), open.line, open.column);
    }

    // '(' expression ')' after if / elif / while
    ExprPtr Parser::parseCondition(const std::string &keyword)
    {
        consume(TokenType::LPAREN, "'(' after '" + keyword + "'");
        ExprPtr condition = parseExpression();
        consume(TokenType::RPAREN, "')' after " + keyword + " condition");
        return condition;
    }

    // ============================================================
    // Statement
    // ============================================================

    StmtPtr Parser::parseStatement()
    {
        NestingGuard guard(*this);
        const Token &tok = current();
        int ln = tok.line;
        int col = tok.column;

        switch (tok.type)
        {
        case TokenType::IF:
            return parseIfStmt();
        case TokenType::WHILE:
            return parseWhileStmt();
        case TokenType::DO:
            return parseDoWhileStmt();
        case TokenType::FOR:
            return parseForStmt();
        case TokenType::FUNC:
            return parseFuncDecl();
        case TokenType::RETURN:
            return parseReturnStmt();
        case TokenType::BREAK:
            advance();
            return std::make_unique<BreakStmt>(ln, col);
        case TokenType::CONTINUE:
            advance();
            return std::make_unique<ContinueStmt>(ln, col);
        case TokenType::LBRACE:
            return parseBlock();
        default:
            break;
        }

        // --- Assignment: IDENTIFIER = EXPR ---
        if (tok.type == TokenType::IDENTIFIER && peekToken(1).type == TokenType::EQUAL)
        {
            std::string name = advance().value; // identifier
            advance();                           // =
            ExprPtr value = parseExpression();
            return std::make_unique<VarAssign>(std::move(name), std::move(value), ln, col);
        }

        // --- Expression statement ---
        ExprPtr expr = parseExpression();
        return std::make_unique<ExprStmt>(std::move(expr), ln, col);
    }

    // ============================================================
    // If / Elif / Else
    // ============================================================

    StmtPtr Parser::parseIfStmt()
    {
        Token kw = advance(); // consume IF

        ExprPtr condition = parseCondition("if");
        BlockPtr thenBlock = parseBlock();

        std::vector<ElifClause> elifs;
        while (check(TokenType::ELIF))
        {
            ElifClause clause;
            clause.line = advance().line; // consume ELIF
            clause.condition = parseCondition("elif");
            clause.body = parseBlock();
            elifs.push_back(std::move(clause));
        }

        BlockPtr elseBlock;
        if (check(TokenType::ELSE))
        {
            advance(); // consume ELSE
            elseBlock = parseBlock();
        }

        return std::make_unique<IfStmt>(std::move(condition), std::move(thenBlock),
                                        std::move(elifs), std::move(elseBlock),
                                        kw.line, kw.column);
    }

    // ============================================================
    // Loops
    // ============================================================

    StmtPtr Parser::parseWhileStmt()
    {
        Token kw = advance(); // consume WHILE
        ExprPtr condition = parseCondition("while");
        BlockPtr body = parseBlock();
        return std::make_unique<WhileStmt>(std::move(condition), std::move(body), kw.line, kw.column);
    }

    StmtPtr Parser::parseDoWhileStmt()
    {
        Token kw = advance(); // consume DO
        BlockPtr body = parseBlock();
        consume(TokenType::WHILE, "'while' after do block");
        ExprPtr condition = parseCondition("while");
        return std::make_unique<DoWhileStmt>(std::move(body), std::move(condition), kw.line, kw.column);
    }

    // for i = start; end { ... }   or   for (i = start; end) { ... }
    StmtPtr Parser::parseForStmt()
    {
        Token kw = advance(); // consume FOR

        bool parenthesized = check(TokenType::LPAREN);
        if (parenthesized)
            advance();

        std::string varName = consume(TokenType::IDENTIFIER, "loop variable name after 'for'").value;
        consume(TokenType::EQUAL, "'=' after for-loop variable");
        ExprPtr start = parseExpression();
        consume(TokenType::SEMICOLON, "';' between for-loop start and end");
        ExprPtr end = parseExpression();

        if (parenthesized)
            consume(TokenType::RPAREN, "')' to close for-loop header");

        BlockPtr body = parseBlock();
        return std::make_unique<ForStmt>(std::move(varName), std::move(start), std::move(end),
                                         std::move(body), kw.line, kw.column);
    }

    // ============================================================
    // Function declaration
    // ============================================================

    StmtPtr Parser::parseFuncDecl()
    {
        Token kw = advance(); // consume FUNC

        std::string name = consume(TokenType::IDENTIFIER, "function name after 'func'").value;
        consume(TokenType::LPAREN, "'(' after function name");

        std::vector<std::string> params;
        std::unordered_set<std::string> seen;
        auto readParam = [&]()
        {
            Token param = consume(TokenType::IDENTIFIER, "parameter name");
            if (!seen.insert(param.value).second)
                throw ParseError("distinct parameter names", "duplicate '" + param.value + "'",
                                 param.line, param.column);
            params.push_back(param.value);
        };

        if (!check(TokenType::RPAREN))
        {
            readParam();
            while (check(TokenType::COMMA))
            {
                advance();
                readParam();
            }
        }
        consume(TokenType::RPAREN, "')' after parameter list");

        std::shared_ptr<const Block> body = parseBlock();
        return std::make_unique<FuncDecl>(std::move(name), std::move(params), std::move(body),
                                          kw.line, kw.column);
    }

    // return [expr] — the value must start on the same line as 'return'
    StmtPtr Parser::parseReturnStmt()
    {
        Token kw = advance(); // consume RETURN

        ExprPtr value;
        if (!check(TokenType::RBRACE) && !check(TokenType::SEMICOLON) && !isAtEnd() &&
            current().line == kw.line)
        {
            value = parseExpression();
        }
        return std::make_unique<ReturnStmt>(std::move(value), kw.line, kw.column);
    }

    // ============================================================
    // Expressions
    // ============================================================

    ExprPtr Parser::parseExpression()
    {
        NestingGuard guard(*this);
        // Assignment in expression position is right-associative: a = b = 1
        if (check(TokenType::IDENTIFIER) && peekToken(1).type == TokenType::EQUAL)
        {
            Token name = advance();
            advance(); // consume =
            ExprPtr value = parseExpression();
            return std::make_unique<AssignExpr>(name.value, std::move(value), name.line, name.column);
        }
        return parseLogicalOr();
    }

    ExprPtr Parser::parseLogicalOr()
    {
        auto left = parseLogicalAnd();
        while (!startsNewLine() && check(TokenType::PIPE_PIPE))
        {
            Token op = advance();
            auto right = parseLogicalAnd();
            left = std::make_unique<LogicalExpr>(std::move(left), "||", std::move(right), op.line, op.column);
        }
        return left;
    }

    ExprPtr Parser::parseLogicalAnd()
    {
        auto left = parseEquality();
        while (!startsNewLine() && check(TokenType::AMP_AMP))
        {
            Token op = advance();
            auto right = parseEquality();
            left = std::make_unique<LogicalExpr>(std::move(left), "&&", std::move(right), op.line, op.column);
        }
        return left;
    }

    ExprPtr Parser::parseEquality()
    {
        auto left = parseComparison();
        while (!startsNewLine() && (check(TokenType::EQUAL_EQUAL) || check(TokenType::BANG_EQUAL)))
        {
            Token op = advance();
            auto right = parseComparison();
            left = std::make_unique<BinaryExpr>(std::move(left), op.value, std::move(right), op.line, op.column);
        }
        return left;
    }

    ExprPtr Parser::parseComparison()
    {
        auto left = parseAdditive();
        while (!startsNewLine() &&
               (check(TokenType::LESS) || check(TokenType::LESS_EQUAL) ||
                check(TokenType::GREATER) || check(TokenType::GREATER_EQUAL)))
        {
            Token op = advance();
            auto right = parseAdditive();
            left = std::make_unique<BinaryExpr>(std::move(left), op.value, std::move(right), op.line, op.column);
        }
        return left;
    }

    ExprPtr Parser::parseAdditive()
    {
        auto left = parseMultiplicative();
        while (!startsNewLine() && (check(TokenType::PLUS) || check(TokenType::MINUS)))
        {
            Token op = advance();
            auto right = parseMultiplicative();
            left = std::make_unique<BinaryExpr>(std::move(left), op.value, std::move(right), op.line, op.column);
        }
        return left;
    }

    ExprPtr Parser::parseMultiplicative()
    {
        auto left = parseUnary();
        while (!startsNewLine() && (check(TokenType::STAR) || check(TokenType::SLASH) || check(TokenType::PERCENT)))
        {
            Token op = advance();
            auto right = parseUnary();
            left = std::make_unique<BinaryExpr>(std::move(left), op.value, std::move(right), op.line, op.column);
        }
        return left;
    }

    ExprPtr Parser::parseUnary()
    {
        if (check(TokenType::BANG) || check(TokenType::MINUS) || check(TokenType::PLUS))
        {
            NestingGuard guard(*this);
            Token op = advance();
            auto operand = parseUnary();
            return std::make_unique<UnaryExpr>(op.value, std::move(operand), op.line, op.column);
        }
        return parsePrimary();
    }

    // ============================================================
    // Primary expressions
    // ============================================================

    ExprPtr Parser::parsePrimary()
    {
        const Token &tok = current();
        int ln = tok.line;
        int col = tok.column;

        if (check(TokenType::NUMBER))
        {
            double val = std::strtod(advance().value.c_str(), nullptr);
            return std::make_unique<NumberLiteral>(val, ln, col);
        }

        if (check(TokenType::STRING))
            return std::make_unique<StringLiteral>(advance().value, ln, col);

        if (check(TokenType::TRUE_KW))
        {
            advance();
            return std::make_unique<BoolLiteral>(true, ln, col);
        }
        if (check(TokenType::FALSE_KW))
        {
            advance();
            return std::make_unique<BoolLiteral>(false, ln, col);
        }

        // Grouped expression
        if (check(TokenType::LPAREN))
        {
            advance();
            auto expr = parseExpression();
            consume(TokenType::RPAREN, "')' after grouped expression");
            return expr;
        }

        // Identifier or function call
        if (check(TokenType::IDENTIFIER))
        {
            std::string name = advance().value;
            if (check(TokenType::LPAREN))
            {
                advance(); // consume (
                auto args = parseArgList();
                consume(TokenType::RPAREN, "')' after arguments to '" + name + "'");
                return std::make_unique<CallExpr>(std::move(name), std::move(args), ln, col);
            }
            return std::make_unique<Identifier>(std::move(name), ln, col);
        }

        throw ParseError("an expression", describe(tok), ln, col);
    }

    std::vector<ExprPtr> Parser::parseArgList()
    {
        std::vector<ExprPtr> args;
        if (!check(TokenType::RPAREN))
        {
            args.push_back(parseExpression());
            while (check(TokenType::COMMA))
            {
                advance();
                args.push_back(parseExpression());
            }
        }
        return args;
    }

} // namespace kuzur
