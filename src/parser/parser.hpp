#pragma once

#include "ast.hpp"
#include "../lexer/token.hpp"
#include "../lib/errors/error.hpp"
#include <vector>
#include <string>

namespace kuzur
{

    class Parser
    {
    public:
        /// Deepest nesting of blocks, parentheses and prefix operators accepted
        static constexpr int MAX_NESTING_DEPTH = 256;

        explicit Parser(const std::vector<Token> &tokens);

        /// Parse the whole token stream. Throws ParseError on the first
        /// unexpected token; there is no error recovery.
        Program parse();

    private:
        std::vector<Token> tokens_;
        size_t pos_;
        int depth_ = 0;

        // Counts one level of nesting for the lifetime of the guard
        class NestingGuard
        {
        public:
            explicit NestingGuard(Parser &parser);
            ~NestingGuard() { parser_.depth_--; }
            NestingGuard(const NestingGuard &) = delete;
            NestingGuard &operator=(const NestingGuard &) = delete;

        private:
            Parser &parser_;
        };

        // Token navigation
        const Token &current() const;
        const Token &peekToken(int offset = 1) const;
        bool check(TokenType type) const;
        bool isAtEnd() const;
        bool startsNewLine() const;
        Token advance();
        Token consume(TokenType type, const std::string &expected);
        void skipSeparators();

        // Human-readable form of a token for "found ..." messages
        static std::string describe(const Token &tok);

        // Statements
        StmtPtr parseStatement();
        StmtPtr parseIfStmt();
        StmtPtr parseWhileStmt();
        StmtPtr parseDoWhileStmt();
        StmtPtr parseForStmt();
        StmtPtr parseFuncDecl();
        StmtPtr parseReturnStmt();
        BlockPtr parseBlock();
        ExprPtr parseCondition(const std::string &keyword);

        // Expressions (precedence climbing)
        ExprPtr parseExpression();
        ExprPtr parseLogicalOr();
        ExprPtr parseLogicalAnd();
        ExprPtr parseEquality();
        ExprPtr parseComparison();
        ExprPtr parseAdditive();
        ExprPtr parseMultiplicative();
        ExprPtr parseUnary();
        ExprPtr parsePrimary();
        std::vector<ExprPtr> parseArgList();
    };

} // namespace kuzur
