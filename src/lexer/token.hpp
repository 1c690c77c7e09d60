#pragma once

#include <string>
#include <unordered_map>

namespace kuzur
{

    enum class TokenType
    {
        // Literals
        NUMBER,
        STRING,

        // Boolean keywords (also used as literals)
        TRUE_KW,
        FALSE_KW,

        // Control flow keywords
        IF,
        ELIF,
        ELSE,
        WHILE,
        FOR,
        DO,
        FUNC,
        RETURN,
        BREAK,
        CONTINUE,

        // Arithmetic operators
        PLUS,
        MINUS,
        STAR,
        SLASH,
        PERCENT,

        // Assignment & equality
        EQUAL,       // =
        EQUAL_EQUAL, // ==
        BANG,        // !
        BANG_EQUAL,  // !=

        // Relational operators
        GREATER,       // >
        LESS,          // <
        GREATER_EQUAL, // >=
        LESS_EQUAL,    // <=

        // Logical operators
        AMP_AMP,   // &&
        PIPE_PIPE, // ||

        // Delimiters
        LPAREN,    // (
        RPAREN,    // )
        LBRACE,    // {
        RBRACE,    // }
        COMMA,     // ,
        SEMICOLON, // ;

        // Special
        IDENTIFIER,
        EOF_TOKEN
    };

    inline const std::unordered_map<int, std::string> &tokenTypeNames()
    {
        static const std::unordered_map<int, std::string> map = {
            {(int)TokenType::NUMBER, "NUMBER"},
            {(int)TokenType::STRING, "STRING"},
            {(int)TokenType::TRUE_KW, "TRUE"},
            {(int)TokenType::FALSE_KW, "FALSE"},
            {(int)TokenType::IF, "IF"},
            {(int)TokenType::ELIF, "ELIF"},
            {(int)TokenType::ELSE, "ELSE"},
            {(int)TokenType::WHILE, "WHILE"},
            {(int)TokenType::FOR, "FOR"},
            {(int)TokenType::DO, "DO"},
            {(int)TokenType::FUNC, "FUNC"},
            {(int)TokenType::RETURN, "RETURN"},
            {(int)TokenType::BREAK, "BREAK"},
            {(int)TokenType::CONTINUE, "CONTINUE"},
            {(int)TokenType::PLUS, "PLUS"},
            {(int)TokenType::MINUS, "MINUS"},
            {(int)TokenType::STAR, "STAR"},
            {(int)TokenType::SLASH, "SLASH"},
            {(int)TokenType::PERCENT, "PERCENT"},
            {(int)TokenType::EQUAL, "EQUAL"},
            {(int)TokenType::EQUAL_EQUAL, "EQUAL_EQUAL"},
            {(int)TokenType::BANG, "BANG"},
            {(int)TokenType::BANG_EQUAL, "BANG_EQUAL"},
            {(int)TokenType::GREATER, "GREATER"},
            {(int)TokenType::LESS, "LESS"},
            {(int)TokenType::GREATER_EQUAL, "GREATER_EQUAL"},
            {(int)TokenType::LESS_EQUAL, "LESS_EQUAL"},
            {(int)TokenType::AMP_AMP, "AMP_AMP"},
            {(int)TokenType::PIPE_PIPE, "PIPE_PIPE"},
            {(int)TokenType::LPAREN, "LPAREN"},
            {(int)TokenType::RPAREN, "RPAREN"},
            {(int)TokenType::LBRACE, "LBRACE"},
            {(int)TokenType::RBRACE, "RBRACE"},
            {(int)TokenType::COMMA, "COMMA"},
            {(int)TokenType::SEMICOLON, "SEMICOLON"},
            {(int)TokenType::IDENTIFIER, "IDENTIFIER"},
            {(int)TokenType::EOF_TOKEN, "EOF"},
        };
        return map;
    }

    inline std::string tokenTypeToString(TokenType type)
    {
        auto &names = tokenTypeNames();
        auto it = names.find((int)type);
        if (it != names.end())
            return it->second;
        return "UNKNOWN";
    }

    struct Token
    {
        TokenType type;
        std::string value;
        int line;
        int column;

        Token(TokenType type, std::string value, int line, int column)
            : type(type), value(std::move(value)), line(line), column(column) {}
    };

} // namespace kuzur
