#pragma once

#include "token.hpp"
#include <string>
#include <vector>

namespace kuzur
{

    class Lexer
    {
    public:
        explicit Lexer(const std::string &source);
        std::vector<Token> tokenize();

    private:
        std::string source_;
        size_t pos_;
        int line_;
        int column_;

        char current() const;
        char peek(int offset = 1) const;
        void advance();
        bool isAtEnd() const;

        void skipWhitespaceAndComments();
        void skipSingleLineComment();

        Token readNumber();
        Token readString();
        Token readIdentifierOrKeyword();

        // Emits a one- or two-character operator: `second` is the optional
        // follow-up character that selects the longer form.
        void emitOperator(std::vector<Token> &tokens, char second,
                          TokenType longType, const char *longText,
                          TokenType shortType, const char *shortText);

        static TokenType lookupKeyword(const std::string &word);
        static bool isAlpha(char c);
        static bool isDigit(char c);
        static bool isAlphaNumeric(char c);
    };

} // namespace kuzur
