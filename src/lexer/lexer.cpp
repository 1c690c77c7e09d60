#include "lexer.hpp"
#include "../lib/errors/error.hpp"
#include <unordered_map>

namespace kuzur
{

    // ---- Map-based keyword table ------------------------------------------------

    static const std::unordered_map<std::string, TokenType> &keywordMap()
    {
        static const std::unordered_map<std::string, TokenType> map = {
            // Control flow
            {"if", TokenType::IF},
            {"elif", TokenType::ELIF},
            {"else", TokenType::ELSE},
            {"while", TokenType::WHILE},
            {"for", TokenType::FOR},
            {"do", TokenType::DO},
            {"func", TokenType::FUNC},
            {"return", TokenType::RETURN},
            {"break", TokenType::BREAK},
            {"continue", TokenType::CONTINUE},

            // Literals
            {"true", TokenType::TRUE_KW},
            {"false", TokenType::FALSE_KW},
        };
        return map;
    }

    // ---- Constructor ------------------------------------------------------------

    Lexer::Lexer(const std::string &source)
        : source_(source), pos_(0), line_(1), column_(1) {}

    // ---- Character helpers ------------------------------------------------------

    char Lexer::current() const
    {
        if (isAtEnd())
            return '\0';
        return source_[pos_];
    }

    char Lexer::peek(int offset) const
    {
        size_t idx = pos_ + offset;
        if (idx >= source_.size())
            return '\0';
        return source_[idx];
    }

    void Lexer::advance()
    {
        if (!isAtEnd())
        {
            if (source_[pos_] == '\n')
            {
                line_++;
                column_ = 1;
            }
            else
            {
                column_++;
            }
            pos_++;
        }
    }

    bool Lexer::isAtEnd() const
    {
        return pos_ >= source_.size();
    }

    bool Lexer::isAlpha(char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool Lexer::isDigit(char c)
    {
        return c >= '0' && c <= '9';
    }

    bool Lexer::isAlphaNumeric(char c)
    {
        return isAlpha(c) || isDigit(c);
    }

    // ---- Whitespace & comment skipping -----------------------------------------

    void Lexer::skipWhitespaceAndComments()
    {
        while (!isAtEnd())
        {
            char c = current();

            // Newlines carry no meaning; statements are delimited by grammar
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
            {
                advance();
                continue;
            }

            // Single-line comment: //
            if (c == '/' && peek(1) == '/')
            {
                skipSingleLineComment();
                continue;
            }

            break;
        }
    }

    void Lexer::skipSingleLineComment()
    {
        while (!isAtEnd() && current() != '\n')
        {
            advance();
        }
    }

    // ---- Token readers ----------------------------------------------------------

    Token Lexer::readNumber()
    {
        int startLine = line_;
        int startColumn = column_;
        std::string num;

        while (!isAtEnd() && isDigit(current()))
        {
            num += current();
            advance();
        }

        // Decimal point followed by digits → fractional part
        if (!isAtEnd() && current() == '.' && isDigit(peek(1)))
        {
            num += '.';
            advance(); // consume '.'
            while (!isAtEnd() && isDigit(current()))
            {
                num += current();
                advance();
            }
        }

        return Token(TokenType::NUMBER, num, startLine, startColumn);
    }

    Token Lexer::readString()
    {
        int startLine = line_;
        int startColumn = column_;
        char quote = current();
        advance(); // consume opening quote

        // Raw characters only: no escape processing, no line breaks
        std::string str;
        while (!isAtEnd() && current() != quote && current() != '\n')
        {
            str += current();
            advance();
        }

        if (isAtEnd() || current() == '\n')
        {
            throw LexError("unterminated string literal", startLine, startColumn);
        }

        advance(); // consume closing quote
        return Token(TokenType::STRING, str, startLine, startColumn);
    }

    Token Lexer::readIdentifierOrKeyword()
    {
        int startLine = line_;
        int startColumn = column_;
        std::string word;

        while (!isAtEnd() && isAlphaNumeric(current()))
        {
            word += current();
            advance();
        }

        TokenType type = lookupKeyword(word);
        return Token(type, word, startLine, startColumn);
    }

    TokenType Lexer::lookupKeyword(const std::string &word)
    {
        auto &kw = keywordMap();
        auto it = kw.find(word);
        if (it != kw.end())
            return it->second;
        return TokenType::IDENTIFIER;
    }

    void Lexer::emitOperator(std::vector<Token> &tokens, char second,
                             TokenType longType, const char *longText,
                             TokenType shortType, const char *shortText)
    {
        int tokenLine = line_;
        int tokenColumn = column_;
        if (peek(1) == second)
        {
            tokens.emplace_back(longType, longText, tokenLine, tokenColumn);
            advance();
            advance();
        }
        else
        {
            tokens.emplace_back(shortType, shortText, tokenLine, tokenColumn);
            advance();
        }
    }

    // ---- Main tokenize loop -----------------------------------------------------

    std::vector<Token> Lexer::tokenize()
    {
        std::vector<Token> tokens;

        while (!isAtEnd())
        {
            skipWhitespaceAndComments();
            if (isAtEnd())
                break;

            char c = current();
            int tokenLine = line_;
            int tokenColumn = column_;

            // --- Number literal ---
            if (isDigit(c))
            {
                tokens.push_back(readNumber());
                continue;
            }

            // --- String literal ---
            if (c == '"' || c == '\'')
            {
                tokens.push_back(readString());
                continue;
            }

            // --- Identifier or keyword ---
            if (isAlpha(c))
            {
                tokens.push_back(readIdentifierOrKeyword());
                continue;
            }

            // --- Operators: longest match first ---
            switch (c)
            {
            case '=':
                emitOperator(tokens, '=', TokenType::EQUAL_EQUAL, "==", TokenType::EQUAL, "=");
                continue;
            case '!':
                emitOperator(tokens, '=', TokenType::BANG_EQUAL, "!=", TokenType::BANG, "!");
                continue;
            case '<':
                emitOperator(tokens, '=', TokenType::LESS_EQUAL, "<=", TokenType::LESS, "<");
                continue;
            case '>':
                emitOperator(tokens, '=', TokenType::GREATER_EQUAL, ">=", TokenType::GREATER, ">");
                continue;
            case '&':
                if (peek(1) != '&')
                    throw LexError("unexpected character '&' (did you mean '&&'?)", tokenLine, tokenColumn);
                tokens.emplace_back(TokenType::AMP_AMP, "&&", tokenLine, tokenColumn);
                advance();
                advance();
                continue;
            case '|':
                if (peek(1) != '|')
                    throw LexError("unexpected character '|' (did you mean '||'?)", tokenLine, tokenColumn);
                tokens.emplace_back(TokenType::PIPE_PIPE, "||", tokenLine, tokenColumn);
                advance();
                advance();
                continue;
            default:
                break;
            }

            // --- Single-character operators and delimiters ---
            static const std::unordered_map<char, TokenType> singles = {
                {'+', TokenType::PLUS},
                {'-', TokenType::MINUS},
                {'*', TokenType::STAR},
                {'/', TokenType::SLASH},
                {'%', TokenType::PERCENT},
                {'(', TokenType::LPAREN},
                {')', TokenType::RPAREN},
                {'{', TokenType::LBRACE},
                {'}', TokenType::RBRACE},
                {',', TokenType::COMMA},
                {';', TokenType::SEMICOLON},
            };
            auto it = singles.find(c);
            if (it != singles.end())
            {
                tokens.emplace_back(it->second, std::string(1, c), tokenLine, tokenColumn);
                advance();
                continue;
            }

            // Unknown character
            throw LexError("unexpected character '" + std::string(1, c) + "'", tokenLine, tokenColumn);
        }

        tokens.emplace_back(TokenType::EOF_TOKEN, "", line_, column_);
        return tokens;
    }

} // namespace kuzur
