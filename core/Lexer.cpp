/*
 * Lexer.cpp
 *
 *  Tokenizer for method bodies.
 */

#include "../headers/autopo_internal.h"
#include <cctype>
#include <unordered_map>

namespace autopo
{
    namespace {
        const std::unordered_map<std::string, TokenType>& keywords()
        {
            static const std::unordered_map<std::string, TokenType> table = {
                {"def", TokenType::Def},
                {"let", TokenType::Let},
                {"if", TokenType::If},
                {"else", TokenType::Else},
                {"while", TokenType::While},
                {"for", TokenType::For},
                {"in", TokenType::In},
                {"return", TokenType::Return},
                {"break", TokenType::Break},
                {"continue", TokenType::Continue},
                {"commit", TokenType::Commit},
                {"raise", TokenType::Raise},
                {"import", TokenType::Import},
                {"from", TokenType::From},
                {"del", TokenType::Del},
                {"pass", TokenType::Pass},
                {"and", TokenType::And},
                {"or", TokenType::Or},
                {"not", TokenType::Not},
                {"true", TokenType::True},
                {"false", TokenType::False},
                {"null", TokenType::Null},
                {"self", TokenType::Self}
            };
            return table;
        }
    }

    const char* toString(TokenType type)
    {
        switch (type)
        {
        case TokenType::Identifier: return "identifier";
        case TokenType::Integer: return "integer";
        case TokenType::Float: return "float";
        case TokenType::String: return "string";
        case TokenType::Def: return "'def'";
        case TokenType::Let: return "'let'";
        case TokenType::If: return "'if'";
        case TokenType::Else: return "'else'";
        case TokenType::While: return "'while'";
        case TokenType::For: return "'for'";
        case TokenType::In: return "'in'";
        case TokenType::Return: return "'return'";
        case TokenType::Break: return "'break'";
        case TokenType::Continue: return "'continue'";
        case TokenType::Commit: return "'commit'";
        case TokenType::Raise: return "'raise'";
        case TokenType::Import: return "'import'";
        case TokenType::From: return "'from'";
        case TokenType::Del: return "'del'";
        case TokenType::Pass: return "'pass'";
        case TokenType::And: return "'and'";
        case TokenType::Or: return "'or'";
        case TokenType::Not: return "'not'";
        case TokenType::True: return "'true'";
        case TokenType::False: return "'false'";
        case TokenType::Null: return "'null'";
        case TokenType::Self: return "'self'";
        case TokenType::LeftParen: return "'('";
        case TokenType::RightParen: return "')'";
        case TokenType::LeftBrace: return "'{'";
        case TokenType::RightBrace: return "'}'";
        case TokenType::LeftBracket: return "'['";
        case TokenType::RightBracket: return "']'";
        case TokenType::Comma: return "','";
        case TokenType::Colon: return "':'";
        case TokenType::Semicolon: return "';'";
        case TokenType::Dot: return "'.'";
        case TokenType::Assign: return "'='";
        case TokenType::PlusAssign: return "'+='";
        case TokenType::MinusAssign: return "'-='";
        case TokenType::StarAssign: return "'*='";
        case TokenType::Plus: return "'+'";
        case TokenType::Minus: return "'-'";
        case TokenType::Star: return "'*'";
        case TokenType::Slash: return "'/'";
        case TokenType::Percent: return "'%'";
        case TokenType::Equal: return "'=='";
        case TokenType::NotEqual: return "'!='";
        case TokenType::Less: return "'<'";
        case TokenType::LessEqual: return "'<='";
        case TokenType::Greater: return "'>'";
        case TokenType::GreaterEqual: return "'>='";
        case TokenType::EndOfInput: return "end of input";
        }
        return "token";
    }

    ParseError::ParseError(const std::string& message, int line, int column) :
        std::runtime_error(message + " at line " + std::to_string(line) + ", column " + std::to_string(column)),
        line(line), column(column)
    {
    }

    Lexer::Lexer(const std::string& source) : source(source), pos(0), line(1), column(1) {}

    char Lexer::current() const
    {
        return pos < source.size() ? source[pos] : '\0';
    }

    char Lexer::peek(int offset) const
    {
        const size_t at = pos + offset;
        return at < source.size() ? source[at] : '\0';
    }

    void Lexer::advance()
    {
        if (pos >= source.size()) return;
        if (source[pos] == '\n')
        {
            line++;
            column = 1;
        }
        else
        {
            column++;
        }
        pos++;
    }

    void Lexer::skipWhitespaceAndComments()
    {
        while (pos < source.size())
        {
            const char c = current();
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                advance();
            }
            else if (c == '#' || (c == '/' && peek() == '/'))
            {
                while (pos < source.size() && current() != '\n')
                    advance();
            }
            else if (c == '/' && peek() == '*')
            {
                const int startLine = line;
                const int startColumn = column;
                advance();
                advance();
                while (pos < source.size() && !(current() == '*' && peek() == '/'))
                    advance();
                if (pos >= source.size())
                    throw ParseError("unterminated block comment", startLine, startColumn);
                advance();
                advance();
            }
            else
            {
                return;
            }
        }
    }

    Token Lexer::makeToken(TokenType type, std::string text, int tokenLine, int tokenColumn) const
    {
        return Token{type, std::move(text), tokenLine, tokenColumn};
    }

    Token Lexer::readNumber()
    {
        const int startLine = line;
        const int startColumn = column;
        std::string text;
        bool isFloat = false;
        while (std::isdigit(static_cast<unsigned char>(current())))
        {
            text += current();
            advance();
        }
        if (current() == '.' && std::isdigit(static_cast<unsigned char>(peek())))
        {
            isFloat = true;
            text += current();
            advance();
            while (std::isdigit(static_cast<unsigned char>(current())))
            {
                text += current();
                advance();
            }
        }
        if (current() == 'e' || current() == 'E')
        {
            const char sign = peek();
            const bool signedExponent = (sign == '+' || sign == '-') && std::isdigit(static_cast<unsigned char>(peek(2)));
            if (std::isdigit(static_cast<unsigned char>(sign)) || signedExponent)
            {
                isFloat = true;
                text += current();
                advance();
                if (signedExponent)
                {
                    text += current();
                    advance();
                }
                while (std::isdigit(static_cast<unsigned char>(current())))
                {
                    text += current();
                    advance();
                }
            }
        }
        if (std::isalpha(static_cast<unsigned char>(current())) || current() == '_')
            throw ParseError("malformed number '" + text + current() + "'", startLine, startColumn);
        return makeToken(isFloat ? TokenType::Float : TokenType::Integer, text, startLine, startColumn);
    }

    Token Lexer::readString()
    {
        const int startLine = line;
        const int startColumn = column;
        const char quote = current();
        advance();
        std::string text;
        while (true)
        {
            if (pos >= source.size() || current() == '\n')
                throw ParseError("unterminated string literal", startLine, startColumn);
            const char c = current();
            if (c == quote)
            {
                advance();
                break;
            }
            if (c == '\\')
            {
                advance();
                const char escaped = current();
                switch (escaped)
                {
                case 'n': text += '\n'; break;
                case 't': text += '\t'; break;
                case 'r': text += '\r'; break;
                case '0': text += '\0'; break;
                case '\\': text += '\\'; break;
                case '"': text += '"'; break;
                case '\'': text += '\''; break;
                default:
                    throw ParseError(std::string("unknown escape sequence '\\") + escaped + "'", line, column);
                }
                advance();
                continue;
            }
            text += c;
            advance();
        }
        return makeToken(TokenType::String, text, startLine, startColumn);
    }

    Token Lexer::readIdentifier()
    {
        const int startLine = line;
        const int startColumn = column;
        std::string text;
        while (std::isalnum(static_cast<unsigned char>(current())) || current() == '_')
        {
            text += current();
            advance();
        }
        auto keyword = keywords().find(text);
        if (keyword != keywords().end())
            return makeToken(keyword->second, text, startLine, startColumn);
        return makeToken(TokenType::Identifier, text, startLine, startColumn);
    }

    std::vector<Token> Lexer::tokenize()
    {
        std::vector<Token> tokens;
        while (true)
        {
            skipWhitespaceAndComments();
            if (pos >= source.size())
            {
                tokens.push_back(makeToken(TokenType::EndOfInput, "", line, column));
                return tokens;
            }

            const char c = current();
            const int startLine = line;
            const int startColumn = column;

            if (std::isdigit(static_cast<unsigned char>(c)))
            {
                tokens.push_back(readNumber());
                continue;
            }
            if (c == '"' || c == '\'')
            {
                tokens.push_back(readString());
                continue;
            }
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
            {
                tokens.push_back(readIdentifier());
                continue;
            }

            TokenType type;
            std::string text(1, c);
            const char next = peek();
            switch (c)
            {
            case '(': type = TokenType::LeftParen; break;
            case ')': type = TokenType::RightParen; break;
            case '{': type = TokenType::LeftBrace; break;
            case '}': type = TokenType::RightBrace; break;
            case '[': type = TokenType::LeftBracket; break;
            case ']': type = TokenType::RightBracket; break;
            case ',': type = TokenType::Comma; break;
            case ':': type = TokenType::Colon; break;
            case ';': type = TokenType::Semicolon; break;
            case '.': type = TokenType::Dot; break;
            case '%': type = TokenType::Percent; break;
            case '/': type = TokenType::Slash; break;
            case '+':
                type = next == '=' ? TokenType::PlusAssign : TokenType::Plus;
                break;
            case '-':
                type = next == '=' ? TokenType::MinusAssign : TokenType::Minus;
                break;
            case '*':
                type = next == '=' ? TokenType::StarAssign : TokenType::Star;
                break;
            case '=':
                type = next == '=' ? TokenType::Equal : TokenType::Assign;
                break;
            case '!':
                if (next != '=')
                    throw ParseError("unexpected character '!'", startLine, startColumn);
                type = TokenType::NotEqual;
                break;
            case '<':
                type = next == '=' ? TokenType::LessEqual : TokenType::Less;
                break;
            case '>':
                type = next == '=' ? TokenType::GreaterEqual : TokenType::Greater;
                break;
            default:
                throw ParseError(std::string("unexpected character '") + c + "'", startLine, startColumn);
            }

            advance();
            if (type == TokenType::PlusAssign || type == TokenType::MinusAssign || type == TokenType::StarAssign ||
                type == TokenType::Equal || type == TokenType::NotEqual ||
                type == TokenType::LessEqual || type == TokenType::GreaterEqual)
            {
                text += current();
                advance();
            }
            tokens.push_back(makeToken(type, text, startLine, startColumn));
        }
    }
}
