#include "osoquery/lexer.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace osoquery
{
    namespace
    {
        inline bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v'; }

        inline bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

        inline bool is_word_start(char c)
        {
            return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$';
        }

        inline bool is_word_char(char c)
        {
            return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$' || c == '.';
        }

        inline bool is_punct(char c)
        {
            return c == '[' || c == ']' || c == '{' || c == '}' || c == ',' || c == '%';
        }

        inline int hex_digit_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    } // namespace

    const char* token_kind_name(TokenKind k)
    {
        switch (k)
        {
            case TokenKind::eIdentifier:
                return "identifier";
            case TokenKind::eKeyword:
                return "keyword";
            case TokenKind::eString:
                return "string";
            case TokenKind::eInteger:
                return "integer";
            case TokenKind::eFloat:
                return "float";
            case TokenKind::ePunct:
                return "punctuation";
            case TokenKind::eEndOfLine:
                return "end of line";
            case TokenKind::eEndOfInput:
                return "end of input";
        }
        return "token";
    }

    bool is_keyword(std::string_view word)
    {
        static constexpr std::string_view kKeywords[] = {"param",
                                                         "oparam",
                                                         "shader",
                                                         "closure",
                                                         "int",
                                                         "float",
                                                         "string",
                                                         "point",
                                                         "vector",
                                                         "normal",
                                                         "color",
                                                         "matrix",
                                                         "struct",
                                                         "void"};
        for (auto k : kKeywords)
        {
            if (k == word)
                return true;
        }
        return false;
    }

    void Lexer::reset()
    {
        m_Pos         = 0;
        m_Line        = 1;
        m_AtLineStart = true;
        m_LineHasTok  = false;
    }

    void Lexer::skipBlank()
    {
        while (!atEnd() && is_blank(m_Source[m_Pos]))
            ++m_Pos;
    }

    bool Lexer::skipCommentOrEmptyLine()
    {
        skipBlank();
        if (atEnd())
            return false;

        const char c = m_Source[m_Pos];
        if (c == '#')
        {
            while (!atEnd() && m_Source[m_Pos] != '\n')
                ++m_Pos;
            if (atEnd())
                return false;
        }
        else if (c != '\n')
        {
            return false;
        }

        // consume the newline of the skipped line
        ++m_Pos;
        ++m_Line;
        return true;
    }

    Result<Token> Lexer::next()
    {
        while (m_AtLineStart && skipCommentOrEmptyLine())
        {
        }

        skipBlank();

        Token tok;
        tok.line = m_Line;

        if (atEnd())
        {
            if (m_LineHasTok)
            {
                m_LineHasTok = false;
                tok.kind     = TokenKind::eEndOfLine;
                return Result<Token>::ok(std::move(tok));
            }
            tok.kind = TokenKind::eEndOfInput;
            return Result<Token>::ok(std::move(tok));
        }

        const char c = m_Source[m_Pos];

        if (c == '\n')
        {
            tok.kind = TokenKind::eEndOfLine;
            tok.text = m_Source.substr(m_Pos, 1);
            ++m_Pos;
            ++m_Line;
            m_AtLineStart = true;
            m_LineHasTok  = false;
            return Result<Token>::ok(std::move(tok));
        }

        m_AtLineStart = false;
        m_LineHasTok  = true;

        if (c == '"')
            return lexString();

        const char c1 = (m_Pos + 1 < m_Source.size()) ? m_Source[m_Pos + 1] : '\0';
        const char c2 = (m_Pos + 2 < m_Source.size()) ? m_Source[m_Pos + 2] : '\0';
        if (is_digit(c) || (c == '.' && is_digit(c1)) ||
            ((c == '+' || c == '-') && (is_digit(c1) || (c1 == '.' && is_digit(c2)))))
            return lexNumber();

        if (is_word_start(c))
            return Result<Token>::ok(lexWord());

        if (is_punct(c))
        {
            tok.kind = TokenKind::ePunct;
            tok.text = m_Source.substr(m_Pos, 1);
            ++m_Pos;
            return Result<Token>::ok(std::move(tok));
        }

        return Result<Token>::err(malformed(std::string("unexpected character '") + c + "'"));
    }

    Result<Token> Lexer::lexString()
    {
        Token tok;
        tok.kind = TokenKind::eString;
        tok.line = m_Line;

        const size_t start = m_Pos;
        ++m_Pos; // opening quote

        std::string out;
        for (;;)
        {
            if (atEnd() || m_Source[m_Pos] == '\n')
                return Result<Token>::err(malformed("unterminated string literal"));

            const char c = m_Source[m_Pos++];
            if (c == '"')
                break;

            if (c != '\\')
            {
                out.push_back(c);
                continue;
            }

            if (atEnd() || m_Source[m_Pos] == '\n')
                return Result<Token>::err(malformed("unterminated string literal"));

            const char e = m_Source[m_Pos++];
            switch (e)
            {
                case 'n':
                    out.push_back('\n');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 'a':
                    out.push_back('\a');
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'v':
                    out.push_back('\v');
                    break;
                case '\\':
                case '"':
                case '\'':
                case '?':
                    out.push_back(e);
                    break;
                case 'x':
                {
                    int value  = 0;
                    int digits = 0;
                    while (digits < 2 && !atEnd() && hex_digit_value(m_Source[m_Pos]) >= 0)
                    {
                        value = value * 16 + hex_digit_value(m_Source[m_Pos]);
                        ++m_Pos;
                        ++digits;
                    }
                    if (digits == 0)
                        return Result<Token>::err(malformed("\\x escape without hex digits"));
                    out.push_back(static_cast<char>(value));
                    break;
                }
                default:
                    if (e >= '0' && e <= '7')
                    {
                        int value  = e - '0';
                        int digits = 1;
                        while (digits < 3 && !atEnd() && m_Source[m_Pos] >= '0' && m_Source[m_Pos] <= '7')
                        {
                            value = value * 8 + (m_Source[m_Pos] - '0');
                            ++m_Pos;
                            ++digits;
                        }
                        out.push_back(static_cast<char>(value & 0xFF));
                        break;
                    }
                    return Result<Token>::err(malformed(std::string("unknown escape sequence '\\") + e + "'"));
            }
        }

        tok.text  = m_Source.substr(start, m_Pos - start);
        tok.value = std::move(out);
        return Result<Token>::ok(std::move(tok));
    }

    Result<Token> Lexer::lexNumber()
    {
        Token tok;
        tok.line = m_Line;

        const size_t start = m_Pos;
        if (m_Source[m_Pos] == '+' || m_Source[m_Pos] == '-')
            ++m_Pos;

        while (!atEnd() && is_digit(m_Source[m_Pos]))
            ++m_Pos;

        bool isFloat = false;
        if (!atEnd() && m_Source[m_Pos] == '.')
        {
            isFloat = true;
            ++m_Pos;
            while (!atEnd() && is_digit(m_Source[m_Pos]))
                ++m_Pos;
        }

        if (!atEnd() && (m_Source[m_Pos] == 'e' || m_Source[m_Pos] == 'E'))
        {
            size_t p = m_Pos + 1;
            if (p < m_Source.size() && (m_Source[p] == '+' || m_Source[p] == '-'))
                ++p;
            if (p < m_Source.size() && is_digit(m_Source[p]))
            {
                isFloat = true;
                m_Pos   = p;
                while (!atEnd() && is_digit(m_Source[m_Pos]))
                    ++m_Pos;
            }
        }

        if (!atEnd() && is_word_char(m_Source[m_Pos]))
        {
            size_t end = m_Pos;
            while (end < m_Source.size() && is_word_char(m_Source[end]))
                ++end;
            return Result<Token>::err(
                malformed("invalid numeric literal '" + std::string(m_Source.substr(start, end - start)) + "'"));
        }

        tok.text = m_Source.substr(start, m_Pos - start);

        if (isFloat)
        {
            const std::string s(tok.text);
            char*             endp = nullptr;
            tok.kind               = TokenKind::eFloat;
            tok.floatValue         = std::strtod(s.c_str(), &endp);
            if (endp != s.c_str() + s.size())
                return Result<Token>::err(malformed("invalid numeric literal '" + s + "'"));
            return Result<Token>::ok(std::move(tok));
        }

        // from_chars does not accept a leading '+'
        std::string_view digits = tok.text;
        if (!digits.empty() && digits.front() == '+')
            digits.remove_prefix(1);

        int64_t v  = 0;
        auto    rc = std::from_chars(digits.data(), digits.data() + digits.size(), v);
        if (rc.ec != std::errc {} || rc.ptr != digits.data() + digits.size())
            return Result<Token>::err(malformed("integer literal out of range '" + std::string(tok.text) + "'"));

        tok.kind       = TokenKind::eInteger;
        tok.intValue   = v;
        tok.floatValue = static_cast<double>(v);
        return Result<Token>::ok(std::move(tok));
    }

    Token Lexer::lexWord()
    {
        Token tok;
        tok.line = m_Line;

        const size_t start = m_Pos;
        ++m_Pos;
        while (!atEnd() && is_word_char(m_Source[m_Pos]))
            ++m_Pos;

        tok.text = m_Source.substr(start, m_Pos - start);
        tok.kind = is_keyword(tok.text) ? TokenKind::eKeyword : TokenKind::eIdentifier;
        return tok;
    }

    // ------------------------------------------------------------
    // TokenCursor
    // ------------------------------------------------------------

    TokenCursor::TokenCursor() { m_Tokens.emplace_back(); }

    TokenCursor::TokenCursor(std::vector<Token> tokens) : m_Tokens(std::move(tokens))
    {
        if (m_Tokens.empty() || !m_Tokens.back().isTerminator())
        {
            Token eoi;
            eoi.kind = TokenKind::eEndOfInput;
            eoi.line = m_Tokens.empty() ? 0 : m_Tokens.back().line;
            m_Tokens.push_back(std::move(eoi));
        }
    }

    const Token& TokenCursor::peek(size_t ahead) const
    {
        const size_t i = m_Index + ahead;
        return (i < m_Tokens.size()) ? m_Tokens[i] : m_Tokens.back();
    }

    const Token& TokenCursor::next()
    {
        const Token& t = m_Tokens[m_Index];
        if (m_Index + 1 < m_Tokens.size())
            ++m_Index;
        return t;
    }

    Result<TokenCursor> read_line(Lexer& lexer)
    {
        std::vector<Token> tokens;
        for (;;)
        {
            auto r = lexer.next();
            if (!r.isOk())
                return Result<TokenCursor>::err(r.error());

            const bool done = r.value().isTerminator();
            tokens.push_back(std::move(r.value()));
            if (done)
                break;
        }
        return Result<TokenCursor>::ok(TokenCursor(std::move(tokens)));
    }
} // namespace osoquery
