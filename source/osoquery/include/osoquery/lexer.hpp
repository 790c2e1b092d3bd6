#pragma once

#include "osoquery/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace osoquery
{
    enum class TokenKind : uint8_t
    {
        eIdentifier = 0,
        eKeyword,
        eString,
        eInteger,
        eFloat,
        ePunct,
        eEndOfLine,
        eEndOfInput
    };

    const char* token_kind_name(TokenKind k);

    struct Token
    {
        TokenKind        kind = TokenKind::eEndOfInput;
        std::string_view text;           // lexeme as written in the source
        std::string      value;          // decoded contents (eString only)
        int64_t          intValue   = 0; // eInteger
        double           floatValue = 0; // eFloat and eInteger
        size_t           line       = 0;

        bool isTerminator() const { return kind == TokenKind::eEndOfLine || kind == TokenKind::eEndOfInput; }
        bool isPunct(char c) const { return kind == TokenKind::ePunct && text.size() == 1 && text[0] == c; }
        bool isKeyword(std::string_view k) const { return kind == TokenKind::eKeyword && text == k; }

        // Identifier or keyword spelled `w`.
        bool isWord(std::string_view w) const
        {
            return (kind == TokenKind::eIdentifier || kind == TokenKind::eKeyword) && text == w;
        }
    };

    // ------------------------------------------------------------
    // Lexer
    //
    // Lazy tokenizer over the whole source. Lines whose first
    // non-blank character is '#' and blank lines produce no tokens.
    // Every non-empty line ends with an eEndOfLine token; the stream
    // ends with eEndOfInput, which is returned again on further calls.
    //
    // Keywords: param oparam shader closure and the base type names.
    // Punctuation: [ ] { } , %
    // ------------------------------------------------------------
    class Lexer
    {
    public:
        explicit Lexer(std::string_view source) : m_Source(source) {}

        Result<Token> next();

        // Restart from the first byte.
        void reset();

        size_t line() const { return m_Line; }

    private:
        bool atEnd() const { return m_Pos >= m_Source.size(); }
        void skipBlank();
        bool skipCommentOrEmptyLine();

        Result<Token> lexString();
        Result<Token> lexNumber();
        Token         lexWord();

        Error malformed(const std::string& msg) const { return {ErrorCode::eMalformedToken, msg, m_Line}; }

        std::string_view m_Source;
        size_t           m_Pos         = 0;
        size_t           m_Line        = 1;
        bool             m_AtLineStart = true;
        bool             m_LineHasTok  = false;
    };

    bool is_keyword(std::string_view word);

    // ------------------------------------------------------------
    // TokenCursor
    //
    // The tokens of one source line, always terminated by an
    // eEndOfLine or eEndOfInput token. Decoders work on a cursor so
    // lookahead never crosses a line boundary.
    // ------------------------------------------------------------
    class TokenCursor
    {
    public:
        TokenCursor();
        explicit TokenCursor(std::vector<Token> tokens);

        // Token `ahead` positions past the current one; clamps to the terminator.
        const Token& peek(size_t ahead = 0) const;

        // Returns the current token and advances; never moves past the terminator.
        const Token& next();

        bool atEnd() const { return peek().isTerminator(); }
        bool isEndOfInput() const { return m_Tokens.back().kind == TokenKind::eEndOfInput; }
        bool empty() const { return m_Tokens.size() == 1; }

        size_t line() const { return m_Tokens.back().line; }
        size_t position() const { return m_Index; }

    private:
        std::vector<Token> m_Tokens;
        size_t             m_Index = 0;
    };

    // Pull tokens for the next non-empty line. The returned cursor holds
    // only eEndOfInput once the source is exhausted.
    Result<TokenCursor> read_line(Lexer& lexer);
} // namespace osoquery
