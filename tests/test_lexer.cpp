#include "test_helpers.hpp"

#include <osoquery/lexer.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace osoquery;

static std::vector<Token> lex_all(std::string_view src)
{
    std::vector<Token> out;
    Lexer              lexer(src);
    for (;;)
    {
        auto r = lexer.next();
        EXPECT_TRUE(r.isOk()) << r.error().message;
        if (!r.isOk())
            break;
        out.push_back(r.value());
        if (out.back().kind == TokenKind::eEndOfInput)
            break;
    }
    return out;
}

TEST(Lexer, DeclarationLineTokenKinds)
{
    auto toks = lex_all("param float Kd 0.8 %meta{string,help,\"x\"}\n");

    ASSERT_EQ(toks.size(), 15u);
    EXPECT_TRUE(toks[0].isKeyword("param"));
    EXPECT_TRUE(toks[1].isKeyword("float"));
    EXPECT_EQ(toks[2].kind, TokenKind::eIdentifier);
    EXPECT_EQ(toks[2].text, "Kd");
    EXPECT_EQ(toks[3].kind, TokenKind::eFloat);
    EXPECT_DOUBLE_EQ(toks[3].floatValue, 0.8);
    EXPECT_TRUE(toks[4].isPunct('%'));
    EXPECT_EQ(toks[5].kind, TokenKind::eIdentifier);
    EXPECT_TRUE(toks[6].isPunct('{'));
    EXPECT_TRUE(toks[7].isKeyword("string"));
    EXPECT_TRUE(toks[8].isPunct(','));
    EXPECT_EQ(toks[9].text, "help");
    EXPECT_TRUE(toks[10].isPunct(','));
    EXPECT_EQ(toks[11].kind, TokenKind::eString);
    EXPECT_EQ(toks[11].value, "x");
    EXPECT_TRUE(toks[12].isPunct('}'));
    EXPECT_EQ(toks[13].kind, TokenKind::eEndOfLine);
    EXPECT_EQ(toks[14].kind, TokenKind::eEndOfInput);
}

TEST(Lexer, SkipsCommentsAndBlankLines)
{
    auto toks = lex_all("# Compiled by oslc\n\n   \nparam int x 1\n# trailing\n");

    ASSERT_EQ(toks.size(), 6u);
    EXPECT_TRUE(toks[0].isKeyword("param"));
    EXPECT_EQ(toks[0].line, 4u);
    EXPECT_EQ(toks[3].kind, TokenKind::eInteger);
    EXPECT_EQ(toks[3].intValue, 1);
    EXPECT_EQ(toks[4].kind, TokenKind::eEndOfLine);
    EXPECT_EQ(toks[5].kind, TokenKind::eEndOfInput);
}

TEST(Lexer, LastLineWithoutNewlineStillEndsWithEndOfLine)
{
    auto toks = lex_all("shader matte");

    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[2].kind, TokenKind::eEndOfLine);
    EXPECT_EQ(toks[3].kind, TokenKind::eEndOfInput);
}

TEST(Lexer, EmptyInputIsEndOfInput)
{
    Lexer lexer("");
    for (int i = 0; i < 3; ++i)
    {
        auto r = lexer.next();
        ASSERT_TRUE(r.isOk());
        EXPECT_EQ(r.value().kind, TokenKind::eEndOfInput);
    }
}

TEST(Lexer, NumberForms)
{
    auto toks = lex_all("-1 +2 1e3 .5 -2.5e-1 0");

    ASSERT_GE(toks.size(), 6u);
    EXPECT_EQ(toks[0].kind, TokenKind::eInteger);
    EXPECT_EQ(toks[0].intValue, -1);
    EXPECT_EQ(toks[1].kind, TokenKind::eInteger);
    EXPECT_EQ(toks[1].intValue, 2);
    EXPECT_EQ(toks[1].text, "+2");
    EXPECT_EQ(toks[2].kind, TokenKind::eFloat);
    EXPECT_DOUBLE_EQ(toks[2].floatValue, 1000.0);
    EXPECT_EQ(toks[3].kind, TokenKind::eFloat);
    EXPECT_DOUBLE_EQ(toks[3].floatValue, 0.5);
    EXPECT_EQ(toks[4].kind, TokenKind::eFloat);
    EXPECT_DOUBLE_EQ(toks[4].floatValue, -0.25);
    EXPECT_EQ(toks[5].kind, TokenKind::eInteger);
    EXPECT_DOUBLE_EQ(toks[5].floatValue, 0.0);
}

TEST(Lexer, StringEscapes)
{
    auto toks = lex_all(R"("a\tb\"c\\d\101\x41")");

    ASSERT_GE(toks.size(), 1u);
    ASSERT_EQ(toks[0].kind, TokenKind::eString);
    EXPECT_EQ(toks[0].value, "a\tb\"c\\dAA");
    EXPECT_EQ(toks[0].text, R"("a\tb\"c\\d\101\x41")");
}

TEST(Lexer, KeywordsAndIdentifiers)
{
    auto toks = lex_all("closure color Foo $tmp1 ___325_c a.b");

    ASSERT_GE(toks.size(), 6u);
    EXPECT_EQ(toks[0].kind, TokenKind::eKeyword);
    EXPECT_EQ(toks[1].kind, TokenKind::eKeyword);
    EXPECT_EQ(toks[2].kind, TokenKind::eIdentifier);
    EXPECT_EQ(toks[3].kind, TokenKind::eIdentifier);
    EXPECT_EQ(toks[3].text, "$tmp1");
    EXPECT_EQ(toks[4].text, "___325_c");
    EXPECT_EQ(toks[5].text, "a.b");
}

TEST(Lexer, UnterminatedStringIsMalformed)
{
    Lexer lexer("shader \"matte\nparam float Kd 1\n");

    auto first = lexer.next();
    ASSERT_TRUE(first.isOk());

    auto r = lexer.next();
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eMalformedToken);
    EXPECT_EQ(r.error().line, 1u);
}

TEST(Lexer, NumberFollowedByLettersIsMalformed)
{
    Lexer lexer("\n\n12abc");

    auto r = lexer.next();
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eMalformedToken);
    EXPECT_EQ(r.error().line, 3u);
}

TEST(Lexer, UnexpectedCharacterIsMalformed)
{
    Lexer lexer("param float @x");
    lexer.next();
    lexer.next();

    auto r = lexer.next();
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eMalformedToken);
}

TEST(Lexer, ResetRestartsFromFirstLine)
{
    Lexer lexer("# c\nshader matte\n");
    lexer.next();
    lexer.next();
    lexer.reset();

    auto r = lexer.next();
    ASSERT_TRUE(r.isOk());
    EXPECT_TRUE(r.value().isKeyword("shader"));
    EXPECT_EQ(r.value().line, 2u);
}

TEST(TokenCursor, ReadLineStopsAtLineEnd)
{
    Lexer lexer("param float Kd\nparam float Ks\n");

    auto first = read_line(lexer);
    ASSERT_TRUE(first.isOk());
    TokenCursor& c = first.value();
    EXPECT_EQ(c.line(), 1u);
    EXPECT_FALSE(c.isEndOfInput());

    EXPECT_TRUE(c.next().isKeyword("param"));
    EXPECT_TRUE(c.next().isKeyword("float"));
    EXPECT_EQ(c.next().text, "Kd");
    EXPECT_TRUE(c.atEnd());

    // never moves past the terminator
    EXPECT_EQ(c.next().kind, TokenKind::eEndOfLine);
    EXPECT_EQ(c.peek(5).kind, TokenKind::eEndOfLine);

    auto second = read_line(lexer);
    ASSERT_TRUE(second.isOk());
    EXPECT_EQ(second.value().line(), 2u);
    EXPECT_EQ(second.value().peek(2).text, "Ks");

    auto done = read_line(lexer);
    ASSERT_TRUE(done.isOk());
    EXPECT_TRUE(done.value().empty());
    EXPECT_TRUE(done.value().isEndOfInput());
}

TEST(TokenCursor, DefaultIsEmpty)
{
    TokenCursor c;
    EXPECT_TRUE(c.empty());
    EXPECT_TRUE(c.atEnd());
    EXPECT_EQ(c.peek().kind, TokenKind::eEndOfInput);
}

TEST(TokenCursor, PeekLooksAhead)
{
    TokenCursor c = test::line_cursor("color [ 3 ]");

    EXPECT_TRUE(c.peek(1).isPunct('['));
    EXPECT_EQ(c.peek(2).intValue, 3);
    EXPECT_EQ(c.position(), 0u);
    c.next();
    EXPECT_EQ(c.position(), 1u);
}
