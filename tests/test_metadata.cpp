#include "test_helpers.hpp"

#include <osoquery/metadata.hpp>

#include <gtest/gtest.h>

using namespace osoquery;
using osoquery::test::line_cursor;

namespace
{
    // Decodes every hint on the line, like the reader does after a declaration.
    Result<void> decode_all(TokenCursor& cursor, StringPool& pool, std::vector<Metadata>& out, Parameter* param)
    {
        while (!cursor.atEnd())
        {
            auto r = decode_hint(cursor, pool, out, param);
            if (!r.isOk())
                return r;
        }
        return Result<void>::ok();
    }
} // namespace

TEST(Metadata, InlineStringHint)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%string label \"diffuse color\"");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    ASSERT_EQ(md.size(), 1u);
    EXPECT_EQ(pool.view(md[0].key), "label");
    EXPECT_EQ(md[0].type.base, BaseType::eString);
    EXPECT_FALSE(md[0].type.isArray());
    ASSERT_EQ(md[0].value.strings.size(), 1u);
    EXPECT_EQ(pool.view(md[0].value.strings[0]), "diffuse color");
}

TEST(Metadata, BracedMetaHint)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%meta{string,help,\"Specular scaling\"} %meta{float,min,0}");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    ASSERT_EQ(md.size(), 2u);
    EXPECT_EQ(pool.view(md[0].key), "help");
    EXPECT_EQ(pool.view(md[0].value.strings[0]), "Specular scaling");
    EXPECT_EQ(pool.view(md[1].key), "min");
    EXPECT_EQ(md[1].type.base, BaseType::eFloat);
    EXPECT_EQ(md[1].value.floats, std::vector<float>({0.0f}));
}

TEST(Metadata, BracedMetaWithArrayValue)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%meta{int[2],range,{0,10}}");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    ASSERT_EQ(md.size(), 1u);
    EXPECT_EQ(md[0].type.base, BaseType::eInt);
    // stored type is scalar, arity comes from the value count
    EXPECT_FALSE(md[0].type.isArray());
    EXPECT_EQ(md[0].value.ints, std::vector<int32_t>({0, 10}));
}

TEST(Metadata, BracedMetaFixedArrayCountMustMatch)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%meta{float[2],range,{0}}");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eArityMismatch);
    EXPECT_TRUE(md.empty());
}

TEST(Metadata, ArityInferredFromTrailingTokens)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%color swatches 1 0 0 0 1 0 %int count 2");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    ASSERT_EQ(md.size(), 2u);
    EXPECT_EQ(md[0].value.floats.size(), 6u);
    EXPECT_EQ(md[0].type.base, BaseType::eColor);
    EXPECT_EQ(md[1].value.ints, std::vector<int32_t>({2}));
}

TEST(Metadata, AggregateArityMismatch)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%color tint 1 1");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eArityMismatch);
}

TEST(Metadata, MissingValue)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%float max %string label \"x\"");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eArityMismatch);
}

TEST(Metadata, MissingKey)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%float");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eUnexpectedEndOfInput);
}

TEST(Metadata, ValueOfWrongKind)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%string label 5");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eTypeMismatch);
}

TEST(Metadata, StructTypedMetadataIsRejected)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%struct s 1");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eTypeMismatch);
}

TEST(Metadata, UnknownHintName)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%banana x 1");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eUnknownType);
}

TEST(Metadata, MalformedMetaBody)
{
    const char* cases[] = {"%meta{}", "%meta{string help \"x\"}", "%meta{string,\"help\",\"x\"}", "%meta{float,x,{1,2}3}"};

    for (const char* text : cases)
    {
        StringPool            pool;
        std::vector<Metadata> md;
        TokenCursor           cursor = line_cursor(text);

        auto r = decode_all(cursor, pool, md, nullptr);
        ASSERT_FALSE(r.isOk()) << text;
        EXPECT_EQ(r.error().code, ErrorCode::eUnexpectedDeclaration) << text;
        EXPECT_EQ(r.error().line, 1u) << text;
    }
}

TEST(Metadata, UnterminatedBrace)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%meta{string,help,\"x\"");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eUnexpectedEndOfInput);
}

TEST(Metadata, ParameterHints)
{
    StringPool            pool;
    Parameter             param;
    TokenCursor           cursor =
        line_cursor("%space{\"world\"} %struct{\"Ray\"} %structfields{origin,dir} %initexpr %derivs %read{1,2}");

    auto r = decode_all(cursor, pool, param.metadata, &param);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    EXPECT_TRUE(param.metadata.empty());
    EXPECT_EQ(pool.view(param.space), "world");
    EXPECT_EQ(pool.view(param.structName), "Ray");
    ASSERT_EQ(param.structFields.size(), 2u);
    EXPECT_EQ(pool.view(param.structFields[0]), "origin");
    EXPECT_EQ(pool.view(param.structFields[1]), "dir");
    EXPECT_TRUE(param.hasInitExpr);
}

TEST(Metadata, ParameterHintsIgnoredWithoutParameter)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%space{\"world\"} %initexpr %meta{string,help,\"x\"}");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    ASSERT_EQ(md.size(), 1u);
    EXPECT_EQ(pool.find("world"), kInvalidStringId);
}

TEST(Metadata, DuplicateKeysKeepOrderAndFindReturnsFirst)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%string help \"first\" %string page \"Basics\" %string help \"second\"");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    ASSERT_EQ(md.size(), 3u);

    const Metadata* help = find_metadata(md, pool.find("help"));
    ASSERT_NE(help, nullptr);
    EXPECT_EQ(help, &md[0]);
    EXPECT_EQ(pool.view(help->value.strings[0]), "first");
    EXPECT_EQ(find_metadata(md, pool.find("missing")), nullptr);
}

TEST(Metadata, DefaultHintScalarAndList)
{
    StringPool pool;

    Parameter   k;
    k.type.base        = BaseType::eInt;
    TokenCursor scalar = line_cursor("%default{7}");
    auto        a      = decode_all(scalar, pool, k.metadata, &k);
    ASSERT_TRUE(a.isOk()) << a.error().message;
    ASSERT_TRUE(k.hasDefault);
    EXPECT_EQ(k.defaultValue.ints, std::vector<int32_t>({7}));
    EXPECT_TRUE(k.metadata.empty());

    Parameter names;
    names.type.base      = BaseType::eString;
    names.type.arrayKind = ArrayKind::eUnsized;
    TokenCursor list     = line_cursor("%default{[\"a\",\"b\"]}");
    auto        b        = decode_all(list, pool, names.metadata, &names);
    ASSERT_TRUE(b.isOk()) << b.error().message;
    ASSERT_TRUE(names.hasDefault);
    EXPECT_EQ(names.type.arrayLength, 2u);
    ASSERT_EQ(names.defaultValue.strings.size(), 2u);
    EXPECT_EQ(pool.view(names.defaultValue.strings[1]), "b");
}

TEST(Metadata, DefaultHintReplacesLiteral)
{
    StringPool pool;
    Parameter  p;
    p.type.base           = BaseType::eFloat;
    p.hasDefault          = true;
    p.defaultValue.floats = {1.0f};

    TokenCursor cursor = line_cursor("%default{0.25}");
    auto        r      = decode_all(cursor, pool, p.metadata, &p);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    EXPECT_EQ(p.defaultValue.floats, std::vector<float>({0.25f}));
}

TEST(Metadata, DefaultHintFollowsTypeRules)
{
    StringPool pool;

    Parameter color;
    color.type.base       = BaseType::eColor;
    TokenCursor twoValues = line_cursor("%default{[1,1]}");
    auto        arity     = decode_all(twoValues, pool, color.metadata, &color);
    ASSERT_FALSE(arity.isOk());
    EXPECT_EQ(arity.error().code, ErrorCode::eArityMismatch);
    EXPECT_FALSE(color.hasDefault);

    Parameter i;
    i.type.base       = BaseType::eInt;
    TokenCursor wrong = line_cursor("%default{\"x\"}");
    auto        kind  = decode_all(wrong, pool, i.metadata, &i);
    ASSERT_FALSE(kind.isOk());
    EXPECT_EQ(kind.error().code, ErrorCode::eTypeMismatch);
}

TEST(Metadata, DefaultHintOnOutputIsRejected)
{
    StringPool pool;
    Parameter  out;
    out.type.base = BaseType::eFloat;
    out.direction = Direction::eOutput;

    TokenCursor cursor = line_cursor("%default{1}");
    auto        r      = decode_all(cursor, pool, out.metadata, &out);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eUnexpectedDeclaration);
    EXPECT_FALSE(out.hasDefault);
}

TEST(Metadata, DefaultHintIgnoredOnShaderLine)
{
    StringPool            pool;
    std::vector<Metadata> md;
    TokenCursor           cursor = line_cursor("%default{1}");

    auto r = decode_all(cursor, pool, md, nullptr);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    EXPECT_TRUE(md.empty());
}
