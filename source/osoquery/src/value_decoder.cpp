#include "osoquery/value_decoder.hpp"
#include "osoquery/parser_utils.hpp"

#include <cmath>
#include <limits>

namespace osoquery
{
    static Result<int32_t> decode_int(const Token& tok)
    {
        if (tok.kind == TokenKind::eInteger)
        {
            if (tok.intValue < std::numeric_limits<int32_t>::min() ||
                tok.intValue > std::numeric_limits<int32_t>::max())
                return Result<int32_t>::err(
                    token_error(ErrorCode::eTypeMismatch, tok, "integer value out of range: " + describe_token(tok)));
            return Result<int32_t>::ok(static_cast<int32_t>(tok.intValue));
        }

        int32_t b = 0;
        if (tok.kind == TokenKind::eIdentifier && parse_bool_value(tok.text, b))
            return Result<int32_t>::ok(b);

        return Result<int32_t>::err(
            token_error(ErrorCode::eTypeMismatch, tok, "expected an int value, got " + describe_token(tok)));
    }

    Result<ParameterValue> decode_scalars(BaseType base, const std::vector<const Token*>& tokens, StringPool& pool)
    {
        ParameterValue v;
        v.kind = value_kind_for(base);

        switch (v.kind)
        {
            case ValueKind::eInt:
                v.ints.reserve(tokens.size());
                for (const Token* tok : tokens)
                {
                    auto r = decode_int(*tok);
                    if (!r.isOk())
                        return Result<ParameterValue>::err(r.error());
                    v.ints.push_back(r.value());
                }
                break;

            case ValueKind::eFloat:
                v.floats.reserve(tokens.size());
                for (const Token* tok : tokens)
                {
                    if (tok->kind != TokenKind::eFloat && tok->kind != TokenKind::eInteger)
                        return Result<ParameterValue>::err(token_error(
                            ErrorCode::eTypeMismatch,
                            *tok,
                            std::string("expected a numeric value for ") + base_type_name(base) + ", got " +
                                describe_token(*tok)));
                    if (!(std::fabs(tok->floatValue) <= std::numeric_limits<float>::max()))
                        return Result<ParameterValue>::err(token_error(
                            ErrorCode::eTypeMismatch, *tok, "float value out of range: " + describe_token(*tok)));
                    v.floats.push_back(static_cast<float>(tok->floatValue));
                }
                break;

            case ValueKind::eString:
                v.strings.reserve(tokens.size());
                for (const Token* tok : tokens)
                {
                    if (tok->kind != TokenKind::eString)
                        return Result<ParameterValue>::err(token_error(
                            ErrorCode::eTypeMismatch, *tok, "expected a quoted string, got " + describe_token(*tok)));
                    v.strings.push_back(pool.intern(tok->value));
                }
                break;
        }

        return Result<ParameterValue>::ok(std::move(v));
    }

    Result<DecodedValue> decode_value(TypeDescriptor& type, TokenCursor& cursor, StringPool& pool)
    {
        std::vector<const Token*> tokens;
        while (!cursor.atEnd() && !cursor.peek().isPunct('%'))
            tokens.push_back(&cursor.next());

        DecodedValue out;

        if (tokens.empty())
        {
            if (type.isUnsizedArray())
                type.arrayLength = 0;
            return Result<DecodedValue>::ok(std::move(out));
        }

        const Token& first = *tokens.front();

        if (type.isClosure)
            return Result<DecodedValue>::err(
                token_error(ErrorCode::eTypeMismatch, first, "closure types cannot carry a default value"));

        if (type.base == BaseType::eStruct || type.base == BaseType::eVoid || type.base == BaseType::eUnknown)
            return Result<DecodedValue>::err(token_error(ErrorCode::eTypeMismatch,
                                                         first,
                                                         std::string("type '") + base_type_name(type.base) +
                                                             "' cannot carry a default value"));

        const size_t components = base_type_components(type.base);
        const size_t count      = tokens.size();

        size_t expected = components;
        if (type.arrayKind == ArrayKind::eFixed)
        {
            expected = components * type.arrayLength;
        }
        else if (type.arrayKind == ArrayKind::eUnsized)
        {
            if (count % components != 0)
                return Result<DecodedValue>::err(token_error(ErrorCode::eArityMismatch,
                                                             first,
                                                             "value count " + std::to_string(count) +
                                                                 " is not a multiple of " +
                                                                 std::to_string(components) + " for " +
                                                                 type_descriptor_name(type)));
            expected = count;
        }

        if (count != expected)
            return Result<DecodedValue>::err(token_error(ErrorCode::eArityMismatch,
                                                         first,
                                                         "expected " + std::to_string(expected) + " values for " +
                                                             type_descriptor_name(type) + ", got " +
                                                             std::to_string(count)));

        auto v = decode_scalars(type.base, tokens, pool);
        if (!v.isOk())
            return Result<DecodedValue>::err(v.error());

        if (type.isUnsizedArray())
            type.arrayLength = static_cast<uint32_t>(count / components);

        out.present = true;
        out.value   = std::move(v.value());
        return Result<DecodedValue>::ok(std::move(out));
    }
} // namespace osoquery
