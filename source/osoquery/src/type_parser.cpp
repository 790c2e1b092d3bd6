#include "osoquery/type_parser.hpp"
#include "osoquery/parser_utils.hpp"

#include <limits>

namespace osoquery
{
    static Result<void> parse_array_suffix(TokenCursor& cursor, TypeDescriptor& td)
    {
        const Token& open = cursor.next(); // '['
        const Token& len  = cursor.peek();

        if (len.isPunct(']'))
        {
            cursor.next();
            td.arrayKind   = ArrayKind::eUnsized;
            td.arrayLength = 0;
            return Result<void>::ok();
        }

        if (len.kind != TokenKind::eInteger)
            return Result<void>::err(token_error(
                ErrorCode::eInvalidArraySize, len.isTerminator() ? open : len,
                "array length must be a non-negative integer, got " + describe_token(len)));

        if (len.intValue < 0 || len.intValue > static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
            return Result<void>::err(token_error(
                ErrorCode::eInvalidArraySize, len, "invalid array length " + std::string(len.text)));

        td.arrayKind   = ArrayKind::eFixed;
        td.arrayLength = static_cast<uint32_t>(len.intValue);
        cursor.next();

        const Token& close = cursor.peek();
        if (!close.isPunct(']'))
            return Result<void>::err(token_error(ErrorCode::eInvalidArraySize,
                                                 close.isTerminator() ? len : close,
                                                 "expected ']' after array length, got " + describe_token(close)));
        cursor.next();
        return Result<void>::ok();
    }

    Result<TypeDescriptor> parse_type_descriptor(TokenCursor& cursor)
    {
        TypeDescriptor td;

        if (cursor.peek().isKeyword("closure"))
        {
            cursor.next();
            td.isClosure = true;
        }

        const Token& tok = cursor.peek();
        if (tok.isTerminator())
            return Result<TypeDescriptor>::err(
                token_error(ErrorCode::eUnexpectedEndOfInput, tok, "expected a type, got " + describe_token(tok)));

        if ((tok.kind != TokenKind::eKeyword && tok.kind != TokenKind::eIdentifier) ||
            !parse_base_type(tok.text, td.base))
            return Result<TypeDescriptor>::err(
                token_error(ErrorCode::eUnknownType, tok, "unknown type " + describe_token(tok)));
        cursor.next();

        if (!td.isClosure && cursor.peek().isKeyword("closure"))
        {
            cursor.next();
            td.isClosure = true;
        }

        if (cursor.peek().isPunct('['))
        {
            auto r = parse_array_suffix(cursor, td);
            if (!r.isOk())
                return Result<TypeDescriptor>::err(r.error());
        }

        return Result<TypeDescriptor>::ok(td);
    }
} // namespace osoquery
