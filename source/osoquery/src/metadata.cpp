#include "osoquery/metadata.hpp"
#include "osoquery/parser_utils.hpp"
#include "osoquery/type_parser.hpp"
#include "osoquery/value_decoder.hpp"

namespace osoquery
{
    static inline bool is_word(const Token& t)
    {
        return t.kind == TokenKind::eIdentifier || t.kind == TokenKind::eKeyword;
    }

    static Result<Metadata> make_metadata(BaseType                         base,
                                          const Token&                     keyTok,
                                          const std::vector<const Token*>& values,
                                          StringPool&                      pool)
    {
        if (base == BaseType::eStruct || base == BaseType::eVoid || base == BaseType::eUnknown)
            return Result<Metadata>::err(token_error(ErrorCode::eTypeMismatch,
                                                     keyTok,
                                                     std::string("metadata of type '") + base_type_name(base) +
                                                         "' cannot carry a value"));

        const std::string key(keyTok.text);

        if (values.empty())
            return Result<Metadata>::err(
                token_error(ErrorCode::eArityMismatch, keyTok, "metadata '" + key + "' has no value"));

        const size_t components = base_type_components(base);
        if (values.size() % components != 0)
            return Result<Metadata>::err(token_error(ErrorCode::eArityMismatch,
                                                     keyTok,
                                                     "metadata '" + key + "' has " + std::to_string(values.size()) +
                                                         " values, not a multiple of " + std::to_string(components)));

        auto v = decode_scalars(base, values, pool);
        if (!v.isOk())
            return Result<Metadata>::err(v.error());

        Metadata m;
        m.key       = pool.intern(keyTok.text);
        m.type.base = base;
        m.value     = std::move(v.value());
        return Result<Metadata>::ok(std::move(m));
    }

    // %<type> <key> <value>...
    static Result<void> decode_inline_metadata(BaseType               base,
                                               TokenCursor&           cursor,
                                               StringPool&            pool,
                                               std::vector<Metadata>& metadata)
    {
        const Token& typeTok = cursor.next();

        const Token& keyTok = cursor.peek();
        if (keyTok.isTerminator() || keyTok.isPunct('%'))
            return Result<void>::err(token_error(ErrorCode::eUnexpectedEndOfInput,
                                                 typeTok,
                                                 "metadata hint is missing its key, got " + describe_token(keyTok)));
        if (!is_word(keyTok))
            return Result<void>::err(token_error(
                ErrorCode::eTypeMismatch, keyTok, "metadata key must be an identifier, got " + describe_token(keyTok)));
        cursor.next();

        std::vector<const Token*> values;
        while (!cursor.atEnd() && !cursor.peek().isPunct('%'))
            values.push_back(&cursor.next());

        auto m = make_metadata(base, keyTok, values, pool);
        if (!m.isOk())
            return Result<void>::err(m.error());

        metadata.push_back(std::move(m.value()));
        return Result<void>::ok();
    }

    // Body of %meta{<type>,<key>,<value>...}, braces already stripped.
    static Result<void> decode_meta_body(const Token&           hintTok,
                                         std::vector<Token>     body,
                                         StringPool&            pool,
                                         std::vector<Metadata>& metadata)
    {
        if (body.empty())
            return Result<void>::err(
                token_error(ErrorCode::eUnexpectedDeclaration, hintTok, "malformed %meta hint: empty body"));

        TokenCursor sub(std::move(body));

        auto malformed = [&](const std::string& what) {
            const Token& at = sub.peek().isTerminator() ? hintTok : sub.peek();
            return Result<void>::err(token_error(ErrorCode::eUnexpectedDeclaration, at, "malformed %meta hint: " + what));
        };

        auto td = parse_type_descriptor(sub);
        if (!td.isOk())
            return Result<void>::err(td.error());
        if (td.value().isClosure)
            return Result<void>::err(
                token_error(ErrorCode::eTypeMismatch, hintTok, "metadata cannot have a closure type"));

        if (!sub.peek().isPunct(','))
            return malformed("expected ',' after type");
        sub.next();

        if (!is_word(sub.peek()))
            return malformed("expected a key");
        const Token& keyTok = sub.next();

        if (!sub.peek().isPunct(','))
            return malformed("expected ',' after key");
        sub.next();

        bool braced = false;
        if (sub.peek().isPunct('{'))
        {
            braced = true;
            sub.next();
        }

        std::vector<const Token*> values;
        while (!sub.atEnd())
        {
            const Token& t = sub.peek();
            if (braced && t.isPunct('}'))
            {
                sub.next();
                braced = false;
                break;
            }
            sub.next();
            if (t.isPunct(','))
                continue;
            values.push_back(&t);
        }

        if (braced)
            return malformed("unterminated value list");
        if (!sub.atEnd())
            return malformed("unexpected " + describe_token(sub.peek()) + " after value list");

        if (td.value().arrayKind == ArrayKind::eFixed)
        {
            const size_t expected = base_type_components(td.value().base) * td.value().arrayLength;
            if (values.size() != expected)
                return Result<void>::err(token_error(ErrorCode::eArityMismatch,
                                                     keyTok,
                                                     "metadata '" + std::string(keyTok.text) + "' expects " +
                                                         std::to_string(expected) + " values, got " +
                                                         std::to_string(values.size())));
        }

        auto m = make_metadata(td.value().base, keyTok, values, pool);
        if (!m.isOk())
            return Result<void>::err(m.error());

        metadata.push_back(std::move(m.value()));
        return Result<void>::ok();
    }

    // Body of %default{v} or %default{[a,b,...]}; replaces any literal default.
    static Result<void> decode_default_body(const Token&       hintTok,
                                            std::vector<Token> body,
                                            StringPool&        pool,
                                            Parameter&         param)
    {
        if (param.isOutput())
            return Result<void>::err(token_error(
                ErrorCode::eUnexpectedDeclaration, hintTok, "output parameter cannot have a default value"));

        std::vector<Token> values;
        for (auto& t : body)
        {
            if (!t.isPunct('[') && !t.isPunct(']') && !t.isPunct(','))
                values.push_back(std::move(t));
        }
        if (values.empty())
            return Result<void>::ok();

        TypeDescriptor type = param.type;
        TokenCursor    sub(std::move(values));

        auto dv = decode_value(type, sub, pool);
        if (!dv.isOk())
            return Result<void>::err(dv.error());
        if (!sub.atEnd())
            return Result<void>::err(token_error(ErrorCode::eUnexpectedDeclaration,
                                                 sub.peek(),
                                                 "unexpected " + describe_token(sub.peek()) + " in %default hint"));

        param.type         = type;
        param.hasDefault   = dv.value().present;
        param.defaultValue = std::move(dv.value().value);
        return Result<void>::ok();
    }

    static StringId first_name(const std::vector<Token>& body, StringPool& pool)
    {
        for (const auto& t : body)
        {
            if (t.kind == TokenKind::eString)
                return pool.intern(t.value);
            if (is_word(t))
                return pool.intern(t.text);
        }
        return kInvalidStringId;
    }

    Result<void> decode_hint(TokenCursor&           cursor,
                             StringPool&            pool,
                             std::vector<Metadata>& metadata,
                             Parameter*             parameter)
    {
        const Token& pct = cursor.peek();
        if (!pct.isPunct('%'))
            return Result<void>::err(
                token_error(ErrorCode::eUnexpectedDeclaration, pct, "expected '%', got " + describe_token(pct)));
        cursor.next();

        const Token& word = cursor.peek();
        if (word.isTerminator())
            return Result<void>::err(
                token_error(ErrorCode::eUnexpectedEndOfInput, pct, "expected a hint after '%'"));
        if (!is_word(word))
            return Result<void>::err(
                token_error(ErrorCode::eUnknownType, word, "unknown metadata type " + describe_token(word)));

        // %name{...}
        if (cursor.peek(1).isPunct('{'))
        {
            cursor.next();
            cursor.next();

            std::vector<Token> body;
            int                depth = 1;
            while (!cursor.atEnd())
            {
                const Token& t = cursor.next();
                if (t.isPunct('{'))
                    ++depth;
                else if (t.isPunct('}') && --depth == 0)
                    break;
                body.push_back(t);
            }
            if (depth != 0)
                return Result<void>::err(token_error(ErrorCode::eUnexpectedEndOfInput,
                                                     word,
                                                     "unterminated '{' in %" + std::string(word.text) + " hint"));

            if (word.text == "meta")
                return decode_meta_body(word, std::move(body), pool, metadata);

            if (word.text == "default")
            {
                if (parameter == nullptr)
                    return Result<void>::ok();
                return decode_default_body(word, std::move(body), pool, *parameter);
            }

            if (parameter != nullptr)
            {
                if (word.text == "space")
                {
                    parameter->space = first_name(body, pool);
                }
                else if (word.text == "struct")
                {
                    parameter->structName = first_name(body, pool);
                }
                else if (word.text == "structfields")
                {
                    for (const auto& t : body)
                    {
                        if (is_word(t))
                            parameter->structFields.push_back(pool.intern(t.text));
                        else if (t.kind == TokenKind::eString)
                            parameter->structFields.push_back(pool.intern(t.value));
                    }
                }
            }
            // %read{}, %write{}, %argrw{} and friends describe bytecode
            return Result<void>::ok();
        }

        BaseType base = BaseType::eUnknown;
        if (word.kind == TokenKind::eKeyword && parse_base_type(word.text, base))
            return decode_inline_metadata(base, cursor, pool, metadata);

        if (word.text == "initexpr")
        {
            cursor.next();
            if (parameter != nullptr)
                parameter->hasInitExpr = true;
            return Result<void>::ok();
        }

        if (word.text == "derivs")
        {
            cursor.next();
            return Result<void>::ok();
        }

        return Result<void>::err(
            token_error(ErrorCode::eUnknownType, word, "unknown metadata type " + describe_token(word)));
    }

    const Metadata* find_metadata(const std::vector<Metadata>& metadata, StringId key)
    {
        for (const auto& m : metadata)
        {
            if (m.key == key)
                return &m;
        }
        return nullptr;
    }
} // namespace osoquery
