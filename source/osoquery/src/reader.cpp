#include "osoquery/reader.hpp"
#include "osoquery/lexer.hpp"
#include "osoquery/metadata.hpp"
#include "osoquery/parser_utils.hpp"
#include "osoquery/type_parser.hpp"
#include "osoquery/value_decoder.hpp"

#include <filesystem>
#include <fstream>

namespace osoquery
{
    namespace
    {
        enum class ReaderState : uint8_t
        {
            eHeader = 0,
            eShader,
            eParameters
        };

        inline bool is_shader_type_word(const Token& t)
        {
            return t.isKeyword("shader") || t.isWord("surface") || t.isWord("displacement") || t.isWord("volume") ||
                   t.isWord("light");
        }

        inline bool is_other_symbol_word(const Token& t)
        {
            return t.isWord("local") || t.isWord("temp") || t.isWord("global") || t.isWord("const");
        }

        inline bool is_name_token(const Token& t)
        {
            return t.kind == TokenKind::eString || t.kind == TokenKind::eIdentifier;
        }

        // Declaration keywords are legal parameter names; type keywords are not.
        inline bool is_parameter_name(const Token& t)
        {
            if (t.kind == TokenKind::eIdentifier)
                return true;
            BaseType base = BaseType::eUnknown;
            return t.kind == TokenKind::eKeyword && t.text != "closure" && !parse_base_type(t.text, base);
        }

        class OsoReader
        {
        public:
            Result<ShaderRecord> run(std::string_view source)
            {
                Lexer  lexer(source);
                size_t lastLine = 0;

                for (;;)
                {
                    auto lr = read_line(lexer);
                    if (!lr.isOk())
                        return Result<ShaderRecord>::err(lr.error());

                    TokenCursor& cursor = lr.value();
                    if (cursor.empty())
                        break;
                    lastLine = cursor.line();

                    const Token& first = cursor.peek();
                    if (first.kind == TokenKind::eIdentifier && first.text == "code")
                    {
                        if (m_State != ReaderState::eParameters)
                            return fail(ErrorCode::eUnexpectedDeclaration, first, "code section before shader declaration");
                        break;
                    }

                    auto r = handleLine(cursor);
                    if (!r.isOk())
                        return Result<ShaderRecord>::err(r.error());
                }

                if (m_State != ReaderState::eParameters)
                    return Result<ShaderRecord>::err(
                        {ErrorCode::eUnexpectedEndOfInput, "missing shader declaration", lastLine});

                return Result<ShaderRecord>::ok(m_Builder.build());
            }

        private:
            static Result<ShaderRecord> fail(ErrorCode code, const Token& tok, const std::string& message)
            {
                return Result<ShaderRecord>::err(token_error(code, tok, message));
            }

            static Result<void> failLine(ErrorCode code, const Token& tok, const std::string& message)
            {
                return Result<void>::err(token_error(code, tok, message));
            }

            Result<void> handleLine(TokenCursor& cursor)
            {
                const Token& first = cursor.peek();

                if (first.isWord("OpenShadingLanguage"))
                {
                    if (m_State != ReaderState::eHeader)
                        return failLine(
                            ErrorCode::eUnexpectedDeclaration, first, "version line must be the first declaration");
                    m_State = ReaderState::eShader;
                    return parseVersion(cursor);
                }

                if (m_State == ReaderState::eHeader)
                    m_State = ReaderState::eShader;

                if (first.isKeyword("param") || first.isKeyword("oparam"))
                {
                    if (m_State != ReaderState::eParameters)
                        return failLine(ErrorCode::eUnexpectedDeclaration,
                                        first,
                                        "'" + std::string(first.text) + "' before shader declaration");
                    return parseParameter(cursor);
                }

                if (first.isPunct('%'))
                {
                    if (m_State != ReaderState::eParameters)
                        return failLine(ErrorCode::eUnexpectedDeclaration, first, "hint before shader declaration");
                    return parseHintLine(cursor);
                }

                if (is_shader_type_word(first))
                {
                    if (m_State == ReaderState::eParameters)
                        return failLine(ErrorCode::eUnexpectedDeclaration, first, "second shader declaration");
                    return parseShader(cursor);
                }

                if (is_other_symbol_word(first) && m_State == ReaderState::eParameters)
                {
                    // locals, temps, globals and constants are not part of the signature
                    m_CurrentParam = kNoParam;
                    m_AfterSymbols = true;
                    return Result<void>::ok();
                }

                return failLine(ErrorCode::eUnexpectedDeclaration, first, "unexpected " + describe_token(first));
            }

            Result<void> parseVersion(TokenCursor& cursor)
            {
                const Token& marker = cursor.next();
                const Token& ver    = cursor.peek();

                int major = 0;
                int minor = 0;
                if ((ver.kind != TokenKind::eFloat && ver.kind != TokenKind::eInteger) ||
                    !parse_version_text(ver.text, major, minor))
                    return failLine(ErrorCode::eUnexpectedDeclaration,
                                    ver.isTerminator() ? marker : ver,
                                    "malformed version, got " + describe_token(ver));
                cursor.next();

                if (!cursor.atEnd())
                    return failLine(
                        ErrorCode::eUnexpectedDeclaration, cursor.peek(), "unexpected " + describe_token(cursor.peek()));

                m_Builder.setVersion(major, minor);
                return Result<void>::ok();
            }

            Result<void> parseShader(TokenCursor& cursor)
            {
                const Token& head = cursor.next();

                std::string_view shaderType = head.text;

                // "shader surface name" spells the type after the keyword;
                // "shader name" is a generic shader.
                if (head.isKeyword("shader") && (cursor.peek().kind == TokenKind::eIdentifier) &&
                    is_name_token(cursor.peek(1)))
                    shaderType = cursor.next().text;

                const Token& nameTok = cursor.peek();
                if (nameTok.isTerminator())
                    return failLine(ErrorCode::eUnexpectedEndOfInput, head, "shader declaration is missing its name");
                if (!is_name_token(nameTok))
                    return failLine(
                        ErrorCode::eUnexpectedDeclaration, nameTok, "expected shader name, got " + describe_token(nameTok));
                cursor.next();

                StringPool& pool = m_Builder.pool();
                const auto  name = (nameTok.kind == TokenKind::eString) ? pool.intern(nameTok.value)
                                                                       : pool.intern(nameTok.text);
                m_Builder.setShader(pool.intern(shaderType), name);

                while (!cursor.atEnd())
                {
                    if (!cursor.peek().isPunct('%'))
                        return failLine(ErrorCode::eUnexpectedDeclaration,
                                        cursor.peek(),
                                        "unexpected " + describe_token(cursor.peek()) + " in shader declaration");

                    auto r = decode_hint(cursor, pool, m_Builder.shaderMetadata(), nullptr);
                    if (!r.isOk())
                        return r;
                }

                m_State = ReaderState::eParameters;
                return Result<void>::ok();
            }

            Result<void> parseParameter(TokenCursor& cursor)
            {
                const Token& kw = cursor.next();

                Parameter param;
                param.direction = kw.isKeyword("oparam") ? Direction::eOutput : Direction::eInput;

                auto td = parse_type_descriptor(cursor);
                if (!td.isOk())
                    return Result<void>::err(td.error());
                param.type = td.value();

                const Token& nameTok = cursor.peek();
                if (nameTok.isTerminator())
                    return failLine(ErrorCode::eUnexpectedEndOfInput, kw, "parameter declaration is missing its name");
                if (!is_parameter_name(nameTok))
                    return failLine(ErrorCode::eUnexpectedDeclaration,
                                    nameTok,
                                    "expected parameter name, got " + describe_token(nameTok));
                cursor.next();

                StringPool& pool = m_Builder.pool();
                param.name       = pool.intern(nameTok.text);

                if (param.isOutput())
                {
                    if (!cursor.atEnd() && !cursor.peek().isPunct('%'))
                        return failLine(ErrorCode::eUnexpectedDeclaration,
                                        cursor.peek(),
                                        "output parameter '" + std::string(nameTok.text) +
                                            "' cannot have a default value");
                }
                else
                {
                    auto dv = decode_value(param.type, cursor, pool);
                    if (!dv.isOk())
                        return Result<void>::err(dv.error());
                    param.hasDefault   = dv.value().present;
                    param.defaultValue = std::move(dv.value().value);
                }

                while (!cursor.atEnd())
                {
                    auto r = decode_hint(cursor, pool, param.metadata, &param);
                    if (!r.isOk())
                        return r;
                }

                // the literal is a placeholder when init ops compute the default
                if (param.hasInitExpr && param.hasDefault)
                {
                    param.hasDefault   = false;
                    param.defaultValue = ParameterValue {};
                    if (param.type.isUnsizedArray())
                        param.type.arrayLength = 0;
                }

                if (!m_Builder.addParameter(std::move(param)))
                    return failLine(ErrorCode::eDuplicateParameterName,
                                    nameTok,
                                    "duplicate parameter name '" + std::string(nameTok.text) + "'");

                m_CurrentParam = m_Builder.parameterCount() - 1;
                return Result<void>::ok();
            }

            // A line holding only hints continues the previous declaration.
            Result<void> parseHintLine(TokenCursor& cursor)
            {
                StringPool& pool = m_Builder.pool();

                Parameter* param = (m_CurrentParam != kNoParam) ? m_Builder.parameterAt(m_CurrentParam) : nullptr;

                std::vector<Metadata>  discarded;
                std::vector<Metadata>* target = &discarded;
                if (param != nullptr)
                    target = &param->metadata;
                else if (!m_AfterSymbols && m_Builder.parameterCount() == 0)
                    target = &m_Builder.shaderMetadata();

                while (!cursor.atEnd())
                {
                    auto r = decode_hint(cursor, pool, *target, param);
                    if (!r.isOk())
                        return r;
                }

                if (param != nullptr && param->hasInitExpr && param->hasDefault)
                {
                    param->hasDefault   = false;
                    param->defaultValue = ParameterValue {};
                    if (param->type.isUnsizedArray())
                        param->type.arrayLength = 0;
                }
                return Result<void>::ok();
            }

            static constexpr size_t kNoParam = static_cast<size_t>(-1);

            ShaderRecordBuilder m_Builder;
            ReaderState         m_State        = ReaderState::eHeader;
            size_t              m_CurrentParam = kNoParam;
            bool                m_AfterSymbols = false;
        };
    } // namespace

    Result<ShaderRecord> parse_oso(std::string_view source)
    {
        OsoReader reader;
        return reader.run(source);
    }

    Result<ShaderRecord> load_oso_file(const std::string& filePath)
    {
        if (filePath.empty())
            return Result<ShaderRecord>::err({ErrorCode::eInvalidArgument, "empty oso file path", 0});

        std::error_code ec;
        if (!std::filesystem::is_regular_file(filePath, ec))
            return Result<ShaderRecord>::err({ErrorCode::eIO, "Not a regular file: " + filePath, 0});

        std::ifstream f(filePath, std::ios::binary);
        if (!f)
            return Result<ShaderRecord>::err({ErrorCode::eIO, "Failed to open oso file: " + filePath, 0});

        f.seekg(0, std::ios::end);
        const std::streamoff end = f.tellg();
        if (end < 0)
            return Result<ShaderRecord>::err({ErrorCode::eIO, "Failed to read oso file: " + filePath, 0});
        const auto size = static_cast<size_t>(end);
        f.seekg(0, std::ios::beg);

        std::string text;
        text.resize(size);
        f.read(text.data(), static_cast<std::streamsize>(size));
        if (!f)
            return Result<ShaderRecord>::err({ErrorCode::eIO, "Failed to read oso file: " + filePath, 0});

        return parse_oso(text);
    }
} // namespace osoquery
