#include "osoquery/parser_utils.hpp"

#include <cstdio>

namespace osoquery
{
    bool parse_bool_value(std::string_view s, int32_t& out)
    {
        if (s == "true" || s == "TRUE" || s == "True")
        {
            out = 1;
            return true;
        }
        if (s == "false" || s == "FALSE" || s == "False")
        {
            out = 0;
            return true;
        }
        return false;
    }

    bool parse_version_text(std::string_view s, int& major, int& minor)
    {
        auto parse_digits = [](std::string_view d, int& out) {
            if (d.empty() || d.size() > 6)
                return false;
            int v = 0;
            for (char c : d)
            {
                if (c < '0' || c > '9')
                    return false;
                v = v * 10 + (c - '0');
            }
            out = v;
            return true;
        };

        const auto dot = s.find('.');
        if (dot == std::string_view::npos)
        {
            minor = 0;
            return parse_digits(s, major);
        }
        return parse_digits(s.substr(0, dot), major) && parse_digits(s.substr(dot + 1), minor);
    }

    std::string escape_string(std::string_view s)
    {
        std::string out;
        out.reserve(s.size());
        for (char c : s)
        {
            switch (c)
            {
                case '\\':
                    out += "\\\\";
                    break;
                case '"':
                    out += "\\\"";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20)
                    {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        out += buf;
                    }
                    else
                    {
                        out.push_back(c);
                    }
                    break;
            }
        }
        return out;
    }

    Error token_error(ErrorCode code, const Token& tok, const std::string& message)
    {
        return {code, message, tok.line};
    }

    std::string describe_token(const Token& tok)
    {
        if (tok.isTerminator())
            return token_kind_name(tok.kind);
        return "'" + std::string(tok.text) + "'";
    }
} // namespace osoquery
