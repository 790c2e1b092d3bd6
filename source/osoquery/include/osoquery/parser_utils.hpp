#pragma once

#include "osoquery/lexer.hpp"
#include "osoquery/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace osoquery
{
    // true/TRUE/True -> 1, false/FALSE/False -> 0
    bool parse_bool_value(std::string_view s, int32_t& out);

    // "1.12" -> (1, 12). Accepts an integer ("2" -> (2, 0)).
    bool parse_version_text(std::string_view s, int& major, int& minor);

    // Inverse of the lexer's string escapes, for printing values back.
    std::string escape_string(std::string_view s);

    // Builds an error located at the token's line.
    Error token_error(ErrorCode code, const Token& tok, const std::string& message);

    // Short description of a token for messages: `'foo'` or `end of line`.
    std::string describe_token(const Token& tok);
} // namespace osoquery
