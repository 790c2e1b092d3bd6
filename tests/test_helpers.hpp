#pragma once

#include <osoquery/lexer.hpp>

#include <gtest/gtest.h>

#include <string_view>

namespace osoquery::test
{
    // Tokens of the first non-empty line of `text`. The tokens view into
    // `text`, so pass a string literal or keep the buffer alive.
    inline TokenCursor line_cursor(std::string_view text)
    {
        Lexer lexer(text);
        auto  r = read_line(lexer);
        EXPECT_TRUE(r.isOk()) << r.error().message;
        return r.value();
    }
} // namespace osoquery::test
