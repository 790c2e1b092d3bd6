#pragma once

#include "osoquery/lexer.hpp"
#include "osoquery/result.hpp"
#include "osoquery/types.hpp"

namespace osoquery
{
    // Parses a declared type at the cursor:
    //
    //   type := [ 'closure' ] BASE [ 'closure' ] [ '[' [ INTEGER ] ']' ]
    //
    // BASE is one of the base type keywords. `[]` yields an unsized array,
    // `[N]` a fixed one (N >= 0).
    //
    // Errors: eUnknownType, eInvalidArraySize, eUnexpectedEndOfInput.
    Result<TypeDescriptor> parse_type_descriptor(TokenCursor& cursor);
} // namespace osoquery
