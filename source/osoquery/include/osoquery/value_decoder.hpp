#pragma once

#include "osoquery/lexer.hpp"
#include "osoquery/result.hpp"
#include "osoquery/string_pool.hpp"
#include "osoquery/types.hpp"

#include <vector>

namespace osoquery
{
    struct DecodedValue
    {
        bool           present = false; // false: the line supplied no value tokens
        ParameterValue value;
    };

    // ------------------------------------------------------------
    // Type-directed default decoding.
    //
    // Consumes value tokens up to the next '%' or the end of the line.
    // The number of tokens must equal components * length for scalars
    // and fixed arrays; for unsized arrays it must be a multiple of the
    // component count and the resolved length is written back into
    // `type.arrayLength`.
    //
    // No tokens at all is not an error: the result has present == false.
    //
    // Errors: eArityMismatch, eTypeMismatch (including any value for
    // closure, struct or void types).
    // ------------------------------------------------------------
    Result<DecodedValue> decode_value(TypeDescriptor& type, TokenCursor& cursor, StringPool& pool);

    // Decodes already collected scalar tokens into the value kind of `base`.
    // Int takes integers and true/false spellings, Float takes floats and
    // integers, String takes quoted strings.
    Result<ParameterValue> decode_scalars(BaseType base, const std::vector<const Token*>& tokens, StringPool& pool);
} // namespace osoquery
