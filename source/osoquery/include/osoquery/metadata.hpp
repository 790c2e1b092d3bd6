#pragma once

#include "osoquery/lexer.hpp"
#include "osoquery/result.hpp"
#include "osoquery/string_pool.hpp"
#include "osoquery/types.hpp"

#include <vector>

namespace osoquery
{
    // ------------------------------------------------------------
    // Hint decoding
    //
    // Decodes one '%' hint at the cursor. Accepted forms:
    //
    //   %<type> <key> <value>...        metadata, values up to the next '%'
    //   %meta{<type>,<key>,<value>...}  metadata, values may be wrapped in { }
    //   %space{"name"}                  coordinate / color space of the parameter
    //   %struct{"name"}                 struct type name
    //   %structfields{a,b,...}          struct field names
    //   %default{v}, %default{[a,b]}    parameter default, replaces the literal one
    //   %initexpr                       default is computed by code, literal dropped
    //   %derivs, %<name>{...}           bytecode hints, skipped
    //
    // Metadata entries are appended to `metadata` in encountered order;
    // duplicate keys are kept. The value count of a metadata entry is its
    // arity and must be a non-zero multiple of the type's component count.
    // The stored type is always scalar: an array length written in %meta{}
    // is only checked against the value count, so arity is value.size()
    // divided by base_type_components().
    //
    // %default{} values follow decode_value() rules for the parameter's type;
    // on an output parameter it is eUnexpectedDeclaration.
    //
    // `parameter` is null for hints on the shader line; parameter-only hints
    // are then ignored.
    //
    // Errors: eUnknownType, eTypeMismatch, eArityMismatch,
    // eUnexpectedEndOfInput, eUnexpectedDeclaration (malformed %meta{} or
    // %default{} on an output).
    // ------------------------------------------------------------
    Result<void> decode_hint(TokenCursor&           cursor,
                             StringPool&            pool,
                             std::vector<Metadata>& metadata,
                             Parameter*             parameter);

    // Linear search in declaration order; returns the first match or nullptr.
    const Metadata* find_metadata(const std::vector<Metadata>& metadata, StringId key);
} // namespace osoquery
