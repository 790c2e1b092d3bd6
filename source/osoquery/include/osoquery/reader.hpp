#pragma once

#include "osoquery/result.hpp"
#include "osoquery/shader_record.hpp"

#include <string>
#include <string_view>

namespace osoquery
{
    // ------------------------------------------------------------
    // .oso declaration reader
    //
    // Line forms, in order:
    //
    //   OpenShadingLanguage <major>.<minor>      optional, first line only
    //   shader <type> "<name>"                   or: shader <name>
    //   <type> <name>                            type: surface displacement volume light
    //   param  <type> <name> [<values>] [%hints]
    //   oparam <type> <name> [%hints]
    //   local|temp|global|const ...              skipped
    //   %<hint> ...                              attaches to the last parameter
    //   code ...                                 end of declarations, rest ignored
    //
    // Lines starting with '#' are comments. Parsing is fail-fast: the
    // first error is returned with its line and no partial record.
    //
    // Errors: eUnexpectedDeclaration, eDuplicateParameterName,
    // eUnexpectedEndOfInput and everything the lexer and decoders report.
    // ------------------------------------------------------------
    Result<ShaderRecord> parse_oso(std::string_view source);

    // Reads the whole file then parses it. eIO if the path is not a regular
    // file or cannot be read, eInvalidArgument for an empty path.
    Result<ShaderRecord> load_oso_file(const std::string& filePath);
} // namespace osoquery
