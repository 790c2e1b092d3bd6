#pragma once

#include "osoquery/result.hpp"
#include "osoquery/string_pool.hpp"
#include "osoquery/types.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace osoquery
{
    // ------------------------------------------------------------
    // ShaderRecord
    //
    // Immutable result of parsing one .oso file. Copies share the
    // string pool of the parse, so copying is cheap and every StringId
    // held by a copy stays resolvable through text().
    //
    // Safe to read concurrently from any number of threads.
    // ------------------------------------------------------------
    class ShaderRecord
    {
    public:
        ShaderRecord() = default;

        std::string_view name() const { return text(m_Name); }
        std::string_view shaderType() const { return text(m_ShaderType); }

        // Informational, 0.0 when the file has no version line.
        bool hasVersion() const { return m_HasVersion; }
        int  versionMajor() const { return m_VersionMajor; }
        int  versionMinor() const { return m_VersionMinor; }

        size_t                        parameterCount() const { return m_Parameters.size(); }
        const std::vector<Parameter>& parameters() const { return m_Parameters; }

        // nullptr if no parameter has this name.
        const Parameter* findParameter(std::string_view name) const;

        // eIndexOutOfRange if index >= parameterCount().
        Result<const Parameter*> parameterAt(size_t index) const;

        std::vector<const Parameter*> inputParameters() const;
        std::vector<const Parameter*> outputParameters() const;

        // Shader-level metadata (hints on the shader declaration line).
        const std::vector<Metadata>& metadata() const { return m_Metadata; }
        const Metadata*              findMetadata(std::string_view key) const;

        // First metadata entry of `param` with this key, nullptr if none.
        const Metadata* findMetadata(const Parameter& param, std::string_view key) const;

        // Resolves a handle from this record; empty for kInvalidStringId.
        std::string_view text(StringId id) const;

        bool isValid() const { return m_Pool != nullptr && !name().empty() && !shaderType().empty(); }

        // Structural equality; string handles are compared by text, so
        // records from independent parses compare equal when their content does.
        bool operator==(const ShaderRecord& o) const;
        bool operator!=(const ShaderRecord& o) const { return !(*this == o); }

    private:
        friend class ShaderRecordBuilder;

        std::shared_ptr<const StringPool> m_Pool;

        StringId m_Name       = kInvalidStringId;
        StringId m_ShaderType = kInvalidStringId;

        bool m_HasVersion   = false;
        int  m_VersionMajor = 0;
        int  m_VersionMinor = 0;

        std::vector<Parameter>                 m_Parameters;
        std::unordered_map<StringId, uint32_t> m_ParamIndex;
        std::vector<Metadata>                  m_Metadata;
    };

    // Assembles a ShaderRecord during a single parse. Not part of the query surface.
    class ShaderRecordBuilder
    {
    public:
        ShaderRecordBuilder();

        StringPool& pool() { return *m_Pool; }

        void setVersion(int major, int minor);
        void setShader(StringId shaderType, StringId name);

        // Returns false, leaving the record unchanged, if the name is already taken.
        bool addParameter(Parameter param);

        size_t     parameterCount() const { return m_Record.m_Parameters.size(); }
        Parameter* parameterAt(size_t index);

        std::vector<Metadata>& shaderMetadata() { return m_Record.m_Metadata; }

        ShaderRecord build();

    private:
        std::shared_ptr<StringPool> m_Pool;
        ShaderRecord                m_Record;
    };
} // namespace osoquery
