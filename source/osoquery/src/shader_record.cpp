#include "osoquery/shader_record.hpp"

namespace osoquery
{
    namespace
    {
        struct PoolPair
        {
            const StringPool* a;
            const StringPool* b;

            bool same(StringId x, StringId y) const
            {
                if (x == kInvalidStringId || y == kInvalidStringId)
                    return x == y;
                return a->view(x) == b->view(y);
            }

            bool same(const std::vector<StringId>& x, const std::vector<StringId>& y) const
            {
                if (x.size() != y.size())
                    return false;
                for (size_t i = 0; i < x.size(); ++i)
                {
                    if (!same(x[i], y[i]))
                        return false;
                }
                return true;
            }

            bool same(const ParameterValue& x, const ParameterValue& y) const
            {
                return x.kind == y.kind && x.ints == y.ints && x.floats == y.floats && same(x.strings, y.strings);
            }

            bool same(const std::vector<Metadata>& x, const std::vector<Metadata>& y) const
            {
                if (x.size() != y.size())
                    return false;
                for (size_t i = 0; i < x.size(); ++i)
                {
                    if (!same(x[i].key, y[i].key) || x[i].type != y[i].type || !same(x[i].value, y[i].value))
                        return false;
                }
                return true;
            }

            bool same(const Parameter& x, const Parameter& y) const
            {
                return same(x.name, y.name) && x.type == y.type && x.direction == y.direction &&
                       x.hasDefault == y.hasDefault && same(x.defaultValue, y.defaultValue) &&
                       same(x.metadata, y.metadata) && same(x.space, y.space) && same(x.structName, y.structName) &&
                       same(x.structFields, y.structFields) && x.hasInitExpr == y.hasInitExpr;
            }
        };

        const Metadata* find_by_text(const std::vector<Metadata>& metadata, const StringPool& pool, std::string_view key)
        {
            const StringId id = pool.find(key);
            if (id == kInvalidStringId)
                return nullptr;
            for (const auto& m : metadata)
            {
                if (m.key == id)
                    return &m;
            }
            return nullptr;
        }
    } // namespace

    const Parameter* ShaderRecord::findParameter(std::string_view name) const
    {
        if (!m_Pool)
            return nullptr;

        const StringId id = m_Pool->find(name);
        if (id == kInvalidStringId)
            return nullptr;

        auto it = m_ParamIndex.find(id);
        if (it == m_ParamIndex.end())
            return nullptr;
        return &m_Parameters[it->second];
    }

    Result<const Parameter*> ShaderRecord::parameterAt(size_t index) const
    {
        if (index >= m_Parameters.size())
            return Result<const Parameter*>::err({ErrorCode::eIndexOutOfRange,
                                                  "parameter index " + std::to_string(index) + " out of range (count " +
                                                      std::to_string(m_Parameters.size()) + ")",
                                                  0});
        return Result<const Parameter*>::ok(&m_Parameters[index]);
    }

    std::vector<const Parameter*> ShaderRecord::inputParameters() const
    {
        std::vector<const Parameter*> out;
        for (const auto& p : m_Parameters)
        {
            if (!p.isOutput())
                out.push_back(&p);
        }
        return out;
    }

    std::vector<const Parameter*> ShaderRecord::outputParameters() const
    {
        std::vector<const Parameter*> out;
        for (const auto& p : m_Parameters)
        {
            if (p.isOutput())
                out.push_back(&p);
        }
        return out;
    }

    const Metadata* ShaderRecord::findMetadata(std::string_view key) const
    {
        if (!m_Pool)
            return nullptr;
        return find_by_text(m_Metadata, *m_Pool, key);
    }

    const Metadata* ShaderRecord::findMetadata(const Parameter& param, std::string_view key) const
    {
        if (!m_Pool)
            return nullptr;
        return find_by_text(param.metadata, *m_Pool, key);
    }

    std::string_view ShaderRecord::text(StringId id) const
    {
        if (!m_Pool)
            return {};
        return m_Pool->view(id);
    }

    bool ShaderRecord::operator==(const ShaderRecord& o) const
    {
        if (!m_Pool || !o.m_Pool)
            return m_Pool == o.m_Pool && m_Parameters.empty() && o.m_Parameters.empty();

        const PoolPair pp {m_Pool.get(), o.m_Pool.get()};

        if (!pp.same(m_Name, o.m_Name) || !pp.same(m_ShaderType, o.m_ShaderType))
            return false;
        if (m_HasVersion != o.m_HasVersion || m_VersionMajor != o.m_VersionMajor || m_VersionMinor != o.m_VersionMinor)
            return false;
        if (!pp.same(m_Metadata, o.m_Metadata))
            return false;
        if (m_Parameters.size() != o.m_Parameters.size())
            return false;

        for (size_t i = 0; i < m_Parameters.size(); ++i)
        {
            if (!pp.same(m_Parameters[i], o.m_Parameters[i]))
                return false;
        }
        return true;
    }

    // ------------------------------------------------------------
    // ShaderRecordBuilder
    // ------------------------------------------------------------

    ShaderRecordBuilder::ShaderRecordBuilder() : m_Pool(std::make_shared<StringPool>()) {}

    void ShaderRecordBuilder::setVersion(int major, int minor)
    {
        m_Record.m_HasVersion   = true;
        m_Record.m_VersionMajor = major;
        m_Record.m_VersionMinor = minor;
    }

    void ShaderRecordBuilder::setShader(StringId shaderType, StringId name)
    {
        m_Record.m_ShaderType = shaderType;
        m_Record.m_Name       = name;
    }

    Parameter* ShaderRecordBuilder::parameterAt(size_t index)
    {
        return (index < m_Record.m_Parameters.size()) ? &m_Record.m_Parameters[index] : nullptr;
    }

    bool ShaderRecordBuilder::addParameter(Parameter param)
    {
        const auto index = static_cast<uint32_t>(m_Record.m_Parameters.size());
        if (!m_Record.m_ParamIndex.emplace(param.name, index).second)
            return false;
        m_Record.m_Parameters.push_back(std::move(param));
        return true;
    }

    ShaderRecord ShaderRecordBuilder::build()
    {
        m_Record.m_Pool = m_Pool;
        return std::move(m_Record);
    }
} // namespace osoquery
