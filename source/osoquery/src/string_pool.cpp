#include "osoquery/string_pool.hpp"
#include "osoquery/hash.hpp"

namespace osoquery
{
    StringId StringPool::intern(std::string_view text)
    {
        const uint64_t h = xxhash64(text);

        auto range = m_Index.equal_range(h);
        for (auto it = range.first; it != range.second; ++it)
        {
            if (m_Strings[it->second] == text)
                return it->second;
        }

        const auto id = static_cast<StringId>(m_Strings.size());
        m_Strings.emplace_back(text);
        m_Index.emplace(h, id);
        return id;
    }

    StringId StringPool::find(std::string_view text) const
    {
        auto range = m_Index.equal_range(xxhash64(text));
        for (auto it = range.first; it != range.second; ++it)
        {
            if (m_Strings[it->second] == text)
                return it->second;
        }
        return kInvalidStringId;
    }

    std::string_view StringPool::view(StringId id) const
    {
        if (id >= m_Strings.size())
            return {};
        return m_Strings[id];
    }
} // namespace osoquery
