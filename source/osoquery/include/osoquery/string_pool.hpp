#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace osoquery
{
    // ------------------------------------------------------------
    // StringPool
    //
    // Per-parse interning arena. Every distinct string seen while
    // parsing (names, shader type, string defaults, metadata keys)
    // is stored once; the model refers to it by StringId.
    //
    // Lookup is keyed by xxHash64 of the text, collisions are
    // resolved by comparing the stored strings.
    // ------------------------------------------------------------

    using StringId = uint32_t;

    constexpr StringId kInvalidStringId = 0xFFFFFFFFu;

    class StringPool
    {
    public:
        StringId intern(std::string_view text);

        // Returns kInvalidStringId if the text was never interned.
        StringId find(std::string_view text) const;

        // Empty view for kInvalidStringId or an out of range id.
        std::string_view view(StringId id) const;

        size_t size() const { return m_Strings.size(); }

    private:
        // deque keeps element addresses stable, views stay valid while the pool lives
        std::deque<std::string>                     m_Strings;
        std::unordered_multimap<uint64_t, StringId> m_Index;
    };
} // namespace osoquery
