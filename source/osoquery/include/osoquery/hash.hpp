#pragma once

#include <xxhash.h>

#include <cstdint>
#include <string_view>

namespace osoquery
{
    inline uint64_t xxhash64(std::string_view s, uint64_t seed = 0) { return XXH64(s.data(), s.size(), seed); }
} // namespace osoquery
