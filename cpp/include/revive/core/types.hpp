#pragma once

#include <cstdint>
#include <cstddef>

namespace revive::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Milliseconds since the Unix epoch.
    using TimestampMs = i64;

    // Default cap on files visited while indexing the destination tree.
    inline constexpr u64 kDefaultMaxIndexFiles = 200000;

} // namespace revive::core
