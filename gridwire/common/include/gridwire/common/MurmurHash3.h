#pragma once
#include <cstdint>
#include <span>

namespace gridwire::common
{
    /**
     * @brief MurmurHash3 x86 32-bit, as used by the cluster to route envelopes to partitions.
     *
     * Blocks are read little-endian regardless of host byte order so every
     * participant derives the same hash from the same payload bytes.
     */
    struct MurmurHash3
    {
        static constexpr uint32_t DEFAULT_SEED = 0x01000193;

        /**
         * @brief Hash a byte range.
         * @param data Input bytes.
         * @param seed Hash seed (DEFAULT_SEED for partition hashing).
         * @return Signed 32-bit hash, matching the cluster's int representation.
         */
        [[nodiscard]]
        static int32_t x86_32(std::span<const uint8_t> data, uint32_t seed = DEFAULT_SEED) noexcept;
    };
}
