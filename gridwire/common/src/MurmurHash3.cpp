#include <gridwire/common/MurmurHash3.h>
#include <bit>

namespace gridwire::common {

namespace {

constexpr uint32_t C1 = 0xcc9e2d51;
constexpr uint32_t C2 = 0x1b873593;

inline uint32_t read_le_u32(const uint8_t* p) noexcept {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline uint32_t mix_k1(uint32_t k1) noexcept {
    k1 *= C1;
    k1 = std::rotl(k1, 15);
    k1 *= C2;
    return k1;
}

inline uint32_t fmix32(uint32_t h) noexcept {
    h ^= h >> 16;
    h *= 0x85ebca6b;
    h ^= h >> 13;
    h *= 0xc2b2ae35;
    h ^= h >> 16;
    return h;
}

} // anonymous namespace

int32_t MurmurHash3::x86_32(const std::span<const uint8_t> data, const uint32_t seed) noexcept {
    const uint8_t* ptr = data.data();
    const size_t len = data.size();
    const size_t block_bytes = len & ~static_cast<size_t>(3);

    uint32_t h1 = seed;

    // Body: 4-byte blocks
    for (size_t i = 0; i < block_bytes; i += 4) {
        h1 ^= mix_k1(read_le_u32(ptr + i));
        h1 = std::rotl(h1, 13);
        h1 = h1 * 5 + 0xe6546b64;
    }

    // Tail
    const uint8_t* tail = ptr + block_bytes;
    uint32_t k1 = 0;
    switch (len & 3) {
        case 3: k1 ^= static_cast<uint32_t>(tail[2]) << 16; [[fallthrough]];
        case 2: k1 ^= static_cast<uint32_t>(tail[1]) << 8;  [[fallthrough]];
        case 1:
            k1 ^= static_cast<uint32_t>(tail[0]);
            h1 ^= mix_k1(k1);
            break;
        default: break;
    }

    h1 ^= static_cast<uint32_t>(len);
    return static_cast<int32_t>(fmix32(h1));
}

} // namespace gridwire::common
