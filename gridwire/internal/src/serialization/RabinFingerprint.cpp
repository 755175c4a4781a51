/*
 * GridWire
 * Copyright (C) 2025 Swift Storm Studio
 *
 * This file is part of GridWire.
 *
 * GridWire is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * GridWire is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with GridWire.  If not, see <https://www.gnu.org/licenses/>.
 */

// gridwire/internal/src/serialization/RabinFingerprint.cpp
#include "serialization/RabinFingerprint.hpp"

#include <array>

namespace gridwire::serialization {
    namespace {
        constexpr std::array<uint64_t, 256> make_table() noexcept {
            std::array<uint64_t, 256> table{};
            for (uint64_t i = 0; i < 256; ++i) {
                uint64_t fp = i;
                for (int j = 0; j < 8; ++j) { fp = (fp >> 1) ^ (RabinFingerprint::INIT & (0 - (fp & 1))); }
                table[i] = fp;
            }
            return table;
        }

        constexpr auto FP_TABLE = make_table();
    }

    uint64_t RabinFingerprint::fingerprint64(uint64_t fp, uint8_t b) noexcept { return (fp >> 8) ^ FP_TABLE[(fp ^ b) & 0xFF]; }

    uint64_t RabinFingerprint::fingerprint64(uint64_t fp, int32_t v) noexcept {
        const auto u = static_cast<uint32_t>(v);
        fp = fingerprint64(fp, static_cast<uint8_t>(u & 0xFF));
        fp = fingerprint64(fp, static_cast<uint8_t>((u >> 8) & 0xFF));
        fp = fingerprint64(fp, static_cast<uint8_t>((u >> 16) & 0xFF));
        fp = fingerprint64(fp, static_cast<uint8_t>((u >> 24) & 0xFF));
        return fp;
    }

    uint64_t RabinFingerprint::fingerprint64(uint64_t fp, std::string_view s) noexcept {
        fp = fingerprint64(fp, static_cast<int32_t>(s.size()));
        for (const char c : s) { fp = fingerprint64(fp, static_cast<uint8_t>(c)); }
        return fp;
    }

    int64_t RabinFingerprint::of(std::string_view type_name, std::span<const compact::FieldDescriptor> fields) noexcept {
        uint64_t fp = fingerprint64(INIT, type_name);
        fp = fingerprint64(fp, static_cast<int32_t>(fields.size()));
        for (const auto& field : fields) {
            fp = fingerprint64(fp, std::string_view{field.name});
            fp = fingerprint64(fp, static_cast<int32_t>(field.kind));
        }
        return static_cast<int64_t>(fp);
    }
} // namespace gridwire::serialization
