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

// gridwire/internal/include/serialization/RabinFingerprint.hpp
#pragma once

#include "gridwire/compact/Schema.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace gridwire::serialization {
    /**
     * RabinFingerprint - 64-bit Rabin fingerprint used for Compact schema ids.
     *
     * Integers are folded in little-endian byte order; strings as their
     * UTF-8 byte length followed by the bytes.
     */
    class RabinFingerprint {
    public:
        static constexpr uint64_t INIT = 0xc15d213aa4d7a795ULL;

        [[nodiscard]] static uint64_t fingerprint64(uint64_t fp, uint8_t b) noexcept;

        [[nodiscard]] static uint64_t fingerprint64(uint64_t fp, int32_t v) noexcept;

        [[nodiscard]] static uint64_t fingerprint64(uint64_t fp, std::string_view s) noexcept;

        /**
         * Schema id over type name, field count, and each field name and kind.
         */
        [[nodiscard]] static int64_t of(std::string_view type_name, std::span<const compact::FieldDescriptor> fields) noexcept;
    };
} // namespace gridwire::serialization
