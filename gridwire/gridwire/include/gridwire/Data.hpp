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

// gridwire/gridwire/include/gridwire/Data.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/common/ByteBuffer.h"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace gridwire {
    /**
     * Data - Immutable serialized envelope.
     *
     * Layout (8-byte header, then payload):
     * ```
     * [partition_hash:i32][type_id:i32][payload...]
     * ```
     * Both header fields use the byte order of the SerializationService
     * that produced the envelope.
     *
     * Copies share the underlying bytes. An envelope holds no reference
     * to the service that created it.
     *
     * Thread-safety: Fully thread-safe (immutable).
     */
    class GRIDWIRE_API Data {
    public:
        static constexpr size_t PARTITION_HASH_OFFSET = 0;
        static constexpr size_t TYPE_OFFSET = 4;
        static constexpr size_t DATA_OFFSET = 8;
        static constexpr size_t HEAP_DATA_OVERHEAD = DATA_OFFSET;

        /**
         * Empty envelope (type id 0).
         */
        Data() = default;

        /**
         * Wraps serialized bytes.
         *
         * @param bytes Header + payload
         * @param order Byte order the header was written with
         * @throws std::invalid_argument if bytes is non-empty and shorter than the header
         */
        Data(std::vector<uint8_t> bytes, common::ByteOrder order);

        /**
         * Returns the serializer type id stored in the header, 0 for an empty envelope.
         */
        [[nodiscard]] int32_t type() const;

        /**
         * Returns the header partition hash, or hash_code() when the header carries none.
         */
        [[nodiscard]] int32_t partition_hash() const;

        /**
         * Checks whether the header carries a non-zero partition hash.
         */
        [[nodiscard]] bool has_partition_hash() const;

        /**
         * MurmurHash3 (x86, 32-bit) of the payload.
         */
        [[nodiscard]] int32_t hash_code() const;

        [[nodiscard]] size_t total_size() const noexcept { return bytes_ ? bytes_->size() : 0; }

        /**
         * Payload size (total size minus header).
         */
        [[nodiscard]] size_t data_size() const noexcept { return total_size() > DATA_OFFSET ? total_size() - DATA_OFFSET : 0; }

        [[nodiscard]] std::span<const uint8_t> to_bytes() const noexcept;

        [[nodiscard]] std::span<const uint8_t> payload() const noexcept;

        [[nodiscard]] common::ByteOrder order() const noexcept { return order_; }

        [[nodiscard]] bool operator==(const Data& other) const noexcept;

    private:
        std::shared_ptr<const std::vector<uint8_t>> bytes_;
        common::ByteOrder order_ = common::ByteOrder::BigEndian;
    };
} // namespace gridwire
