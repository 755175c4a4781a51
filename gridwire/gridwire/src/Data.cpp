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

// gridwire/gridwire/src/Data.cpp
#include "gridwire/Data.hpp"
#include "gridwire/common/MurmurHash3.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace gridwire {
    Data::Data(std::vector<uint8_t> bytes, common::ByteOrder order) : order_{order} {
        if (!bytes.empty() && bytes.size() < HEAP_DATA_OVERHEAD) {
            throw std::invalid_argument(
                "Data should be either empty or contain at least " + std::to_string(HEAP_DATA_OVERHEAD) + " bytes"
            );
        }
        bytes_ = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    }

    int32_t Data::type() const {
        if (total_size() == 0) { return 0; }
        return static_cast<int32_t>(common::ByteBuffer::load<uint32_t>(bytes_->data() + TYPE_OFFSET, order_));
    }

    int32_t Data::partition_hash() const {
        if (has_partition_hash()) {
            return static_cast<int32_t>(common::ByteBuffer::load<uint32_t>(bytes_->data() + PARTITION_HASH_OFFSET, order_));
        }
        return hash_code();
    }

    bool Data::has_partition_hash() const {
        return total_size() >= HEAP_DATA_OVERHEAD
            && common::ByteBuffer::load<uint32_t>(bytes_->data() + PARTITION_HASH_OFFSET, order_) != 0;
    }

    int32_t Data::hash_code() const { return common::MurmurHash3::x86_32(payload()); }

    std::span<const uint8_t> Data::to_bytes() const noexcept {
        if (!bytes_) { return {}; }
        return {bytes_->data(), bytes_->size()};
    }

    std::span<const uint8_t> Data::payload() const noexcept {
        if (total_size() <= DATA_OFFSET) { return {}; }
        return to_bytes().subspan(DATA_OFFSET);
    }

    bool Data::operator==(const Data& other) const noexcept {
        const auto a = to_bytes();
        const auto b = other.to_bytes();
        return std::equal(a.begin(), a.end(), b.begin(), b.end());
    }
} // namespace gridwire
