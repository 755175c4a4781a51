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

// gridwire/internal/src/serialization/BigNumbers.cpp
#include "serialization/BigNumbers.hpp"

#include <iterator>

namespace gridwire::serialization {
    namespace {
        // Bytes needed so that bit (8*len - 1) is the sign bit.
        size_t twos_complement_length(const BigInt& value) {
            const BigInt magnitude = value < 0 ? BigInt{-value - 1} : value;
            if (magnitude == 0) { return 1; }
            return (boost::multiprecision::msb(magnitude) + 1) / 8 + 1;
        }
    }

    std::vector<uint8_t> to_twos_complement(const BigInt& value) {
        const size_t len = twos_complement_length(value);
        const BigInt unsigned_form = value < 0 ? BigInt{(BigInt{1} << (8 * len)) + value} : value;

        std::vector<uint8_t> out;
        boost::multiprecision::export_bits(unsigned_form, std::back_inserter(out), 8);
        if (out.size() < len) { out.insert(out.begin(), len - out.size(), 0); }
        return out;
    }

    BigInt from_twos_complement(std::span<const uint8_t> bytes) {
        if (bytes.empty()) { return 0; }

        BigInt result;
        boost::multiprecision::import_bits(result, bytes.begin(), bytes.end(), 8);
        if ((bytes[0] & 0x80) != 0) { result -= BigInt{1} << (8 * bytes.size()); }
        return result;
    }
} // namespace gridwire::serialization
