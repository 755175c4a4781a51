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

// gridwire/internal/include/serialization/BigNumbers.hpp
#pragma once

#include "gridwire/Value.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace gridwire::serialization {
    /**
     * Minimal big-endian two's complement form (java.math.BigInteger#toByteArray).
     */
    [[nodiscard]] std::vector<uint8_t> to_twos_complement(const BigInt& value);

    /**
     * Inverse of to_twos_complement. An empty span decodes to zero.
     */
    [[nodiscard]] BigInt from_twos_complement(std::span<const uint8_t> bytes);
} // namespace gridwire::serialization
