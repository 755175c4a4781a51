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

// gridwire/internal/include/serialization/SerializationConstants.hpp
#pragma once

#include <cstdint>

namespace gridwire::serialization {
    /**
     * Well-known type ids shared with every cluster member.
     */
    struct SerializationConstants {
        static constexpr int32_t CONSTANT_TYPE_NULL = 0;
        static constexpr int32_t CONSTANT_TYPE_PORTABLE = -1;
        static constexpr int32_t CONSTANT_TYPE_DATA_SERIALIZABLE = -2;
        static constexpr int32_t CONSTANT_TYPE_BYTE = -3;
        static constexpr int32_t CONSTANT_TYPE_BOOLEAN = -4;
        static constexpr int32_t CONSTANT_TYPE_CHAR = -5;
        static constexpr int32_t CONSTANT_TYPE_SHORT = -6;
        static constexpr int32_t CONSTANT_TYPE_INTEGER = -7;
        static constexpr int32_t CONSTANT_TYPE_LONG = -8;
        static constexpr int32_t CONSTANT_TYPE_FLOAT = -9;
        static constexpr int32_t CONSTANT_TYPE_DOUBLE = -10;
        static constexpr int32_t CONSTANT_TYPE_STRING = -11;
        static constexpr int32_t CONSTANT_TYPE_BYTE_ARRAY = -12;
        static constexpr int32_t CONSTANT_TYPE_BOOLEAN_ARRAY = -13;
        static constexpr int32_t CONSTANT_TYPE_CHAR_ARRAY = -14;
        static constexpr int32_t CONSTANT_TYPE_SHORT_ARRAY = -15;
        static constexpr int32_t CONSTANT_TYPE_INTEGER_ARRAY = -16;
        static constexpr int32_t CONSTANT_TYPE_LONG_ARRAY = -17;
        static constexpr int32_t CONSTANT_TYPE_FLOAT_ARRAY = -18;
        static constexpr int32_t CONSTANT_TYPE_DOUBLE_ARRAY = -19;
        static constexpr int32_t CONSTANT_TYPE_STRING_ARRAY = -20;
        static constexpr int32_t CONSTANT_TYPE_UUID = -21;

        static constexpr int32_t JAVA_DEFAULT_TYPE_CLASS = -24;
        static constexpr int32_t JAVA_DEFAULT_TYPE_DATE = -25;
        static constexpr int32_t JAVA_DEFAULT_TYPE_BIG_INTEGER = -26;
        static constexpr int32_t JAVA_DEFAULT_TYPE_BIG_DECIMAL = -27;
        static constexpr int32_t JAVA_DEFAULT_TYPE_ARRAY = -28;
        static constexpr int32_t JAVA_DEFAULT_TYPE_ARRAY_LIST = -29;
        static constexpr int32_t JAVA_DEFAULT_TYPE_LINKED_LIST = -30;
        static constexpr int32_t JAVA_DEFAULT_TYPE_LOCAL_DATE = -51;
        static constexpr int32_t JAVA_DEFAULT_TYPE_LOCAL_TIME = -52;
        static constexpr int32_t JAVA_DEFAULT_TYPE_LOCAL_DATE_TIME = -53;
        static constexpr int32_t JAVA_DEFAULT_TYPE_OFFSET_DATE_TIME = -54;
        static constexpr int32_t TYPE_COMPACT = -55;

        static constexpr int32_t JSON_SERIALIZATION_TYPE = -130;
    };
} // namespace gridwire::serialization
