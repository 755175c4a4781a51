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

// gridwire/gridwire/include/gridwire/SerializationConfig.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/Serializer.hpp"
#include "gridwire/common/ByteBuffer.h"
#include "gridwire/compact/CompactSerializer.hpp"
#include "gridwire/portable/Portable.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string_view>
#include <vector>

namespace gridwire {
    /**
     * Serializer used for untyped numbers, empty arrays and number arrays.
     */
    enum class NumberType : uint8_t {
        Double,
        Short,
        Integer,
        Long,
        Float,
        Byte,
    };

    [[nodiscard]] GRIDWIRE_API const char* number_type_name(NumberType type) noexcept;

    /**
     * Parses "double", "short", "integer", "long", "float" or "byte".
     *
     * @throws std::invalid_argument for any other name
     */
    [[nodiscard]] GRIDWIRE_API NumberType parse_number_type(std::string_view name);

    /**
     * How JSON payloads are returned by to_object.
     */
    enum class JsonStringDeserializationPolicy : uint8_t {
        Eager,             ///< Parsed into Array/Object/... values
        NoDeserialization, ///< Returned as JsonValue text
    };

    struct CompactConfig {
        std::vector<std::shared_ptr<const compact::CompactSerializerBase>> serializers;
    };

    /**
     * SerializationConfig - Options consumed by SerializationService.
     *
     * Read once at construction; later changes have no effect on an
     * existing service.
     */
    struct GRIDWIRE_API SerializationConfig {
        NumberType default_number_type = NumberType::Double;
        bool is_big_endian = true;
        JsonStringDeserializationPolicy json_string_deserialization_policy = JsonStringDeserializationPolicy::Eager;

        // factory id -> factory; reserved built-in ids win over these
        std::map<int32_t, DataSerializableFactory> data_serializable_factories;

        std::map<int32_t, portable::PortableFactory> portable_factories;
        int32_t portable_version = 0;

        // registered as "!custom<id>"; ids must be >= 1
        std::vector<std::shared_ptr<const Serializer>> custom_serializers;

        CompactConfig compact;

        std::shared_ptr<const Serializer> global_serializer;

        // nested partition keys deeper than this fail with PartitionKeyDepthError
        size_t max_partition_key_depth = 8;

        // nested Portable, Compact or write_object payloads deeper than this fail to decode
        size_t max_nesting_depth = ObjectDataInput::DEFAULT_MAX_NESTING_DEPTH;

        [[nodiscard]] common::ByteOrder byte_order() const noexcept {
            return is_big_endian ? common::ByteOrder::BigEndian : common::ByteOrder::LittleEndian;
        }

        /**
         * Checks serializer ids and limits.
         *
         * Repeated custom ids are left to the registry, which reports them
         * as DuplicateNameError at service construction.
         *
         * @throws std::invalid_argument on a null serializer, a custom id < 1
         *         or a zero depth cap
         */
        void validate() const;

        /**
         * Reads scalar options from a JSON document:
         * ```json
         * {
         *   "defaultNumberType": "integer",
         *   "isBigEndian": false,
         *   "jsonStringDeserializationPolicy": "NO_DESERIALIZATION",
         *   "portableVersion": 1,
         *   "maxPartitionKeyDepth": 4,
         *   "maxNestingDepth": 32
         * }
         * ```
         * Absent keys keep their defaults; unknown keys are ignored with a warning.
         *
         * @throws std::invalid_argument on malformed JSON or invalid values
         */
        [[nodiscard]] static SerializationConfig from_json(std::string_view text);
    };
} // namespace gridwire
