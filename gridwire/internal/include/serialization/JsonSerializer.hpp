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

// gridwire/internal/include/serialization/JsonSerializer.hpp
#pragma once

#include "serialization/DefaultSerializers.hpp"

#include <nlohmann/json.hpp>

namespace gridwire::serialization {
    /**
     * Converts a value to its JSON form.
     *
     * Numbers become JSON numbers, buffers become {"type":"Buffer","data":[...]},
     * date/time and decimal kinds become strings, user objects contribute
     * UserObject::plain_form() and JsonValue text is embedded as parsed JSON.
     * Absent members of an Object are skipped.
     *
     * @throws SerializationException for kinds with no JSON form (Data, GenericRecord)
     */
    [[nodiscard]] nlohmann::json to_json(const Value& value);

    /**
     * Converts parsed JSON back to a value. Every JSON number becomes a Number.
     */
    [[nodiscard]] Value from_json(const nlohmann::json& doc);

    /**
     * JSON text of a value; JsonValue text is returned verbatim.
     */
    [[nodiscard]] std::string to_json_text(const Value& value);

    /**
     * Fallback serializer: JSON text written as a string, parsed on read.
     */
    class JsonSerializer final : public DefaultSerializer<SerializationConstants::JSON_SERIALIZATION_TYPE> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    /**
     * Fallback serializer returning JsonValue text instead of parsing it.
     */
    class JsonValueSerializer final : public DefaultSerializer<SerializationConstants::JSON_SERIALIZATION_TYPE> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };
} // namespace gridwire::serialization
