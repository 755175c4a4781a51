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

// gridwire/internal/include/serialization/CompactStreamSerializer.hpp
#pragma once

#include "gridwire/compact/CompactSerializer.hpp"
#include "gridwire/compact/GenericRecord.hpp"
#include "gridwire/compact/SchemaService.hpp"
#include "serialization/DefaultSerializers.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>

namespace gridwire::serialization {
    /**
     * Serializer for Compact values: GenericRecords and user objects whose
     * type has a registered CompactSerializer.
     *
     * Payload:
     * ```
     * [schema_id:i64][fields in schema order]
     * ```
     * Fixed-size fields are written directly. String, ArrayOfInt32 and
     * ArrayOfString fields are preceded by a presence flag. A Compact field
     * is a presence flag followed by the nested payload.
     *
     * Every schema written is published to the SchemaService; reading a
     * payload whose schema is unknown fails.
     */
    class CompactStreamSerializer final : public DefaultSerializer<SerializationConstants::TYPE_COMPACT> {
    public:
        explicit CompactStreamSerializer(std::shared_ptr<compact::SchemaService> schemas);

        /**
         * Construction-time only.
         *
         * @throws SerializationException if the type or type name is already registered
         */
        void register_serializer(std::shared_ptr<const compact::CompactSerializerBase> serializer);

        [[nodiscard]] bool is_registered(std::type_index type) const noexcept { return by_type_.contains(type); }

        /**
         * GenericRecord, or a user object of a registered type.
         */
        [[nodiscard]] bool handles(const Value& value) const noexcept;

        /**
         * Pins the schema objects of a type must produce and publishes it.
         */
        void register_schema_to_class(std::shared_ptr<const compact::Schema> schema, std::type_index type);

        void write(ObjectDataOutput& out, const Value& value) const override;

        [[nodiscard]] Value read(ObjectDataInput& in) const override;

        /**
         * Runs the registered serializer of object's type into a GenericRecord.
         */
        [[nodiscard]] GenericRecordPtr to_record(const UserObject& object) const;

        /**
         * User object built by the serializer registered for the record's
         * type name, or the record itself when there is none.
         */
        [[nodiscard]] Value from_record(const GenericRecordPtr& record) const;

    private:
        void write_record(ObjectDataOutput& out, const compact::GenericRecord& record) const;
        [[nodiscard]] GenericRecordPtr read_record(ObjectDataInput& in) const;

        std::shared_ptr<compact::SchemaService> schemas_;
        std::unordered_map<std::type_index, std::shared_ptr<const compact::CompactSerializerBase>> by_type_;
        std::unordered_map<std::string, std::shared_ptr<const compact::CompactSerializerBase>> by_name_;

        mutable std::shared_mutex pinned_mutex_;
        std::unordered_map<std::type_index, std::shared_ptr<const compact::Schema>> pinned_;
    };
} // namespace gridwire::serialization
