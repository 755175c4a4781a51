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

// gridwire/gridwire/include/gridwire/SerializationService.hpp
#pragma once

#include "gridwire/Data.hpp"
#include "gridwire/Export.hpp"
#include "gridwire/ObjectData.hpp"
#include "gridwire/SerializationConfig.hpp"
#include "gridwire/SerializerRegistry.hpp"
#include "gridwire/Value.hpp"
#include "gridwire/compact/Schema.hpp"
#include "gridwire/compact/SchemaService.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <typeindex>

/**
 * GridWire Public API
 *
 * Converts runtime values to cluster wire envelopes and back.
 */
namespace gridwire {
    /**
     * SerializationService - Serializer registry plus envelope codec.
     *
     * Envelope layout (byte order from SerializationConfig::is_big_endian):
     * ```
     * [partition_hash:i32][type_id:i32][payload...]
     * ```
     *
     * The registry is built once in the constructor and never changes
     * afterwards, so to_data / to_object may be called concurrently. The
     * only mutable collaborator is the SchemaService, which is internally
     * synchronized.
     *
     * Typical usage:
     * ```cpp
     * SerializationConfig cfg;
     * cfg.data_serializable_factories.emplace(1, &make_employee);
     *
     * SerializationService service{cfg};
     * Data data = service.to_data(Value::string("hello"));
     * Value back = service.to_object(data);
     * ```
     */
    class GRIDWIRE_API SerializationService {
    public:
        /**
         * Maps a value (or the serialized partition key) to a partition hash.
         */
        using PartitioningStrategy = std::function<int32_t(const Value&)>;

        /**
         * Hook that may register extra serializers before the registry is sealed.
         */
        using RegistryExtension = std::function<void(SerializerRegistry::Builder&)>;

        /**
         * Builds the registry.
         *
         * @param config Serialization options (copied)
         * @param schema_service Compact schema catalog; a private one is created when null
         * @param extension Optional registration hook, run last
         * @throws std::invalid_argument if config fails validation
         * @throws DuplicateNameError / DuplicateIdError on conflicting registrations
         */
        explicit SerializationService(
            SerializationConfig config,
            std::shared_ptr<compact::SchemaService> schema_service = nullptr,
            const RegistryExtension& extension = {}
        );

        ~SerializationService() noexcept;

        // Non-copyable, movable
        SerializationService(const SerializationService&) = delete;
        SerializationService& operator=(const SerializationService&) = delete;
        SerializationService(SerializationService&&) noexcept;
        SerializationService& operator=(SerializationService&&) noexcept;

        // ==================== Envelopes ====================

        /**
         * Serializes a value into an envelope.
         *
         * A Data value is returned unchanged. When the value carries a
         * partition key (UserObject::partition_key() or an Object member
         * "partitionKey"), the key is serialized first and the strategy is
         * applied to the key's envelope.
         *
         * @param value Value to serialize
         * @param strategy Partitioning strategy; default_partitioning_strategy when empty
         * @return Immutable envelope
         * @throws UnserializableError for the absent value
         * @throws NoSerializerFoundError if no serializer matches
         * @throws PartitionKeyDepthError if partition keys nest too deeply
         * @throws SerializationException if the serializer rejects the value
         */
        [[nodiscard]] Data to_data(const Value& value, const PartitioningStrategy& strategy = {}) const;

        /**
         * Deserializes a Data value; any other value is returned unchanged.
         */
        [[nodiscard]] Value to_object(const Value& value) const;

        /**
         * Deserializes an envelope.
         *
         * @throws NoDeserializerFoundError if the type id is unknown
         * @throws SerializationException / std::out_of_range on malformed payloads
         */
        [[nodiscard]] Value to_object(const Data& data) const;

        // ==================== Nested values ====================

        /**
         * Writes [type_id:i32][payload] for a value nested in another payload.
         */
        void write_object(ObjectDataOutput& out, const Value& value) const;

        /**
         * Reads a value written by write_object.
         *
         * @throws NoDeserializerFoundError if the type id is unknown
         */
        [[nodiscard]] Value read_object(ObjectDataInput& in) const;

        // ==================== Compact ====================

        /**
         * Pins the schema instances of type must serialize with and publishes it.
         */
        void register_schema_to_class(std::shared_ptr<const compact::Schema> schema, std::type_index type);

        // ==================== Introspection ====================

        [[nodiscard]] static bool is_data(const Value& value) noexcept { return value.kind() == ValueKind::Data; }

        /**
         * Serializer the resolver selects for value.
         *
         * @throws UnserializableError / NoSerializerFoundError like to_data
         */
        [[nodiscard]] const Serializer& find_serializer_for(const Value& value) const;

        [[nodiscard]] const SerializerRegistry& registry() const noexcept;

        [[nodiscard]] const SerializationConfig& config() const noexcept;

        [[nodiscard]] const std::shared_ptr<compact::SchemaService>& schema_service() const noexcept;

        [[nodiscard]] common::ByteOrder byte_order() const noexcept;

        /**
         * Data -> its partition hash; user object with a partition hash -> that
         * hash; anything else -> 0.
         */
        [[nodiscard]] static int32_t default_partitioning_strategy(const Value& value);

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
} // namespace gridwire
