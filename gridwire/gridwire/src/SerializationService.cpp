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

// gridwire/gridwire/src/SerializationService.cpp
#include "gridwire/SerializationService.hpp"
#include "gridwire/core/Address.hpp"
#include "gridwire/core/ReliableTopicMessage.hpp"
#include "gridwire/core/RestValue.hpp"
#include "gridwire/query/Aggregators.hpp"
#include "gridwire/query/Predicates.hpp"
#include "serialization/CompactStreamSerializer.hpp"
#include "serialization/DefaultSerializers.hpp"
#include "serialization/IdentifiedDataSerializableSerializer.hpp"
#include "serialization/JsonSerializer.hpp"
#include "serialization/PortableSerializer.hpp"
#include "serialization/SerializerResolver.hpp"
#include "util/Logging.hpp"

namespace gridwire {
    namespace {
        SerializationConfig validated(SerializationConfig config) {
            config.validate();
            return config;
        }

        /**
         * User factories plus the built-in ones; built-in factory ids win.
         */
        std::map<int32_t, DataSerializableFactory> merge_factories(const std::map<int32_t, DataSerializableFactory>& user) {
            auto merged = user;
            const std::pair<int32_t, DataSerializableFactory> reserved[] = {
                {query::PREDICATE_FACTORY_ID, &query::predicate_factory},
                {core::RELIABLE_TOPIC_MESSAGE_FACTORY_ID, &core::reliable_topic_message_factory},
                {core::CLUSTER_DATA_FACTORY_ID, &core::cluster_data_factory},
                {query::AGGREGATOR_FACTORY_ID, &query::aggregator_factory},
                {core::REST_VALUE_FACTORY_ID, &core::rest_value_factory},
            };
            for (const auto& [id, factory] : reserved) {
                if (merged.contains(id)) {
                    util::logger()->warn("Data serializable factory id {} is reserved; the built-in factory replaces the configured one", id);
                }
                merged.insert_or_assign(id, factory);
            }
            return merged;
        }

        /**
         * Partition key carried by a value; absent when there is none.
         */
        Value partition_key_of(const Value& value) {
            if (const auto* object = value.get_if<UserObjectPtr>()) { return (*object)->partition_key(); }
            if (const auto* object = value.get_if<Object>()) {
                const auto it = object->find("partitionKey");
                if (it != object->end()) { return it->second; }
            }
            return {};
        }
    }

    class SerializationService::Impl {
    public:
        Impl(SerializationConfig config, std::shared_ptr<compact::SchemaService> schemas, const RegistryExtension& extension)
            : config_{validated(std::move(config))},
              schemas_{schemas ? std::move(schemas) : std::make_shared<compact::SchemaService>()},
              compact_{std::make_shared<serialization::CompactStreamSerializer>(schemas_)},
              registry_{build_registry(extension)},
              resolver_{registry_, *compact_} {
            util::logger()->debug(
                "SerializationService ready: {} serializers, default number type {}, {} endian",
                registry_.size(),
                number_type_name(config_.default_number_type),
                config_.is_big_endian ? "big" : "little"
            );
        }

        Data to_data(const SerializationService* owner, const Value& value, const PartitioningStrategy& strategy, size_t depth) const {
            if (is_data(value)) { return value.get<Data>(); }

            const auto& serializer = resolver_.resolve(value);

            int32_t partition_hash = 0;
            const auto key = partition_key_of(value);
            if (!key.is_absent() && !key.is_null()) {
                if (depth + 1 > config_.max_partition_key_depth) { throw PartitionKeyDepthError(config_.max_partition_key_depth); }
                const auto key_data = Value::data(to_data(owner, key, {}, depth + 1));
                partition_hash = strategy ? strategy(key_data) : default_partitioning_strategy(key_data);
            }
            else { partition_hash = strategy ? strategy(value) : default_partitioning_strategy(value); }

            ObjectDataOutput out{config_.byte_order(), owner};
            out.write_int(partition_hash);
            out.write_int(serializer.id());
            serializer.write(out, value);
            return Data{out.take(), config_.byte_order()};
        }

        Value to_object(const SerializationService* owner, const Data& data) const {
            if (data.total_size() == 0) { return Value::null(); }

            const auto type_id = data.type();
            const auto* serializer = registry_.find_by_id(type_id);
            if (serializer == nullptr) { throw NoDeserializerFoundError(type_id); }

            ObjectDataInput in{data.to_bytes(), data.order(), owner, Data::DATA_OFFSET};
            return serializer->read(in);
        }

        SerializationConfig config_;
        std::shared_ptr<compact::SchemaService> schemas_;
        std::shared_ptr<serialization::CompactStreamSerializer> compact_;
        SerializerRegistry registry_;
        serialization::SerializerResolver resolver_;

    private:
        SerializerRegistry build_registry(const RegistryExtension& extension) {
            SerializerRegistry::Builder builder{config_.default_number_type};

            serialization::register_default_serializers(builder);

            for (const auto& serializer : config_.compact.serializers) { compact_->register_serializer(serializer); }
            builder.register_serializer(SerializerName::Compact, compact_);

            builder.register_serializer(
                SerializerName::Identified,
                std::make_shared<serialization::IdentifiedDataSerializableSerializer>(merge_factories(config_.data_serializable_factories))
            );
            builder.register_serializer(
                SerializerName::Portable,
                std::make_shared<serialization::PortableSerializer>(config_.portable_factories, config_.portable_version)
            );

            if (config_.json_string_deserialization_policy == JsonStringDeserializationPolicy::Eager) {
                builder.register_serializer(SerializerName::Json, std::make_shared<serialization::JsonSerializer>());
            }
            else { builder.register_serializer(SerializerName::Json, std::make_shared<serialization::JsonValueSerializer>()); }

            for (const auto& serializer : config_.custom_serializers) {
                builder.register_serializer(SerializerKey::custom(serializer->id()), serializer);
            }

            if (config_.global_serializer) { builder.register_serializer(SerializerName::Global, config_.global_serializer); }

            if (extension) { extension(builder); }
            return std::move(builder).build();
        }
    };

    SerializationService::SerializationService(
        SerializationConfig config,
        std::shared_ptr<compact::SchemaService> schema_service,
        const RegistryExtension& extension
    )
        : impl_{std::make_unique<Impl>(std::move(config), std::move(schema_service), extension)} {}

    SerializationService::~SerializationService() noexcept = default;

    SerializationService::SerializationService(SerializationService&&) noexcept = default;

    SerializationService& SerializationService::operator=(SerializationService&&) noexcept = default;

    Data SerializationService::to_data(const Value& value, const PartitioningStrategy& strategy) const {
        return impl_->to_data(this, value, strategy, 0);
    }

    Value SerializationService::to_object(const Value& value) const {
        if (const auto* data = value.get_if<Data>()) { return impl_->to_object(this, *data); }
        return value;
    }

    Value SerializationService::to_object(const Data& data) const { return impl_->to_object(this, data); }

    void SerializationService::write_object(ObjectDataOutput& out, const Value& value) const {
        const auto& serializer = impl_->resolver_.resolve(value);
        out.write_int(serializer.id());
        serializer.write(out, value);
    }

    Value SerializationService::read_object(ObjectDataInput& in) const {
        const auto type_id = in.read_int();
        const auto* serializer = impl_->registry_.find_by_id(type_id);
        if (serializer == nullptr) { throw NoDeserializerFoundError(type_id); }
        return serializer->read(in);
    }

    void SerializationService::register_schema_to_class(std::shared_ptr<const compact::Schema> schema, std::type_index type) {
        impl_->compact_->register_schema_to_class(std::move(schema), type);
    }

    const Serializer& SerializationService::find_serializer_for(const Value& value) const { return impl_->resolver_.resolve(value); }

    const SerializerRegistry& SerializationService::registry() const noexcept { return impl_->registry_; }

    const SerializationConfig& SerializationService::config() const noexcept { return impl_->config_; }

    const std::shared_ptr<compact::SchemaService>& SerializationService::schema_service() const noexcept { return impl_->schemas_; }

    common::ByteOrder SerializationService::byte_order() const noexcept { return impl_->config_.byte_order(); }

    int32_t SerializationService::default_partitioning_strategy(const Value& value) {
        if (const auto* data = value.get_if<Data>()) { return data->partition_hash(); }
        if (const auto* object = value.get_if<UserObjectPtr>()) {
            if (const auto hash = (*object)->partition_hash()) { return *hash; }
        }
        return 0;
    }
} // namespace gridwire
