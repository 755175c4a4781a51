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

// gridwire/internal/src/serialization/CompactStreamSerializer.cpp
#include "serialization/CompactStreamSerializer.hpp"
#include "util/Logging.hpp"

#include <mutex>
#include <stdexcept>
#include <typeinfo>

namespace gridwire::serialization {
    using compact::FieldKind;
    using compact::GenericRecord;

    namespace {
        /**
         * Collects the fields a CompactSerializer writes into a GenericRecord.
         */
        class RecordBuildingWriter final : public compact::CompactWriter {
        public:
            RecordBuildingWriter(const CompactStreamSerializer& owner, std::string type_name)
                : owner_{owner}, builder_{std::move(type_name)} {}

            void write_boolean(const std::string& name, bool value) override { builder_.set_boolean(name, value); }
            void write_int8(const std::string& name, int8_t value) override { builder_.set_int8(name, value); }
            void write_int16(const std::string& name, int16_t value) override { builder_.set_int16(name, value); }
            void write_int32(const std::string& name, int32_t value) override { builder_.set_int32(name, value); }
            void write_int64(const std::string& name, int64_t value) override { builder_.set_int64(name, value); }
            void write_float32(const std::string& name, float value) override { builder_.set_float32(name, value); }
            void write_float64(const std::string& name, double value) override { builder_.set_float64(name, value); }

            void write_string(const std::string& name, const std::optional<std::string>& value) override {
                builder_.set_string(name, value);
            }

            void write_array_of_int32(const std::string& name, const std::optional<std::vector<int32_t>>& value) override {
                builder_.set_array_of_int32(name, value);
            }

            void write_array_of_string(const std::string& name, const std::optional<std::vector<std::string>>& value) override {
                builder_.set_array_of_string(name, value);
            }

            void write_compact(const std::string& name, const Value& value) override {
                switch (value.kind()) {
                    case ValueKind::Null:
                        builder_.set_generic_record(name, nullptr);
                        return;
                    case ValueKind::GenericRecord:
                        builder_.set_generic_record(name, value.get<GenericRecordPtr>());
                        return;
                    case ValueKind::UserObject:
                        builder_.set_generic_record(name, owner_.to_record(*value.get<UserObjectPtr>()));
                        return;
                    default:
                        throw SerializationException(
                            "Compact field '" + name + "' cannot hold a value of kind " + std::string{kind_name(value.kind())}
                        );
                }
            }

            [[nodiscard]] GenericRecordPtr build() { return builder_.build(); }

        private:
            const CompactStreamSerializer& owner_;
            GenericRecord::Builder builder_;
        };

        /**
         * Serves a CompactSerializer's reads from a decoded record.
         */
        class RecordReader final : public compact::CompactReader {
        public:
            RecordReader(const CompactStreamSerializer& owner, const GenericRecord& record)
                : owner_{owner}, record_{record} {}

            bool read_boolean(const std::string& name) override { return record_.get_boolean(name); }
            int8_t read_int8(const std::string& name) override { return record_.get_int8(name); }
            int16_t read_int16(const std::string& name) override { return record_.get_int16(name); }
            int32_t read_int32(const std::string& name) override { return record_.get_int32(name); }
            int64_t read_int64(const std::string& name) override { return record_.get_int64(name); }
            float read_float32(const std::string& name) override { return record_.get_float32(name); }
            double read_float64(const std::string& name) override { return record_.get_float64(name); }
            std::optional<std::string> read_string(const std::string& name) override { return record_.get_string(name); }

            std::optional<std::vector<int32_t>> read_array_of_int32(const std::string& name) override {
                return record_.get_array_of_int32(name);
            }

            std::optional<std::vector<std::string>> read_array_of_string(const std::string& name) override {
                return record_.get_array_of_string(name);
            }

            Value read_compact(const std::string& name) override {
                auto nested = record_.get_generic_record(name);
                if (!nested) { return Value::null(); }
                return owner_.from_record(nested);
            }

        private:
            const CompactStreamSerializer& owner_;
            const GenericRecord& record_;
        };
    }

    CompactStreamSerializer::CompactStreamSerializer(std::shared_ptr<compact::SchemaService> schemas)
        : schemas_{std::move(schemas)} {
        if (!schemas_) { throw std::invalid_argument("CompactStreamSerializer requires a SchemaService"); }
    }

    void CompactStreamSerializer::register_serializer(std::shared_ptr<const compact::CompactSerializerBase> serializer) {
        if (!serializer) { throw std::invalid_argument("Cannot register a null compact serializer"); }

        const auto type_name = serializer->type_name();
        if (by_type_.contains(serializer->type()) || by_name_.contains(type_name)) {
            throw SerializationException("A compact serializer for " + type_name + " is already registered");
        }
        by_type_.emplace(serializer->type(), serializer);
        by_name_.emplace(type_name, std::move(serializer));
        util::logger()->debug("Registered compact serializer for '{}'", type_name);
    }

    bool CompactStreamSerializer::handles(const Value& value) const noexcept {
        if (value.kind() == ValueKind::GenericRecord) { return true; }
        const auto* ptr = value.get_if<UserObjectPtr>();
        return ptr != nullptr && *ptr && is_registered(std::type_index(typeid(**ptr)));
    }

    void CompactStreamSerializer::register_schema_to_class(std::shared_ptr<const compact::Schema> schema, std::type_index type) {
        if (!schema) { throw std::invalid_argument("Cannot register a null schema"); }

        schemas_->put(schema);
        const auto id = schema->schema_id();
        const auto name = schema->type_name();
        {
            std::unique_lock lock{pinned_mutex_};
            pinned_.insert_or_assign(type, std::move(schema));
        }
        util::logger()->debug("Pinned compact schema {} ('{}') to {}", id, name, type.name());
    }

    GenericRecordPtr CompactStreamSerializer::to_record(const UserObject& object) const {
        const std::type_index type{typeid(object)};
        const auto it = by_type_.find(type);
        if (it == by_type_.end()) { throw SerializationException(std::string{"No compact serializer registered for "} + type.name()); }

        RecordBuildingWriter writer{*this, it->second->type_name()};
        it->second->write_object(writer, object);
        auto record = writer.build();

        std::shared_lock lock{pinned_mutex_};
        const auto pinned = pinned_.find(type);
        if (pinned != pinned_.end() && pinned->second->schema_id() != record->schema().schema_id()) {
            throw SerializationException(
                "Compact serializer for " + record->type_name() + " produced schema " + std::to_string(record->schema().schema_id()) +
                " but schema " + std::to_string(pinned->second->schema_id()) + " is registered for the type"
            );
        }
        return record;
    }

    Value CompactStreamSerializer::from_record(const GenericRecordPtr& record) const {
        const auto it = by_name_.find(record->type_name());
        if (it == by_name_.end()) { return Value::record(record); }

        RecordReader reader{*this, *record};
        return Value::user(it->second->read_object(reader));
    }

    void CompactStreamSerializer::write(ObjectDataOutput& out, const Value& value) const {
        switch (value.kind()) {
            case ValueKind::GenericRecord:
                write_record(out, *value.get<GenericRecordPtr>());
                return;
            case ValueKind::UserObject:
                write_record(out, *to_record(*value.get<UserObjectPtr>()));
                return;
            default:
                throw SerializationException(std::string{"Expected a compact value but got "} + kind_name(value.kind()));
        }
    }

    Value CompactStreamSerializer::read(ObjectDataInput& in) const { return from_record(read_record(in)); }

    void CompactStreamSerializer::write_record(ObjectDataOutput& out, const GenericRecord& record) const {
        schemas_->put(record.schema_ptr());
        out.write_long(record.schema().schema_id());

        for (const auto& field : record.schema().fields()) {
            const auto& name = field.name;
            switch (field.kind) {
                case FieldKind::Boolean: out.write_boolean(record.get_boolean(name)); break;
                case FieldKind::Int8: out.write_byte(record.get_int8(name)); break;
                case FieldKind::Int16: out.write_short(record.get_int16(name)); break;
                case FieldKind::Int32: out.write_int(record.get_int32(name)); break;
                case FieldKind::Int64: out.write_long(record.get_int64(name)); break;
                case FieldKind::Float32: out.write_float(record.get_float32(name)); break;
                case FieldKind::Float64: out.write_double(record.get_float64(name)); break;
                case FieldKind::String: {
                    const auto value = record.get_string(name);
                    out.write_boolean(value.has_value());
                    if (value) { out.write_string(*value); }
                    break;
                }
                case FieldKind::ArrayOfInt32: {
                    const auto value = record.get_array_of_int32(name);
                    out.write_boolean(value.has_value());
                    if (value) { out.write_int_array(*value); }
                    break;
                }
                case FieldKind::ArrayOfString: {
                    const auto value = record.get_array_of_string(name);
                    out.write_boolean(value.has_value());
                    if (value) { out.write_string_array(*value); }
                    break;
                }
                case FieldKind::Compact: {
                    const auto nested = record.get_generic_record(name);
                    out.write_boolean(nested != nullptr);
                    if (nested) { write_record(out, *nested); }
                    break;
                }
            }
        }
    }

    GenericRecordPtr CompactStreamSerializer::read_record(ObjectDataInput& in) const {
        const auto scope = in.enter_nested();
        const auto schema_id = in.read_long();
        const auto schema = schemas_->get(schema_id);
        if (!schema) { throw SerializationException("Unknown compact schema id " + std::to_string(schema_id)); }

        GenericRecord::Builder builder{schema->type_name()};
        for (const auto& field : schema->fields()) {
            const auto& name = field.name;
            switch (field.kind) {
                case FieldKind::Boolean: builder.set_boolean(name, in.read_boolean()); break;
                case FieldKind::Int8: builder.set_int8(name, in.read_byte()); break;
                case FieldKind::Int16: builder.set_int16(name, in.read_short()); break;
                case FieldKind::Int32: builder.set_int32(name, in.read_int()); break;
                case FieldKind::Int64: builder.set_int64(name, in.read_long()); break;
                case FieldKind::Float32: builder.set_float32(name, in.read_float()); break;
                case FieldKind::Float64: builder.set_float64(name, in.read_double()); break;
                case FieldKind::String:
                    builder.set_string(name, in.read_boolean() ? std::optional{in.read_string()} : std::nullopt);
                    break;
                case FieldKind::ArrayOfInt32:
                    builder.set_array_of_int32(name, in.read_boolean() ? std::optional{in.read_int_array()} : std::nullopt);
                    break;
                case FieldKind::ArrayOfString:
                    builder.set_array_of_string(name, in.read_boolean() ? std::optional{in.read_string_array()} : std::nullopt);
                    break;
                case FieldKind::Compact:
                    builder.set_generic_record(name, in.read_boolean() ? read_record(in) : nullptr);
                    break;
            }
        }
        return builder.build();
    }
} // namespace gridwire::serialization
