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

// gridwire/gridwire/src/compact/GenericRecord.cpp
#include "gridwire/compact/GenericRecord.hpp"
#include "gridwire/Errors.hpp"

#include <algorithm>

namespace gridwire::compact {
    namespace {
        bool all_of_kind(const Array& values, ValueKind kind) {
            return std::all_of(values.begin(), values.end(), [kind](const Value& v) { return v.kind() == kind; });
        }

        bool fits(FieldKind kind, const Value& value) {
            switch (kind) {
                case FieldKind::Boolean: return value.kind() == ValueKind::Boolean;
                case FieldKind::Int8: return value.kind() == ValueKind::Byte;
                case FieldKind::Int16: return value.kind() == ValueKind::Short;
                case FieldKind::Int32: return value.kind() == ValueKind::Integer;
                case FieldKind::Int64: return value.kind() == ValueKind::Long;
                case FieldKind::Float32: return value.kind() == ValueKind::Float;
                case FieldKind::Float64: return value.kind() == ValueKind::Double;
                case FieldKind::String: return value.is_null() || value.kind() == ValueKind::String;
                case FieldKind::ArrayOfInt32:
                    return value.is_null() || (value.kind() == ValueKind::Array && all_of_kind(value.get<Array>(), ValueKind::Integer));
                case FieldKind::ArrayOfString:
                    return value.is_null() || (value.kind() == ValueKind::Array && all_of_kind(value.get<Array>(), ValueKind::String));
                case FieldKind::Compact: return value.is_null() || value.kind() == ValueKind::GenericRecord;
            }
            return false;
        }
    }

    // ==================== Builder ====================

    GenericRecord::Builder::Builder(std::string type_name) : type_name_{std::move(type_name)} {}

    GenericRecord::Builder& GenericRecord::Builder::set_field(const std::string& name, FieldKind kind, Value value) {
        if (!fits(kind, value)) {
            throw SerializationException(
                "Field '" + name + "' of kind " + field_kind_name(kind) + " cannot hold a value of kind " + kind_name(value.kind())
            );
        }
        if (!fields_.try_emplace(name, Field{kind, std::move(value)}).second) {
            throw SerializationException("Field '" + name + "' is already set on record " + type_name_);
        }
        return *this;
    }

    GenericRecord::Builder& GenericRecord::Builder::set_boolean(const std::string& name, bool value) {
        return set_field(name, FieldKind::Boolean, Value::boolean(value));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_int8(const std::string& name, int8_t value) {
        return set_field(name, FieldKind::Int8, Value::int8(value));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_int16(const std::string& name, int16_t value) {
        return set_field(name, FieldKind::Int16, Value::int16(value));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_int32(const std::string& name, int32_t value) {
        return set_field(name, FieldKind::Int32, Value::int32(value));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_int64(const std::string& name, int64_t value) {
        return set_field(name, FieldKind::Int64, Value::int64(value));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_float32(const std::string& name, float value) {
        return set_field(name, FieldKind::Float32, Value::float32(value));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_float64(const std::string& name, double value) {
        return set_field(name, FieldKind::Float64, Value::float64(value));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_string(const std::string& name, std::optional<std::string> value) {
        return set_field(name, FieldKind::String, value ? Value::string(std::move(*value)) : Value::null());
    }

    GenericRecord::Builder& GenericRecord::Builder::set_array_of_int32(
        const std::string& name,
        std::optional<std::vector<int32_t>> value
    ) {
        if (!value) { return set_field(name, FieldKind::ArrayOfInt32, Value::null()); }
        Array items;
        items.reserve(value->size());
        for (const auto v : *value) { items.push_back(Value::int32(v)); }
        return set_field(name, FieldKind::ArrayOfInt32, Value::array(std::move(items)));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_array_of_string(
        const std::string& name,
        std::optional<std::vector<std::string>> value
    ) {
        if (!value) { return set_field(name, FieldKind::ArrayOfString, Value::null()); }
        Array items;
        items.reserve(value->size());
        for (auto& v : *value) { items.push_back(Value::string(std::move(v))); }
        return set_field(name, FieldKind::ArrayOfString, Value::array(std::move(items)));
    }

    GenericRecord::Builder& GenericRecord::Builder::set_generic_record(
        const std::string& name,
        std::shared_ptr<const GenericRecord> value
    ) {
        return set_field(name, FieldKind::Compact, Value::record(std::move(value)));
    }

    std::shared_ptr<const GenericRecord> GenericRecord::Builder::build() {
        std::vector<FieldDescriptor> descriptors;
        descriptors.reserve(fields_.size());
        for (const auto& [name, field] : fields_) { descriptors.push_back(FieldDescriptor{name, field.kind}); }

        auto schema = std::make_shared<const Schema>(type_name_, std::move(descriptors));
        return std::shared_ptr<const GenericRecord>(new GenericRecord(std::move(schema), std::move(fields_)));
    }

    // ==================== GenericRecord ====================

    GenericRecord::GenericRecord(std::shared_ptr<const Schema> schema, std::map<std::string, Field> fields)
        : schema_{std::move(schema)}, fields_{std::move(fields)} {}

    const GenericRecord::Field& GenericRecord::checked(const std::string& name, FieldKind expected) const {
        const auto it = fields_.find(name);
        if (it == fields_.end()) { throw SerializationException("Unknown field '" + name + "' in record " + type_name()); }
        if (it->second.kind != expected) {
            throw SerializationException(
                "Field '" + name + "' is " + field_kind_name(it->second.kind) + ", not " + field_kind_name(expected)
            );
        }
        return it->second;
    }

    FieldKind GenericRecord::field_kind(const std::string& name) const {
        const auto it = fields_.find(name);
        if (it == fields_.end()) { throw SerializationException("Unknown field '" + name + "' in record " + type_name()); }
        return it->second.kind;
    }

    const Value& GenericRecord::get_value(const std::string& name) const {
        const auto it = fields_.find(name);
        if (it == fields_.end()) { throw SerializationException("Unknown field '" + name + "' in record " + type_name()); }
        return it->second.value;
    }

    bool GenericRecord::get_boolean(const std::string& name) const { return checked(name, FieldKind::Boolean).value.get<bool>(); }

    int8_t GenericRecord::get_int8(const std::string& name) const { return checked(name, FieldKind::Int8).value.get<int8_t>(); }

    int16_t GenericRecord::get_int16(const std::string& name) const { return checked(name, FieldKind::Int16).value.get<int16_t>(); }

    int32_t GenericRecord::get_int32(const std::string& name) const { return checked(name, FieldKind::Int32).value.get<int32_t>(); }

    int64_t GenericRecord::get_int64(const std::string& name) const { return checked(name, FieldKind::Int64).value.get<int64_t>(); }

    float GenericRecord::get_float32(const std::string& name) const { return checked(name, FieldKind::Float32).value.get<float>(); }

    double GenericRecord::get_float64(const std::string& name) const { return checked(name, FieldKind::Float64).value.get<double>(); }

    std::optional<std::string> GenericRecord::get_string(const std::string& name) const {
        const auto& value = checked(name, FieldKind::String).value;
        if (value.is_null()) { return std::nullopt; }
        return value.get<std::string>();
    }

    std::optional<std::vector<int32_t>> GenericRecord::get_array_of_int32(const std::string& name) const {
        const auto& value = checked(name, FieldKind::ArrayOfInt32).value;
        if (value.is_null()) { return std::nullopt; }
        std::vector<int32_t> result;
        for (const auto& v : value.get<Array>()) { result.push_back(v.get<int32_t>()); }
        return result;
    }

    std::optional<std::vector<std::string>> GenericRecord::get_array_of_string(const std::string& name) const {
        const auto& value = checked(name, FieldKind::ArrayOfString).value;
        if (value.is_null()) { return std::nullopt; }
        std::vector<std::string> result;
        for (const auto& v : value.get<Array>()) { result.push_back(v.get<std::string>()); }
        return result;
    }

    std::shared_ptr<const GenericRecord> GenericRecord::get_generic_record(const std::string& name) const {
        const auto& value = checked(name, FieldKind::Compact).value;
        if (value.is_null()) { return nullptr; }
        return value.get<GenericRecordPtr>();
    }

    bool GenericRecord::operator==(const GenericRecord& other) const {
        if (!(*schema_ == *other.schema_)) { return false; }
        for (const auto& [name, field] : fields_) {
            const auto it = other.fields_.find(name);
            if (it == other.fields_.end() || !(field.value == it->second.value)) { return false; }
        }
        return true;
    }
} // namespace gridwire::compact
