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

// gridwire/gridwire/src/SerializationConfig.cpp
#include "gridwire/SerializationConfig.hpp"
#include "util/Logging.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace gridwire {
    using json = nlohmann::json;

    const char* number_type_name(NumberType type) noexcept {
        switch (type) {
            case NumberType::Double: return "double";
            case NumberType::Short: return "short";
            case NumberType::Integer: return "integer";
            case NumberType::Long: return "long";
            case NumberType::Float: return "float";
            case NumberType::Byte: return "byte";
        }
        return "double";
    }

    NumberType parse_number_type(std::string_view name) {
        if (name == "double") { return NumberType::Double; }
        if (name == "short") { return NumberType::Short; }
        if (name == "integer") { return NumberType::Integer; }
        if (name == "long") { return NumberType::Long; }
        if (name == "float") { return NumberType::Float; }
        if (name == "byte") { return NumberType::Byte; }
        throw std::invalid_argument("Unknown default number type: " + std::string{name});
    }

    namespace {
        JsonStringDeserializationPolicy parse_json_policy(const std::string& name) {
            if (name == "EAGER" || name == "eager") { return JsonStringDeserializationPolicy::Eager; }
            if (name == "NO_DESERIALIZATION" || name == "no_deserialization") { return JsonStringDeserializationPolicy::NoDeserialization; }
            throw std::invalid_argument("Unknown JSON string deserialization policy: " + name);
        }

        template <typename T>
        T required_as(const json& doc, const char* key) {
            try { return doc.at(key).get<T>(); }
            catch (const json::exception& e) { throw std::invalid_argument(std::string{"Invalid value for "} + key + ": " + e.what()); }
        }
    }

    void SerializationConfig::validate() const {
        for (const auto& s : custom_serializers) {
            if (!s) { throw std::invalid_argument("Custom serializer must not be null"); }
            if (s->id() < 1) { throw std::invalid_argument("Custom serializer id must be >= 1, got " + std::to_string(s->id())); }
        }
        for (const auto& s : compact.serializers) {
            if (!s) { throw std::invalid_argument("Compact serializer must not be null"); }
        }
        for (const auto& [id, factory] : data_serializable_factories) {
            if (!factory) { throw std::invalid_argument("Data serializable factory " + std::to_string(id) + " is empty"); }
        }
        for (const auto& [id, factory] : portable_factories) {
            if (!factory) { throw std::invalid_argument("Portable factory " + std::to_string(id) + " is empty"); }
        }
        if (max_partition_key_depth == 0) { throw std::invalid_argument("max_partition_key_depth must be positive"); }
        if (max_nesting_depth == 0) { throw std::invalid_argument("max_nesting_depth must be positive"); }
    }

    SerializationConfig SerializationConfig::from_json(std::string_view text) {
        json doc;
        try { doc = json::parse(text.begin(), text.end()); }
        catch (const json::parse_error& e) { throw std::invalid_argument(std::string{"Malformed serialization config: "} + e.what()); }
        if (!doc.is_object()) { throw std::invalid_argument("Serialization config must be a JSON object"); }

        SerializationConfig cfg;
        for (const auto& [key, value] : doc.items()) {
            if (key == "defaultNumberType") { cfg.default_number_type = parse_number_type(required_as<std::string>(doc, "defaultNumberType")); }
            else if (key == "isBigEndian") { cfg.is_big_endian = required_as<bool>(doc, "isBigEndian"); }
            else if (key == "jsonStringDeserializationPolicy") {
                cfg.json_string_deserialization_policy = parse_json_policy(required_as<std::string>(doc, "jsonStringDeserializationPolicy"));
            }
            else if (key == "portableVersion") { cfg.portable_version = required_as<int32_t>(doc, "portableVersion"); }
            else if (key == "maxPartitionKeyDepth") {
                const auto depth = required_as<int64_t>(doc, "maxPartitionKeyDepth");
                if (depth <= 0) { throw std::invalid_argument("maxPartitionKeyDepth must be positive"); }
                cfg.max_partition_key_depth = static_cast<size_t>(depth);
            }
            else if (key == "maxNestingDepth") {
                const auto depth = required_as<int64_t>(doc, "maxNestingDepth");
                if (depth <= 0) { throw std::invalid_argument("maxNestingDepth must be positive"); }
                cfg.max_nesting_depth = static_cast<size_t>(depth);
            }
            else { util::logger()->warn("Ignoring unknown serialization config key '{}'", key); }
        }
        return cfg;
    }
} // namespace gridwire
