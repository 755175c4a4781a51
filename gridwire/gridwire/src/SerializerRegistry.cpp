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

// gridwire/gridwire/src/SerializerRegistry.cpp
#include "gridwire/SerializerRegistry.hpp"
#include "gridwire/Errors.hpp"
#include "util/Logging.hpp"

#include <charconv>
#include <stdexcept>

namespace gridwire {
    const char* serializer_name_string(SerializerName name) noexcept {
        switch (name) {
            case SerializerName::String: return "string";
            case SerializerName::Double: return "double";
            case SerializerName::Byte: return "byte";
            case SerializerName::Boolean: return "boolean";
            case SerializerName::Null: return "null";
            case SerializerName::Short: return "short";
            case SerializerName::Integer: return "integer";
            case SerializerName::Long: return "long";
            case SerializerName::Float: return "float";
            case SerializerName::Char: return "char";
            case SerializerName::Date: return "date";
            case SerializerName::LocalDate: return "localDate";
            case SerializerName::LocalTime: return "localTime";
            case SerializerName::LocalDateTime: return "localDateTime";
            case SerializerName::OffsetDateTime: return "offsetDateTime";
            case SerializerName::ByteArray: return "byteArray";
            case SerializerName::CharArray: return "charArray";
            case SerializerName::BooleanArray: return "booleanArray";
            case SerializerName::ShortArray: return "shortArray";
            case SerializerName::IntegerArray: return "integerArray";
            case SerializerName::LongArray: return "longArray";
            case SerializerName::DoubleArray: return "doubleArray";
            case SerializerName::StringArray: return "stringArray";
            case SerializerName::JavaClass: return "javaClass";
            case SerializerName::FloatArray: return "floatArray";
            case SerializerName::ArrayList: return "arrayList";
            case SerializerName::LinkedList: return "linkedList";
            case SerializerName::Uuid: return "uuid";
            case SerializerName::BigDecimal: return "bigDecimal";
            case SerializerName::BigInt: return "bigint";
            case SerializerName::JavaArray: return "javaArray";
            case SerializerName::Compact: return "!compact";
            case SerializerName::Identified: return "identified";
            case SerializerName::Portable: return "!portable";
            case SerializerName::Json: return "!json";
            case SerializerName::Global: return "!global";
            case SerializerName::Custom: return "!custom";
        }
        return "";
    }

    // ==================== SerializerKey ====================

    std::optional<SerializerKey> SerializerKey::parse(std::string_view text) {
        constexpr std::string_view custom_prefix = "!custom";
        if (text.starts_with(custom_prefix) && text.size() > custom_prefix.size()) {
            int32_t id = 0;
            const auto digits = text.substr(custom_prefix.size());
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
            if (ec != std::errc{} || ptr != digits.data() + digits.size()) { return std::nullopt; }
            return custom(id);
        }
        for (auto n = static_cast<uint8_t>(SerializerName::String); n < static_cast<uint8_t>(SerializerName::Custom); ++n) {
            const auto name = static_cast<SerializerName>(n);
            if (text == serializer_name_string(name)) { return SerializerKey{name}; }
        }
        return std::nullopt;
    }

    std::string SerializerKey::to_string() const {
        std::string s = serializer_name_string(name);
        if (name == SerializerName::Custom) { s += std::to_string(custom_id); }
        return s;
    }

    // ==================== Builder ====================

    SerializerRegistry::Builder& SerializerRegistry::Builder::register_serializer(
        SerializerKey key,
        std::shared_ptr<const Serializer> serializer
    ) {
        if (!serializer) { throw std::invalid_argument("Cannot register a null serializer under " + key.to_string()); }
        if (name_to_id_.contains(key)) { throw DuplicateNameError(key.to_string()); }

        const auto id = serializer->id();
        if (id_to_serializer_.contains(id)) { throw DuplicateIdError(id); }

        name_to_id_.emplace(key, id);
        id_to_serializer_.emplace(id, std::move(serializer));
        util::logger()->debug("Registered serializer '{}' with id {}", key.to_string(), id);
        return *this;
    }

    SerializerRegistry SerializerRegistry::Builder::build() && {
        return SerializerRegistry{default_number_type_, std::move(name_to_id_), std::move(id_to_serializer_)};
    }

    // ==================== SerializerRegistry ====================

    SerializerRegistry::SerializerRegistry(
        NumberType default_number_type,
        std::map<SerializerKey, int32_t> name_to_id,
        std::unordered_map<int32_t, std::shared_ptr<const Serializer>> id_to_serializer
    )
        : default_number_type_{default_number_type},
          name_to_id_{std::move(name_to_id)},
          id_to_serializer_{std::move(id_to_serializer)} {}

    const Serializer* SerializerRegistry::find_by_id(int32_t id) const noexcept {
        const auto it = id_to_serializer_.find(id);
        return it == id_to_serializer_.end() ? nullptr : it->second.get();
    }

    std::optional<int32_t> SerializerRegistry::id_of(const SerializerKey& key) const noexcept {
        const auto it = name_to_id_.find(key);
        if (it == name_to_id_.end()) { return std::nullopt; }
        return it->second;
    }

    const Serializer* SerializerRegistry::find_by_key(const SerializerKey& key) const noexcept {
        const auto id = id_of(key);
        return id ? find_by_id(*id) : nullptr;
    }

    const Serializer* SerializerRegistry::find_by_name(std::string_view name, bool is_array) const {
        std::string converted;
        if (name == "number") { converted = number_type_name(default_number_type_); }
        else if (name == "buffer") { converted = "byteArray"; }
        else { converted = name; }
        if (is_array) { converted += "Array"; }

        const auto key = SerializerKey::parse(converted);
        return key ? find_by_key(*key) : nullptr;
    }

    const Serializer* SerializerRegistry::find_by_kind(ValueKind kind, bool is_array) const noexcept {
        const auto name = name_for_kind(kind, is_array, default_number_type_);
        return name ? find_by_key(*name) : nullptr;
    }

    namespace {
        SerializerName number_scalar(NumberType type) noexcept {
            switch (type) {
                case NumberType::Double: return SerializerName::Double;
                case NumberType::Short: return SerializerName::Short;
                case NumberType::Integer: return SerializerName::Integer;
                case NumberType::Long: return SerializerName::Long;
                case NumberType::Float: return SerializerName::Float;
                case NumberType::Byte: return SerializerName::Byte;
            }
            return SerializerName::Double;
        }

        SerializerName number_array(NumberType type) noexcept {
            switch (type) {
                case NumberType::Double: return SerializerName::DoubleArray;
                case NumberType::Short: return SerializerName::ShortArray;
                case NumberType::Integer: return SerializerName::IntegerArray;
                case NumberType::Long: return SerializerName::LongArray;
                case NumberType::Float: return SerializerName::FloatArray;
                case NumberType::Byte: return SerializerName::ByteArray;
            }
            return SerializerName::DoubleArray;
        }
    }

    std::optional<SerializerName> SerializerRegistry::name_for_kind(
        ValueKind kind,
        bool is_array,
        NumberType default_number_type
    ) noexcept {
        if (is_array) {
            switch (kind) {
                case ValueKind::Number: return number_array(default_number_type);
                case ValueKind::Boolean: return SerializerName::BooleanArray;
                case ValueKind::Byte: return SerializerName::ByteArray;
                case ValueKind::Char: return SerializerName::CharArray;
                case ValueKind::Short: return SerializerName::ShortArray;
                case ValueKind::Integer: return SerializerName::IntegerArray;
                case ValueKind::Long: return SerializerName::LongArray;
                case ValueKind::Float: return SerializerName::FloatArray;
                case ValueKind::Double: return SerializerName::DoubleArray;
                case ValueKind::String: return SerializerName::StringArray;
                default: return std::nullopt;
            }
        }

        switch (kind) {
            case ValueKind::Null: return SerializerName::Null;
            case ValueKind::Number: return number_scalar(default_number_type);
            case ValueKind::Boolean: return SerializerName::Boolean;
            case ValueKind::Byte: return SerializerName::Byte;
            case ValueKind::Char: return SerializerName::Char;
            case ValueKind::Short: return SerializerName::Short;
            case ValueKind::Integer: return SerializerName::Integer;
            case ValueKind::Long: return SerializerName::Long;
            case ValueKind::Float: return SerializerName::Float;
            case ValueKind::Double: return SerializerName::Double;
            case ValueKind::String: return SerializerName::String;
            case ValueKind::Buffer: return SerializerName::ByteArray;
            case ValueKind::BigInt: return SerializerName::BigInt;
            case ValueKind::BigDecimal: return SerializerName::BigDecimal;
            case ValueKind::Uuid: return SerializerName::Uuid;
            case ValueKind::Date: return SerializerName::Date;
            case ValueKind::LocalDate: return SerializerName::LocalDate;
            case ValueKind::LocalTime: return SerializerName::LocalTime;
            case ValueKind::LocalDateTime: return SerializerName::LocalDateTime;
            case ValueKind::OffsetDateTime: return SerializerName::OffsetDateTime;
            case ValueKind::JavaClass: return SerializerName::JavaClass;
            default: return std::nullopt;
        }
    }
} // namespace gridwire
