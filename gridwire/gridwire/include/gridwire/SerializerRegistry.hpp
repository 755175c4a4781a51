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

// gridwire/gridwire/include/gridwire/SerializerRegistry.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/SerializationConfig.hpp"
#include "gridwire/Serializer.hpp"
#include "gridwire/Value.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gridwire {
    /**
     * SerializerName - Registry keys of the built-in and user serializers.
     *
     * Canonical spellings ("integerArray", "!json", ...) come from
     * serializer_name_string().
     */
    enum class SerializerName : uint8_t {
        String,
        Double,
        Byte,
        Boolean,
        Null,
        Short,
        Integer,
        Long,
        Float,
        Char,
        Date,
        LocalDate,
        LocalTime,
        LocalDateTime,
        OffsetDateTime,
        ByteArray,
        CharArray,
        BooleanArray,
        ShortArray,
        IntegerArray,
        LongArray,
        DoubleArray,
        StringArray,
        JavaClass,
        FloatArray,
        ArrayList,
        LinkedList,
        Uuid,
        BigDecimal,
        BigInt,
        JavaArray,
        Compact,
        Identified,
        Portable,
        Json,
        Global,
        Custom,
    };

    [[nodiscard]] GRIDWIRE_API const char* serializer_name_string(SerializerName name) noexcept;

    /**
     * SerializerKey - Registry key: a name, plus the tag for "!custom<id>".
     */
    struct GRIDWIRE_API SerializerKey {
        SerializerName name = SerializerName::Null;
        int32_t custom_id = 0;

        SerializerKey() = default;

        SerializerKey(SerializerName n) : name{n} {} // NOLINT(google-explicit-constructor)

        [[nodiscard]] static SerializerKey custom(int32_t id) {
            SerializerKey key{SerializerName::Custom};
            key.custom_id = id;
            return key;
        }

        /**
         * Parses a canonical spelling; nullopt if unknown.
         */
        [[nodiscard]] static std::optional<SerializerKey> parse(std::string_view text);

        [[nodiscard]] std::string to_string() const;

        auto operator<=>(const SerializerKey&) const = default;
    };

    /**
     * SerializerRegistry - Frozen name <-> id <-> serializer mapping.
     *
     * Built once through Builder while the SerializationService is
     * constructed, read-only afterwards. Every id has exactly one name.
     * Lookups never fail; absence is nullptr. Returned pointers stay valid
     * for the lifetime of the registry.
     *
     * Thread-safety: Fully thread-safe after build().
     */
    class GRIDWIRE_API SerializerRegistry {
    public:
        class GRIDWIRE_API Builder {
        public:
            explicit Builder(NumberType default_number_type) : default_number_type_{default_number_type} {}

            /**
             * Adds a serializer.
             *
             * @throws DuplicateNameError if the key is already registered
             * @throws DuplicateIdError if serializer->id() is already registered
             * @throws std::invalid_argument if serializer is null
             */
            Builder& register_serializer(SerializerKey key, std::shared_ptr<const Serializer> serializer);

            [[nodiscard]] bool contains(const SerializerKey& key) const { return name_to_id_.contains(key); }

            [[nodiscard]] bool contains_id(int32_t id) const { return id_to_serializer_.contains(id); }

            [[nodiscard]] SerializerRegistry build() &&;

        private:
            NumberType default_number_type_;
            std::map<SerializerKey, int32_t> name_to_id_;
            std::unordered_map<int32_t, std::shared_ptr<const Serializer>> id_to_serializer_;
        };

        [[nodiscard]] const Serializer* find_by_key(const SerializerKey& key) const noexcept;

        [[nodiscard]] const Serializer* find_by_id(int32_t id) const noexcept;

        /**
         * Lookup by canonical name with the kind normalizations applied:
         * "number" becomes the default number type, "buffer" becomes
         * "byteArray", and is_array appends "Array".
         */
        [[nodiscard]] const Serializer* find_by_name(std::string_view name, bool is_array = false) const;

        /**
         * Lookup by value kind (element kind when is_array), same normalizations.
         */
        [[nodiscard]] const Serializer* find_by_kind(ValueKind kind, bool is_array) const noexcept;

        /**
         * Registry name of a value kind, nullopt when no built-in serializer
         * is keyed by that kind.
         */
        [[nodiscard]] static std::optional<SerializerName> name_for_kind(
            ValueKind kind,
            bool is_array,
            NumberType default_number_type
        ) noexcept;

        [[nodiscard]] std::optional<int32_t> id_of(const SerializerKey& key) const noexcept;

        [[nodiscard]] NumberType default_number_type() const noexcept { return default_number_type_; }

        [[nodiscard]] size_t size() const noexcept { return id_to_serializer_.size(); }

    private:
        SerializerRegistry(
            NumberType default_number_type,
            std::map<SerializerKey, int32_t> name_to_id,
            std::unordered_map<int32_t, std::shared_ptr<const Serializer>> id_to_serializer
        );

        NumberType default_number_type_;
        std::map<SerializerKey, int32_t> name_to_id_;
        std::unordered_map<int32_t, std::shared_ptr<const Serializer>> id_to_serializer_;
    };
} // namespace gridwire
