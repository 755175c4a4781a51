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

// gridwire/gridwire/include/gridwire/compact/GenericRecord.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/Value.hpp"
#include "gridwire/compact/Schema.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gridwire::compact {
    /**
     * GenericRecord - Schema-carrying Compact record without a user type.
     *
     * Produced when deserializing a Compact payload whose type has no
     * registered serializer, and usable as a value in its own right.
     *
     * ```cpp
     * auto rec = GenericRecord::Builder("Employee")
     *     .set_string("name", "alice")
     *     .set_int32("age", 42)
     *     .build();
     * auto data = service.to_data(Value::record(rec));
     * ```
     */
    class GRIDWIRE_API GenericRecord {
    public:
        struct Field {
            FieldKind kind;
            Value value;
        };

        class GRIDWIRE_API Builder {
        public:
            explicit Builder(std::string type_name);

            Builder& set_boolean(const std::string& name, bool value);
            Builder& set_int8(const std::string& name, int8_t value);
            Builder& set_int16(const std::string& name, int16_t value);
            Builder& set_int32(const std::string& name, int32_t value);
            Builder& set_int64(const std::string& name, int64_t value);
            Builder& set_float32(const std::string& name, float value);
            Builder& set_float64(const std::string& name, double value);
            Builder& set_string(const std::string& name, std::optional<std::string> value);
            Builder& set_array_of_int32(const std::string& name, std::optional<std::vector<int32_t>> value);
            Builder& set_array_of_string(const std::string& name, std::optional<std::vector<std::string>> value);
            Builder& set_generic_record(const std::string& name, std::shared_ptr<const GenericRecord> value);

            /**
             * Sets a field from an already typed Value (used by the stream codec).
             *
             * @throws SerializationException if the value does not fit the kind
             */
            Builder& set_field(const std::string& name, FieldKind kind, Value value);

            /**
             * @throws SerializationException if the type name is empty
             */
            [[nodiscard]] std::shared_ptr<const GenericRecord> build();

        private:
            std::string type_name_;
            std::map<std::string, Field> fields_;
        };

        [[nodiscard]] const Schema& schema() const noexcept { return *schema_; }

        [[nodiscard]] std::shared_ptr<const Schema> schema_ptr() const noexcept { return schema_; }

        [[nodiscard]] const std::string& type_name() const noexcept { return schema_->type_name(); }

        [[nodiscard]] bool has_field(const std::string& name) const noexcept { return fields_.contains(name); }

        /**
         * @throws SerializationException if the field does not exist
         */
        [[nodiscard]] FieldKind field_kind(const std::string& name) const;

        [[nodiscard]] bool get_boolean(const std::string& name) const;
        [[nodiscard]] int8_t get_int8(const std::string& name) const;
        [[nodiscard]] int16_t get_int16(const std::string& name) const;
        [[nodiscard]] int32_t get_int32(const std::string& name) const;
        [[nodiscard]] int64_t get_int64(const std::string& name) const;
        [[nodiscard]] float get_float32(const std::string& name) const;
        [[nodiscard]] double get_float64(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get_string(const std::string& name) const;
        [[nodiscard]] std::optional<std::vector<int32_t>> get_array_of_int32(const std::string& name) const;
        [[nodiscard]] std::optional<std::vector<std::string>> get_array_of_string(const std::string& name) const;
        [[nodiscard]] std::shared_ptr<const GenericRecord> get_generic_record(const std::string& name) const;

        /**
         * Raw field value. Variable-size fields hold Null when unset.
         *
         * @throws SerializationException if the field does not exist
         */
        [[nodiscard]] const Value& get_value(const std::string& name) const;

        [[nodiscard]] bool operator==(const GenericRecord& other) const;

    private:
        GenericRecord(std::shared_ptr<const Schema> schema, std::map<std::string, Field> fields);

        [[nodiscard]] const Field& checked(const std::string& name, FieldKind expected) const;

        std::shared_ptr<const Schema> schema_;
        std::map<std::string, Field> fields_;
    };
} // namespace gridwire::compact
