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

// gridwire/gridwire/include/gridwire/compact/CompactSerializer.hpp
#pragma once

#include "gridwire/Errors.hpp"
#include "gridwire/Value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace gridwire::compact {
    /**
     * CompactWriter - Field sink handed to CompactSerializer::write.
     */
    class CompactWriter {
    public:
        virtual ~CompactWriter() = default;

        virtual void write_boolean(const std::string& name, bool value) = 0;
        virtual void write_int8(const std::string& name, int8_t value) = 0;
        virtual void write_int16(const std::string& name, int16_t value) = 0;
        virtual void write_int32(const std::string& name, int32_t value) = 0;
        virtual void write_int64(const std::string& name, int64_t value) = 0;
        virtual void write_float32(const std::string& name, float value) = 0;
        virtual void write_float64(const std::string& name, double value) = 0;
        virtual void write_string(const std::string& name, const std::optional<std::string>& value) = 0;
        virtual void write_array_of_int32(const std::string& name, const std::optional<std::vector<int32_t>>& value) = 0;
        virtual void write_array_of_string(const std::string& name, const std::optional<std::vector<std::string>>& value) = 0;

        /**
         * Nested Compact value: Null, a GenericRecord or a user object with a
         * registered Compact serializer.
         */
        virtual void write_compact(const std::string& name, const Value& value) = 0;
    };

    /**
     * CompactReader - Field source handed to CompactSerializer::read.
     *
     * Fields may be read in any order. Reading a missing field or a field of
     * another kind throws SerializationException.
     */
    class CompactReader {
    public:
        virtual ~CompactReader() = default;

        [[nodiscard]] virtual bool read_boolean(const std::string& name) = 0;
        [[nodiscard]] virtual int8_t read_int8(const std::string& name) = 0;
        [[nodiscard]] virtual int16_t read_int16(const std::string& name) = 0;
        [[nodiscard]] virtual int32_t read_int32(const std::string& name) = 0;
        [[nodiscard]] virtual int64_t read_int64(const std::string& name) = 0;
        [[nodiscard]] virtual float read_float32(const std::string& name) = 0;
        [[nodiscard]] virtual double read_float64(const std::string& name) = 0;
        [[nodiscard]] virtual std::optional<std::string> read_string(const std::string& name) = 0;
        [[nodiscard]] virtual std::optional<std::vector<int32_t>> read_array_of_int32(const std::string& name) = 0;
        [[nodiscard]] virtual std::optional<std::vector<std::string>> read_array_of_string(const std::string& name) = 0;

        /**
         * Nested Compact value: Null, a user object when its type has a
         * serializer, otherwise a GenericRecord.
         */
        [[nodiscard]] virtual Value read_compact(const std::string& name) = 0;
    };

    /**
     * CompactSerializerBase - Type-erased Compact serializer.
     *
     * Registered through SerializationConfig::compact. Implement
     * CompactSerializer<T> rather than this class.
     */
    class CompactSerializerBase {
    public:
        virtual ~CompactSerializerBase() = default;

        /**
         * Nominal C++ type handled by this serializer.
         */
        [[nodiscard]] virtual std::type_index type() const noexcept = 0;

        /**
         * Cluster-wide type name stored in the schema.
         */
        [[nodiscard]] virtual std::string type_name() const = 0;

        virtual void write_object(CompactWriter& writer, const UserObject& object) const = 0;

        [[nodiscard]] virtual std::shared_ptr<const UserObject> read_object(CompactReader& reader) const = 0;
    };

    /**
     * CompactSerializer - Typed Compact serializer for T.
     *
     * ```cpp
     * class EmployeeSerializer : public CompactSerializer<Employee> {
     * public:
     *     std::string type_name() const override { return "Employee"; }
     *     void write(CompactWriter& w, const Employee& e) const override {
     *         w.write_string("name", e.name);
     *         w.write_int32("age", e.age);
     *     }
     *     std::shared_ptr<Employee> read(CompactReader& r) const override {
     *         return std::make_shared<Employee>(*r.read_string("name"), r.read_int32("age"));
     *     }
     * };
     * ```
     */
    template <typename T>
    class CompactSerializer : public CompactSerializerBase {
    public:
        [[nodiscard]] std::type_index type() const noexcept final { return std::type_index(typeid(T)); }

        virtual void write(CompactWriter& writer, const T& object) const = 0;

        [[nodiscard]] virtual std::shared_ptr<T> read(CompactReader& reader) const = 0;

        void write_object(CompactWriter& writer, const UserObject& object) const final {
            const auto* typed = dynamic_cast<const T*>(&object);
            if (typed == nullptr) { throw SerializationException("Compact serializer for " + type_name() + " received an object of another type"); }
            write(writer, *typed);
        }

        [[nodiscard]] std::shared_ptr<const UserObject> read_object(CompactReader& reader) const final { return read(reader); }
    };
} // namespace gridwire::compact
