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

// gridwire/gridwire/include/gridwire/portable/Portable.hpp
#pragma once

#include "gridwire/Value.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gridwire::portable {
    class PortableWriter;
    class PortableReader;

    /**
     * Portable - Objects serialized with named, typed fields.
     *
     * Like IdentifiedDataSerializable, instances are recreated through a
     * factory keyed by (factory id, class id); unlike it, every field is
     * written with its name and type so readers can look fields up by name.
     */
    class Portable : public virtual UserObject {
    public:
        [[nodiscard]] virtual int32_t factory_id() const noexcept = 0;

        [[nodiscard]] virtual int32_t class_id() const noexcept = 0;

        virtual void write_portable(PortableWriter& writer) const = 0;

        virtual void read_portable(PortableReader& reader) = 0;
    };

    using PortableFactory = std::function<std::shared_ptr<Portable>(int32_t class_id)>;

    /**
     * Field type ids of the Portable wire format.
     */
    enum class FieldType : int8_t {
        Portable = 0,
        Byte = 1,
        Boolean = 2,
        Char = 3,
        Short = 4,
        Int = 5,
        Long = 6,
        Float = 7,
        Double = 8,
        Utf = 9,
        ByteArray = 11,
        IntArray = 15,
        LongArray = 16,
        UtfArray = 19,
    };

    class PortableWriter {
    public:
        virtual ~PortableWriter() = default;

        virtual void write_byte(std::string_view name, int8_t value) = 0;
        virtual void write_boolean(std::string_view name, bool value) = 0;
        virtual void write_char(std::string_view name, char16_t value) = 0;
        virtual void write_short(std::string_view name, int16_t value) = 0;
        virtual void write_int(std::string_view name, int32_t value) = 0;
        virtual void write_long(std::string_view name, int64_t value) = 0;
        virtual void write_float(std::string_view name, float value) = 0;
        virtual void write_double(std::string_view name, double value) = 0;
        virtual void write_utf(std::string_view name, std::string_view value) = 0;
        virtual void write_byte_array(std::string_view name, const std::vector<uint8_t>& value) = 0;
        virtual void write_int_array(std::string_view name, const std::vector<int32_t>& value) = 0;
        virtual void write_long_array(std::string_view name, const std::vector<int64_t>& value) = 0;
        virtual void write_utf_array(std::string_view name, const std::vector<std::string>& value) = 0;

        /**
         * Nested Portable; nullptr writes a null field.
         */
        virtual void write_portable(std::string_view name, const std::shared_ptr<const Portable>& value) = 0;
    };

    /**
     * PortableReader - Named field access.
     *
     * @throws SerializationException for unknown fields or type mismatches
     */
    class PortableReader {
    public:
        virtual ~PortableReader() = default;

        [[nodiscard]] virtual int32_t version() const noexcept = 0;

        [[nodiscard]] virtual bool has_field(std::string_view name) const = 0;

        [[nodiscard]] virtual int8_t read_byte(std::string_view name) = 0;
        [[nodiscard]] virtual bool read_boolean(std::string_view name) = 0;
        [[nodiscard]] virtual char16_t read_char(std::string_view name) = 0;
        [[nodiscard]] virtual int16_t read_short(std::string_view name) = 0;
        [[nodiscard]] virtual int32_t read_int(std::string_view name) = 0;
        [[nodiscard]] virtual int64_t read_long(std::string_view name) = 0;
        [[nodiscard]] virtual float read_float(std::string_view name) = 0;
        [[nodiscard]] virtual double read_double(std::string_view name) = 0;
        [[nodiscard]] virtual std::string read_utf(std::string_view name) = 0;
        [[nodiscard]] virtual std::vector<uint8_t> read_byte_array(std::string_view name) = 0;
        [[nodiscard]] virtual std::vector<int32_t> read_int_array(std::string_view name) = 0;
        [[nodiscard]] virtual std::vector<int64_t> read_long_array(std::string_view name) = 0;
        [[nodiscard]] virtual std::vector<std::string> read_utf_array(std::string_view name) = 0;
        [[nodiscard]] virtual std::shared_ptr<Portable> read_portable(std::string_view name) = 0;
    };
} // namespace gridwire::portable
