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

// gridwire/gridwire/include/gridwire/ObjectData.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/Value.hpp"
#include "gridwire/common/ByteBuffer.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gridwire {
    class SerializationService;

    /**
     * ObjectDataOutput - Append-only payload cursor handed to serializers.
     *
     * All multi-byte values use the byte order chosen at construction.
     * Strings are written as an int32 UTF-8 byte length followed by the
     * bytes; a length of -1 denotes a null string. Arrays are an int32
     * element count followed by the elements.
     *
     * Owned by a single serialize call; not thread-safe.
     */
    class GRIDWIRE_API ObjectDataOutput {
    public:
        explicit ObjectDataOutput(
            common::ByteOrder order,
            const SerializationService* service = nullptr,
            size_t initial_capacity = 64
        );

        void write_boolean(bool value) { buf_.put_u8(value ? 1 : 0); }
        void write_byte(int8_t value) { buf_.put_i8(value); }
        void write_char(char16_t value) { buf_.put_u16(static_cast<uint16_t>(value)); }
        void write_short(int16_t value) { buf_.put_i16(value); }
        void write_int(int32_t value) { buf_.put_i32(value); }
        void write_long(int64_t value) { buf_.put_i64(value); }
        void write_float(float value) { buf_.put_f32(value); }
        void write_double(double value) { buf_.put_f64(value); }

        void write_string(std::string_view value);
        void write_nullable_string(const std::optional<std::string>& value);

        /**
         * Raw bytes, no length prefix.
         */
        void write_bytes(std::span<const uint8_t> bytes) { buf_.put_bytes(bytes); }

        void write_byte_array(std::span<const uint8_t> bytes);
        void write_int_array(std::span<const int32_t> values);
        void write_long_array(std::span<const int64_t> values);
        void write_string_array(std::span<const std::string> values);

        /**
         * Envelope as an int32 length and its bytes; an empty envelope is written as -1.
         */
        void write_data(const Data& data);

        /**
         * Nested value: serializer id followed by its payload.
         *
         * @throws SerializationException if the cursor has no service
         */
        void write_object(const Value& value);

        /**
         * Overwrites an int already written at an absolute position.
         */
        void write_int_at(size_t position, int32_t value) { buf_.put_u32_at(position, static_cast<uint32_t>(value)); }

        [[nodiscard]] size_t position() const noexcept { return buf_.position(); }

        [[nodiscard]] common::ByteOrder order() const noexcept { return buf_.order(); }

        [[nodiscard]] const SerializationService* service() const noexcept { return service_; }

        [[nodiscard]] std::span<const uint8_t> span() const noexcept { return buf_.span(); }

        /**
         * Moves the written bytes out.
         */
        [[nodiscard]] std::vector<uint8_t> take() { return buf_.take(); }

    private:
        common::ByteBuffer buf_;
        const SerializationService* service_;
    };

    /**
     * ObjectDataInput - Read cursor over a serialized payload.
     *
     * Mirrors ObjectDataOutput. Reading past the end throws std::out_of_range.
     * The viewed bytes must outlive the cursor.
     *
     * Nested payloads are bounded: a cursor bound to a service takes the
     * service's max_nesting_depth, an unbound one DEFAULT_MAX_NESTING_DEPTH.
     */
    class GRIDWIRE_API ObjectDataInput {
    public:
        static constexpr size_t DEFAULT_MAX_NESTING_DEPTH = 64;

        /**
         * One open level of nested decoding; released on destruction.
         */
        class GRIDWIRE_API NestingScope {
        public:
            explicit NestingScope(ObjectDataInput& in);
            ~NestingScope() noexcept;

            NestingScope(const NestingScope&) = delete;
            NestingScope& operator=(const NestingScope&) = delete;

        private:
            ObjectDataInput& in_;
        };

        ObjectDataInput(
            std::span<const uint8_t> bytes,
            common::ByteOrder order,
            const SerializationService* service = nullptr,
            size_t offset = 0
        );

        [[nodiscard]] bool read_boolean() { return buf_.get_u8() != 0; }
        [[nodiscard]] int8_t read_byte() { return buf_.get_i8(); }
        [[nodiscard]] char16_t read_char() { return static_cast<char16_t>(buf_.get_u16()); }
        [[nodiscard]] int16_t read_short() { return buf_.get_i16(); }
        [[nodiscard]] int32_t read_int() { return buf_.get_i32(); }
        [[nodiscard]] int64_t read_long() { return buf_.get_i64(); }
        [[nodiscard]] float read_float() { return buf_.get_f32(); }
        [[nodiscard]] double read_double() { return buf_.get_f64(); }

        /**
         * @throws SerializationException if a null string was written
         */
        [[nodiscard]] std::string read_string();

        [[nodiscard]] std::optional<std::string> read_nullable_string();

        [[nodiscard]] std::vector<uint8_t> read_bytes(size_t length) { return buf_.get_bytes(length); }

        [[nodiscard]] std::vector<uint8_t> read_byte_array();
        [[nodiscard]] std::vector<int32_t> read_int_array();
        [[nodiscard]] std::vector<int64_t> read_long_array();
        [[nodiscard]] std::vector<std::string> read_string_array();

        /**
         * Envelope written by ObjectDataOutput::write_data, in this cursor's byte order.
         *
         * @throws SerializationException if the length cannot hold an envelope
         */
        [[nodiscard]] Data read_data();

        /**
         * Reads an int32 element count.
         *
         * @throws SerializationException on a negative count or one larger than the remaining bytes
         */
        [[nodiscard]] size_t read_length(size_t min_element_size = 1);

        /**
         * Nested value written by ObjectDataOutput::write_object.
         *
         * @throws SerializationException if the cursor has no service
         */
        [[nodiscard]] Value read_object();

        /**
         * Opens a nesting level for a nested payload.
         *
         * @throws SerializationException once more than max_nesting_depth() levels are open
         */
        [[nodiscard]] NestingScope enter_nested() { return NestingScope{*this}; }

        [[nodiscard]] size_t nesting_depth() const noexcept { return depth_; }

        [[nodiscard]] size_t max_nesting_depth() const noexcept { return max_depth_; }

        [[nodiscard]] size_t position() const noexcept { return buf_.position(); }

        void set_position(size_t position) { buf_.position(position); }

        [[nodiscard]] size_t remaining() const noexcept { return buf_.remaining(); }

        [[nodiscard]] common::ByteOrder order() const noexcept { return buf_.order(); }

        [[nodiscard]] const SerializationService* service() const noexcept { return service_; }

    private:
        common::ByteBuffer buf_;
        const SerializationService* service_;
        size_t max_depth_;
        size_t depth_ = 0;
    };
} // namespace gridwire
