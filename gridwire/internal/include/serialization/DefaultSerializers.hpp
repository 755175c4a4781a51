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

// gridwire/internal/include/serialization/DefaultSerializers.hpp
#pragma once

#include "gridwire/SerializerRegistry.hpp"
#include "gridwire/Serializer.hpp"
#include "serialization/SerializationConstants.hpp"

#include <cstdint>

namespace gridwire::serialization {
    /**
     * Base of the built-in serializers: a fixed well-known type id.
     */
    template <int32_t Id>
    class DefaultSerializer : public Serializer {
    public:
        static constexpr int32_t ID = Id;

        [[nodiscard]] int32_t id() const noexcept final { return Id; }
    };

    // ==================== Scalars ====================

    class NullSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_NULL> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class StringSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_STRING> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class BooleanSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_BOOLEAN> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class ByteSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_BYTE> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class CharSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_CHAR> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class ShortSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_SHORT> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class IntegerSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_INTEGER> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class LongSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_LONG> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class FloatSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_FLOAT> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class DoubleSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_DOUBLE> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    // ==================== Date / time ====================

    class DateSerializer final : public DefaultSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_DATE> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class LocalDateSerializer final : public DefaultSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_LOCAL_DATE> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class LocalTimeSerializer final : public DefaultSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_LOCAL_TIME> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class LocalDateTimeSerializer final : public DefaultSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_LOCAL_DATE_TIME> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class OffsetDateTimeSerializer final : public DefaultSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_OFFSET_DATE_TIME> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    // ==================== Typed arrays ====================

    /**
     * Byte arrays. Accepts a Buffer or an Array of numbers; reads a Buffer.
     */
    class ByteArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_BYTE_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class BooleanArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_BOOLEAN_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class CharArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_CHAR_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class ShortArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_SHORT_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class IntegerArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_INTEGER_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class LongArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_LONG_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class FloatArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_FLOAT_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class DoubleArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_DOUBLE_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    /**
     * String arrays. Null elements are written as null strings.
     */
    class StringArraySerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_STRING_ARRAY> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    // ==================== Java collections ====================

    /**
     * Element count followed by one nested object per element; reads an Array.
     * Used for ArrayList, LinkedList and Object[] sent by Java members.
     */
    template <int32_t Id>
    class ListSerializer final : public DefaultSerializer<Id> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override {
            const auto& items = value.get<Array>();
            out.write_int(static_cast<int32_t>(items.size()));
            for (const auto& item : items) { out.write_object(item); }
        }

        [[nodiscard]] Value read(ObjectDataInput& in) const override {
            const auto size = in.read_length(4);
            Array items;
            items.reserve(size);
            for (size_t i = 0; i < size; ++i) { items.push_back(in.read_object()); }
            return Value::array(std::move(items));
        }
    };

    using ArrayListSerializer = ListSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_ARRAY_LIST>;
    using LinkedListSerializer = ListSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_LINKED_LIST>;
    using JavaArraySerializer = ListSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_ARRAY>;

    // ==================== Misc ====================

    class JavaClassSerializer final : public DefaultSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_CLASS> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class UuidSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_UUID> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class BigIntSerializer final : public DefaultSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_BIG_INTEGER> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    class BigDecimalSerializer final : public DefaultSerializer<SerializationConstants::JAVA_DEFAULT_TYPE_BIG_DECIMAL> {
    public:
        void write(ObjectDataOutput& out, const Value& value) const override;
        [[nodiscard]] Value read(ObjectDataInput& in) const override;
    };

    /**
     * Registers every default-type serializer under its canonical name.
     */
    void register_default_serializers(SerializerRegistry::Builder& builder);
} // namespace gridwire::serialization
