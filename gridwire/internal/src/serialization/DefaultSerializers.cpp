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

// gridwire/internal/src/serialization/DefaultSerializers.cpp
#include "serialization/DefaultSerializers.hpp"
#include "serialization/BigNumbers.hpp"

#include <memory>
#include <string>

namespace gridwire::serialization {
    namespace {
        [[noreturn]] void unsupported(const Value& value, const char* target) {
            throw SerializationException(std::string{"Cannot write a value of kind "} + kind_name(value.kind()) + " as " + target);
        }

        double number_of(const Value& value, const char* target) {
            if (!value.is_numeric()) { unsupported(value, target); }
            return value.as_double();
        }

        int64_t integer_of(const Value& value, const char* target) {
            if (!value.is_numeric()) { unsupported(value, target); }
            return value.as_int64();
        }

        char16_t char_of(const Value& value, const char* target) {
            if (const auto* c = value.get_if<char16_t>()) { return *c; }
            return static_cast<char16_t>(integer_of(value, target));
        }

        const Array& array_of(const Value& value, const char* target) {
            const auto* items = value.get_if<Array>();
            if (items == nullptr) { unsupported(value, target); }
            return *items;
        }

        template <typename Fn>
        void write_elements(ObjectDataOutput& out, const Value& value, const char* target, Fn&& write_one) {
            const auto& items = array_of(value, target);
            out.write_int(static_cast<int32_t>(items.size()));
            for (const auto& item : items) { write_one(item); }
        }

        template <typename Fn>
        Value read_elements(ObjectDataInput& in, size_t element_size, Fn&& read_one) {
            const auto size = in.read_length(element_size);
            Array items;
            items.reserve(size);
            for (size_t i = 0; i < size; ++i) { items.push_back(read_one()); }
            return Value::array(std::move(items));
        }

        void write_local_date(ObjectDataOutput& out, const LocalDate& d) {
            out.write_int(d.year);
            out.write_byte(d.month);
            out.write_byte(d.day);
        }

        LocalDate read_local_date(ObjectDataInput& in) {
            LocalDate d;
            d.year = in.read_int();
            d.month = in.read_byte();
            d.day = in.read_byte();
            return d;
        }

        void write_local_time(ObjectDataOutput& out, const LocalTime& t) {
            out.write_byte(t.hour);
            out.write_byte(t.minute);
            out.write_byte(t.second);
            out.write_int(t.nano);
        }

        LocalTime read_local_time(ObjectDataInput& in) {
            LocalTime t;
            t.hour = in.read_byte();
            t.minute = in.read_byte();
            t.second = in.read_byte();
            t.nano = in.read_int();
            return t;
        }
    }

    // ==================== Scalars ====================

    void NullSerializer::write(ObjectDataOutput&, const Value&) const {}

    Value NullSerializer::read(ObjectDataInput&) const { return Value::null(); }

    void StringSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* s = value.get_if<std::string>();
        if (s == nullptr) { unsupported(value, "string"); }
        out.write_string(*s);
    }

    Value StringSerializer::read(ObjectDataInput& in) const {
        auto s = in.read_nullable_string();
        return s ? Value::string(std::move(*s)) : Value::null();
    }

    void BooleanSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* b = value.get_if<bool>();
        if (b == nullptr) { unsupported(value, "boolean"); }
        out.write_boolean(*b);
    }

    Value BooleanSerializer::read(ObjectDataInput& in) const { return Value::boolean(in.read_boolean()); }

    void ByteSerializer::write(ObjectDataOutput& out, const Value& value) const {
        out.write_byte(static_cast<int8_t>(integer_of(value, "byte")));
    }

    Value ByteSerializer::read(ObjectDataInput& in) const { return Value::int8(in.read_byte()); }

    void CharSerializer::write(ObjectDataOutput& out, const Value& value) const { out.write_char(char_of(value, "char")); }

    Value CharSerializer::read(ObjectDataInput& in) const { return Value::character(in.read_char()); }

    void ShortSerializer::write(ObjectDataOutput& out, const Value& value) const {
        out.write_short(static_cast<int16_t>(integer_of(value, "short")));
    }

    Value ShortSerializer::read(ObjectDataInput& in) const { return Value::int16(in.read_short()); }

    void IntegerSerializer::write(ObjectDataOutput& out, const Value& value) const {
        out.write_int(static_cast<int32_t>(integer_of(value, "integer")));
    }

    Value IntegerSerializer::read(ObjectDataInput& in) const { return Value::int32(in.read_int()); }

    void LongSerializer::write(ObjectDataOutput& out, const Value& value) const { out.write_long(integer_of(value, "long")); }

    Value LongSerializer::read(ObjectDataInput& in) const { return Value::int64(in.read_long()); }

    void FloatSerializer::write(ObjectDataOutput& out, const Value& value) const {
        out.write_float(static_cast<float>(number_of(value, "float")));
    }

    Value FloatSerializer::read(ObjectDataInput& in) const { return Value::float32(in.read_float()); }

    void DoubleSerializer::write(ObjectDataOutput& out, const Value& value) const { out.write_double(number_of(value, "double")); }

    Value DoubleSerializer::read(ObjectDataInput& in) const { return Value::float64(in.read_double()); }

    // ==================== Date / time ====================

    void DateSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* d = value.get_if<Date>();
        if (d == nullptr) { unsupported(value, "date"); }
        out.write_long(d->time_since_epoch().count());
    }

    Value DateSerializer::read(ObjectDataInput& in) const { return Value::date(Date{std::chrono::milliseconds{in.read_long()}}); }

    void LocalDateSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* d = value.get_if<LocalDate>();
        if (d == nullptr) { unsupported(value, "localDate"); }
        write_local_date(out, *d);
    }

    Value LocalDateSerializer::read(ObjectDataInput& in) const { return Value::local_date(read_local_date(in)); }

    void LocalTimeSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* t = value.get_if<LocalTime>();
        if (t == nullptr) { unsupported(value, "localTime"); }
        write_local_time(out, *t);
    }

    Value LocalTimeSerializer::read(ObjectDataInput& in) const { return Value::local_time(read_local_time(in)); }

    void LocalDateTimeSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* dt = value.get_if<LocalDateTime>();
        if (dt == nullptr) { unsupported(value, "localDateTime"); }
        write_local_date(out, dt->date);
        write_local_time(out, dt->time);
    }

    Value LocalDateTimeSerializer::read(ObjectDataInput& in) const {
        LocalDateTime dt;
        dt.date = read_local_date(in);
        dt.time = read_local_time(in);
        return Value::local_date_time(dt);
    }

    void OffsetDateTimeSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* odt = value.get_if<OffsetDateTime>();
        if (odt == nullptr) { unsupported(value, "offsetDateTime"); }
        write_local_date(out, odt->date_time.date);
        write_local_time(out, odt->date_time.time);
        out.write_int(odt->offset_seconds);
    }

    Value OffsetDateTimeSerializer::read(ObjectDataInput& in) const {
        OffsetDateTime odt;
        odt.date_time.date = read_local_date(in);
        odt.date_time.time = read_local_time(in);
        odt.offset_seconds = in.read_int();
        return Value::offset_date_time(odt);
    }

    // ==================== Typed arrays ====================

    void ByteArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        if (const auto* bytes = value.get_if<Bytes>()) {
            out.write_byte_array(*bytes);
            return;
        }
        write_elements(out, value, "byteArray", [&out](const Value& e) { out.write_byte(static_cast<int8_t>(integer_of(e, "byteArray"))); });
    }

    Value ByteArraySerializer::read(ObjectDataInput& in) const { return Value::buffer(in.read_byte_array()); }

    void BooleanArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        write_elements(out, value, "booleanArray", [&out](const Value& e) {
            const auto* b = e.get_if<bool>();
            if (b == nullptr) { unsupported(e, "booleanArray element"); }
            out.write_boolean(*b);
        });
    }

    Value BooleanArraySerializer::read(ObjectDataInput& in) const {
        return read_elements(in, 1, [&in] { return Value::boolean(in.read_boolean()); });
    }

    void CharArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        write_elements(out, value, "charArray", [&out](const Value& e) { out.write_char(char_of(e, "charArray")); });
    }

    Value CharArraySerializer::read(ObjectDataInput& in) const {
        return read_elements(in, 2, [&in] { return Value::character(in.read_char()); });
    }

    void ShortArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        write_elements(out, value, "shortArray", [&out](const Value& e) { out.write_short(static_cast<int16_t>(integer_of(e, "shortArray"))); });
    }

    Value ShortArraySerializer::read(ObjectDataInput& in) const {
        return read_elements(in, 2, [&in] { return Value::int16(in.read_short()); });
    }

    void IntegerArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        write_elements(out, value, "integerArray", [&out](const Value& e) { out.write_int(static_cast<int32_t>(integer_of(e, "integerArray"))); });
    }

    Value IntegerArraySerializer::read(ObjectDataInput& in) const {
        return read_elements(in, 4, [&in] { return Value::int32(in.read_int()); });
    }

    void LongArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        write_elements(out, value, "longArray", [&out](const Value& e) { out.write_long(integer_of(e, "longArray")); });
    }

    Value LongArraySerializer::read(ObjectDataInput& in) const {
        return read_elements(in, 8, [&in] { return Value::int64(in.read_long()); });
    }

    void FloatArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        write_elements(out, value, "floatArray", [&out](const Value& e) { out.write_float(static_cast<float>(number_of(e, "floatArray"))); });
    }

    Value FloatArraySerializer::read(ObjectDataInput& in) const {
        return read_elements(in, 4, [&in] { return Value::float32(in.read_float()); });
    }

    void DoubleArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        write_elements(out, value, "doubleArray", [&out](const Value& e) { out.write_double(number_of(e, "doubleArray")); });
    }

    Value DoubleArraySerializer::read(ObjectDataInput& in) const {
        return read_elements(in, 8, [&in] { return Value::float64(in.read_double()); });
    }

    void StringArraySerializer::write(ObjectDataOutput& out, const Value& value) const {
        write_elements(out, value, "stringArray", [&out](const Value& e) {
            if (e.is_null()) {
                out.write_nullable_string(std::nullopt);
                return;
            }
            const auto* s = e.get_if<std::string>();
            if (s == nullptr) { unsupported(e, "stringArray element"); }
            out.write_string(*s);
        });
    }

    Value StringArraySerializer::read(ObjectDataInput& in) const {
        return read_elements(in, 4, [&in] {
            auto s = in.read_nullable_string();
            return s ? Value::string(std::move(*s)) : Value::null();
        });
    }

    // ==================== Misc ====================

    void JavaClassSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* c = value.get_if<JavaClass>();
        if (c == nullptr) { unsupported(value, "javaClass"); }
        out.write_string(c->name);
    }

    Value JavaClassSerializer::read(ObjectDataInput& in) const { return Value::java_class(in.read_string()); }

    void UuidSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* u = value.get_if<Uuid>();
        if (u == nullptr) { unsupported(value, "uuid"); }
        out.write_long(u->most_significant);
        out.write_long(u->least_significant);
    }

    Value UuidSerializer::read(ObjectDataInput& in) const {
        Uuid u;
        u.most_significant = in.read_long();
        u.least_significant = in.read_long();
        return Value::uuid(u);
    }

    void BigIntSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* v = value.get_if<BigInt>();
        if (v == nullptr) { unsupported(value, "bigint"); }
        out.write_byte_array(to_twos_complement(*v));
    }

    Value BigIntSerializer::read(ObjectDataInput& in) const { return Value::big_int(from_twos_complement(in.read_byte_array())); }

    void BigDecimalSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* d = value.get_if<BigDecimal>();
        if (d == nullptr) { unsupported(value, "bigDecimal"); }
        out.write_byte_array(to_twos_complement(d->unscaled));
        out.write_int(d->scale);
    }

    Value BigDecimalSerializer::read(ObjectDataInput& in) const {
        BigDecimal d;
        d.unscaled = from_twos_complement(in.read_byte_array());
        d.scale = in.read_int();
        return Value::big_decimal(std::move(d));
    }

    void register_default_serializers(SerializerRegistry::Builder& builder) {
        builder.register_serializer(SerializerName::String, std::make_shared<StringSerializer>())
            .register_serializer(SerializerName::Double, std::make_shared<DoubleSerializer>())
            .register_serializer(SerializerName::Byte, std::make_shared<ByteSerializer>())
            .register_serializer(SerializerName::Boolean, std::make_shared<BooleanSerializer>())
            .register_serializer(SerializerName::Null, std::make_shared<NullSerializer>())
            .register_serializer(SerializerName::Short, std::make_shared<ShortSerializer>())
            .register_serializer(SerializerName::Integer, std::make_shared<IntegerSerializer>())
            .register_serializer(SerializerName::Long, std::make_shared<LongSerializer>())
            .register_serializer(SerializerName::Float, std::make_shared<FloatSerializer>())
            .register_serializer(SerializerName::Char, std::make_shared<CharSerializer>())
            .register_serializer(SerializerName::Date, std::make_shared<DateSerializer>())
            .register_serializer(SerializerName::LocalDate, std::make_shared<LocalDateSerializer>())
            .register_serializer(SerializerName::LocalTime, std::make_shared<LocalTimeSerializer>())
            .register_serializer(SerializerName::LocalDateTime, std::make_shared<LocalDateTimeSerializer>())
            .register_serializer(SerializerName::OffsetDateTime, std::make_shared<OffsetDateTimeSerializer>())
            .register_serializer(SerializerName::ByteArray, std::make_shared<ByteArraySerializer>())
            .register_serializer(SerializerName::CharArray, std::make_shared<CharArraySerializer>())
            .register_serializer(SerializerName::BooleanArray, std::make_shared<BooleanArraySerializer>())
            .register_serializer(SerializerName::ShortArray, std::make_shared<ShortArraySerializer>())
            .register_serializer(SerializerName::IntegerArray, std::make_shared<IntegerArraySerializer>())
            .register_serializer(SerializerName::LongArray, std::make_shared<LongArraySerializer>())
            .register_serializer(SerializerName::DoubleArray, std::make_shared<DoubleArraySerializer>())
            .register_serializer(SerializerName::StringArray, std::make_shared<StringArraySerializer>())
            .register_serializer(SerializerName::JavaClass, std::make_shared<JavaClassSerializer>())
            .register_serializer(SerializerName::FloatArray, std::make_shared<FloatArraySerializer>())
            .register_serializer(SerializerName::ArrayList, std::make_shared<ArrayListSerializer>())
            .register_serializer(SerializerName::LinkedList, std::make_shared<LinkedListSerializer>())
            .register_serializer(SerializerName::Uuid, std::make_shared<UuidSerializer>())
            .register_serializer(SerializerName::BigDecimal, std::make_shared<BigDecimalSerializer>())
            .register_serializer(SerializerName::BigInt, std::make_shared<BigIntSerializer>())
            .register_serializer(SerializerName::JavaArray, std::make_shared<JavaArraySerializer>());
    }
} // namespace gridwire::serialization
