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

// gridwire/gridwire/include/gridwire/Value.hpp
#pragma once

#include "gridwire/Data.hpp"
#include "gridwire/Errors.hpp"
#include "gridwire/Export.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gridwire {
    namespace compact {
        class GenericRecord;
    }

    class UserObject;
    class Value;

    /**
     * ValueKind - Runtime kind of a Value.
     *
     * Enumerators follow the alternative order of Value::Storage, so
     * kind() is the variant index.
     */
    enum class ValueKind : uint8_t {
        Absent,
        Null,
        Boolean,
        Number,
        Byte,
        Char,
        Short,
        Integer,
        Long,
        Float,
        Double,
        String,
        Buffer,
        Array,
        Object,
        BigInt,
        BigDecimal,
        Uuid,
        Date,
        LocalDate,
        LocalTime,
        LocalDateTime,
        OffsetDateTime,
        JavaClass,
        JsonValue,
        GenericRecord,
        UserObject,
        Data,
    };

    /**
     * Lower camel case kind name ("number", "buffer", "localDate", ...).
     */
    [[nodiscard]] GRIDWIRE_API const char* kind_name(ValueKind kind) noexcept;

    // ==================== Payload types ====================

    /**
     * The "undefined" sentinel. Never serializable.
     */
    struct AbsentValue {
        bool operator==(const AbsentValue&) const = default;
    };

    /**
     * Untyped number; the configured default number type decides its codec.
     */
    struct Number {
        double value = 0.0;

        bool operator==(const Number&) const = default;
    };

    using Bytes = std::vector<uint8_t>;
    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value>;
    using BigInt = boost::multiprecision::cpp_int;
    using Date = std::chrono::sys_time<std::chrono::milliseconds>;

    /**
     * Arbitrary precision decimal: unscaled * 10^-scale.
     */
    struct GRIDWIRE_API BigDecimal {
        BigInt unscaled;
        int32_t scale = 0;

        /**
         * Parses plain or scientific notation ("-1.25", "3E+4", "1.5e-3").
         *
         * @throws std::invalid_argument on malformed text
         */
        [[nodiscard]] static BigDecimal from_string(std::string_view text);

        [[nodiscard]] std::string to_string() const;

        bool operator==(const BigDecimal&) const = default;
    };

    struct GRIDWIRE_API Uuid {
        int64_t most_significant = 0;
        int64_t least_significant = 0;

        /**
         * Canonical 8-4-4-4-12 hex form.
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const Uuid&) const = default;
    };

    struct LocalDate {
        int32_t year = 1970;
        int8_t month = 1;
        int8_t day = 1;

        bool operator==(const LocalDate&) const = default;
    };

    struct LocalTime {
        int8_t hour = 0;
        int8_t minute = 0;
        int8_t second = 0;
        int32_t nano = 0;

        bool operator==(const LocalTime&) const = default;
    };

    struct LocalDateTime {
        LocalDate date;
        LocalTime time;

        bool operator==(const LocalDateTime&) const = default;
    };

    struct OffsetDateTime {
        LocalDateTime date_time;
        int32_t offset_seconds = 0;

        bool operator==(const OffsetDateTime&) const = default;
    };

    struct JavaClass {
        std::string name;

        bool operator==(const JavaClass&) const = default;
    };

    /**
     * JSON text kept as-is (lazy JSON deserialization).
     */
    struct JsonValue {
        std::string text;

        bool operator==(const JsonValue&) const = default;
    };

    using GenericRecordPtr = std::shared_ptr<const compact::GenericRecord>;
    using UserObjectPtr = std::shared_ptr<const UserObject>;

    /**
     * Value - Closed sum of every runtime value the serializer understands.
     *
     * A default-constructed Value is the absent sentinel. Build values with
     * the named factories; inspect them with kind(), get<T>() and get_if<T>().
     *
     * ```cpp
     * auto v = Value::array({Value::int32(1), Value::int32(2)});
     * if (v.kind() == ValueKind::Array) {
     *     for (const auto& e : v.get<Array>()) { ... }
     * }
     * ```
     */
    class GRIDWIRE_API Value {
    public:
        using Storage = std::variant<
            AbsentValue,
            std::nullptr_t,
            bool,
            Number,
            int8_t,
            char16_t,
            int16_t,
            int32_t,
            int64_t,
            float,
            double,
            std::string,
            Bytes,
            Array,
            Object,
            BigInt,
            BigDecimal,
            Uuid,
            Date,
            LocalDate,
            LocalTime,
            LocalDateTime,
            OffsetDateTime,
            JavaClass,
            JsonValue,
            GenericRecordPtr,
            UserObjectPtr,
            Data
        >;

        Value() = default;

        // ==================== Factories ====================

        [[nodiscard]] static Value absent() { return Value{}; }
        [[nodiscard]] static Value null() { return make<std::nullptr_t>(nullptr); }
        [[nodiscard]] static Value boolean(bool v) { return make<bool>(v); }
        [[nodiscard]] static Value number(double v) { return make<Number>(Number{v}); }
        [[nodiscard]] static Value int8(int8_t v) { return make<int8_t>(v); }
        [[nodiscard]] static Value character(char16_t v) { return make<char16_t>(v); }
        [[nodiscard]] static Value int16(int16_t v) { return make<int16_t>(v); }
        [[nodiscard]] static Value int32(int32_t v) { return make<int32_t>(v); }
        [[nodiscard]] static Value int64(int64_t v) { return make<int64_t>(v); }
        [[nodiscard]] static Value float32(float v) { return make<float>(v); }
        [[nodiscard]] static Value float64(double v) { return make<double>(v); }
        [[nodiscard]] static Value string(std::string v) { return make<std::string>(std::move(v)); }
        [[nodiscard]] static Value buffer(Bytes v) { return make<Bytes>(std::move(v)); }
        [[nodiscard]] static Value array(Array v) { return make<Array>(std::move(v)); }
        [[nodiscard]] static Value object(Object v) { return make<Object>(std::move(v)); }
        [[nodiscard]] static Value big_int(BigInt v) { return make<BigInt>(std::move(v)); }
        [[nodiscard]] static Value big_decimal(BigDecimal v) { return make<BigDecimal>(std::move(v)); }
        [[nodiscard]] static Value uuid(Uuid v) { return make<Uuid>(v); }
        [[nodiscard]] static Value date(Date v) { return make<Date>(v); }
        [[nodiscard]] static Value local_date(LocalDate v) { return make<LocalDate>(v); }
        [[nodiscard]] static Value local_time(LocalTime v) { return make<LocalTime>(v); }
        [[nodiscard]] static Value local_date_time(LocalDateTime v) { return make<LocalDateTime>(v); }
        [[nodiscard]] static Value offset_date_time(OffsetDateTime v) { return make<OffsetDateTime>(v); }
        [[nodiscard]] static Value java_class(std::string name) { return make<JavaClass>(JavaClass{std::move(name)}); }
        [[nodiscard]] static Value json(std::string text) { return make<JsonValue>(JsonValue{std::move(text)}); }
        [[nodiscard]] static Value record(GenericRecordPtr v);
        [[nodiscard]] static Value user(UserObjectPtr v);
        [[nodiscard]] static Value data(Data v) { return make<Data>(std::move(v)); }

        // ==================== Inspection ====================

        [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }

        [[nodiscard]] bool is_absent() const noexcept { return kind() == ValueKind::Absent; }

        [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }

        /**
         * Checks for Number, Byte, Short, Integer, Long, Float or Double.
         */
        [[nodiscard]] bool is_numeric() const noexcept;

        /**
         * Numeric value as double.
         *
         * @throws SerializationException if the value is not numeric
         */
        [[nodiscard]] double as_double() const;

        /**
         * Numeric value truncated to int64.
         *
         * @throws SerializationException if the value is not numeric
         */
        [[nodiscard]] int64_t as_int64() const;

        /**
         * Returns the held alternative.
         *
         * @throws SerializationException if the value holds another alternative
         */
        template <typename T>
        [[nodiscard]] const T& get() const {
            if (const auto* v = std::get_if<T>(&storage_)) { return *v; }
            throw SerializationException(std::string{"Unexpected value kind: "} + kind_name(kind()));
        }

        template <typename T>
        [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&storage_); }

        [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

        /**
         * Deep equality. Numeric kinds compare by numeric value, user objects
         * through UserObject::equals.
         */
        [[nodiscard]] bool operator==(const Value& other) const;

        /**
         * Debug representation.
         */
        [[nodiscard]] std::string to_string() const;

    private:
        template <typename T, typename Arg>
        static Value make(Arg&& arg) {
            Value v;
            v.storage_.emplace<T>(std::forward<Arg>(arg));
            return v;
        }

        Storage storage_;
    };

    /**
     * UserObject - Base of application types handed to the serializer.
     *
     * Capabilities (IdentifiedDataSerializable, Portable, CustomSerializable,
     * Compact registration) are discovered through the dynamic type. The
     * hooks below are optional.
     */
    class GRIDWIRE_API UserObject {
    public:
        virtual ~UserObject() = default;

        /**
         * Nested partition key. Absent or null means the object has none.
         */
        [[nodiscard]] virtual Value partition_key() const { return {}; }

        /**
         * Partition hash used verbatim by the default partitioning strategy.
         */
        [[nodiscard]] virtual std::optional<int32_t> partition_hash() const { return std::nullopt; }

        /**
         * Plain representation used by the JSON fallback codec.
         */
        [[nodiscard]] virtual Value plain_form() const { return Value::object({}); }

        /**
         * Value equality; identity unless overridden.
         */
        [[nodiscard]] virtual bool equals(const UserObject& other) const { return this == &other; }
    };
} // namespace gridwire
