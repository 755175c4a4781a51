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

// gridwire/gridwire/src/Value.cpp
#include "gridwire/Value.hpp"
#include "gridwire/compact/GenericRecord.hpp"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace gridwire {
    const char* kind_name(ValueKind kind) noexcept {
        switch (kind) {
            case ValueKind::Absent: return "absent";
            case ValueKind::Null: return "null";
            case ValueKind::Boolean: return "boolean";
            case ValueKind::Number: return "number";
            case ValueKind::Byte: return "byte";
            case ValueKind::Char: return "char";
            case ValueKind::Short: return "short";
            case ValueKind::Integer: return "integer";
            case ValueKind::Long: return "long";
            case ValueKind::Float: return "float";
            case ValueKind::Double: return "double";
            case ValueKind::String: return "string";
            case ValueKind::Buffer: return "buffer";
            case ValueKind::Array: return "array";
            case ValueKind::Object: return "object";
            case ValueKind::BigInt: return "bigint";
            case ValueKind::BigDecimal: return "bigDecimal";
            case ValueKind::Uuid: return "uuid";
            case ValueKind::Date: return "date";
            case ValueKind::LocalDate: return "localDate";
            case ValueKind::LocalTime: return "localTime";
            case ValueKind::LocalDateTime: return "localDateTime";
            case ValueKind::OffsetDateTime: return "offsetDateTime";
            case ValueKind::JavaClass: return "javaClass";
            case ValueKind::JsonValue: return "jsonValue";
            case ValueKind::GenericRecord: return "genericRecord";
            case ValueKind::UserObject: return "userObject";
            case ValueKind::Data: return "data";
        }
        return "unknown";
    }

    // ==================== BigDecimal ====================

    BigDecimal BigDecimal::from_string(std::string_view text) {
        if (text.empty()) { throw std::invalid_argument("Empty decimal string"); }

        size_t i = 0;
        bool negative = false;
        if (text[0] == '+' || text[0] == '-') {
            negative = text[0] == '-';
            ++i;
        }

        std::string digits;
        int64_t scale = 0;
        bool seen_point = false;
        for (; i < text.size(); ++i) {
            const char c = text[i];
            if (c >= '0' && c <= '9') {
                digits.push_back(c);
                if (seen_point) { ++scale; }
            }
            else if (c == '.' && !seen_point) { seen_point = true; }
            else if (c == 'e' || c == 'E') { break; }
            else { throw std::invalid_argument("Malformed decimal: " + std::string{text}); }
        }
        if (digits.empty()) { throw std::invalid_argument("Malformed decimal: " + std::string{text}); }

        if (i < text.size()) {
            auto exp_text = text.substr(i + 1);
            if (!exp_text.empty() && exp_text[0] == '+') { exp_text.remove_prefix(1); }
            int64_t exponent = 0;
            const auto [ptr, ec] = std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
            if (ec != std::errc{} || ptr != exp_text.data() + exp_text.size() || exp_text.empty()) {
                throw std::invalid_argument("Malformed decimal exponent: " + std::string{text});
            }
            scale -= exponent;
        }
        if (scale > std::numeric_limits<int32_t>::max() || scale < std::numeric_limits<int32_t>::min()) {
            throw std::invalid_argument("Decimal scale out of range: " + std::string{text});
        }

        // cpp_int reads a leading zero as an octal prefix
        const auto first = digits.find_first_not_of('0');
        digits = first == std::string::npos ? "0" : digits.substr(first);

        BigDecimal result;
        result.unscaled = BigInt{digits};
        if (negative) { result.unscaled = -result.unscaled; }
        result.scale = static_cast<int32_t>(scale);
        return result;
    }

    std::string BigDecimal::to_string() const {
        const bool negative = unscaled < 0;
        std::string digits = (negative ? BigInt{-unscaled} : unscaled).str();

        if (scale <= 0) {
            if (unscaled != 0) { digits.append(static_cast<size_t>(-static_cast<int64_t>(scale)), '0'); }
        }
        else {
            const auto s = static_cast<size_t>(scale);
            if (digits.size() <= s) { digits.insert(0, s - digits.size() + 1, '0'); }
            digits.insert(digits.size() - s, 1, '.');
        }
        return negative ? "-" + digits : digits;
    }

    // ==================== Uuid ====================

    std::string Uuid::to_string() const {
        const auto msb = static_cast<uint64_t>(most_significant);
        const auto lsb = static_cast<uint64_t>(least_significant);

        std::ostringstream os;
        os << std::hex << std::setfill('0')
            << std::setw(8) << (msb >> 32) << '-'
            << std::setw(4) << ((msb >> 16) & 0xFFFF) << '-'
            << std::setw(4) << (msb & 0xFFFF) << '-'
            << std::setw(4) << (lsb >> 48) << '-'
            << std::setw(12) << (lsb & 0xFFFFFFFFFFFFULL);
        return os.str();
    }

    // ==================== Value ====================

    Value Value::record(GenericRecordPtr v) {
        if (!v) { return null(); }
        return make<GenericRecordPtr>(std::move(v));
    }

    Value Value::user(UserObjectPtr v) {
        if (!v) { return null(); }
        return make<UserObjectPtr>(std::move(v));
    }

    bool Value::is_numeric() const noexcept {
        switch (kind()) {
            case ValueKind::Number:
            case ValueKind::Byte:
            case ValueKind::Short:
            case ValueKind::Integer:
            case ValueKind::Long:
            case ValueKind::Float:
            case ValueKind::Double:
                return true;
            default:
                return false;
        }
    }

    double Value::as_double() const {
        switch (kind()) {
            case ValueKind::Number: return std::get<Number>(storage_).value;
            case ValueKind::Byte: return std::get<int8_t>(storage_);
            case ValueKind::Short: return std::get<int16_t>(storage_);
            case ValueKind::Integer: return std::get<int32_t>(storage_);
            case ValueKind::Long: return static_cast<double>(std::get<int64_t>(storage_));
            case ValueKind::Float: return std::get<float>(storage_);
            case ValueKind::Double: return std::get<double>(storage_);
            default: throw SerializationException(std::string{"Expected a numeric value but got "} + kind_name(kind()));
        }
    }

    int64_t Value::as_int64() const {
        switch (kind()) {
            case ValueKind::Byte: return std::get<int8_t>(storage_);
            case ValueKind::Short: return std::get<int16_t>(storage_);
            case ValueKind::Integer: return std::get<int32_t>(storage_);
            case ValueKind::Long: return std::get<int64_t>(storage_);
            default: break;
        }
        const double d = as_double();
        if (!std::isfinite(d)) { return 0; }
        if (d >= 9223372036854775807.0) { return std::numeric_limits<int64_t>::max(); }
        if (d <= -9223372036854775808.0) { return std::numeric_limits<int64_t>::min(); }
        return static_cast<int64_t>(d);
    }

    namespace {
        bool is_integral_kind(ValueKind k) noexcept {
            return k == ValueKind::Byte || k == ValueKind::Short || k == ValueKind::Integer || k == ValueKind::Long;
        }
    }

    bool Value::operator==(const Value& other) const {
        if (is_numeric() && other.is_numeric()) {
            if (is_integral_kind(kind()) && is_integral_kind(other.kind())) { return as_int64() == other.as_int64(); }
            return as_double() == other.as_double();
        }
        if (kind() != other.kind()) { return false; }

        return std::visit(
            [&other](const auto& lhs) -> bool {
                using T = std::decay_t<decltype(lhs)>;
                const auto& rhs = std::get<T>(other.storage_);
                if constexpr (std::is_same_v<T, GenericRecordPtr>) {
                    if (!lhs || !rhs) { return lhs == rhs; }
                    return *lhs == *rhs;
                }
                else if constexpr (std::is_same_v<T, UserObjectPtr>) {
                    if (!lhs || !rhs) { return lhs == rhs; }
                    return lhs->equals(*rhs);
                }
                else { return lhs == rhs; }
            },
            storage_
        );
    }

    std::string Value::to_string() const {
        std::ostringstream os;
        std::visit(
            [&os, this](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, AbsentValue>) { os << "absent"; }
                else if constexpr (std::is_same_v<T, std::nullptr_t>) { os << "null"; }
                else if constexpr (std::is_same_v<T, bool>) { os << (v ? "true" : "false"); }
                else if constexpr (std::is_same_v<T, Number>) { os << v.value; }
                else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, char16_t>) { os << static_cast<int32_t>(v); }
                else if constexpr (std::is_arithmetic_v<T>) { os << v; }
                else if constexpr (std::is_same_v<T, std::string>) { os << '"' << v << '"'; }
                else if constexpr (std::is_same_v<T, Bytes>) { os << "buffer[" << v.size() << "]"; }
                else if constexpr (std::is_same_v<T, Array>) {
                    os << '[';
                    for (size_t i = 0; i < v.size(); ++i) { os << (i ? ", " : "") << v[i].to_string(); }
                    os << ']';
                }
                else if constexpr (std::is_same_v<T, Object>) {
                    os << '{';
                    bool first = true;
                    for (const auto& [key, value] : v) {
                        os << (first ? "" : ", ") << key << ": " << value.to_string();
                        first = false;
                    }
                    os << '}';
                }
                else if constexpr (std::is_same_v<T, BigInt>) { os << v.str() << 'n'; }
                else if constexpr (std::is_same_v<T, BigDecimal> || std::is_same_v<T, Uuid>) { os << v.to_string(); }
                else if constexpr (std::is_same_v<T, Date>) { os << "date(" << v.time_since_epoch().count() << ")"; }
                else if constexpr (std::is_same_v<T, JavaClass>) { os << "class " << v.name; }
                else if constexpr (std::is_same_v<T, JsonValue>) { os << v.text; }
                else if constexpr (std::is_same_v<T, GenericRecordPtr>) { os << "record(" << v->type_name() << ")"; }
                else if constexpr (std::is_same_v<T, Data>) { os << "data(type=" << v.type() << ", size=" << v.total_size() << ")"; }
                else { os << kind_name(kind()); }
            },
            storage_
        );
        return os.str();
    }
} // namespace gridwire
