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

// gridwire/internal/src/serialization/JsonSerializer.cpp
#include "serialization/JsonSerializer.hpp"
#include "util/Logging.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <typeinfo>

namespace gridwire::serialization {
    using json = nlohmann::json;

    namespace {
        json number_to_json(double d) {
            if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) { return static_cast<int64_t>(d); }
            if (!std::isfinite(d)) { return nullptr; }
            return d;
        }

        std::string two(int v) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "%02d", v);
            return buf;
        }

        std::string format_date(const LocalDate& d) {
            return std::to_string(d.year) + "-" + two(d.month) + "-" + two(d.day);
        }

        std::string format_time(const LocalTime& t) {
            char nano[16];
            std::snprintf(nano, sizeof(nano), "%09d", t.nano);
            return two(t.hour) + ":" + two(t.minute) + ":" + two(t.second) + "." + nano;
        }
    }

    json to_json(const Value& value) {
        switch (value.kind()) {
            case ValueKind::Absent:
            case ValueKind::Null:
                return nullptr;
            case ValueKind::Boolean:
                return value.get<bool>();
            case ValueKind::Number:
            case ValueKind::Float:
            case ValueKind::Double:
                return number_to_json(value.as_double());
            case ValueKind::Byte:
            case ValueKind::Short:
            case ValueKind::Integer:
            case ValueKind::Long:
                return value.as_int64();
            case ValueKind::Char:
                return static_cast<int32_t>(value.get<char16_t>());
            case ValueKind::String:
                return value.get<std::string>();
            case ValueKind::Buffer: {
                json data = json::array();
                for (const auto b : value.get<Bytes>()) { data.push_back(b); }
                return json{{"type", "Buffer"}, {"data", std::move(data)}};
            }
            case ValueKind::Array: {
                json arr = json::array();
                for (const auto& item : value.get<Array>()) { arr.push_back(to_json(item)); }
                return arr;
            }
            case ValueKind::Object: {
                json obj = json::object();
                for (const auto& [key, item] : value.get<Object>()) {
                    if (item.is_absent()) { continue; }
                    obj[key] = to_json(item);
                }
                return obj;
            }
            case ValueKind::BigInt:
                return value.get<BigInt>().str();
            case ValueKind::BigDecimal:
                return value.get<BigDecimal>().to_string();
            case ValueKind::Uuid:
                return value.get<Uuid>().to_string();
            case ValueKind::Date:
                return value.get<Date>().time_since_epoch().count();
            case ValueKind::LocalDate:
                return format_date(value.get<LocalDate>());
            case ValueKind::LocalTime:
                return format_time(value.get<LocalTime>());
            case ValueKind::LocalDateTime: {
                const auto& dt = value.get<LocalDateTime>();
                return format_date(dt.date) + "T" + format_time(dt.time);
            }
            case ValueKind::OffsetDateTime: {
                const auto& odt = value.get<OffsetDateTime>();
                return format_date(odt.date_time.date) + "T" + format_time(odt.date_time.time) + "/" + std::to_string(odt.offset_seconds);
            }
            case ValueKind::JavaClass:
                return value.get<JavaClass>().name;
            case ValueKind::JsonValue:
                try { return json::parse(value.get<JsonValue>().text); }
                catch (const json::parse_error& e) { throw SerializationException(std::string{"Malformed JSON value: "} + e.what()); }
            case ValueKind::UserObject: {
                const auto& obj = value.get<UserObjectPtr>();
                util::logger()->trace("Serializing {} through its plain JSON form", typeid(*obj).name());
                return to_json(obj->plain_form());
            }
            case ValueKind::GenericRecord:
            case ValueKind::Data:
                break;
        }
        throw SerializationException(std::string{"Value of kind "} + kind_name(value.kind()) + " has no JSON form");
    }

    Value from_json(const json& doc) {
        switch (doc.type()) {
            case json::value_t::null:
            case json::value_t::discarded:
                return Value::null();
            case json::value_t::boolean:
                return Value::boolean(doc.get<bool>());
            case json::value_t::number_integer:
            case json::value_t::number_unsigned:
            case json::value_t::number_float:
                return Value::number(doc.get<double>());
            case json::value_t::string:
                return Value::string(doc.get<std::string>());
            case json::value_t::array: {
                Array items;
                items.reserve(doc.size());
                for (const auto& item : doc) { items.push_back(from_json(item)); }
                return Value::array(std::move(items));
            }
            case json::value_t::object: {
                Object members;
                for (const auto& [key, item] : doc.items()) { members.emplace(key, from_json(item)); }
                return Value::object(std::move(members));
            }
            case json::value_t::binary: {
                const auto& bin = doc.get_binary();
                return Value::buffer(Bytes(bin.begin(), bin.end()));
            }
        }
        return Value::null();
    }

    std::string to_json_text(const Value& value) {
        if (const auto* raw = value.get_if<JsonValue>()) { return raw->text; }
        try { return to_json(value).dump(); }
        catch (const json::type_error& e) { throw SerializationException(std::string{"Cannot encode value as JSON: "} + e.what()); }
    }

    void JsonSerializer::write(ObjectDataOutput& out, const Value& value) const { out.write_string(to_json_text(value)); }

    Value JsonSerializer::read(ObjectDataInput& in) const {
        const auto text = in.read_string();
        try { return from_json(json::parse(text)); }
        catch (const json::parse_error& e) { throw SerializationException(std::string{"Malformed JSON payload: "} + e.what()); }
    }

    void JsonValueSerializer::write(ObjectDataOutput& out, const Value& value) const { out.write_string(to_json_text(value)); }

    Value JsonValueSerializer::read(ObjectDataInput& in) const { return Value::json(in.read_string()); }
} // namespace gridwire::serialization
