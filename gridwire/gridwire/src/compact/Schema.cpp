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

// gridwire/gridwire/src/compact/Schema.cpp
#include "gridwire/compact/Schema.hpp"
#include "gridwire/Errors.hpp"
#include "serialization/RabinFingerprint.hpp"

#include <algorithm>

namespace gridwire::compact {
    const char* field_kind_name(FieldKind kind) noexcept {
        switch (kind) {
            case FieldKind::Boolean: return "BOOLEAN";
            case FieldKind::Int8: return "INT8";
            case FieldKind::Int16: return "INT16";
            case FieldKind::Int32: return "INT32";
            case FieldKind::ArrayOfInt32: return "ARRAY_OF_INT32";
            case FieldKind::Int64: return "INT64";
            case FieldKind::Float32: return "FLOAT32";
            case FieldKind::Float64: return "FLOAT64";
            case FieldKind::String: return "STRING";
            case FieldKind::ArrayOfString: return "ARRAY_OF_STRING";
            case FieldKind::Compact: return "COMPACT";
        }
        return "UNKNOWN";
    }

    bool is_known_field_kind(int32_t raw) noexcept {
        switch (static_cast<FieldKind>(raw)) {
            case FieldKind::Boolean:
            case FieldKind::Int8:
            case FieldKind::Int16:
            case FieldKind::Int32:
            case FieldKind::ArrayOfInt32:
            case FieldKind::Int64:
            case FieldKind::Float32:
            case FieldKind::Float64:
            case FieldKind::String:
            case FieldKind::ArrayOfString:
            case FieldKind::Compact:
                return true;
        }
        return false;
    }

    Schema::Schema(std::string type_name, std::vector<FieldDescriptor> fields)
        : type_name_{std::move(type_name)}, fields_{std::move(fields)} {
        if (type_name_.empty()) { throw SerializationException("Compact schema requires a type name"); }

        std::sort(fields_.begin(), fields_.end(), [](const FieldDescriptor& a, const FieldDescriptor& b) { return a.name < b.name; });
        const auto dup = std::adjacent_find(
            fields_.begin(),
            fields_.end(),
            [](const FieldDescriptor& a, const FieldDescriptor& b) { return a.name == b.name; }
        );
        if (dup != fields_.end()) { throw SerializationException("Duplicate field '" + dup->name + "' in schema " + type_name_); }

        schema_id_ = serialization::RabinFingerprint::of(type_name_, fields_);
    }

    const FieldDescriptor* Schema::field(const std::string& name) const noexcept {
        const auto it = std::lower_bound(
            fields_.begin(),
            fields_.end(),
            name,
            [](const FieldDescriptor& f, const std::string& n) { return f.name < n; }
        );
        if (it == fields_.end() || it->name != name) { return nullptr; }
        return &*it;
    }
} // namespace gridwire::compact
