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

// gridwire/internal/src/serialization/SerializerResolver.cpp
#include "serialization/SerializerResolver.hpp"
#include "gridwire/portable/Portable.hpp"

#include <cmath>
#include <limits>

namespace gridwire::serialization {
    std::optional<int32_t> SerializerResolver::custom_id_of(const Value& value) {
        if (const auto* ptr = value.get_if<UserObjectPtr>()) {
            const auto* custom = dynamic_cast<const CustomSerializable*>(ptr->get());
            if (custom != nullptr && custom->custom_id() >= 1) { return custom->custom_id(); }
            return std::nullopt;
        }

        const auto* object = value.get_if<Object>();
        if (object == nullptr) { return std::nullopt; }
        const auto it = object->find("hzCustomId");
        if (it == object->end() || !it->second.is_numeric()) { return std::nullopt; }

        const double id = it->second.as_double();
        if (std::trunc(id) != id || id < 1 || id > std::numeric_limits<int32_t>::max()) { return std::nullopt; }
        return static_cast<int32_t>(id);
    }

    Classification SerializerResolver::classify(const Value& value) const {
        Classification result;
        result.kind = value.kind();
        result.custom_id = custom_id_of(value);

        switch (value.kind()) {
            case ValueKind::Absent:
                result.capability = Capability::Absent;
                return result;
            case ValueKind::Null:
                result.capability = Capability::Null;
                return result;
            case ValueKind::GenericRecord:
                result.capability = Capability::Structured;
                return result;
            case ValueKind::UserObject: {
                const auto& object = value.get<UserObjectPtr>();
                if (compact_.handles(value)) { result.capability = Capability::Structured; }
                else if (dynamic_cast<const IdentifiedDataSerializable*>(object.get())) { result.capability = Capability::FactoryPolymorphic; }
                else if (dynamic_cast<const portable::Portable*>(object.get())) { result.capability = Capability::PortablePolymorphic; }
                else { result.capability = Capability::Fallback; }
                return result;
            }
            case ValueKind::Array: {
                const auto& items = value.get<Array>();
                result.capability = Capability::Array;
                result.kind = items.empty() ? ValueKind::Number : items.front().kind();
                return result;
            }
            default:
                result.capability = SerializerRegistry::name_for_kind(value.kind(), false, registry_.default_number_type())
                    ? Capability::Scalar
                    : Capability::Fallback;
                return result;
        }
    }

    const Serializer& SerializerResolver::resolve(const Value& value) const {
        const auto c = classify(value);

        const Serializer* found = nullptr;
        switch (c.capability) {
            case Capability::Absent:
                throw UnserializableError("Absent value cannot be serialized");
            case Capability::Null:
                found = registry_.find_by_key(SerializerName::Null);
                break;
            case Capability::Structured:
                found = registry_.find_by_key(SerializerName::Compact);
                break;
            case Capability::FactoryPolymorphic:
                found = registry_.find_by_key(SerializerName::Identified);
                break;
            case Capability::PortablePolymorphic:
                found = registry_.find_by_key(SerializerName::Portable);
                break;
            case Capability::Scalar:
                found = registry_.find_by_kind(c.kind, false);
                break;
            case Capability::Array:
                found = registry_.find_by_kind(c.kind, true);
                break;
            case Capability::Fallback:
                break;
        }

        if (found == nullptr && c.custom_id) { found = registry_.find_by_key(SerializerKey::custom(*c.custom_id)); }
        if (found == nullptr) { found = registry_.find_by_key(SerializerName::Global); }
        if (found == nullptr) { found = registry_.find_by_key(SerializerName::Json); }
        if (found == nullptr) {
            throw NoSerializerFoundError("There is no suitable serializer for " + value.to_string());
        }
        return *found;
    }
} // namespace gridwire::serialization
