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

// gridwire/internal/src/serialization/IdentifiedDataSerializableSerializer.cpp
#include "serialization/IdentifiedDataSerializableSerializer.hpp"

#include <string>

namespace gridwire::serialization {
    IdentifiedDataSerializableSerializer::IdentifiedDataSerializableSerializer(std::map<int32_t, DataSerializableFactory> factories)
        : factories_{std::move(factories)} {}

    void IdentifiedDataSerializableSerializer::write(ObjectDataOutput& out, const Value& value) const {
        const auto* ptr = value.get_if<UserObjectPtr>();
        const auto* ids = ptr ? dynamic_cast<const IdentifiedDataSerializable*>(ptr->get()) : nullptr;
        if (ids == nullptr) {
            throw SerializationException(std::string{"Expected an IdentifiedDataSerializable but got "} + kind_name(value.kind()));
        }
        out.write_boolean(true);
        out.write_int(ids->factory_id());
        out.write_int(ids->class_id());
        ids->write_data(out);
    }

    Value IdentifiedDataSerializableSerializer::read(ObjectDataInput& in) const {
        if (!in.read_boolean()) {
            throw SerializationException("Native clients do not support DataSerializable. Please use IdentifiedDataSerializable");
        }
        const auto factory_id = in.read_int();
        const auto class_id = in.read_int();

        const auto it = factories_.find(factory_id);
        if (it == factories_.end()) {
            throw SerializationException("There is no IdentifiedDataSerializable factory with id " + std::to_string(factory_id));
        }
        auto object = it->second(class_id);
        if (!object) {
            throw SerializationException(
                "Factory " + std::to_string(factory_id) + " cannot create an instance of class id " + std::to_string(class_id)
            );
        }
        object->read_data(in);
        return Value::user(std::move(object));
    }
} // namespace gridwire::serialization
