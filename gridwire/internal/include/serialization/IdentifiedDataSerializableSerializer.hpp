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

// gridwire/internal/include/serialization/IdentifiedDataSerializableSerializer.hpp
#pragma once

#include "serialization/DefaultSerializers.hpp"

#include <cstdint>
#include <map>

namespace gridwire::serialization {
    /**
     * Serializer for IdentifiedDataSerializable objects.
     *
     * Payload:
     * ```
     * [identified:bool=true][factory_id:i32][class_id:i32][write_data...]
     * ```
     */
    class IdentifiedDataSerializableSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_DATA_SERIALIZABLE> {
    public:
        explicit IdentifiedDataSerializableSerializer(std::map<int32_t, DataSerializableFactory> factories);

        void write(ObjectDataOutput& out, const Value& value) const override;

        /**
         * @throws SerializationException if the identified flag is false, the
         *         factory is unknown or the factory yields no object
         */
        [[nodiscard]] Value read(ObjectDataInput& in) const override;

        [[nodiscard]] bool has_factory(int32_t factory_id) const noexcept { return factories_.contains(factory_id); }

    private:
        std::map<int32_t, DataSerializableFactory> factories_;
    };
} // namespace gridwire::serialization
