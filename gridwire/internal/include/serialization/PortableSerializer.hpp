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

// gridwire/internal/include/serialization/PortableSerializer.hpp
#pragma once

#include "gridwire/portable/Portable.hpp"
#include "serialization/DefaultSerializers.hpp"

#include <cstdint>
#include <map>
#include <memory>

namespace gridwire::serialization {
    /**
     * Serializer for Portable objects.
     *
     * Payload:
     * ```
     * [factory_id:i32][class_id:i32][version:i32][field_count:i32]
     * field_count x [name:string][type:i8][value]
     * ```
     * A nested Portable field is a null flag followed, when not null, by
     * the same layout.
     */
    class PortableSerializer final : public DefaultSerializer<SerializationConstants::CONSTANT_TYPE_PORTABLE> {
    public:
        PortableSerializer(std::map<int32_t, portable::PortableFactory> factories, int32_t version);

        void write(ObjectDataOutput& out, const Value& value) const override;

        /**
         * @throws SerializationException on unknown factories, classes or field types
         */
        [[nodiscard]] Value read(ObjectDataInput& in) const override;

        void write_portable(ObjectDataOutput& out, const portable::Portable& object) const;

        [[nodiscard]] std::shared_ptr<portable::Portable> read_portable(ObjectDataInput& in) const;

        [[nodiscard]] int32_t version() const noexcept { return version_; }

    private:
        std::map<int32_t, portable::PortableFactory> factories_;
        int32_t version_;
    };
} // namespace gridwire::serialization
