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

// gridwire/gridwire/include/gridwire/Serializer.hpp
#pragma once

#include "gridwire/ObjectData.hpp"
#include "gridwire/Value.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace gridwire {
    /**
     * Serializer - Contract implemented by every codec.
     *
     * A serializer owns one stable type id. write() appends the payload only
     * (never the envelope header); read() consumes exactly the bytes write()
     * produced and returns a value equal to the one written.
     *
     * Serializers are registered once when a SerializationService is built
     * and must not mutate shared state afterwards, so a single instance can
     * serve concurrent calls.
     *
     * Typical usage (custom serializer):
     * ```cpp
     * class MoneySerializer : public Serializer {
     * public:
     *     int32_t id() const noexcept override { return 7; }
     *     void write(ObjectDataOutput& out, const Value& v) const override { ... }
     *     Value read(ObjectDataInput& in) const override { ... }
     * };
     *
     * SerializationConfig cfg;
     * cfg.custom_serializers.push_back(std::make_shared<MoneySerializer>());
     * ```
     */
    class Serializer {
    public:
        virtual ~Serializer() = default;

        /**
         * Stable type id written into the envelope header.
         */
        [[nodiscard]] virtual int32_t id() const noexcept = 0;

        /**
         * Appends the payload of value.
         *
         * @throws SerializationException if value is of an unsupported kind
         */
        virtual void write(ObjectDataOutput& out, const Value& value) const = 0;

        /**
         * Reads one payload.
         *
         * @throws SerializationException on malformed input
         * @throws std::out_of_range when reading past the end
         */
        [[nodiscard]] virtual Value read(ObjectDataInput& in) const = 0;
    };

    /**
     * IdentifiedDataSerializable - Objects rebuilt through a (factory id, class id) pair.
     *
     * The receiving side looks the factory up in
     * SerializationConfig::data_serializable_factories, asks it for an empty
     * instance of class_id() and lets the instance read its own fields.
     */
    class IdentifiedDataSerializable : public virtual UserObject {
    public:
        [[nodiscard]] virtual int32_t factory_id() const noexcept = 0;

        [[nodiscard]] virtual int32_t class_id() const noexcept = 0;

        virtual void write_data(ObjectDataOutput& out) const = 0;

        virtual void read_data(ObjectDataInput& in) = 0;
    };

    /**
     * Creates an empty instance for a class id, nullptr if the id is unknown.
     */
    using DataSerializableFactory = std::function<std::shared_ptr<IdentifiedDataSerializable>(int32_t class_id)>;

    /**
     * CustomSerializable - Objects handled by the custom serializer whose id is custom_id().
     *
     * Only ids >= 1 select a custom serializer.
     */
    class CustomSerializable : public virtual UserObject {
    public:
        [[nodiscard]] virtual int32_t custom_id() const noexcept = 0;
    };
} // namespace gridwire
