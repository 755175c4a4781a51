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

// gridwire/internal/include/serialization/SerializerResolver.hpp
#pragma once

#include "gridwire/SerializerRegistry.hpp"
#include "serialization/CompactStreamSerializer.hpp"

#include <cstdint>
#include <optional>

namespace gridwire::serialization {
    /**
     * What the resolver knows about a value before looking up a codec.
     */
    enum class Capability : uint8_t {
        Absent,
        Null,
        Structured,
        FactoryPolymorphic,
        PortablePolymorphic,
        Scalar,
        Array,
        Fallback,
    };

    struct Classification {
        Capability capability = Capability::Fallback;

        // Array: kind of the first element, Number for an empty array
        ValueKind kind = ValueKind::Absent;

        // custom serializer tag (>= 1) carried by the value, if any
        std::optional<int32_t> custom_id;
    };

    /**
     * SerializerResolver - Picks the codec for a value.
     *
     * First match wins:
     * 1. absent -> UnserializableError
     * 2. null -> null codec
     * 3. GenericRecord or registered Compact type -> Compact
     * 4. IdentifiedDataSerializable -> identified
     * 5. Portable -> portable
     * 6. kind lookup (arrays by their first element)
     * 7. custom tag -> "!custom<id>"
     * 8. global serializer
     * 9. JSON
     *
     * Holds references only; the registry and the Compact codec must
     * outlive it.
     */
    class SerializerResolver {
    public:
        SerializerResolver(const SerializerRegistry& registry, const CompactStreamSerializer& compact) noexcept
            : registry_{registry}, compact_{compact} {}

        [[nodiscard]] Classification classify(const Value& value) const;

        /**
         * @throws UnserializableError for the absent value
         * @throws NoSerializerFoundError if nothing matches
         */
        [[nodiscard]] const Serializer& resolve(const Value& value) const;

        /**
         * Custom tag of a CustomSerializable or of an Object with an integral
         * "hzCustomId" member; ids below 1 are ignored.
         */
        [[nodiscard]] static std::optional<int32_t> custom_id_of(const Value& value);

    private:
        const SerializerRegistry& registry_;
        const CompactStreamSerializer& compact_;
    };
} // namespace gridwire::serialization
