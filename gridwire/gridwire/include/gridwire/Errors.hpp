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

// gridwire/gridwire/include/gridwire/Errors.hpp
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace gridwire {
    /**
     * Exception thrown when serialization/deserialization fails.
     *
     * Base of every error raised by the serialization engine.
     */
    class SerializationException : public std::runtime_error {
    public:
        explicit SerializationException(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * The absent sentinel was handed to a serialization entry point.
     */
    class UnserializableError : public SerializationException {
    public:
        explicit UnserializableError(const std::string& msg) : SerializationException(msg) {}
    };

    /**
     * A serializer name was registered twice while building the registry.
     */
    class DuplicateNameError : public SerializationException {
    public:
        explicit DuplicateNameError(std::string name)
            : SerializationException("Given serializer name is already in the registry: " + name), name_{std::move(name)} {}

        [[nodiscard]] const std::string& name() const noexcept { return name_; }

    private:
        std::string name_;
    };

    /**
     * A serializer id was registered twice while building the registry.
     */
    class DuplicateIdError : public SerializationException {
    public:
        explicit DuplicateIdError(int32_t id)
            : SerializationException("Given serializer id is already in the registry: " + std::to_string(id)), id_{id} {}

        [[nodiscard]] int32_t id() const noexcept { return id_; }

    private:
        int32_t id_;
    };

    /**
     * No serializer matched a value (only possible when the JSON fallback is missing).
     */
    class NoSerializerFoundError : public SerializationException {
    public:
        explicit NoSerializerFoundError(const std::string& msg) : SerializationException(msg) {}
    };

    /**
     * An envelope or nested value carries a type id with no registered serializer.
     */
    class NoDeserializerFoundError : public SerializationException {
    public:
        explicit NoDeserializerFoundError(int32_t type_id)
            : SerializationException("There is no suitable deserializer for data with type " + std::to_string(type_id)),
              type_id_{type_id} {}

        [[nodiscard]] int32_t type_id() const noexcept { return type_id_; }

    private:
        int32_t type_id_;
    };

    /**
     * Partition keys nested deeper than the configured cap (usually a key cycle).
     */
    class PartitionKeyDepthError : public SerializationException {
    public:
        explicit PartitionKeyDepthError(size_t depth)
            : SerializationException("Partition key nesting exceeds the maximum depth of " + std::to_string(depth)) {}
    };
} // namespace gridwire
