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

// gridwire/gridwire/include/gridwire/compact/Schema.hpp
#pragma once

#include "gridwire/Export.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gridwire::compact {
    /**
     * FieldKind - Compact field types (wire ids shared with the cluster).
     */
    enum class FieldKind : int32_t {
        Boolean = 1,
        Int8 = 3,
        Int16 = 7,
        Int32 = 9,
        ArrayOfInt32 = 10,
        Int64 = 11,
        Float32 = 13,
        Float64 = 15,
        String = 17,
        ArrayOfString = 18,
        Compact = 29,
    };

    [[nodiscard]] GRIDWIRE_API const char* field_kind_name(FieldKind kind) noexcept;

    /**
     * Checks whether a kind is one of the values above.
     */
    [[nodiscard]] GRIDWIRE_API bool is_known_field_kind(int32_t raw) noexcept;

    struct FieldDescriptor {
        std::string name;
        FieldKind kind;

        bool operator==(const FieldDescriptor&) const = default;
    };

    /**
     * Schema - Type name plus the ordered field list of a Compact type.
     *
     * Fields are kept sorted by name; that order is also the wire order.
     * The schema id is a 64-bit Rabin fingerprint over the type name and
     * the field list, so two processes derive the same id for the same
     * schema without coordination.
     *
     * Immutable after construction.
     */
    class GRIDWIRE_API Schema {
    public:
        /**
         * @throws SerializationException on duplicate field names or an empty type name
         */
        Schema(std::string type_name, std::vector<FieldDescriptor> fields);

        [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

        [[nodiscard]] const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }

        [[nodiscard]] int64_t schema_id() const noexcept { return schema_id_; }

        /**
         * Returns the descriptor for a field, nullptr if absent.
         */
        [[nodiscard]] const FieldDescriptor* field(const std::string& name) const noexcept;

        [[nodiscard]] bool operator==(const Schema& other) const noexcept {
            return schema_id_ == other.schema_id_ && type_name_ == other.type_name_ && fields_ == other.fields_;
        }

    private:
        std::string type_name_;
        std::vector<FieldDescriptor> fields_;
        int64_t schema_id_;
    };
} // namespace gridwire::compact
