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

// gridwire/gridwire/include/gridwire/compact/SchemaService.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/compact/Schema.hpp"

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace gridwire::compact {
    /**
     * SchemaService - Catalog of known Compact schemas, keyed by schema id.
     *
     * The only mutable collaborator of the serialization service: schemas
     * are published while serializing and looked up while deserializing.
     * One instance may be shared by several services.
     *
     * Thread-safety: Fully thread-safe (reader/writer lock).
     */
    class GRIDWIRE_API SchemaService {
    public:
        /**
         * Publishes a schema. Publishing the same schema again is a no-op.
         *
         * @throws SerializationException if a different schema already uses the id
         */
        void put(std::shared_ptr<const Schema> schema);

        /**
         * Looks up a schema, nullptr if unknown.
         */
        [[nodiscard]] std::shared_ptr<const Schema> get(int64_t schema_id) const;

        [[nodiscard]] bool contains(int64_t schema_id) const;

        [[nodiscard]] size_t size() const;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<int64_t, std::shared_ptr<const Schema>> schemas_;
    };
} // namespace gridwire::compact
