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

// gridwire/gridwire/src/compact/SchemaService.cpp
#include "gridwire/compact/SchemaService.hpp"
#include "gridwire/Errors.hpp"
#include "util/Logging.hpp"

#include <mutex>
#include <string>

namespace gridwire::compact {
    void SchemaService::put(std::shared_ptr<const Schema> schema) {
        if (!schema) { throw SerializationException("Cannot register a null schema"); }

        std::unique_lock lock{mutex_};
        const auto [it, inserted] = schemas_.try_emplace(schema->schema_id(), schema);
        if (inserted) {
            util::logger()->debug("Registered compact schema {} (id={}, fields={})", schema->type_name(), schema->schema_id(), schema->fields().size());
            return;
        }
        if (!(*it->second == *schema)) {
            throw SerializationException(
                "Schema id " + std::to_string(schema->schema_id()) + " is already used by type " + it->second->type_name()
            );
        }
    }

    std::shared_ptr<const Schema> SchemaService::get(int64_t schema_id) const {
        std::shared_lock lock{mutex_};
        const auto it = schemas_.find(schema_id);
        return it == schemas_.end() ? nullptr : it->second;
    }

    bool SchemaService::contains(int64_t schema_id) const {
        std::shared_lock lock{mutex_};
        return schemas_.contains(schema_id);
    }

    size_t SchemaService::size() const {
        std::shared_lock lock{mutex_};
        return schemas_.size();
    }
} // namespace gridwire::compact
