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

// gridwire/gridwire/src/core/RestValue.cpp
#include "gridwire/core/RestValue.hpp"

namespace gridwire::core {
    void RestValue::write_data(ObjectDataOutput& out) const {
        out.write_string(value_);
        out.write_string(content_type_);
    }

    void RestValue::read_data(ObjectDataInput& in) {
        value_ = in.read_string();
        content_type_ = in.read_string();
    }

    bool RestValue::equals(const UserObject& other) const {
        const auto* rhs = dynamic_cast<const RestValue*>(&other);
        return rhs != nullptr && value_ == rhs->value_ && content_type_ == rhs->content_type_;
    }

    std::shared_ptr<IdentifiedDataSerializable> rest_value_factory(int32_t class_id) {
        if (class_id == REST_VALUE_CLASS_ID) { return std::make_shared<RestValue>(); }
        return nullptr;
    }
} // namespace gridwire::core
