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

// gridwire/gridwire/include/gridwire/core/RestValue.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/Serializer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace gridwire::core {
    inline constexpr int32_t REST_VALUE_FACTORY_ID = -25;
    inline constexpr int32_t REST_VALUE_CLASS_ID = 1;

    /**
     * RestValue - Value stored through the member REST endpoint.
     *
     * Payload: [value:string][content_type:string]
     */
    class GRIDWIRE_API RestValue final : public IdentifiedDataSerializable {
    public:
        RestValue() = default;
        RestValue(std::string value, std::string content_type)
            : value_{std::move(value)}, content_type_{std::move(content_type)} {}

        [[nodiscard]] int32_t factory_id() const noexcept override { return REST_VALUE_FACTORY_ID; }
        [[nodiscard]] int32_t class_id() const noexcept override { return REST_VALUE_CLASS_ID; }

        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

        [[nodiscard]] const std::string& value() const noexcept { return value_; }
        [[nodiscard]] const std::string& content_type() const noexcept { return content_type_; }

        [[nodiscard]] bool equals(const UserObject& other) const override;

    private:
        std::string value_;
        std::string content_type_;
    };

    [[nodiscard]] GRIDWIRE_API std::shared_ptr<IdentifiedDataSerializable> rest_value_factory(int32_t class_id);
} // namespace gridwire::core
