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

// gridwire/gridwire/include/gridwire/core/Address.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/Serializer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace gridwire::core {
    inline constexpr int32_t CLUSTER_DATA_FACTORY_ID = 0;
    inline constexpr int32_t ADDRESS_CLASS_ID = 1;

    /**
     * Address - Host and port of a cluster member.
     *
     * Payload: [port:i32][type:i8][host:string]
     */
    class GRIDWIRE_API Address final : public IdentifiedDataSerializable {
    public:
        static constexpr int8_t IPV4 = 4;
        static constexpr int8_t IPV6 = 6;

        Address() = default;

        /**
         * The address type is IPV6 when host contains ':'.
         */
        Address(std::string host, int32_t port);

        [[nodiscard]] int32_t factory_id() const noexcept override { return CLUSTER_DATA_FACTORY_ID; }
        [[nodiscard]] int32_t class_id() const noexcept override { return ADDRESS_CLASS_ID; }

        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

        [[nodiscard]] const std::string& host() const noexcept { return host_; }
        [[nodiscard]] int32_t port() const noexcept { return port_; }
        [[nodiscard]] int8_t type() const noexcept { return type_; }

        /**
         * "host:port", or "[host]:port" for IPv6.
         */
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] bool equals(const UserObject& other) const override;

    private:
        std::string host_;
        int32_t port_ = 0;
        int8_t type_ = IPV4;
    };

    [[nodiscard]] GRIDWIRE_API std::shared_ptr<IdentifiedDataSerializable> cluster_data_factory(int32_t class_id);
} // namespace gridwire::core
