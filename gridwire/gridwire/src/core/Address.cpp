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

// gridwire/gridwire/src/core/Address.cpp
#include "gridwire/core/Address.hpp"

namespace gridwire::core {
    Address::Address(std::string host, int32_t port)
        : host_{std::move(host)}, port_{port}, type_{host_.find(':') == std::string::npos ? IPV4 : IPV6} {}

    void Address::write_data(ObjectDataOutput& out) const {
        out.write_int(port_);
        out.write_byte(type_);
        out.write_string(host_);
    }

    void Address::read_data(ObjectDataInput& in) {
        port_ = in.read_int();
        type_ = in.read_byte();
        host_ = in.read_string();
    }

    std::string Address::to_string() const {
        const auto port = std::to_string(port_);
        if (type_ == IPV6) { return "[" + host_ + "]:" + port; }
        return host_ + ":" + port;
    }

    bool Address::equals(const UserObject& other) const {
        const auto* rhs = dynamic_cast<const Address*>(&other);
        return rhs != nullptr && port_ == rhs->port_ && type_ == rhs->type_ && host_ == rhs->host_;
    }

    std::shared_ptr<IdentifiedDataSerializable> cluster_data_factory(int32_t class_id) {
        if (class_id == ADDRESS_CLASS_ID) { return std::make_shared<Address>(); }
        return nullptr;
    }
} // namespace gridwire::core
