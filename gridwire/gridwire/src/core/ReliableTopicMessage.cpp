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

// gridwire/gridwire/src/core/ReliableTopicMessage.cpp
#include "gridwire/core/ReliableTopicMessage.hpp"
#include "gridwire/Errors.hpp"

namespace gridwire::core {
    void ReliableTopicMessage::write_data(ObjectDataOutput& out) const {
        out.write_long(publish_time_);
        out.write_object(publisher_ ? Value::user(publisher_) : Value::null());
        out.write_data(payload_);
    }

    void ReliableTopicMessage::read_data(ObjectDataInput& in) {
        publish_time_ = in.read_long();

        const auto publisher = in.read_object();
        if (publisher.is_null()) { publisher_ = nullptr; }
        else {
            const auto* object = publisher.get_if<UserObjectPtr>();
            publisher_ = object ? std::dynamic_pointer_cast<const Address>(*object) : nullptr;
            if (!publisher_) { throw SerializationException(std::string{"Expected a publisher address but got "} + kind_name(publisher.kind())); }
        }

        payload_ = in.read_data();
    }

    bool ReliableTopicMessage::equals(const UserObject& other) const {
        const auto* rhs = dynamic_cast<const ReliableTopicMessage*>(&other);
        if (rhs == nullptr || publish_time_ != rhs->publish_time_ || !(payload_ == rhs->payload_)) { return false; }
        if (!publisher_ || !rhs->publisher_) { return publisher_ == rhs->publisher_; }
        return publisher_->equals(*rhs->publisher_);
    }

    std::shared_ptr<IdentifiedDataSerializable> reliable_topic_message_factory(int32_t class_id) {
        if (class_id == RELIABLE_TOPIC_MESSAGE_CLASS_ID) { return std::make_shared<ReliableTopicMessage>(); }
        return nullptr;
    }
} // namespace gridwire::core
