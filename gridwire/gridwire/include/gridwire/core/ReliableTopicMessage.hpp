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

// gridwire/gridwire/include/gridwire/core/ReliableTopicMessage.hpp
#pragma once

#include "gridwire/Data.hpp"
#include "gridwire/Export.hpp"
#include "gridwire/Serializer.hpp"
#include "gridwire/core/Address.hpp"

#include <cstdint>
#include <memory>

namespace gridwire::core {
    inline constexpr int32_t RELIABLE_TOPIC_MESSAGE_FACTORY_ID = -18;
    inline constexpr int32_t RELIABLE_TOPIC_MESSAGE_CLASS_ID = 2;

    /**
     * ReliableTopicMessage - Entry of the ringbuffer behind a reliable topic.
     *
     * Payload: [publish_time:i64][publisher:object][payload:data]
     *
     * The published value stays serialized; decode it with
     * SerializationService::to_object(payload()). The publisher address is
     * null when the message was not published by a cluster member.
     */
    class GRIDWIRE_API ReliableTopicMessage final : public IdentifiedDataSerializable {
    public:
        ReliableTopicMessage() = default;
        ReliableTopicMessage(int64_t publish_time, std::shared_ptr<const Address> publisher, Data payload)
            : publish_time_{publish_time}, publisher_{std::move(publisher)}, payload_{std::move(payload)} {}

        [[nodiscard]] int32_t factory_id() const noexcept override { return RELIABLE_TOPIC_MESSAGE_FACTORY_ID; }
        [[nodiscard]] int32_t class_id() const noexcept override { return RELIABLE_TOPIC_MESSAGE_CLASS_ID; }

        void write_data(ObjectDataOutput& out) const override;

        /**
         * @throws SerializationException if the publisher field is neither null nor an Address
         */
        void read_data(ObjectDataInput& in) override;

        /**
         * Milliseconds since the Unix epoch.
         */
        [[nodiscard]] int64_t publish_time() const noexcept { return publish_time_; }
        [[nodiscard]] const std::shared_ptr<const Address>& publisher() const noexcept { return publisher_; }
        [[nodiscard]] const Data& payload() const noexcept { return payload_; }

        [[nodiscard]] bool equals(const UserObject& other) const override;

    private:
        int64_t publish_time_ = 0;
        std::shared_ptr<const Address> publisher_;
        Data payload_;
    };

    [[nodiscard]] GRIDWIRE_API std::shared_ptr<IdentifiedDataSerializable> reliable_topic_message_factory(int32_t class_id);
} // namespace gridwire::core
