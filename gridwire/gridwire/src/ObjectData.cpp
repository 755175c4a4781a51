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

// gridwire/gridwire/src/ObjectData.cpp
#include "gridwire/ObjectData.hpp"
#include "gridwire/SerializationService.hpp"

#include <limits>

namespace gridwire {
    namespace {
        int32_t checked_length(size_t size) {
            if (size > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
                throw SerializationException("Length " + std::to_string(size) + " does not fit the int32 length prefix");
            }
            return static_cast<int32_t>(size);
        }

        constexpr int32_t NULL_LENGTH = -1;
    }

    // ==================== ObjectDataOutput ====================

    ObjectDataOutput::ObjectDataOutput(common::ByteOrder order, const SerializationService* service, size_t initial_capacity)
        : buf_{initial_capacity, order}, service_{service} {}

    void ObjectDataOutput::write_string(std::string_view value) {
        write_int(checked_length(value.size()));
        buf_.put_bytes({reinterpret_cast<const uint8_t*>(value.data()), value.size()});
    }

    void ObjectDataOutput::write_nullable_string(const std::optional<std::string>& value) {
        if (!value) {
            write_int(NULL_LENGTH);
            return;
        }
        write_string(*value);
    }

    void ObjectDataOutput::write_byte_array(std::span<const uint8_t> bytes) {
        write_int(checked_length(bytes.size()));
        buf_.put_bytes(bytes);
    }

    void ObjectDataOutput::write_int_array(std::span<const int32_t> values) {
        write_int(checked_length(values.size()));
        for (const auto v : values) { write_int(v); }
    }

    void ObjectDataOutput::write_long_array(std::span<const int64_t> values) {
        write_int(checked_length(values.size()));
        for (const auto v : values) { write_long(v); }
    }

    void ObjectDataOutput::write_string_array(std::span<const std::string> values) {
        write_int(checked_length(values.size()));
        for (const auto& v : values) { write_string(v); }
    }

    void ObjectDataOutput::write_data(const Data& data) {
        if (data.total_size() == 0) {
            write_int(NULL_LENGTH);
            return;
        }
        write_byte_array(data.to_bytes());
    }

    void ObjectDataOutput::write_object(const Value& value) {
        if (service_ == nullptr) { throw SerializationException("write_object requires an output bound to a SerializationService"); }
        service_->write_object(*this, value);
    }

    // ==================== ObjectDataInput ====================

    ObjectDataInput::ObjectDataInput(
        std::span<const uint8_t> bytes,
        common::ByteOrder order,
        const SerializationService* service,
        size_t offset
    )
        : buf_{common::ByteBuffer::wrap(bytes, order)},
          service_{service},
          max_depth_{service ? service->config().max_nesting_depth : DEFAULT_MAX_NESTING_DEPTH} {
        buf_.position(offset);
    }

    std::string ObjectDataInput::read_string() {
        auto value = read_nullable_string();
        if (!value) { throw SerializationException("Unexpected null string"); }
        return std::move(*value);
    }

    std::optional<std::string> ObjectDataInput::read_nullable_string() {
        const auto length = read_int();
        if (length == NULL_LENGTH) { return std::nullopt; }
        if (length < 0 || static_cast<size_t>(length) > remaining()) {
            throw SerializationException("Invalid string length " + std::to_string(length));
        }
        const auto bytes = buf_.get_bytes(static_cast<size_t>(length));
        return std::string(bytes.begin(), bytes.end());
    }

    size_t ObjectDataInput::read_length(size_t min_element_size) {
        const auto length = read_int();
        if (length < 0) { throw SerializationException("Negative length " + std::to_string(length)); }

        const auto count = static_cast<size_t>(length);
        if (min_element_size > 0 && count > remaining() / min_element_size) {
            throw SerializationException(
                "Length " + std::to_string(length) + " exceeds the " + std::to_string(remaining()) + " remaining bytes"
            );
        }
        return count;
    }

    std::vector<uint8_t> ObjectDataInput::read_byte_array() { return buf_.get_bytes(read_length(1)); }

    std::vector<int32_t> ObjectDataInput::read_int_array() {
        std::vector<int32_t> values(read_length(sizeof(int32_t)));
        for (auto& v : values) { v = read_int(); }
        return values;
    }

    std::vector<int64_t> ObjectDataInput::read_long_array() {
        std::vector<int64_t> values(read_length(sizeof(int64_t)));
        for (auto& v : values) { v = read_long(); }
        return values;
    }

    std::vector<std::string> ObjectDataInput::read_string_array() {
        std::vector<std::string> values(read_length(sizeof(int32_t)));
        for (auto& v : values) { v = read_string(); }
        return values;
    }

    Data ObjectDataInput::read_data() {
        const auto length = read_int();
        if (length == NULL_LENGTH || length == 0) { return Data{}; }
        if (length < static_cast<int32_t>(Data::DATA_OFFSET) || static_cast<size_t>(length) > remaining()) {
            throw SerializationException("Invalid envelope length " + std::to_string(length));
        }
        return Data{buf_.get_bytes(static_cast<size_t>(length)), order()};
    }

    Value ObjectDataInput::read_object() {
        if (service_ == nullptr) { throw SerializationException("read_object requires an input bound to a SerializationService"); }
        const auto scope = enter_nested();
        return service_->read_object(*this);
    }

    ObjectDataInput::NestingScope::NestingScope(ObjectDataInput& in) : in_{in} {
        if (in_.depth_ >= in_.max_depth_) {
            throw SerializationException("Nested payload exceeds the maximum depth of " + std::to_string(in_.max_depth_));
        }
        ++in_.depth_;
    }

    ObjectDataInput::NestingScope::~NestingScope() noexcept { --in_.depth_; }
} // namespace gridwire
