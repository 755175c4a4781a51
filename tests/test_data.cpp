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

// tests/test_data.cpp
#include "gridwire/Data.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace gridwire;
using gridwire::common::ByteOrder;

namespace {
    std::vector<uint8_t> envelope(int32_t hash, int32_t type, std::vector<uint8_t> payload) {
        common::ByteBuffer buf(8 + payload.size(), ByteOrder::BigEndian);
        buf.put_i32(hash);
        buf.put_i32(type);
        buf.put_bytes(payload);
        return buf.take();
    }
}

TEST(DataTest, ReadsHeaderFields) {
    const Data data{envelope(99, -7, {0, 0, 0, 14}), ByteOrder::BigEndian};

    EXPECT_EQ(data.type(), -7);
    EXPECT_TRUE(data.has_partition_hash());
    EXPECT_EQ(data.partition_hash(), 99);
    EXPECT_EQ(data.total_size(), 12u);
    EXPECT_EQ(data.data_size(), 4u);
    ASSERT_EQ(data.payload().size(), 4u);
    EXPECT_EQ(data.payload()[3], 14);
}

TEST(DataTest, MissingPartitionHashFallsBackToPayloadHash) {
    const Data data{envelope(0, -11, {0, 0, 0, 3, 'k', 'e', 'y'}), ByteOrder::BigEndian};

    EXPECT_FALSE(data.has_partition_hash());
    EXPECT_EQ(data.partition_hash(), data.hash_code());
    EXPECT_EQ(data.hash_code(), 1476017569);
}

TEST(DataTest, RejectsTruncatedHeader) {
    EXPECT_THROW(Data(std::vector<uint8_t>{1, 2, 3}, ByteOrder::BigEndian), std::invalid_argument);
    EXPECT_NO_THROW(Data(std::vector<uint8_t>{}, ByteOrder::BigEndian));
}

TEST(DataTest, EmptyEnvelope) {
    const Data data;
    EXPECT_EQ(data.type(), 0);
    EXPECT_EQ(data.total_size(), 0u);
    EXPECT_EQ(data.data_size(), 0u);
    EXPECT_TRUE(data.payload().empty());
}

TEST(DataTest, HonorsLittleEndianHeader) {
    common::ByteBuffer buf(8, ByteOrder::LittleEndian);
    buf.put_i32(5);
    buf.put_i32(-11);
    const Data data{buf.take(), ByteOrder::LittleEndian};

    EXPECT_EQ(data.type(), -11);
    EXPECT_EQ(data.partition_hash(), 5);
}

TEST(DataTest, EqualityIsByteWise) {
    const Data a{envelope(1, -7, {1}), ByteOrder::BigEndian};
    const Data b{envelope(1, -7, {1}), ByteOrder::BigEndian};
    const Data c{envelope(2, -7, {1}), ByteOrder::BigEndian};

    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}
