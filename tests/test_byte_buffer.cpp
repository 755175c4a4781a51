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

// tests/test_byte_buffer.cpp
#include "gridwire/common/ByteBuffer.h"
#include "gridwire/common/MurmurHash3.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>
#include <vector>

using namespace gridwire::common;

namespace {
    std::span<const uint8_t> bytes_of(std::string_view s) {
        return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
    }
}

TEST(ByteBufferTest, BigEndianIntLayout) {
    ByteBuffer buf(16, ByteOrder::BigEndian);
    buf.put_i32(0x01020304);

    const auto bytes = buf.span();
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0x01);
    EXPECT_EQ(bytes[1], 0x02);
    EXPECT_EQ(bytes[2], 0x03);
    EXPECT_EQ(bytes[3], 0x04);
}

TEST(ByteBufferTest, LittleEndianIntLayout) {
    ByteBuffer buf(16, ByteOrder::LittleEndian);
    buf.put_i32(0x01020304);

    const auto bytes = buf.span();
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0x04);
    EXPECT_EQ(bytes[3], 0x01);
}

TEST(ByteBufferTest, ReadsBackThroughView) {
    ByteBuffer out(32, ByteOrder::BigEndian);
    out.put_i8(-5);
    out.put_i16(-1234);
    out.put_i64(-9000000000LL);
    out.put_f64(2.5);

    auto in = ByteBuffer::wrap(out.span(), ByteOrder::BigEndian);
    EXPECT_EQ(in.get_i8(), -5);
    EXPECT_EQ(in.get_i16(), -1234);
    EXPECT_EQ(in.get_i64(), -9000000000LL);
    EXPECT_DOUBLE_EQ(in.get_f64(), 2.5);
    EXPECT_EQ(in.remaining(), 0u);
}

TEST(ByteBufferTest, ReadPastEndThrows) {
    const std::vector<uint8_t> bytes{1, 2};
    auto in = ByteBuffer::wrap(bytes, ByteOrder::BigEndian);
    EXPECT_THROW((void)in.get_i32(), std::out_of_range);
}

TEST(ByteBufferTest, OwningBufferCannotReposition) {
    ByteBuffer buf(8, ByteOrder::BigEndian);
    buf.put_i32(1);
    EXPECT_THROW(buf.position(0), std::logic_error);
}

TEST(ByteBufferTest, PatchesIntInPlace) {
    ByteBuffer buf(16, ByteOrder::BigEndian);
    buf.put_i32(0);
    buf.put_i32(7);
    buf.put_u32_at(0, 42);

    EXPECT_EQ(buf.position(), 8u);

    auto in = ByteBuffer::wrap(buf.span(), ByteOrder::BigEndian);
    EXPECT_EQ(in.get_i32(), 42);
    EXPECT_EQ(in.get_i32(), 7);
}

TEST(MurmurHash3Test, MatchesReferenceVectors) {
    EXPECT_EQ(MurmurHash3::x86_32({}, 0), 0);
    EXPECT_EQ(static_cast<uint32_t>(MurmurHash3::x86_32(bytes_of("hello"), 0)), 0x248bfa47u);
}

TEST(MurmurHash3Test, UsesClusterSeedByDefault) {
    EXPECT_EQ(MurmurHash3::x86_32({}), -1585187909);
    EXPECT_EQ(MurmurHash3::x86_32(bytes_of("hello")), 1425223722);
}
