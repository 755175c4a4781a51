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

// tests/test_value.cpp
#include "gridwire/Value.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace gridwire;

TEST(ValueTest, DefaultIsAbsent) {
    const Value v;
    EXPECT_TRUE(v.is_absent());
    EXPECT_EQ(v.kind(), ValueKind::Absent);
    EXPECT_FALSE(v.is_null());
}

TEST(ValueTest, KindFollowsFactory) {
    EXPECT_EQ(Value::null().kind(), ValueKind::Null);
    EXPECT_EQ(Value::number(1).kind(), ValueKind::Number);
    EXPECT_EQ(Value::int8(1).kind(), ValueKind::Byte);
    EXPECT_EQ(Value::character(u'x').kind(), ValueKind::Char);
    EXPECT_EQ(Value::int64(1).kind(), ValueKind::Long);
    EXPECT_EQ(Value::buffer({1, 2}).kind(), ValueKind::Buffer);
    EXPECT_EQ(Value::json("{}").kind(), ValueKind::JsonValue);
    EXPECT_EQ(Value::record(nullptr).kind(), ValueKind::Null);
    EXPECT_EQ(Value::user(nullptr).kind(), ValueKind::Null);
    EXPECT_EQ(Value::data(Data{}).kind(), ValueKind::Data);
}

TEST(ValueTest, NumericKindsCompareByValue) {
    EXPECT_EQ(Value::number(56), Value::int32(56));
    EXPECT_EQ(Value::int8(56), Value::int64(56));
    EXPECT_EQ(Value::float32(0.5f), Value::float64(0.5));
    EXPECT_FALSE(Value::int32(1) == Value::int32(2));
    EXPECT_FALSE(Value::int32(1) == Value::string("1"));
}

TEST(ValueTest, DeepEquality) {
    const auto a = Value::object({{"abc", Value::string("abc")}, {"five", Value::number(5)}});
    const auto b = Value::object({{"abc", Value::string("abc")}, {"five", Value::int32(5)}});
    const auto c = Value::object({{"abc", Value::string("abd")}, {"five", Value::int32(5)}});

    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_EQ(Value::array({Value::boolean(true)}), Value::array({Value::boolean(true)}));
}

TEST(ValueTest, GetWrongAlternativeThrows) {
    const auto v = Value::string("x");
    EXPECT_EQ(v.get<std::string>(), "x");
    EXPECT_EQ(v.get_if<int32_t>(), nullptr);
    EXPECT_THROW((void)v.get<int32_t>(), SerializationException);
    EXPECT_THROW((void)v.as_double(), SerializationException);
}

TEST(ValueTest, AsInt64TruncatesNumbers) {
    EXPECT_EQ(Value::number(56.9).as_int64(), 56);
    EXPECT_EQ(Value::int16(-3).as_int64(), -3);
}

TEST(BigDecimalTest, ParsesPlainAndScientific) {
    const auto plain = BigDecimal::from_string("-1.25");
    EXPECT_EQ(plain.unscaled, BigInt{-125});
    EXPECT_EQ(plain.scale, 2);

    const auto sci = BigDecimal::from_string("3E+4");
    EXPECT_EQ(sci.unscaled, BigInt{3});
    EXPECT_EQ(sci.scale, -4);

    EXPECT_EQ(BigDecimal::from_string("1.5e-3").to_string(), "0.0015");
}

TEST(BigDecimalTest, FormatsRoundTrip) {
    for (const char* text : {"1.11111111111111111111111111", "-0.5", "123", "0.007"}) {
        EXPECT_EQ(BigDecimal::from_string(text).to_string(), text);
    }
}

TEST(BigDecimalTest, LeadingZerosAreDecimal) {
    EXPECT_EQ(BigDecimal::from_string("010").unscaled, BigInt{10});
}

TEST(BigDecimalTest, RejectsMalformedText) {
    EXPECT_THROW((void)BigDecimal::from_string(""), std::invalid_argument);
    EXPECT_THROW((void)BigDecimal::from_string("1.2.3"), std::invalid_argument);
    EXPECT_THROW((void)BigDecimal::from_string("1e"), std::invalid_argument);
}

TEST(UuidTest, CanonicalForm) {
    const Uuid uuid{1, 2};
    EXPECT_EQ(uuid.to_string(), "00000000-0000-0001-0000-000000000002");
}
