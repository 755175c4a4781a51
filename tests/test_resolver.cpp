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

// tests/test_resolver.cpp
#include "serialization/SerializerResolver.hpp"
#include "serialization/SerializationConstants.hpp"
#include "test_types.hpp"

#include <gtest/gtest.h>

using namespace gridwire;
using namespace gridwire::fixtures;
using namespace gridwire::serialization;

class SerializerResolverTest : public ::testing::Test {
protected:
    SerializerResolverTest()
        : compact_{std::make_shared<CompactStreamSerializer>(std::make_shared<compact::SchemaService>())},
          registry_{build()},
          resolver_{registry_, *compact_} {}

    // Defaults and compact only; no JSON fallback.
    SerializerRegistry build() {
        compact_->register_serializer(std::make_shared<PointSerializer>());

        SerializerRegistry::Builder builder{NumberType::Double};
        register_default_serializers(builder);
        builder.register_serializer(SerializerName::Compact, compact_);
        builder.register_serializer(SerializerKey::custom(Money::CUSTOM_ID), std::make_shared<MoneySerializer>());
        return std::move(builder).build();
    }

    std::shared_ptr<CompactStreamSerializer> compact_;
    SerializerRegistry registry_;
    SerializerResolver resolver_;
};

TEST_F(SerializerResolverTest, ClassifiesSentinels) {
    EXPECT_EQ(resolver_.classify(Value{}).capability, Capability::Absent);
    EXPECT_EQ(resolver_.classify(Value::null()).capability, Capability::Null);
}

TEST_F(SerializerResolverTest, ClassifiesUserObjects) {
    EXPECT_EQ(resolver_.classify(Value::user(std::make_shared<Point>(1, 2))).capability, Capability::Structured);
    EXPECT_EQ(resolver_.classify(Value::user(std::make_shared<Employee>("a", 1))).capability, Capability::FactoryPolymorphic);
    EXPECT_EQ(
        resolver_.classify(Value::user(std::make_shared<Customer>("c", 1, std::vector<std::string>{}))).capability,
        Capability::PortablePolymorphic
    );

    const auto money = resolver_.classify(Value::user(std::make_shared<Money>(1, "USD")));
    EXPECT_EQ(money.capability, Capability::Fallback);
    ASSERT_TRUE(money.custom_id.has_value());
    EXPECT_EQ(*money.custom_id, Money::CUSTOM_ID);
}

TEST_F(SerializerResolverTest, ClassifiesArraysByFirstElement) {
    const auto strings = resolver_.classify(Value::array({Value::string("a"), Value::int32(1)}));
    EXPECT_EQ(strings.capability, Capability::Array);
    EXPECT_EQ(strings.kind, ValueKind::String);

    const auto empty = resolver_.classify(Value::array({}));
    EXPECT_EQ(empty.capability, Capability::Array);
    EXPECT_EQ(empty.kind, ValueKind::Number);
}

TEST_F(SerializerResolverTest, ClassifiesScalarsAndFallbacks) {
    EXPECT_EQ(resolver_.classify(Value::number(1)).capability, Capability::Scalar);
    EXPECT_EQ(resolver_.classify(Value::uuid(Uuid{1, 2})).capability, Capability::Scalar);
    EXPECT_EQ(resolver_.classify(Value::object({})).capability, Capability::Fallback);
    EXPECT_EQ(resolver_.classify(Value::json("{}")).capability, Capability::Fallback);
}

TEST_F(SerializerResolverTest, CustomIdFromObjectMember) {
    EXPECT_EQ(SerializerResolver::custom_id_of(Value::object({{"hzCustomId", Value::number(3)}})), 3);
    EXPECT_EQ(SerializerResolver::custom_id_of(Value::object({{"hzCustomId", Value::int64(12)}})), 12);
    EXPECT_FALSE(SerializerResolver::custom_id_of(Value::object({{"hzCustomId", Value::number(0)}})).has_value());
    EXPECT_FALSE(SerializerResolver::custom_id_of(Value::object({{"hzCustomId", Value::number(2.5)}})).has_value());
    EXPECT_FALSE(SerializerResolver::custom_id_of(Value::object({{"hzCustomId", Value::string("3")}})).has_value());
    EXPECT_FALSE(SerializerResolver::custom_id_of(Value::string("hzCustomId")).has_value());
}

TEST_F(SerializerResolverTest, ResolvesBuiltInIds) {
    EXPECT_EQ(resolver_.resolve(Value::null()).id(), SerializationConstants::CONSTANT_TYPE_NULL);
    EXPECT_EQ(resolver_.resolve(Value::number(1)).id(), SerializationConstants::CONSTANT_TYPE_DOUBLE);
    EXPECT_EQ(resolver_.resolve(Value::string("s")).id(), SerializationConstants::CONSTANT_TYPE_STRING);
    EXPECT_EQ(resolver_.resolve(Value::array({})).id(), SerializationConstants::CONSTANT_TYPE_DOUBLE_ARRAY);
    EXPECT_EQ(resolver_.resolve(Value::array({Value::boolean(true)})).id(), SerializationConstants::CONSTANT_TYPE_BOOLEAN_ARRAY);
    EXPECT_EQ(resolver_.resolve(Value::user(std::make_shared<Point>(1, 2))).id(), SerializationConstants::TYPE_COMPACT);
    EXPECT_EQ(resolver_.resolve(Value::user(std::make_shared<Money>(1, "USD"))).id(), Money::CUSTOM_ID);
}

TEST_F(SerializerResolverTest, AbsentIsUnserializable) {
    EXPECT_THROW((void)resolver_.resolve(Value{}), UnserializableError);
}

TEST_F(SerializerResolverTest, NothingMatchesWithoutFallback) {
    EXPECT_THROW((void)resolver_.resolve(Value::object({{"a", Value::number(1)}})), NoSerializerFoundError);
    EXPECT_THROW((void)resolver_.resolve(Value::user(std::make_shared<Employee>("a", 1))), NoSerializerFoundError);
    EXPECT_THROW((void)resolver_.resolve(Value::array({Value::object({})})), NoSerializerFoundError);
}
