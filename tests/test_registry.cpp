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

// tests/test_registry.cpp
#include "gridwire/SerializerRegistry.hpp"
#include "serialization/DefaultSerializers.hpp"
#include "test_types.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace gridwire;
using gridwire::fixtures::MarkerSerializer;
using gridwire::serialization::SerializationConstants;

class SerializerRegistryTest : public ::testing::Test {
protected:
    static SerializerRegistry defaults(NumberType number_type) {
        SerializerRegistry::Builder builder{number_type};
        serialization::register_default_serializers(builder);
        return std::move(builder).build();
    }
};

TEST_F(SerializerRegistryTest, DuplicateNameFails) {
    SerializerRegistry::Builder builder{NumberType::Double};
    builder.register_serializer(SerializerKey::custom(5), std::make_shared<MarkerSerializer>(5));

    try {
        builder.register_serializer(SerializerKey::custom(5), std::make_shared<MarkerSerializer>(6));
        FAIL() << "expected DuplicateNameError";
    }
    catch (const DuplicateNameError& e) {
        EXPECT_EQ(e.name(), "!custom5");
    }
}

TEST_F(SerializerRegistryTest, DuplicateIdFails) {
    SerializerRegistry::Builder builder{NumberType::Double};
    builder.register_serializer(SerializerKey::custom(5), std::make_shared<MarkerSerializer>(5));

    try {
        builder.register_serializer(SerializerName::Global, std::make_shared<MarkerSerializer>(5));
        FAIL() << "expected DuplicateIdError";
    }
    catch (const DuplicateIdError& e) {
        EXPECT_EQ(e.id(), 5);
    }
    EXPECT_FALSE(builder.contains(SerializerName::Global));
}

TEST_F(SerializerRegistryTest, NullSerializerIsRejected) {
    SerializerRegistry::Builder builder{NumberType::Double};
    EXPECT_THROW(builder.register_serializer(SerializerName::Global, nullptr), std::invalid_argument);
}

TEST_F(SerializerRegistryTest, DefaultsUseWellKnownIds) {
    const auto registry = defaults(NumberType::Double);

    EXPECT_EQ(registry.id_of(SerializerName::Null), SerializationConstants::CONSTANT_TYPE_NULL);
    EXPECT_EQ(registry.id_of(SerializerName::String), SerializationConstants::CONSTANT_TYPE_STRING);
    EXPECT_EQ(registry.id_of(SerializerName::IntegerArray), SerializationConstants::CONSTANT_TYPE_INTEGER_ARRAY);
    EXPECT_EQ(registry.id_of(SerializerName::Uuid), SerializationConstants::CONSTANT_TYPE_UUID);
    EXPECT_EQ(registry.id_of(SerializerName::BigDecimal), SerializationConstants::JAVA_DEFAULT_TYPE_BIG_DECIMAL);
    EXPECT_EQ(registry.id_of(SerializerName::OffsetDateTime), SerializationConstants::JAVA_DEFAULT_TYPE_OFFSET_DATE_TIME);
    EXPECT_FALSE(registry.id_of(SerializerName::Json).has_value());
}

TEST_F(SerializerRegistryTest, NameNormalization) {
    const auto registry = defaults(NumberType::Integer);

    EXPECT_EQ(registry.find_by_name("number")->id(), SerializationConstants::CONSTANT_TYPE_INTEGER);
    EXPECT_EQ(registry.find_by_name("number", true)->id(), SerializationConstants::CONSTANT_TYPE_INTEGER_ARRAY);
    EXPECT_EQ(registry.find_by_name("buffer")->id(), SerializationConstants::CONSTANT_TYPE_BYTE_ARRAY);
    EXPECT_EQ(registry.find_by_name("string", true)->id(), SerializationConstants::CONSTANT_TYPE_STRING_ARRAY);
    EXPECT_EQ(registry.find_by_name("object"), nullptr);
    EXPECT_EQ(registry.find_by_name("bogus", true), nullptr);
}

TEST_F(SerializerRegistryTest, KindLookupFollowsDefaultNumberType) {
    EXPECT_EQ(defaults(NumberType::Double).find_by_kind(ValueKind::Number, false)->id(), SerializationConstants::CONSTANT_TYPE_DOUBLE);
    EXPECT_EQ(defaults(NumberType::Long).find_by_kind(ValueKind::Number, false)->id(), SerializationConstants::CONSTANT_TYPE_LONG);
    EXPECT_EQ(defaults(NumberType::Byte).find_by_kind(ValueKind::Number, true)->id(), SerializationConstants::CONSTANT_TYPE_BYTE_ARRAY);
    EXPECT_EQ(defaults(NumberType::Float).find_by_kind(ValueKind::Number, true)->id(), SerializationConstants::CONSTANT_TYPE_FLOAT_ARRAY);
}

TEST_F(SerializerRegistryTest, KindsWithoutBuiltInSerializer) {
    EXPECT_FALSE(SerializerRegistry::name_for_kind(ValueKind::Object, false, NumberType::Double).has_value());
    EXPECT_FALSE(SerializerRegistry::name_for_kind(ValueKind::UserObject, false, NumberType::Double).has_value());
    EXPECT_FALSE(SerializerRegistry::name_for_kind(ValueKind::Object, true, NumberType::Double).has_value());
    EXPECT_FALSE(SerializerRegistry::name_for_kind(ValueKind::Uuid, true, NumberType::Double).has_value());
}

TEST(SerializerKeyTest, ParsesCanonicalSpellings) {
    EXPECT_EQ(SerializerKey::parse("integerArray"), SerializerKey{SerializerName::IntegerArray});
    EXPECT_EQ(SerializerKey::parse("!json"), SerializerKey{SerializerName::Json});
    EXPECT_EQ(SerializerKey::parse("!custom12"), SerializerKey::custom(12));
    EXPECT_FALSE(SerializerKey::parse("!custom").has_value());
    EXPECT_FALSE(SerializerKey::parse("!custom1x").has_value());
    EXPECT_FALSE(SerializerKey::parse("IntegerArray").has_value());
    EXPECT_EQ(SerializerKey::custom(3).to_string(), "!custom3");
}
