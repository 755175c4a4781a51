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

// tests/test_compact.cpp
#include "gridwire/SerializationService.hpp"
#include "gridwire/compact/GenericRecord.hpp"
#include "serialization/SerializationConstants.hpp"
#include "test_types.hpp"

#include <gtest/gtest.h>

#include <typeindex>

using namespace gridwire;
using namespace gridwire::fixtures;
using gridwire::compact::FieldDescriptor;
using gridwire::compact::FieldKind;
using gridwire::compact::GenericRecord;
using gridwire::compact::Schema;
using gridwire::serialization::SerializationConstants;

namespace {
    /**
     * Identified type that is also registered for compact serialization.
     */
    class Badge final : public IdentifiedDataSerializable {
    public:
        explicit Badge(int32_t number = 0) : number(number) {}

        int32_t factory_id() const noexcept override { return 1; }
        int32_t class_id() const noexcept override { return 9; }
        void write_data(ObjectDataOutput& out) const override { out.write_int(number); }
        void read_data(ObjectDataInput& in) override { number = in.read_int(); }

        int32_t number;
    };

    class BadgeSerializer final : public compact::CompactSerializer<Badge> {
    public:
        std::string type_name() const override { return "Badge"; }
        void write(compact::CompactWriter& writer, const Badge& b) const override { writer.write_int32("number", b.number); }
        std::shared_ptr<Badge> read(compact::CompactReader& reader) const override {
            return std::make_shared<Badge>(reader.read_int32("number"));
        }
    };

    SerializationConfig compact_config() {
        SerializationConfig config;
        config.compact.serializers.push_back(std::make_shared<PointSerializer>());
        config.compact.serializers.push_back(std::make_shared<SegmentSerializer>());
        config.compact.serializers.push_back(std::make_shared<BadgeSerializer>());
        return config;
    }
}

class CompactTest : public ::testing::Test {
protected:
    SerializationService service_{compact_config()};
};

// ==================== Registered types ====================

TEST_F(CompactTest, PointRoundTrip) {
    const auto labelled = Value::user(std::make_shared<Point>(3, -4, "origin-ish"));
    const auto bare = Value::user(std::make_shared<Point>(0, 0));

    const auto data = service_.to_data(labelled);
    EXPECT_EQ(data.type(), SerializationConstants::TYPE_COMPACT);
    EXPECT_EQ(service_.to_object(data), labelled);
    EXPECT_EQ(service_.to_object(service_.to_data(bare)), bare);
}

TEST_F(CompactTest, NestedCompactRoundTrip) {
    const auto segment = std::make_shared<Segment>(std::make_shared<Point>(1, 2, "a"), nullptr);
    const auto back = service_.to_object(service_.to_data(Value::user(segment)));

    const auto restored = std::dynamic_pointer_cast<const Segment>(back.get<UserObjectPtr>());
    ASSERT_NE(restored, nullptr);
    ASSERT_NE(restored->start, nullptr);
    EXPECT_EQ(restored->start->x, 1);
    EXPECT_EQ(restored->start->label, std::optional<std::string>{"a"});
    EXPECT_EQ(restored->end, nullptr);
}

TEST_F(CompactTest, CompactRegistrationBeatsIdentified) {
    const auto data = service_.to_data(Value::user(std::make_shared<Badge>(12)));
    EXPECT_EQ(data.type(), SerializationConstants::TYPE_COMPACT);

    const auto badge = std::dynamic_pointer_cast<const Badge>(service_.to_object(data).get<UserObjectPtr>());
    ASSERT_NE(badge, nullptr);
    EXPECT_EQ(badge->number, 12);
}

TEST_F(CompactTest, DuplicateSerializerFailsConstruction) {
    auto config = compact_config();
    config.compact.serializers.push_back(std::make_shared<PointSerializer>());
    EXPECT_THROW(SerializationService{config}, SerializationException);
}

// ==================== Generic records ====================

TEST_F(CompactTest, GenericRecordWithoutSerializerStaysGeneric) {
    const auto inner = GenericRecord::Builder{"Inner"}.set_boolean("flag", true).build();
    const auto record = GenericRecord::Builder{"Outer"}
        .set_int8("i8", -1)
        .set_int16("i16", 300)
        .set_int64("i64", 1LL << 40)
        .set_float32("f32", 0.5F)
        .set_float64("f64", -1.25)
        .set_string("name", std::nullopt)
        .set_array_of_int32("ints", std::vector<int32_t>{1, 2, 3})
        .set_array_of_string("tags", std::vector<std::string>{"x"})
        .set_generic_record("inner", inner)
        .build();

    const auto back = service_.to_object(service_.to_data(Value::record(record)));
    ASSERT_EQ(back.kind(), ValueKind::GenericRecord);

    const auto& restored = *back.get<GenericRecordPtr>();
    EXPECT_TRUE(restored == *record);
    EXPECT_EQ(restored.get_int16("i16"), 300);
    EXPECT_FALSE(restored.get_string("name").has_value());
    EXPECT_TRUE(restored.get_generic_record("inner")->get_boolean("flag"));
}

TEST_F(CompactTest, GenericRecordOfRegisteredTypeBecomesObject) {
    const auto record = GenericRecord::Builder{"Point"}
        .set_int32("x", 5)
        .set_int32("y", 6)
        .set_string("label", std::nullopt)
        .build();

    const auto back = service_.to_object(service_.to_data(Value::record(record)));
    EXPECT_EQ(back, Value::user(std::make_shared<Point>(5, 6)));
}

TEST_F(CompactTest, NestingBeyondConfiguredDepthFails) {
    auto config = compact_config();
    config.max_nesting_depth = 4;
    const SerializationService service{config};

    const auto link = [](GenericRecordPtr next) { return GenericRecord::Builder{"Link"}.set_generic_record("next", std::move(next)).build(); };
    GenericRecordPtr chain;
    for (int i = 0; i < 4; ++i) { chain = link(chain); }

    const auto back = service.to_object(service.to_data(Value::record(chain)));
    ASSERT_EQ(back.kind(), ValueKind::GenericRecord);
    EXPECT_TRUE(*back.get<GenericRecordPtr>() == *chain);

    EXPECT_THROW((void)service.to_object(service.to_data(Value::record(link(chain)))), SerializationException);
}

TEST_F(CompactTest, RecordFieldsAreTypeChecked) {
    GenericRecord::Builder builder{"T"};
    builder.set_int32("n", 1);

    EXPECT_THROW(builder.set_int32("n", 2), SerializationException);
    EXPECT_THROW(builder.set_field("s", FieldKind::String, Value::int32(1)), SerializationException);

    const auto record = builder.build();
    EXPECT_EQ(record->field_kind("n"), FieldKind::Int32);
    EXPECT_THROW((void)record->get_int64("n"), SerializationException);
    EXPECT_THROW((void)record->get_int32("missing"), SerializationException);
}

// ==================== Schemas ====================

TEST_F(CompactTest, UnknownSchemaFailsOnAnotherService) {
    const SerializationService reader{compact_config()};
    const auto data = service_.to_data(Value::user(std::make_shared<Point>(1, 1)));

    EXPECT_THROW((void)reader.to_object(data), SerializationException);
}

TEST_F(CompactTest, SharedSchemaServiceDecodesAcrossServices) {
    const auto schemas = std::make_shared<compact::SchemaService>();
    const SerializationService writer{compact_config(), schemas};
    const SerializationService reader{SerializationConfig{}, schemas};

    const auto back = reader.to_object(writer.to_data(Value::user(std::make_shared<Point>(7, 8, "p"))));
    ASSERT_EQ(back.kind(), ValueKind::GenericRecord);

    const auto& record = *back.get<GenericRecordPtr>();
    EXPECT_EQ(record.type_name(), "Point");
    EXPECT_EQ(record.get_int32("x"), 7);
    EXPECT_EQ(record.get_string("label"), std::optional<std::string>{"p"});
    EXPECT_GE(schemas->size(), 1u);
}

TEST_F(CompactTest, PinnedSchemaMustMatch) {
    SerializationService service{compact_config()};
    const auto point = Value::user(std::make_shared<Point>(1, 2));

    service.register_schema_to_class(
        std::make_shared<const Schema>(
            "Point",
            std::vector<FieldDescriptor>{{"y", FieldKind::Int32}, {"x", FieldKind::Int32}, {"label", FieldKind::String}}
        ),
        std::type_index(typeid(Point))
    );
    EXPECT_NO_THROW((void)service.to_data(point));

    service.register_schema_to_class(
        std::make_shared<const Schema>("Point", std::vector<FieldDescriptor>{{"x", FieldKind::Int32}}),
        std::type_index(typeid(Point))
    );
    EXPECT_THROW((void)service.to_data(point), SerializationException);
}

TEST(SchemaTest, FieldsAreSortedByName) {
    const Schema schema{"S", {{"b", FieldKind::Int8}, {"a", FieldKind::Int64}, {"c", FieldKind::String}}};

    ASSERT_EQ(schema.fields().size(), 3u);
    EXPECT_EQ(schema.fields()[0].name, "a");
    EXPECT_EQ(schema.fields()[2].name, "c");
    ASSERT_NE(schema.field("b"), nullptr);
    EXPECT_EQ(schema.field("b")->kind, FieldKind::Int8);
    EXPECT_EQ(schema.field("z"), nullptr);
}

TEST(SchemaTest, IdDependsOnNameAndFields) {
    const Schema a{"S", {{"x", FieldKind::Int32}, {"y", FieldKind::Int32}}};
    const Schema reordered{"S", {{"y", FieldKind::Int32}, {"x", FieldKind::Int32}}};
    const Schema renamed{"T", {{"x", FieldKind::Int32}, {"y", FieldKind::Int32}}};
    const Schema retyped{"S", {{"x", FieldKind::Int64}, {"y", FieldKind::Int32}}};

    EXPECT_EQ(a.schema_id(), reordered.schema_id());
    EXPECT_NE(a.schema_id(), renamed.schema_id());
    EXPECT_NE(a.schema_id(), retyped.schema_id());
}

TEST(SchemaTest, RejectsInvalidDefinitions) {
    EXPECT_THROW((Schema{"", {}}), SerializationException);
    EXPECT_THROW((Schema{"S", {{"x", FieldKind::Int32}, {"x", FieldKind::Int64}}}), SerializationException);
}

TEST(SchemaServiceTest, IdenticalSchemaIsStoredOnce) {
    compact::SchemaService schemas;
    const auto schema = std::make_shared<const Schema>("S", std::vector<FieldDescriptor>{{"x", FieldKind::Int32}});

    schemas.put(schema);
    schemas.put(std::make_shared<const Schema>("S", std::vector<FieldDescriptor>{{"x", FieldKind::Int32}}));
    EXPECT_EQ(schemas.size(), 1u);
    EXPECT_TRUE(schemas.contains(schema->schema_id()));
    EXPECT_EQ(schemas.get(schema->schema_id() + 1), nullptr);
}
