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

// tests/test_portable.cpp
#include "gridwire/SerializationService.hpp"
#include "serialization/SerializationConstants.hpp"
#include "test_types.hpp"

#include <gtest/gtest.h>

using namespace gridwire;
using namespace gridwire::fixtures;
using gridwire::serialization::SerializationConstants;

namespace {
    /**
     * One field of every portable type.
     */
    class Sample final : public portable::Portable {
    public:
        static constexpr int32_t CLASS_ID = 4;

        int32_t factory_id() const noexcept override { return Customer::FACTORY_ID; }
        int32_t class_id() const noexcept override { return CLASS_ID; }

        void write_portable(portable::PortableWriter& writer) const override {
            writer.write_byte("b", b);
            writer.write_boolean("z", z);
            writer.write_char("c", c);
            writer.write_short("s", s);
            writer.write_int("i", i);
            writer.write_long("l", l);
            writer.write_float("f", f);
            writer.write_double("d", d);
            writer.write_utf("u", u);
            writer.write_byte_array("ba", bytes);
            writer.write_int_array("ia", ints);
            writer.write_long_array("la", longs);
        }

        void read_portable(portable::PortableReader& reader) override {
            version = reader.version();
            la_present = reader.has_field("la");
            longs = reader.read_long_array("la");
            ints = reader.read_int_array("ia");
            bytes = reader.read_byte_array("ba");
            u = reader.read_utf("u");
            d = reader.read_double("d");
            f = reader.read_float("f");
            l = reader.read_long("l");
            i = reader.read_int("i");
            s = reader.read_short("s");
            c = reader.read_char("c");
            z = reader.read_boolean("z");
            b = reader.read_byte("b");
        }

        int8_t b = -3;
        bool z = true;
        char16_t c = u'Z';
        int16_t s = -300;
        int32_t i = 70000;
        int64_t l = -5000000000LL;
        float f = 1.5F;
        double d = -2.25;
        std::string u = "portable";
        std::vector<uint8_t> bytes{1, 2, 255};
        std::vector<int32_t> ints{-1, 0, 1};
        std::vector<int64_t> longs{1LL << 40};

        int32_t version = -1;
        bool la_present = false;
    };

    /**
     * Reads a field under the wrong type.
     */
    class Mistyped final : public portable::Portable {
    public:
        static constexpr int32_t CLASS_ID = 5;

        int32_t factory_id() const noexcept override { return Customer::FACTORY_ID; }
        int32_t class_id() const noexcept override { return CLASS_ID; }

        void write_portable(portable::PortableWriter& writer) const override { writer.write_int("n", 1); }

        void read_portable(portable::PortableReader& reader) override { (void)reader.read_long("n"); }
    };

    /**
     * Writes the same field name twice.
     */
    class Repeated final : public portable::Portable {
    public:
        int32_t factory_id() const noexcept override { return Customer::FACTORY_ID; }
        int32_t class_id() const noexcept override { return 6; }

        void write_portable(portable::PortableWriter& writer) const override {
            writer.write_int("n", 1);
            writer.write_int("n", 2);
        }

        void read_portable(portable::PortableReader&) override {}
    };

    std::shared_ptr<portable::Portable> sample_factory(int32_t class_id) {
        switch (class_id) {
            case Customer::CLASS_ID: return std::make_shared<Customer>();
            case Sample::CLASS_ID: return std::make_shared<Sample>();
            case Mistyped::CLASS_ID: return std::make_shared<Mistyped>();
            default: return nullptr;
        }
    }
}

class PortableTest : public ::testing::Test {
protected:
    static SerializationConfig config() {
        SerializationConfig config;
        config.portable_factories.emplace(Customer::FACTORY_ID, &sample_factory);
        config.portable_version = 3;
        return config;
    }

    SerializationService service_{config()};
};

TEST_F(PortableTest, NestedPortableRoundTrip) {
    const auto referrer = std::make_shared<Customer>("Root", 1, std::vector<std::string>{"gold"});
    const auto value = Value::user(std::make_shared<Customer>("Leaf", 2, std::vector<std::string>{"a", "b"}, referrer));

    const auto data = service_.to_data(value);
    EXPECT_EQ(data.type(), SerializationConstants::CONSTANT_TYPE_PORTABLE);

    const auto back = service_.to_object(data);
    EXPECT_EQ(back, value);

    const auto customer = std::dynamic_pointer_cast<const Customer>(back.get<UserObjectPtr>());
    ASSERT_NE(customer, nullptr);
    ASSERT_NE(customer->referrer(), nullptr);
    EXPECT_EQ(customer->referrer()->referrer(), nullptr);
}

TEST_F(PortableTest, EveryFieldTypeSurvives) {
    const auto original = std::make_shared<Sample>();
    original->u = "changed";
    original->i = -42;

    const auto back = service_.to_object(service_.to_data(Value::user(original)));
    const auto sample = std::dynamic_pointer_cast<const Sample>(back.get<UserObjectPtr>());
    ASSERT_NE(sample, nullptr);

    EXPECT_EQ(sample->version, 3);
    EXPECT_TRUE(sample->la_present);
    EXPECT_EQ(sample->b, original->b);
    EXPECT_EQ(sample->z, original->z);
    EXPECT_EQ(sample->c, original->c);
    EXPECT_EQ(sample->s, original->s);
    EXPECT_EQ(sample->i, -42);
    EXPECT_EQ(sample->l, original->l);
    EXPECT_FLOAT_EQ(sample->f, original->f);
    EXPECT_DOUBLE_EQ(sample->d, original->d);
    EXPECT_EQ(sample->u, "changed");
    EXPECT_EQ(sample->bytes, original->bytes);
    EXPECT_EQ(sample->ints, original->ints);
    EXPECT_EQ(sample->longs, original->longs);
}

TEST_F(PortableTest, HeaderCarriesIdentifiersAndFieldCount) {
    const auto data = service_.to_data(Value::user(std::make_shared<Sample>()));

    ObjectDataInput in{data.payload(), data.order()};
    EXPECT_EQ(in.read_int(), Customer::FACTORY_ID);
    EXPECT_EQ(in.read_int(), Sample::CLASS_ID);
    EXPECT_EQ(in.read_int(), 3);
    EXPECT_EQ(in.read_int(), 12);
}

TEST_F(PortableTest, UnknownFactoryFails) {
    const SerializationService reader{SerializationConfig{}};
    const auto data = service_.to_data(Value::user(std::make_shared<Sample>()));

    EXPECT_THROW((void)reader.to_object(data), SerializationException);
}

TEST_F(PortableTest, UnknownClassFails) {
    ObjectDataOutput out{service_.byte_order()};
    out.write_int(0);
    out.write_int(SerializationConstants::CONSTANT_TYPE_PORTABLE);
    out.write_int(Customer::FACTORY_ID);
    out.write_int(99);
    out.write_int(0);
    out.write_int(0);

    EXPECT_THROW((void)service_.to_object(Data{out.take(), service_.byte_order()}), SerializationException);
}

TEST_F(PortableTest, NestingBeyondConfiguredDepthFails) {
    auto config = PortableTest::config();
    config.max_nesting_depth = 3;
    const SerializationService service{config};

    std::shared_ptr<const Customer> chain;
    for (int32_t i = 0; i < 3; ++i) { chain = std::make_shared<Customer>("c" + std::to_string(i), i, std::vector<std::string>{}, chain); }
    const auto at_limit = Value::user(chain);
    EXPECT_EQ(service.to_object(service.to_data(at_limit)), at_limit);

    const auto too_deep = service.to_data(Value::user(std::make_shared<Customer>("top", 9, std::vector<std::string>{}, chain)));
    try {
        (void)service.to_object(too_deep);
        FAIL() << "expected SerializationException";
    }
    catch (const SerializationException& e) {
        EXPECT_NE(std::string{e.what()}.find("maximum depth of 3"), std::string::npos);
    }
}

TEST_F(PortableTest, DeeplyNestedPayloadFailsWithoutExhaustingStack) {
    ObjectDataOutput out{service_.byte_order()};
    out.write_int(0);
    out.write_int(SerializationConstants::CONSTANT_TYPE_PORTABLE);
    for (int i = 0; i < 10000; ++i) {
        out.write_int(Customer::FACTORY_ID);
        out.write_int(Customer::CLASS_ID);
        out.write_int(3);
        out.write_int(1);
        out.write_string("referrer");
        out.write_byte(static_cast<int8_t>(portable::FieldType::Portable));
        out.write_boolean(false);
    }

    EXPECT_THROW((void)service_.to_object(Data{out.take(), service_.byte_order()}), SerializationException);
}

TEST_F(PortableTest, DuplicateFieldNameFails) {
    EXPECT_THROW((void)service_.to_data(Value::user(std::make_shared<Repeated>())), SerializationException);
}

TEST_F(PortableTest, FieldTypeMismatchFails) {
    const auto data = service_.to_data(Value::user(std::make_shared<Mistyped>()));
    EXPECT_THROW((void)service_.to_object(data), SerializationException);
}
