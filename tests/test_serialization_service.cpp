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

// tests/test_serialization_service.cpp
#include "gridwire/SerializationService.hpp"
#include "serialization/SerializationConstants.hpp"
#include "test_types.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace gridwire;
using namespace gridwire::fixtures;
using gridwire::common::ByteOrder;
using gridwire::serialization::SerializationConstants;

namespace {
    std::vector<uint8_t> bytes_of(const Data& data) {
        const auto span = data.to_bytes();
        return {span.begin(), span.end()};
    }

    /**
     * Implements both factory-based and named-field serialization.
     */
    class DualFormat final : public IdentifiedDataSerializable, public portable::Portable {
    public:
        int32_t factory_id() const noexcept override { return Employee::FACTORY_ID; }
        int32_t class_id() const noexcept override { return 77; }
        void write_data(ObjectDataOutput&) const override {}
        void read_data(ObjectDataInput&) override {}
        void write_portable(portable::PortableWriter&) const override {}
        void read_portable(portable::PortableReader&) override {}
    };
}

class SerializationServiceTest : public ::testing::Test {
protected:
    static SerializationConfig config_with_employees() {
        SerializationConfig config;
        config.data_serializable_factories.emplace(Employee::FACTORY_ID, &employee_factory);
        return config;
    }

    SerializationService service_{config_with_employees()};
};

// ==================== Round trips ====================

TEST_F(SerializationServiceTest, IntegerRoundTrips) {
    const auto data = service_.to_data(Value::int32(14));

    EXPECT_EQ(data.type(), SerializationConstants::CONSTANT_TYPE_INTEGER);
    EXPECT_EQ(data.total_size(), Data::HEAP_DATA_OVERHEAD + 4);
    EXPECT_EQ(service_.to_object(data), Value::int32(14));
}

TEST_F(SerializationServiceTest, EmptyArrayWithByteDefaultRoundTripsAsEmptyBuffer) {
    SerializationConfig config;
    config.default_number_type = NumberType::Byte;
    const SerializationService service{config};

    const auto data = service.to_data(Value::array({}));
    EXPECT_EQ(data.type(), SerializationConstants::CONSTANT_TYPE_BYTE_ARRAY);

    const auto back = service.to_object(data);
    ASSERT_EQ(back.kind(), ValueKind::Buffer);
    EXPECT_TRUE(back.get<Bytes>().empty());
}

TEST_F(SerializationServiceTest, IdentifiedObjectRoundTrips) {
    const auto data = service_.to_data(Value::user(std::make_shared<Employee>("Ada", 36)));
    EXPECT_EQ(data.type(), SerializationConstants::CONSTANT_TYPE_DATA_SERIALIZABLE);

    const auto back = service_.to_object(data);
    const auto employee = std::dynamic_pointer_cast<const Employee>(back.get<UserObjectPtr>());
    ASSERT_NE(employee, nullptr);
    EXPECT_EQ(employee->name(), "Ada");
    EXPECT_EQ(employee->age(), 36);
}

TEST_F(SerializationServiceTest, NonDataPassesThroughToObject) {
    EXPECT_EQ(service_.to_object(Value::string("plain")), Value::string("plain"));
    EXPECT_TRUE(service_.to_object(Value::null()).is_null());

    const auto data = service_.to_data(Value::boolean(true));
    EXPECT_EQ(service_.to_object(Value::data(data)), Value::boolean(true));
}

TEST_F(SerializationServiceTest, EmptyEnvelopeIsNull) {
    EXPECT_TRUE(service_.to_object(Data{}).is_null());
}

TEST_F(SerializationServiceTest, IsDataRecognizesEnvelopesOnly) {
    EXPECT_TRUE(SerializationService::is_data(Value::data(service_.to_data(Value::int32(1)))));
    EXPECT_FALSE(SerializationService::is_data(Value::int32(1)));
    EXPECT_FALSE(SerializationService::is_data(Value::null()));
}

// ==================== Envelope properties ====================

TEST_F(SerializationServiceTest, ToDataIsIdempotent) {
    const auto data = service_.to_data(Value::string("once"));
    const auto again = service_.to_data(Value::data(data));
    EXPECT_EQ(bytes_of(again), bytes_of(data));
}

TEST_F(SerializationServiceTest, EncodingIsDeterministic) {
    const auto value = Value::object({{"a", Value::number(1)}, {"b", Value::array({Value::string("x")})}});
    EXPECT_EQ(bytes_of(service_.to_data(value)), bytes_of(service_.to_data(value)));

    const auto employee = Value::user(std::make_shared<Employee>("Lin", 41));
    EXPECT_EQ(bytes_of(service_.to_data(employee)), bytes_of(service_.to_data(employee)));
}

TEST_F(SerializationServiceTest, HeaderUsesConfiguredByteOrder) {
    SerializationConfig config;
    config.is_big_endian = false;
    const SerializationService service{config};

    const auto data = service.to_data(Value::int32(14));
    EXPECT_EQ(service.byte_order(), ByteOrder::LittleEndian);
    EXPECT_EQ(bytes_of(data), (std::vector<uint8_t>{0, 0, 0, 0, 0xF9, 0xFF, 0xFF, 0xFF, 14, 0, 0, 0}));
    EXPECT_EQ(service.to_object(data), Value::int32(14));
}

TEST_F(SerializationServiceTest, DefaultNumberTypeChangesEncoding) {
    SerializationConfig as_integer;
    as_integer.default_number_type = NumberType::Integer;
    SerializationConfig as_long;
    as_long.default_number_type = NumberType::Long;

    const SerializationService integer_service{as_integer};
    const SerializationService long_service{as_long};

    const auto number = Value::number(5);
    EXPECT_EQ(integer_service.to_data(number).type(), SerializationConstants::CONSTANT_TYPE_INTEGER);
    EXPECT_EQ(long_service.to_data(number).type(), SerializationConstants::CONSTANT_TYPE_LONG);
    EXPECT_EQ(integer_service.to_object(integer_service.to_data(number)), number);
    EXPECT_EQ(long_service.to_object(long_service.to_data(number)), number);

    const auto empty = Value::array({});
    EXPECT_EQ(integer_service.to_data(empty).type(), SerializationConstants::CONSTANT_TYPE_INTEGER_ARRAY);
    EXPECT_EQ(long_service.to_data(empty).type(), SerializationConstants::CONSTANT_TYPE_LONG_ARRAY);
    EXPECT_EQ(integer_service.to_object(integer_service.to_data(empty)), empty);
    EXPECT_EQ(long_service.to_object(long_service.to_data(empty)), empty);
}

// ==================== Partitioning ====================

TEST_F(SerializationServiceTest, PartitionKeyHashesSerializedKey) {
    const auto value = Value::object({{"partitionKey", Value::string("key")}, {"name", Value::string("outer")}});
    const auto data = service_.to_data(value);

    const auto key_data = service_.to_data(Value::string("key"));
    EXPECT_EQ(data.partition_hash(), key_data.hash_code());
    EXPECT_EQ(data.partition_hash(), 1476017569);
    EXPECT_NE(data.partition_hash(), data.hash_code());
}

TEST_F(SerializationServiceTest, StrategySeesSerializedKey) {
    const auto strategy = [](const Value& v) { return v.kind() == ValueKind::Data ? 11 : 22; };

    const auto keyed = Value::user(std::make_shared<Order>("o-1", Value::string("customer-9")));
    EXPECT_EQ(service_.to_data(keyed, strategy).partition_hash(), 11);
    EXPECT_EQ(service_.to_data(Value::string("unkeyed"), strategy).partition_hash(), 22);
}

TEST_F(SerializationServiceTest, NullPartitionKeyIsIgnored) {
    const auto value = Value::object({{"partitionKey", Value::null()}});
    const auto data = service_.to_data(value);
    EXPECT_FALSE(data.has_partition_hash());
}

TEST_F(SerializationServiceTest, PartitionHashAccessorIsUsedVerbatim) {
    const auto data = service_.to_data(Value::user(std::make_shared<Hashed>(42)));
    EXPECT_TRUE(data.has_partition_hash());
    EXPECT_EQ(data.partition_hash(), 42);
}

TEST_F(SerializationServiceTest, PartitionKeyNestingIsCapped) {
    EXPECT_NO_THROW((void)service_.to_data(Value::user(std::make_shared<ChainedKey>(7))));
    EXPECT_THROW((void)service_.to_data(Value::user(std::make_shared<ChainedKey>(8))), PartitionKeyDepthError);

    SerializationConfig shallow;
    shallow.max_partition_key_depth = 2;
    const SerializationService service{shallow};
    EXPECT_NO_THROW((void)service.to_data(Value::user(std::make_shared<ChainedKey>(1))));
    EXPECT_THROW((void)service.to_data(Value::user(std::make_shared<ChainedKey>(2))), PartitionKeyDepthError);
}

// ==================== Failures ====================

TEST_F(SerializationServiceTest, UnknownTypeIdFails) {
    common::ByteBuffer buf(12, ByteOrder::BigEndian);
    buf.put_i32(0);
    buf.put_i32(12345);
    buf.put_i32(0);
    const Data data{buf.take(), ByteOrder::BigEndian};

    try {
        (void)service_.to_object(data);
        FAIL() << "expected NoDeserializerFoundError";
    }
    catch (const NoDeserializerFoundError& e) {
        EXPECT_EQ(e.type_id(), 12345);
        EXPECT_NE(std::string{e.what()}.find("12345"), std::string::npos);
    }
}

TEST_F(SerializationServiceTest, AbsentValueIsUnserializable) {
    EXPECT_THROW((void)service_.to_data(Value{}), UnserializableError);
    EXPECT_THROW((void)service_.to_data(Value::absent()), SerializationException);
}

TEST_F(SerializationServiceTest, UnknownFactoryFailsOnRead) {
    const SerializationService writer{config_with_employees()};
    const SerializationService reader{SerializationConfig{}};

    const auto data = writer.to_data(Value::user(std::make_shared<Employee>("Ada", 36)));
    EXPECT_THROW((void)reader.to_object(data), SerializationException);
}

TEST_F(SerializationServiceTest, InvalidConfigurationFailsConstruction) {
    SerializationConfig config;
    config.custom_serializers.push_back(std::make_shared<MarkerSerializer>(0));
    EXPECT_THROW(SerializationService{config}, std::invalid_argument);

    SerializationConfig clash;
    clash.global_serializer = std::make_shared<MarkerSerializer>(SerializationConstants::CONSTANT_TYPE_STRING);
    EXPECT_THROW(SerializationService{clash}, DuplicateIdError);
}

TEST_F(SerializationServiceTest, RepeatedCustomIdFailsWithDuplicateName) {
    SerializationConfig config;
    config.custom_serializers.push_back(std::make_shared<MarkerSerializer>(5));
    config.custom_serializers.push_back(std::make_shared<MarkerSerializer>(5));

    try {
        SerializationService service{config};
        FAIL() << "expected DuplicateNameError";
    }
    catch (const DuplicateNameError& e) {
        EXPECT_NE(std::string{e.what()}.find("!custom5"), std::string::npos);
    }
}

// ==================== Precedence ====================

TEST_F(SerializationServiceTest, FactoryFormatBeatsPortableAndJson) {
    const auto& serializer = service_.find_serializer_for(Value::user(std::make_shared<DualFormat>()));
    EXPECT_EQ(serializer.id(), SerializationConstants::CONSTANT_TYPE_DATA_SERIALIZABLE);
}

TEST_F(SerializationServiceTest, PlainUserObjectFallsBackToJson) {
    const auto data = service_.to_data(Value::user(std::make_shared<Order>("o-7", Value{})));
    EXPECT_EQ(data.type(), SerializationConstants::JSON_SERIALIZATION_TYPE);
    EXPECT_EQ(service_.to_object(data), Value::object({{"id", Value::string("o-7")}}));
}

TEST_F(SerializationServiceTest, CustomSerializerMatchesTag) {
    SerializationConfig config;
    config.custom_serializers.push_back(std::make_shared<MoneySerializer>());
    config.custom_serializers.push_back(std::make_shared<MarkerSerializer>(9));
    const SerializationService service{config};

    const auto money = Value::user(std::make_shared<Money>(1999, "EUR"));
    const auto data = service.to_data(money);
    EXPECT_EQ(data.type(), Money::CUSTOM_ID);
    EXPECT_EQ(service.to_object(data), money);

    EXPECT_EQ(service.to_data(Value::object({{"hzCustomId", Value::number(9)}})).type(), 9);
    EXPECT_EQ(
        service.to_data(Value::object({{"hzCustomId", Value::number(0)}})).type(),
        SerializationConstants::JSON_SERIALIZATION_TYPE
    );
    EXPECT_EQ(
        service.to_data(Value::object({{"hzCustomId", Value::number(9.5)}})).type(),
        SerializationConstants::JSON_SERIALIZATION_TYPE
    );
}

TEST_F(SerializationServiceTest, KindMatchBeatsCustomTag) {
    SerializationConfig config;
    config.custom_serializers.push_back(std::make_shared<MarkerSerializer>(9));
    const SerializationService service{config};

    EXPECT_EQ(service.to_data(Value::string("tagless")).type(), SerializationConstants::CONSTANT_TYPE_STRING);
}

TEST_F(SerializationServiceTest, GlobalSerializerPrecedesJson) {
    SerializationConfig config;
    config.global_serializer = std::make_shared<MarkerSerializer>(100);
    const SerializationService service{config};

    const auto data = service.to_data(Value::object({{"a", Value::number(1)}}));
    EXPECT_EQ(data.type(), 100);
    EXPECT_EQ(service.to_object(data), Value::string("marker"));
    EXPECT_EQ(service.to_data(Value::int32(1)).type(), SerializationConstants::CONSTANT_TYPE_INTEGER);
}

TEST_F(SerializationServiceTest, ExtensionRegistersExtraSerializers) {
    const SerializationService service{
        SerializationConfig{},
        nullptr,
        [](SerializerRegistry::Builder& builder) {
            builder.register_serializer(SerializerKey::custom(55), std::make_shared<MarkerSerializer>(55));
        }
    };

    EXPECT_NE(service.registry().find_by_id(55), nullptr);
    EXPECT_EQ(service.to_data(Value::object({{"hzCustomId", Value::number(55)}})).type(), 55);
}

TEST_F(SerializationServiceTest, LazyJsonPolicyKeepsText) {
    SerializationConfig config;
    config.json_string_deserialization_policy = JsonStringDeserializationPolicy::NoDeserialization;
    const SerializationService service{config};

    const auto back = service.to_object(service.to_data(Value::object({{"abc", Value::string("abc")}})));
    ASSERT_EQ(back.kind(), ValueKind::JsonValue);
    EXPECT_EQ(back.get<JsonValue>().text, R"({"abc":"abc"})");

    const auto eager = service_.to_object(service_.to_data(back));
    EXPECT_EQ(eager, Value::object({{"abc", Value::string("abc")}}));
}

// ==================== Nested values ====================

TEST_F(SerializationServiceTest, WriteObjectPrefixesTypeId) {
    ObjectDataOutput out{service_.byte_order(), &service_};
    service_.write_object(out, Value::string("x"));
    out.write_object(Value::int64(9));

    const auto bytes = out.take();
    ObjectDataInput in{bytes, service_.byte_order(), &service_};
    EXPECT_EQ(in.read_int(), SerializationConstants::CONSTANT_TYPE_STRING);
    in.set_position(0);
    EXPECT_EQ(service_.read_object(in), Value::string("x"));
    EXPECT_EQ(in.read_object(), Value::int64(9));
    EXPECT_EQ(in.remaining(), 0u);
}

TEST_F(SerializationServiceTest, ReadObjectWithUnknownIdFails) {
    ObjectDataOutput out{service_.byte_order()};
    out.write_int(4242);

    const auto bytes = out.take();
    ObjectDataInput in{bytes, service_.byte_order(), &service_};
    EXPECT_THROW((void)service_.read_object(in), NoDeserializerFoundError);
}

TEST_F(SerializationServiceTest, NestedWritesNeedAService) {
    ObjectDataOutput out{ByteOrder::BigEndian};
    EXPECT_THROW(out.write_object(Value::int32(1)), SerializationException);
}

TEST_F(SerializationServiceTest, NestingScopesAreBoundedAndReleased) {
    const std::vector<uint8_t> empty;
    ObjectDataInput unbound{empty, ByteOrder::BigEndian};
    EXPECT_EQ(unbound.max_nesting_depth(), ObjectDataInput::DEFAULT_MAX_NESTING_DEPTH);

    SerializationConfig config;
    config.max_nesting_depth = 2;
    const SerializationService shallow{config};
    ObjectDataInput in{empty, ByteOrder::BigEndian, &shallow};
    EXPECT_EQ(in.max_nesting_depth(), 2u);

    {
        const auto outer = in.enter_nested();
        const auto inner = in.enter_nested();
        EXPECT_EQ(in.nesting_depth(), 2u);
        EXPECT_THROW(ObjectDataInput::NestingScope{in}, SerializationException);
        EXPECT_EQ(in.nesting_depth(), 2u);
    }
    EXPECT_EQ(in.nesting_depth(), 0u);
}

// ==================== Concurrency ====================

TEST_F(SerializationServiceTest, ConcurrentCallsShareOneService) {
    constexpr int THREADS = 4;
    constexpr int ITERATIONS = 200;

    std::vector<std::thread> threads;
    std::vector<int> failures(THREADS, 0);
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this, t, &failures] {
            for (int i = 0; i < ITERATIONS; ++i) {
                const auto value = Value::user(std::make_shared<Employee>("worker", t * ITERATIONS + i));
                if (!(service_.to_object(service_.to_data(value)) == value)) { ++failures[t]; }
            }
        });
    }
    for (auto& thread : threads) { thread.join(); }

    for (const auto f : failures) { EXPECT_EQ(f, 0); }
}
