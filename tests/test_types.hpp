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

// tests/test_types.hpp
#pragma once

#include "gridwire/Serializer.hpp"
#include "gridwire/compact/CompactSerializer.hpp"
#include "gridwire/portable/Portable.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gridwire::fixtures {
    // ==================== IdentifiedDataSerializable ====================

    class Employee final : public IdentifiedDataSerializable {
    public:
        static constexpr int32_t FACTORY_ID = 1;
        static constexpr int32_t CLASS_ID = 1;

        Employee() = default;
        Employee(std::string name, int32_t age) : name_{std::move(name)}, age_{age} {}

        int32_t factory_id() const noexcept override { return FACTORY_ID; }
        int32_t class_id() const noexcept override { return CLASS_ID; }

        void write_data(ObjectDataOutput& out) const override {
            out.write_string(name_);
            out.write_int(age_);
        }

        void read_data(ObjectDataInput& in) override {
            name_ = in.read_string();
            age_ = in.read_int();
        }

        bool equals(const UserObject& other) const override {
            const auto* rhs = dynamic_cast<const Employee*>(&other);
            return rhs != nullptr && name_ == rhs->name_ && age_ == rhs->age_;
        }

        const std::string& name() const noexcept { return name_; }
        int32_t age() const noexcept { return age_; }

    private:
        std::string name_;
        int32_t age_ = 0;
    };

    inline std::shared_ptr<IdentifiedDataSerializable> employee_factory(int32_t class_id) {
        if (class_id == Employee::CLASS_ID) { return std::make_shared<Employee>(); }
        return nullptr;
    }

    // ==================== Portable ====================

    class Customer final : public portable::Portable {
    public:
        static constexpr int32_t FACTORY_ID = 2;
        static constexpr int32_t CLASS_ID = 3;

        Customer() = default;
        Customer(std::string name, int32_t id, std::vector<std::string> tags, std::shared_ptr<const Customer> referrer = nullptr)
            : name_{std::move(name)}, id_{id}, tags_{std::move(tags)}, referrer_{std::move(referrer)} {}

        int32_t factory_id() const noexcept override { return FACTORY_ID; }
        int32_t class_id() const noexcept override { return CLASS_ID; }

        void write_portable(portable::PortableWriter& writer) const override {
            writer.write_utf("name", name_);
            writer.write_int("id", id_);
            writer.write_utf_array("tags", tags_);
            writer.write_portable("referrer", referrer_);
        }

        void read_portable(portable::PortableReader& reader) override {
            // out of write order on purpose
            referrer_ = std::dynamic_pointer_cast<Customer>(reader.read_portable("referrer"));
            id_ = reader.read_int("id");
            name_ = reader.read_utf("name");
            tags_ = reader.read_utf_array("tags");
        }

        bool equals(const UserObject& other) const override {
            const auto* rhs = dynamic_cast<const Customer*>(&other);
            if (rhs == nullptr || name_ != rhs->name_ || id_ != rhs->id_ || tags_ != rhs->tags_) { return false; }
            if (!referrer_ || !rhs->referrer_) { return referrer_ == rhs->referrer_; }
            return referrer_->equals(*rhs->referrer_);
        }

        const std::shared_ptr<const Customer>& referrer() const noexcept { return referrer_; }

    private:
        std::string name_;
        int32_t id_ = 0;
        std::vector<std::string> tags_;
        std::shared_ptr<const Customer> referrer_;
    };

    inline std::shared_ptr<portable::Portable> customer_factory(int32_t class_id) {
        if (class_id == Customer::CLASS_ID) { return std::make_shared<Customer>(); }
        return nullptr;
    }

    // ==================== Compact ====================

    class Point final : public UserObject {
    public:
        Point(int32_t x, int32_t y, std::optional<std::string> label = std::nullopt)
            : x(x), y(y), label(std::move(label)) {}

        bool equals(const UserObject& other) const override {
            const auto* rhs = dynamic_cast<const Point*>(&other);
            return rhs != nullptr && x == rhs->x && y == rhs->y && label == rhs->label;
        }

        int32_t x;
        int32_t y;
        std::optional<std::string> label;
    };

    class PointSerializer final : public compact::CompactSerializer<Point> {
    public:
        std::string type_name() const override { return "Point"; }

        void write(compact::CompactWriter& writer, const Point& p) const override {
            writer.write_int32("x", p.x);
            writer.write_int32("y", p.y);
            writer.write_string("label", p.label);
        }

        std::shared_ptr<Point> read(compact::CompactReader& reader) const override {
            return std::make_shared<Point>(reader.read_int32("x"), reader.read_int32("y"), reader.read_string("label"));
        }
    };

    class Segment final : public UserObject {
    public:
        Segment(std::shared_ptr<const Point> start, std::shared_ptr<const Point> end) : start(std::move(start)), end(std::move(end)) {}

        bool equals(const UserObject& other) const override {
            const auto* rhs = dynamic_cast<const Segment*>(&other);
            return rhs != nullptr && same(start, rhs->start) && same(end, rhs->end);
        }

        std::shared_ptr<const Point> start;
        std::shared_ptr<const Point> end;

    private:
        static bool same(const std::shared_ptr<const Point>& a, const std::shared_ptr<const Point>& b) {
            if (!a || !b) { return a == b; }
            return a->equals(*b);
        }
    };

    class SegmentSerializer final : public compact::CompactSerializer<Segment> {
    public:
        std::string type_name() const override { return "Segment"; }

        void write(compact::CompactWriter& writer, const Segment& s) const override {
            writer.write_compact("start", Value::user(s.start));
            writer.write_compact("end", Value::user(s.end));
        }

        std::shared_ptr<Segment> read(compact::CompactReader& reader) const override {
            return std::make_shared<Segment>(point_of(reader.read_compact("start")), point_of(reader.read_compact("end")));
        }

    private:
        static std::shared_ptr<const Point> point_of(const Value& value) {
            if (value.is_null()) { return nullptr; }
            return std::dynamic_pointer_cast<const Point>(value.get<UserObjectPtr>());
        }
    };

    // ==================== Custom / global ====================

    class Money final : public CustomSerializable {
    public:
        static constexpr int32_t CUSTOM_ID = 7;

        Money(int64_t cents, std::string currency) : cents(cents), currency(std::move(currency)) {}

        int32_t custom_id() const noexcept override { return CUSTOM_ID; }

        bool equals(const UserObject& other) const override {
            const auto* rhs = dynamic_cast<const Money*>(&other);
            return rhs != nullptr && cents == rhs->cents && currency == rhs->currency;
        }

        int64_t cents;
        std::string currency;
    };

    class MoneySerializer final : public Serializer {
    public:
        int32_t id() const noexcept override { return Money::CUSTOM_ID; }

        void write(ObjectDataOutput& out, const Value& value) const override {
            const auto* money = dynamic_cast<const Money*>(value.get<UserObjectPtr>().get());
            if (money == nullptr) { throw SerializationException("not money"); }
            out.write_long(money->cents);
            out.write_string(money->currency);
        }

        Value read(ObjectDataInput& in) const override {
            const auto cents = in.read_long();
            return Value::user(std::make_shared<Money>(cents, in.read_string()));
        }
    };

    /**
     * Writes nothing and reads back a marker string.
     */
    class MarkerSerializer final : public Serializer {
    public:
        explicit MarkerSerializer(int32_t id) : id_{id} {}

        int32_t id() const noexcept override { return id_; }

        void write(ObjectDataOutput& out, const Value&) const override { out.write_string("marker"); }

        Value read(ObjectDataInput& in) const override { return Value::string(in.read_string()); }

    private:
        int32_t id_;
    };

    // ==================== Partitioning ====================

    /**
     * Plain user object with a nested partition key and a JSON form.
     */
    class Order final : public UserObject {
    public:
        Order(std::string id, Value key) : id(std::move(id)), key(std::move(key)) {}

        Value partition_key() const override { return key; }

        Value plain_form() const override { return Value::object({{"id", Value::string(id)}}); }

        std::string id;
        Value key;
    };

    class Hashed final : public UserObject {
    public:
        explicit Hashed(int32_t hash) : hash(hash) {}

        std::optional<int32_t> partition_hash() const override { return hash; }

        Value plain_form() const override { return Value::object({{"hash", Value::number(hash)}}); }

        int32_t hash;
    };

    /**
     * Partition key that is itself keyed, forming a chain of the given length.
     */
    class ChainedKey final : public UserObject {
    public:
        explicit ChainedKey(size_t remaining) : remaining(remaining) {}

        Value partition_key() const override {
            if (remaining == 0) { return Value::string("leaf"); }
            return Value::user(std::make_shared<ChainedKey>(remaining - 1));
        }

        Value plain_form() const override { return Value::object({{"remaining", Value::number(static_cast<double>(remaining))}}); }

        size_t remaining;
    };
} // namespace gridwire::fixtures
