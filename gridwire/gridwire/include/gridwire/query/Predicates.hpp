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

// gridwire/gridwire/include/gridwire/query/Predicates.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/Serializer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gridwire::query {
    inline constexpr int32_t PREDICATE_FACTORY_ID = -20;

    /**
     * Class ids inside the predicate factory.
     */
    struct PredicateClassId {
        static constexpr int32_t SQL = 0;
        static constexpr int32_t AND = 1;
        static constexpr int32_t BETWEEN = 2;
        static constexpr int32_t EQUAL = 3;
        static constexpr int32_t GREATER_LESS = 4;
        static constexpr int32_t LIKE = 5;
        static constexpr int32_t ILIKE = 6;
        static constexpr int32_t IN = 7;
        static constexpr int32_t INSTANCE_OF = 8;
        static constexpr int32_t NOT_EQUAL = 9;
        static constexpr int32_t NOT = 10;
        static constexpr int32_t OR = 11;
        static constexpr int32_t REGEX = 12;
        static constexpr int32_t ALWAYS_FALSE = 13;
        static constexpr int32_t ALWAYS_TRUE = 14;
    };

    /**
     * Predicate - Query predicate evaluated by the cluster.
     *
     * Predicates only travel over the wire; nothing here evaluates them.
     * Nested values and child predicates are written with
     * ObjectDataOutput::write_object, so serializing a predicate requires a
     * cursor bound to a SerializationService.
     */
    class GRIDWIRE_API Predicate : public IdentifiedDataSerializable {
    public:
        [[nodiscard]] int32_t factory_id() const noexcept final { return PREDICATE_FACTORY_ID; }

        [[nodiscard]] bool equals(const UserObject& other) const override;

    protected:
        /**
         * Compares the fields of two predicates with the same class id.
         */
        [[nodiscard]] virtual bool same_fields(const Predicate& other) const = 0;
    };

    using PredicatePtr = std::shared_ptr<const Predicate>;

    class GRIDWIRE_API SqlPredicate final : public Predicate {
    public:
        SqlPredicate() = default;
        explicit SqlPredicate(std::string sql) : sql_{std::move(sql)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::SQL; }
        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

        [[nodiscard]] const std::string& sql() const noexcept { return sql_; }

    protected:
        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        std::string sql_;
    };

    /**
     * Shared layout of AND and OR: [count:i32] count x [predicate:object].
     */
    class GRIDWIRE_API CompoundPredicate : public Predicate {
    public:
        [[nodiscard]] const std::vector<PredicatePtr>& predicates() const noexcept { return predicates_; }

        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

    protected:
        CompoundPredicate() = default;
        explicit CompoundPredicate(std::vector<PredicatePtr> predicates) : predicates_{std::move(predicates)} {}

        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        std::vector<PredicatePtr> predicates_;
    };

    class GRIDWIRE_API AndPredicate final : public CompoundPredicate {
    public:
        AndPredicate() = default;
        explicit AndPredicate(std::vector<PredicatePtr> predicates) : CompoundPredicate{std::move(predicates)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::AND; }
    };

    class GRIDWIRE_API OrPredicate final : public CompoundPredicate {
    public:
        OrPredicate() = default;
        explicit OrPredicate(std::vector<PredicatePtr> predicates) : CompoundPredicate{std::move(predicates)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::OR; }
    };

    class GRIDWIRE_API NotPredicate final : public Predicate {
    public:
        NotPredicate() = default;
        explicit NotPredicate(PredicatePtr predicate) : predicate_{std::move(predicate)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::NOT; }
        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

        [[nodiscard]] const PredicatePtr& predicate() const noexcept { return predicate_; }

    protected:
        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        PredicatePtr predicate_;
    };

    /**
     * [field:string][to:object][from:object]
     */
    class GRIDWIRE_API BetweenPredicate final : public Predicate {
    public:
        BetweenPredicate() = default;
        BetweenPredicate(std::string field, Value from, Value to)
            : field_{std::move(field)}, from_{std::move(from)}, to_{std::move(to)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::BETWEEN; }
        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

        [[nodiscard]] const std::string& field() const noexcept { return field_; }
        [[nodiscard]] const Value& from() const noexcept { return from_; }
        [[nodiscard]] const Value& to() const noexcept { return to_; }

    protected:
        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        std::string field_;
        Value from_;
        Value to_;
    };

    /**
     * Shared layout of EQUAL and NOT_EQUAL: [field:string][value:object].
     */
    class GRIDWIRE_API FieldValuePredicate : public Predicate {
    public:
        [[nodiscard]] const std::string& field() const noexcept { return field_; }
        [[nodiscard]] const Value& value() const noexcept { return value_; }

        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

    protected:
        FieldValuePredicate() = default;
        FieldValuePredicate(std::string field, Value value) : field_{std::move(field)}, value_{std::move(value)} {}

        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        std::string field_;
        Value value_;
    };

    class GRIDWIRE_API EqualPredicate final : public FieldValuePredicate {
    public:
        EqualPredicate() = default;
        EqualPredicate(std::string field, Value value) : FieldValuePredicate{std::move(field), std::move(value)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::EQUAL; }
    };

    class GRIDWIRE_API NotEqualPredicate final : public FieldValuePredicate {
    public:
        NotEqualPredicate() = default;
        NotEqualPredicate(std::string field, Value value) : FieldValuePredicate{std::move(field), std::move(value)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::NOT_EQUAL; }
    };

    /**
     * [field:string][value:object][equal:bool][less:bool]
     */
    class GRIDWIRE_API GreaterLessPredicate final : public Predicate {
    public:
        GreaterLessPredicate() = default;
        GreaterLessPredicate(std::string field, Value value, bool equal, bool less)
            : field_{std::move(field)}, value_{std::move(value)}, equal_{equal}, less_{less} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::GREATER_LESS; }
        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

        [[nodiscard]] const std::string& field() const noexcept { return field_; }
        [[nodiscard]] const Value& value() const noexcept { return value_; }
        [[nodiscard]] bool equal() const noexcept { return equal_; }
        [[nodiscard]] bool less() const noexcept { return less_; }

    protected:
        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        std::string field_;
        Value value_;
        bool equal_ = false;
        bool less_ = false;
    };

    /**
     * Shared layout of LIKE, ILIKE and REGEX: [field:string][pattern:string].
     */
    class GRIDWIRE_API PatternPredicate : public Predicate {
    public:
        [[nodiscard]] const std::string& field() const noexcept { return field_; }
        [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

    protected:
        PatternPredicate() = default;
        PatternPredicate(std::string field, std::string pattern) : field_{std::move(field)}, pattern_{std::move(pattern)} {}

        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        std::string field_;
        std::string pattern_;
    };

    class GRIDWIRE_API LikePredicate final : public PatternPredicate {
    public:
        LikePredicate() = default;
        LikePredicate(std::string field, std::string expression) : PatternPredicate{std::move(field), std::move(expression)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::LIKE; }
    };

    class GRIDWIRE_API ILikePredicate final : public PatternPredicate {
    public:
        ILikePredicate() = default;
        ILikePredicate(std::string field, std::string expression) : PatternPredicate{std::move(field), std::move(expression)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::ILIKE; }
    };

    class GRIDWIRE_API RegexPredicate final : public PatternPredicate {
    public:
        RegexPredicate() = default;
        RegexPredicate(std::string field, std::string regex) : PatternPredicate{std::move(field), std::move(regex)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::REGEX; }
    };

    /**
     * [field:string][count:i32] count x [value:object]
     */
    class GRIDWIRE_API InPredicate final : public Predicate {
    public:
        InPredicate() = default;
        InPredicate(std::string field, std::vector<Value> values) : field_{std::move(field)}, values_{std::move(values)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::IN; }
        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

        [[nodiscard]] const std::string& field() const noexcept { return field_; }
        [[nodiscard]] const std::vector<Value>& values() const noexcept { return values_; }

    protected:
        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        std::string field_;
        std::vector<Value> values_;
    };

    class GRIDWIRE_API InstanceOfPredicate final : public Predicate {
    public:
        InstanceOfPredicate() = default;
        explicit InstanceOfPredicate(std::string class_name) : class_name_{std::move(class_name)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::INSTANCE_OF; }
        void write_data(ObjectDataOutput& out) const override;
        void read_data(ObjectDataInput& in) override;

        [[nodiscard]] const std::string& class_name() const noexcept { return class_name_; }

    protected:
        [[nodiscard]] bool same_fields(const Predicate& other) const override;

    private:
        std::string class_name_;
    };

    /**
     * TRUE and FALSE carry no fields.
     */
    class GRIDWIRE_API ConstantPredicate : public Predicate {
    public:
        void write_data(ObjectDataOutput&) const override {}
        void read_data(ObjectDataInput&) override {}

    protected:
        [[nodiscard]] bool same_fields(const Predicate&) const override { return true; }
    };

    class GRIDWIRE_API TruePredicate final : public ConstantPredicate {
    public:
        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::ALWAYS_TRUE; }
    };

    class GRIDWIRE_API FalsePredicate final : public ConstantPredicate {
    public:
        [[nodiscard]] int32_t class_id() const noexcept override { return PredicateClassId::ALWAYS_FALSE; }
    };

    /**
     * Factory registered under PREDICATE_FACTORY_ID; nullptr for unknown class ids.
     */
    [[nodiscard]] GRIDWIRE_API std::shared_ptr<IdentifiedDataSerializable> predicate_factory(int32_t class_id);

    /**
     * Convenience constructors.
     *
     * ```cpp
     * using namespace gridwire::query;
     * auto p = predicates::and_predicate({
     *     predicates::equal("city", Value::string("Tokyo")),
     *     predicates::greater_than("age", Value::int32(30)),
     * });
     * auto data = service.to_data(Value::user(p));
     * ```
     */
    namespace predicates {
        [[nodiscard]] GRIDWIRE_API PredicatePtr sql(std::string sql);
        [[nodiscard]] GRIDWIRE_API PredicatePtr and_predicate(std::vector<PredicatePtr> predicates);
        [[nodiscard]] GRIDWIRE_API PredicatePtr or_predicate(std::vector<PredicatePtr> predicates);
        [[nodiscard]] GRIDWIRE_API PredicatePtr not_predicate(PredicatePtr predicate);
        [[nodiscard]] GRIDWIRE_API PredicatePtr between(std::string field, Value from, Value to);
        [[nodiscard]] GRIDWIRE_API PredicatePtr equal(std::string field, Value value);
        [[nodiscard]] GRIDWIRE_API PredicatePtr not_equal(std::string field, Value value);
        [[nodiscard]] GRIDWIRE_API PredicatePtr greater_than(std::string field, Value value);
        [[nodiscard]] GRIDWIRE_API PredicatePtr greater_equal(std::string field, Value value);
        [[nodiscard]] GRIDWIRE_API PredicatePtr less_than(std::string field, Value value);
        [[nodiscard]] GRIDWIRE_API PredicatePtr less_equal(std::string field, Value value);
        [[nodiscard]] GRIDWIRE_API PredicatePtr like(std::string field, std::string expression);
        [[nodiscard]] GRIDWIRE_API PredicatePtr ilike(std::string field, std::string expression);
        [[nodiscard]] GRIDWIRE_API PredicatePtr in_predicate(std::string field, std::vector<Value> values);
        [[nodiscard]] GRIDWIRE_API PredicatePtr instance_of(std::string class_name);
        [[nodiscard]] GRIDWIRE_API PredicatePtr regex(std::string field, std::string regex);
        [[nodiscard]] GRIDWIRE_API PredicatePtr always_true();
        [[nodiscard]] GRIDWIRE_API PredicatePtr always_false();
    } // namespace predicates
} // namespace gridwire::query
