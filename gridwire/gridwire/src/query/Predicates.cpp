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

// gridwire/gridwire/src/query/Predicates.cpp
#include "gridwire/query/Predicates.hpp"
#include "gridwire/Errors.hpp"

#include <algorithm>
#include <typeinfo>

namespace gridwire::query {
    namespace {
        PredicatePtr read_predicate(ObjectDataInput& in) {
            const auto value = in.read_object();
            const auto* object = value.get_if<UserObjectPtr>();
            auto predicate = object ? std::dynamic_pointer_cast<const Predicate>(*object) : nullptr;
            if (!predicate) { throw SerializationException(std::string{"Expected a predicate but got "} + kind_name(value.kind())); }
            return predicate;
        }

        bool same_predicates(const std::vector<PredicatePtr>& lhs, const std::vector<PredicatePtr>& rhs) {
            return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](const PredicatePtr& a, const PredicatePtr& b) {
                if (!a || !b) { return a == b; }
                return a->equals(*b);
            });
        }
    }

    bool Predicate::equals(const UserObject& other) const {
        const auto* predicate = dynamic_cast<const Predicate*>(&other);
        if (predicate == nullptr || typeid(*this) != typeid(*predicate)) { return false; }
        return same_fields(*predicate);
    }

    // ==================== Field layouts ====================

    void SqlPredicate::write_data(ObjectDataOutput& out) const { out.write_string(sql_); }

    void SqlPredicate::read_data(ObjectDataInput& in) { sql_ = in.read_string(); }

    bool SqlPredicate::same_fields(const Predicate& other) const {
        return sql_ == static_cast<const SqlPredicate&>(other).sql_;
    }

    void CompoundPredicate::write_data(ObjectDataOutput& out) const {
        out.write_int(static_cast<int32_t>(predicates_.size()));
        for (const auto& predicate : predicates_) { out.write_object(Value::user(predicate)); }
    }

    void CompoundPredicate::read_data(ObjectDataInput& in) {
        const auto count = in.read_length(sizeof(int32_t));
        predicates_.clear();
        predicates_.reserve(count);
        for (size_t i = 0; i < count; ++i) { predicates_.push_back(read_predicate(in)); }
    }

    bool CompoundPredicate::same_fields(const Predicate& other) const {
        return same_predicates(predicates_, static_cast<const CompoundPredicate&>(other).predicates_);
    }

    void NotPredicate::write_data(ObjectDataOutput& out) const { out.write_object(Value::user(predicate_)); }

    void NotPredicate::read_data(ObjectDataInput& in) { predicate_ = read_predicate(in); }

    bool NotPredicate::same_fields(const Predicate& other) const {
        const auto& rhs = static_cast<const NotPredicate&>(other).predicate_;
        if (!predicate_ || !rhs) { return predicate_ == rhs; }
        return predicate_->equals(*rhs);
    }

    void BetweenPredicate::write_data(ObjectDataOutput& out) const {
        out.write_string(field_);
        out.write_object(to_);
        out.write_object(from_);
    }

    void BetweenPredicate::read_data(ObjectDataInput& in) {
        field_ = in.read_string();
        to_ = in.read_object();
        from_ = in.read_object();
    }

    bool BetweenPredicate::same_fields(const Predicate& other) const {
        const auto& rhs = static_cast<const BetweenPredicate&>(other);
        return field_ == rhs.field_ && from_ == rhs.from_ && to_ == rhs.to_;
    }

    void FieldValuePredicate::write_data(ObjectDataOutput& out) const {
        out.write_string(field_);
        out.write_object(value_);
    }

    void FieldValuePredicate::read_data(ObjectDataInput& in) {
        field_ = in.read_string();
        value_ = in.read_object();
    }

    bool FieldValuePredicate::same_fields(const Predicate& other) const {
        const auto& rhs = static_cast<const FieldValuePredicate&>(other);
        return field_ == rhs.field_ && value_ == rhs.value_;
    }

    void GreaterLessPredicate::write_data(ObjectDataOutput& out) const {
        out.write_string(field_);
        out.write_object(value_);
        out.write_boolean(equal_);
        out.write_boolean(less_);
    }

    void GreaterLessPredicate::read_data(ObjectDataInput& in) {
        field_ = in.read_string();
        value_ = in.read_object();
        equal_ = in.read_boolean();
        less_ = in.read_boolean();
    }

    bool GreaterLessPredicate::same_fields(const Predicate& other) const {
        const auto& rhs = static_cast<const GreaterLessPredicate&>(other);
        return field_ == rhs.field_ && value_ == rhs.value_ && equal_ == rhs.equal_ && less_ == rhs.less_;
    }

    void PatternPredicate::write_data(ObjectDataOutput& out) const {
        out.write_string(field_);
        out.write_string(pattern_);
    }

    void PatternPredicate::read_data(ObjectDataInput& in) {
        field_ = in.read_string();
        pattern_ = in.read_string();
    }

    bool PatternPredicate::same_fields(const Predicate& other) const {
        const auto& rhs = static_cast<const PatternPredicate&>(other);
        return field_ == rhs.field_ && pattern_ == rhs.pattern_;
    }

    void InPredicate::write_data(ObjectDataOutput& out) const {
        out.write_string(field_);
        out.write_int(static_cast<int32_t>(values_.size()));
        for (const auto& value : values_) { out.write_object(value); }
    }

    void InPredicate::read_data(ObjectDataInput& in) {
        field_ = in.read_string();
        const auto count = in.read_length(sizeof(int32_t));
        values_.clear();
        values_.reserve(count);
        for (size_t i = 0; i < count; ++i) { values_.push_back(in.read_object()); }
    }

    bool InPredicate::same_fields(const Predicate& other) const {
        const auto& rhs = static_cast<const InPredicate&>(other);
        return field_ == rhs.field_ && values_ == rhs.values_;
    }

    void InstanceOfPredicate::write_data(ObjectDataOutput& out) const { out.write_string(class_name_); }

    void InstanceOfPredicate::read_data(ObjectDataInput& in) { class_name_ = in.read_string(); }

    bool InstanceOfPredicate::same_fields(const Predicate& other) const {
        return class_name_ == static_cast<const InstanceOfPredicate&>(other).class_name_;
    }

    // ==================== Factory ====================

    std::shared_ptr<IdentifiedDataSerializable> predicate_factory(int32_t class_id) {
        switch (class_id) {
            case PredicateClassId::SQL: return std::make_shared<SqlPredicate>();
            case PredicateClassId::AND: return std::make_shared<AndPredicate>();
            case PredicateClassId::BETWEEN: return std::make_shared<BetweenPredicate>();
            case PredicateClassId::EQUAL: return std::make_shared<EqualPredicate>();
            case PredicateClassId::GREATER_LESS: return std::make_shared<GreaterLessPredicate>();
            case PredicateClassId::LIKE: return std::make_shared<LikePredicate>();
            case PredicateClassId::ILIKE: return std::make_shared<ILikePredicate>();
            case PredicateClassId::IN: return std::make_shared<InPredicate>();
            case PredicateClassId::INSTANCE_OF: return std::make_shared<InstanceOfPredicate>();
            case PredicateClassId::NOT_EQUAL: return std::make_shared<NotEqualPredicate>();
            case PredicateClassId::NOT: return std::make_shared<NotPredicate>();
            case PredicateClassId::OR: return std::make_shared<OrPredicate>();
            case PredicateClassId::REGEX: return std::make_shared<RegexPredicate>();
            case PredicateClassId::ALWAYS_FALSE: return std::make_shared<FalsePredicate>();
            case PredicateClassId::ALWAYS_TRUE: return std::make_shared<TruePredicate>();
            default: return nullptr;
        }
    }

    // ==================== Builders ====================

    namespace predicates {
        PredicatePtr sql(std::string sql) { return std::make_shared<SqlPredicate>(std::move(sql)); }

        PredicatePtr and_predicate(std::vector<PredicatePtr> predicates) { return std::make_shared<AndPredicate>(std::move(predicates)); }

        PredicatePtr or_predicate(std::vector<PredicatePtr> predicates) { return std::make_shared<OrPredicate>(std::move(predicates)); }

        PredicatePtr not_predicate(PredicatePtr predicate) { return std::make_shared<NotPredicate>(std::move(predicate)); }

        PredicatePtr between(std::string field, Value from, Value to) {
            return std::make_shared<BetweenPredicate>(std::move(field), std::move(from), std::move(to));
        }

        PredicatePtr equal(std::string field, Value value) { return std::make_shared<EqualPredicate>(std::move(field), std::move(value)); }

        PredicatePtr not_equal(std::string field, Value value) {
            return std::make_shared<NotEqualPredicate>(std::move(field), std::move(value));
        }

        PredicatePtr greater_than(std::string field, Value value) {
            return std::make_shared<GreaterLessPredicate>(std::move(field), std::move(value), false, false);
        }

        PredicatePtr greater_equal(std::string field, Value value) {
            return std::make_shared<GreaterLessPredicate>(std::move(field), std::move(value), true, false);
        }

        PredicatePtr less_than(std::string field, Value value) {
            return std::make_shared<GreaterLessPredicate>(std::move(field), std::move(value), false, true);
        }

        PredicatePtr less_equal(std::string field, Value value) {
            return std::make_shared<GreaterLessPredicate>(std::move(field), std::move(value), true, true);
        }

        PredicatePtr like(std::string field, std::string expression) {
            return std::make_shared<LikePredicate>(std::move(field), std::move(expression));
        }

        PredicatePtr ilike(std::string field, std::string expression) {
            return std::make_shared<ILikePredicate>(std::move(field), std::move(expression));
        }

        PredicatePtr in_predicate(std::string field, std::vector<Value> values) {
            return std::make_shared<InPredicate>(std::move(field), std::move(values));
        }

        PredicatePtr instance_of(std::string class_name) { return std::make_shared<InstanceOfPredicate>(std::move(class_name)); }

        PredicatePtr regex(std::string field, std::string regex) {
            return std::make_shared<RegexPredicate>(std::move(field), std::move(regex));
        }

        PredicatePtr always_true() { return std::make_shared<TruePredicate>(); }

        PredicatePtr always_false() { return std::make_shared<FalsePredicate>(); }
    } // namespace predicates
} // namespace gridwire::query
