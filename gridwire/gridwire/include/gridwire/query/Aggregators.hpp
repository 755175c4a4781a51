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

// gridwire/gridwire/include/gridwire/query/Aggregators.hpp
#pragma once

#include "gridwire/Export.hpp"
#include "gridwire/Serializer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace gridwire::query {
    inline constexpr int32_t AGGREGATOR_FACTORY_ID = -29;

    /**
     * Class ids inside the aggregator factory.
     */
    struct AggregatorClassId {
        static constexpr int32_t BIG_DECIMAL_AVG = 0;
        static constexpr int32_t BIG_DECIMAL_SUM = 1;
        static constexpr int32_t BIG_INT_AVG = 2;
        static constexpr int32_t BIG_INT_SUM = 3;
        static constexpr int32_t COUNT = 4;
        static constexpr int32_t DISTINCT = 5;
        static constexpr int32_t DOUBLE_AVG = 6;
        static constexpr int32_t DOUBLE_SUM = 7;
        static constexpr int32_t FIXED_SUM = 8;
        static constexpr int32_t FLOATING_POINT_SUM = 9;
        static constexpr int32_t INT_AVG = 10;
        static constexpr int32_t INT_SUM = 11;
        static constexpr int32_t LONG_AVG = 12;
        static constexpr int32_t LONG_SUM = 13;
        static constexpr int32_t MAX = 14;
        static constexpr int32_t MIN = 15;
        static constexpr int32_t NUMBER_AVG = 16;
    };

    /**
     * Aggregator - Aggregation the cluster runs over map entries.
     *
     * Payload: [attribute_path:nullable string][state]
     *
     * The state is the aggregator's running result. A client only sends
     * aggregators it has just created, so the state it writes is the
     * initial one; a decoded aggregator keeps whatever state it received.
     * An absent attribute path aggregates the entry values themselves.
     */
    class GRIDWIRE_API Aggregator : public IdentifiedDataSerializable {
    public:
        [[nodiscard]] int32_t factory_id() const noexcept final { return AGGREGATOR_FACTORY_ID; }

        [[nodiscard]] const std::optional<std::string>& attribute_path() const noexcept { return attribute_path_; }

        void write_data(ObjectDataOutput& out) const final;
        void read_data(ObjectDataInput& in) final;

        [[nodiscard]] bool equals(const UserObject& other) const override;

    protected:
        Aggregator() = default;
        explicit Aggregator(std::optional<std::string> attribute_path) : attribute_path_{std::move(attribute_path)} {}

        virtual void write_state(ObjectDataOutput& out) const = 0;
        virtual void read_state(ObjectDataInput& in) = 0;

        /**
         * Compares the state of two aggregators of the same type.
         */
        [[nodiscard]] virtual bool same_state(const Aggregator& other) const = 0;

    private:
        std::optional<std::string> attribute_path_;
    };

    using AggregatorPtr = std::shared_ptr<const Aggregator>;

    namespace detail {
        template <typename T>
        void write_scalar(ObjectDataOutput& out, T value) {
            static_assert(std::is_same_v<T, int64_t> || std::is_same_v<T, double>);
            if constexpr (std::is_same_v<T, int64_t>) { out.write_long(value); }
            else { out.write_double(value); }
        }

        template <typename T>
        [[nodiscard]] T read_scalar(ObjectDataInput& in) {
            static_assert(std::is_same_v<T, int64_t> || std::is_same_v<T, double>);
            if constexpr (std::is_same_v<T, int64_t>) { return in.read_long(); }
            else { return in.read_double(); }
        }
    } // namespace detail

    /**
     * Single running value: [value:i64|f64].
     */
    template <int32_t ClassId, typename T>
    class AccumulatingAggregator final : public Aggregator {
    public:
        AccumulatingAggregator() = default;
        explicit AccumulatingAggregator(std::optional<std::string> attribute_path) : Aggregator{std::move(attribute_path)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return ClassId; }

        [[nodiscard]] T value() const noexcept { return value_; }

    protected:
        void write_state(ObjectDataOutput& out) const override { detail::write_scalar(out, value_); }
        void read_state(ObjectDataInput& in) override { value_ = detail::read_scalar<T>(in); }

        [[nodiscard]] bool same_state(const Aggregator& other) const override {
            return value_ == static_cast<const AccumulatingAggregator&>(other).value_;
        }

    private:
        T value_{};
    };

    /**
     * Running sum and count: [sum:i64|f64][count:i64].
     */
    template <int32_t ClassId, typename Sum>
    class AveragingAggregator final : public Aggregator {
    public:
        AveragingAggregator() = default;
        explicit AveragingAggregator(std::optional<std::string> attribute_path) : Aggregator{std::move(attribute_path)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return ClassId; }

        [[nodiscard]] Sum sum() const noexcept { return sum_; }
        [[nodiscard]] int64_t count() const noexcept { return count_; }

    protected:
        void write_state(ObjectDataOutput& out) const override {
            detail::write_scalar(out, sum_);
            out.write_long(count_);
        }

        void read_state(ObjectDataInput& in) override {
            sum_ = detail::read_scalar<Sum>(in);
            count_ = in.read_long();
        }

        [[nodiscard]] bool same_state(const Aggregator& other) const override {
            const auto& rhs = static_cast<const AveragingAggregator&>(other);
            return sum_ == rhs.sum_ && count_ == rhs.count_;
        }

    private:
        Sum sum_{};
        int64_t count_ = 0;
    };

    /**
     * Best value seen so far, null until one is found: [value:object].
     */
    template <int32_t ClassId>
    class ExtremumAggregator final : public Aggregator {
    public:
        ExtremumAggregator() = default;
        explicit ExtremumAggregator(std::optional<std::string> attribute_path) : Aggregator{std::move(attribute_path)} {}

        [[nodiscard]] int32_t class_id() const noexcept override { return ClassId; }

        [[nodiscard]] const Value& value() const noexcept { return value_; }

    protected:
        void write_state(ObjectDataOutput& out) const override { out.write_object(value_); }
        void read_state(ObjectDataInput& in) override { value_ = in.read_object(); }

        [[nodiscard]] bool same_state(const Aggregator& other) const override {
            return value_ == static_cast<const ExtremumAggregator&>(other).value_;
        }

    private:
        Value value_ = Value::null();
    };

    using CountAggregator = AccumulatingAggregator<AggregatorClassId::COUNT, int64_t>;
    using DoubleSumAggregator = AccumulatingAggregator<AggregatorClassId::DOUBLE_SUM, double>;
    using FixedPointSumAggregator = AccumulatingAggregator<AggregatorClassId::FIXED_SUM, int64_t>;
    using FloatingPointSumAggregator = AccumulatingAggregator<AggregatorClassId::FLOATING_POINT_SUM, double>;
    using IntegerSumAggregator = AccumulatingAggregator<AggregatorClassId::INT_SUM, int64_t>;
    using LongSumAggregator = AccumulatingAggregator<AggregatorClassId::LONG_SUM, int64_t>;

    using DoubleAverageAggregator = AveragingAggregator<AggregatorClassId::DOUBLE_AVG, double>;
    using NumberAverageAggregator = AveragingAggregator<AggregatorClassId::NUMBER_AVG, double>;
    using IntegerAverageAggregator = AveragingAggregator<AggregatorClassId::INT_AVG, int64_t>;
    using LongAverageAggregator = AveragingAggregator<AggregatorClassId::LONG_AVG, int64_t>;

    using MaxAggregator = ExtremumAggregator<AggregatorClassId::MAX>;
    using MinAggregator = ExtremumAggregator<AggregatorClassId::MIN>;

    /**
     * Factory registered under AGGREGATOR_FACTORY_ID; nullptr for class ids
     * without a client-side aggregator (the big number and distinct ones).
     */
    [[nodiscard]] GRIDWIRE_API std::shared_ptr<IdentifiedDataSerializable> aggregator_factory(int32_t class_id);

    namespace aggregators {
        [[nodiscard]] GRIDWIRE_API AggregatorPtr count(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr double_sum(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr fixed_point_sum(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr floating_point_sum(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr integer_sum(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr long_sum(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr double_avg(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr number_avg(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr integer_avg(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr long_avg(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr max(std::optional<std::string> attribute_path = std::nullopt);
        [[nodiscard]] GRIDWIRE_API AggregatorPtr min(std::optional<std::string> attribute_path = std::nullopt);
    } // namespace aggregators
} // namespace gridwire::query
