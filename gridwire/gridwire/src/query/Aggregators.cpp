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

// gridwire/gridwire/src/query/Aggregators.cpp
#include "gridwire/query/Aggregators.hpp"

#include <typeinfo>

namespace gridwire::query {
    void Aggregator::write_data(ObjectDataOutput& out) const {
        out.write_nullable_string(attribute_path_);
        write_state(out);
    }

    void Aggregator::read_data(ObjectDataInput& in) {
        attribute_path_ = in.read_nullable_string();
        read_state(in);
    }

    bool Aggregator::equals(const UserObject& other) const {
        const auto* aggregator = dynamic_cast<const Aggregator*>(&other);
        if (aggregator == nullptr || typeid(*this) != typeid(*aggregator)) { return false; }
        return attribute_path_ == aggregator->attribute_path_ && same_state(*aggregator);
    }

    // ==================== Factory ====================

    std::shared_ptr<IdentifiedDataSerializable> aggregator_factory(int32_t class_id) {
        switch (class_id) {
            case AggregatorClassId::COUNT: return std::make_shared<CountAggregator>();
            case AggregatorClassId::DOUBLE_AVG: return std::make_shared<DoubleAverageAggregator>();
            case AggregatorClassId::DOUBLE_SUM: return std::make_shared<DoubleSumAggregator>();
            case AggregatorClassId::FIXED_SUM: return std::make_shared<FixedPointSumAggregator>();
            case AggregatorClassId::FLOATING_POINT_SUM: return std::make_shared<FloatingPointSumAggregator>();
            case AggregatorClassId::INT_AVG: return std::make_shared<IntegerAverageAggregator>();
            case AggregatorClassId::INT_SUM: return std::make_shared<IntegerSumAggregator>();
            case AggregatorClassId::LONG_AVG: return std::make_shared<LongAverageAggregator>();
            case AggregatorClassId::LONG_SUM: return std::make_shared<LongSumAggregator>();
            case AggregatorClassId::MAX: return std::make_shared<MaxAggregator>();
            case AggregatorClassId::MIN: return std::make_shared<MinAggregator>();
            case AggregatorClassId::NUMBER_AVG: return std::make_shared<NumberAverageAggregator>();
            default: return nullptr;
        }
    }

    // ==================== Builders ====================

    namespace aggregators {
        AggregatorPtr count(std::optional<std::string> attribute_path) { return std::make_shared<CountAggregator>(std::move(attribute_path)); }

        AggregatorPtr double_sum(std::optional<std::string> attribute_path) {
            return std::make_shared<DoubleSumAggregator>(std::move(attribute_path));
        }

        AggregatorPtr fixed_point_sum(std::optional<std::string> attribute_path) {
            return std::make_shared<FixedPointSumAggregator>(std::move(attribute_path));
        }

        AggregatorPtr floating_point_sum(std::optional<std::string> attribute_path) {
            return std::make_shared<FloatingPointSumAggregator>(std::move(attribute_path));
        }

        AggregatorPtr integer_sum(std::optional<std::string> attribute_path) {
            return std::make_shared<IntegerSumAggregator>(std::move(attribute_path));
        }

        AggregatorPtr long_sum(std::optional<std::string> attribute_path) { return std::make_shared<LongSumAggregator>(std::move(attribute_path)); }

        AggregatorPtr double_avg(std::optional<std::string> attribute_path) {
            return std::make_shared<DoubleAverageAggregator>(std::move(attribute_path));
        }

        AggregatorPtr number_avg(std::optional<std::string> attribute_path) {
            return std::make_shared<NumberAverageAggregator>(std::move(attribute_path));
        }

        AggregatorPtr integer_avg(std::optional<std::string> attribute_path) {
            return std::make_shared<IntegerAverageAggregator>(std::move(attribute_path));
        }

        AggregatorPtr long_avg(std::optional<std::string> attribute_path) {
            return std::make_shared<LongAverageAggregator>(std::move(attribute_path));
        }

        AggregatorPtr max(std::optional<std::string> attribute_path) { return std::make_shared<MaxAggregator>(std::move(attribute_path)); }

        AggregatorPtr min(std::optional<std::string> attribute_path) { return std::make_shared<MinAggregator>(std::move(attribute_path)); }
    } // namespace aggregators
} // namespace gridwire::query
