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

// gridwire/internal/src/util/Logging.cpp
#include "util/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gridwire::util {
    std::shared_ptr<spdlog::logger> logger() {
        static const std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get(LOGGER_NAME)) { return existing; }
            auto created = spdlog::stderr_color_mt(LOGGER_NAME);
            created->set_level(spdlog::level::warn);
            return created;
        }();
        return instance;
    }
} // namespace gridwire::util
