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

// gridwire/internal/include/util/Logging.hpp
#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace gridwire::util {
    inline constexpr const char* LOGGER_NAME = "gridwire";

    /**
     * Library logger ("gridwire").
     *
     * Created on first use with a stderr sink at warn level unless the host
     * application already registered a logger under that name with spdlog.
     */
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger();
} // namespace gridwire::util
