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

// gridwire/gridwire/include/gridwire/Export.hpp
#pragma once

/**
 * Symbol visibility macros for shared library export/import.
 *
 * - GRIDWIRE_API: Used for public API classes and functions
 * - GRIDWIRE_LOCAL: Used for internal symbols (hidden visibility)
 */

#if defined(_WIN32) || defined(_WIN64)
// Windows DLL export/import
    #ifdef GRIDWIRE_BUILD_SHARED
        #define GRIDWIRE_API __declspec(dllexport)
    #else
        #define GRIDWIRE_API __declspec(dllimport)
    #endif
    #define GRIDWIRE_LOCAL
#elif defined(__GNUC__) || defined(__clang__)
// GCC/Clang visibility attributes
    #ifdef GRIDWIRE_BUILD_SHARED
        #define GRIDWIRE_API __attribute__((visibility("default")))
        #define GRIDWIRE_LOCAL __attribute__((visibility("hidden")))
    #else
        #define GRIDWIRE_API
        #define GRIDWIRE_LOCAL
    #endif
#else
// Unknown compiler - no visibility control
    #define GRIDWIRE_API
    #define GRIDWIRE_LOCAL
#endif
