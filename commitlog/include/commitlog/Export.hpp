/*
* CommitLog
 * Copyright (C) 2025 Swift Storm Studio
 *
 * This file is part of CommitLog.
 *
 * CommitLog is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * CommitLog is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with CommitLog.  If not, see <https://www.gnu.org/licenses/>.
 */

// commitlog/include/commitlog/Export.hpp
#pragma once

/**
 * Symbol visibility macros for shared library export/import.
 *
 * - COMMITLOG_API: Used for classes exposed to the higher-level log
 * - COMMITLOG_LOCAL: Used for internal symbols (hidden visibility)
 */

#if defined(_WIN32) || defined(_WIN64)
// Windows DLL export/import
    #ifdef COMMITLOG_BUILD_SHARED
        #define COMMITLOG_API __declspec(dllexport)
    #elif defined(COMMITLOG_USE_SHARED)
        #define COMMITLOG_API __declspec(dllimport)
    #else
        #define COMMITLOG_API
    #endif
    #define COMMITLOG_LOCAL
#elif defined(__GNUC__) || defined(__clang__)
// GCC/Clang visibility attributes
    #ifdef COMMITLOG_BUILD_SHARED
        #define COMMITLOG_API __attribute__((visibility("default")))
        #define COMMITLOG_LOCAL __attribute__((visibility("hidden")))
    #else
        #define COMMITLOG_API
        #define COMMITLOG_LOCAL
    #endif
#else
// Unknown compiler - no visibility control
    #define COMMITLOG_API
    #define COMMITLOG_LOCAL
#endif
