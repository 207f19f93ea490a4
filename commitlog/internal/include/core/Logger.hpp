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

// internal/include/core/Logger.hpp
#pragma once

// COMMITLOG_TRACE -> spdlog::trace
// COMMITLOG_DEBUG -> spdlog::debug
// COMMITLOG_INFO  -> spdlog::info
// COMMITLOG_WARN  -> spdlog::warn
// COMMITLOG_ERROR -> spdlog::error

#define COMMITLOG_LOG_LEVEL_QUIET 0
#define COMMITLOG_LOG_LEVEL_ERROR 1
#define COMMITLOG_LOG_LEVEL_WARNING 2
#define COMMITLOG_LOG_LEVEL_INFO 3
#define COMMITLOG_LOG_LEVEL_DEBUG 4
#define COMMITLOG_LOG_LEVEL_TRACE 5

#ifndef COMMITLOG_LOG_LEVEL
#  define COMMITLOG_LOG_LEVEL COMMITLOG_LOG_LEVEL_DEBUG
#endif

// Must stay above the spdlog include.
#if COMMITLOG_LOG_LEVEL == COMMITLOG_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif COMMITLOG_LOG_LEVEL == COMMITLOG_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif COMMITLOG_LOG_LEVEL == COMMITLOG_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif COMMITLOG_LOG_LEVEL == COMMITLOG_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif COMMITLOG_LOG_LEVEL == COMMITLOG_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#else
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

#include <spdlog/spdlog.h>

#include <memory>

namespace commitlog::core {
    /**
 * Returns the library logger ("commitlog", stderr).
 *
 * Created on first use. If the application registered a logger under the
 * same name beforehand, that one is used instead.
 */
    [[nodiscard]] spdlog::logger* logger();

    /**
 * Sets the runtime level. Statements below SPDLOG_ACTIVE_LEVEL are compiled
 * out regardless.
 */
    void set_log_level(spdlog::level::level_enum level);
} // namespace commitlog::core

#define COMMITLOG_TRACE(...) SPDLOG_LOGGER_TRACE(::commitlog::core::logger(), __VA_ARGS__)
#define COMMITLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::commitlog::core::logger(), __VA_ARGS__)
#define COMMITLOG_INFO(...) SPDLOG_LOGGER_INFO(::commitlog::core::logger(), __VA_ARGS__)
#define COMMITLOG_WARN(...) SPDLOG_LOGGER_WARN(::commitlog::core::logger(), __VA_ARGS__)
#define COMMITLOG_ERROR(...) SPDLOG_LOGGER_ERROR(::commitlog::core::logger(), __VA_ARGS__)
