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

// internal/src/core/Logger.cpp
#include "core/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace commitlog::core {
    namespace {
        std::shared_ptr<spdlog::logger> make_logger() {
            if (auto existing = spdlog::get("commitlog")) { return existing; }
            auto created = spdlog::stderr_color_mt("commitlog");
            created->set_pattern("%Y-%m-%dT%H:%M:%S.%e [%n] [%^%l%$] %v");
            return created;
        }
    } // anonymous namespace

    spdlog::logger* logger() {
        // Holding the shared_ptr keeps the logger alive past spdlog::drop_all().
        static const std::shared_ptr<spdlog::logger> instance = make_logger();
        return instance.get();
    }

    void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }
} // namespace commitlog::core
