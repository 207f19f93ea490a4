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

// internal/src/engine/log/Config.cpp
#include "engine/log/Config.hpp"
#include "engine/log/Index.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace commitlog::engine::log {
    void Config::validate() const {
        if (segment.max_store_bytes == 0) { throw std::invalid_argument("Config: segment.max_store_bytes must be > 0"); }
        if (segment.max_index_bytes < Index::ENTRY_WIDTH) {
            throw std::invalid_argument(
                "Config: segment.max_index_bytes must hold at least one entry (" + std::to_string(Index::ENTRY_WIDTH) + " bytes)"
            );
        }
        if (segment.write_buffer_bytes == 0) { throw std::invalid_argument("Config: segment.write_buffer_bytes must be > 0"); }
    }

    void to_json(nlohmann::json& j, const Config::SegmentOptions& opts) {
        j = nlohmann::json{
            {"maxStoreBytes", opts.max_store_bytes},
            {"maxIndexBytes", opts.max_index_bytes},
            {"initialOffset", opts.initial_offset},
            {"writeBufferBytes", opts.write_buffer_bytes}
        };
    }

    void from_json(const nlohmann::json& j, Config::SegmentOptions& opts) {
        const Config::SegmentOptions defaults{};
        opts.max_store_bytes = j.value("maxStoreBytes", defaults.max_store_bytes);
        opts.max_index_bytes = j.value("maxIndexBytes", defaults.max_index_bytes);
        opts.initial_offset = j.value("initialOffset", defaults.initial_offset);
        opts.write_buffer_bytes = j.value("writeBufferBytes", defaults.write_buffer_bytes);
    }

    void to_json(nlohmann::json& j, const Config& config) { j = nlohmann::json{{"segment", config.segment}}; }

    void from_json(const nlohmann::json& j, Config& config) {
        config = Config{};
        if (j.contains("segment")) { j.at("segment").get_to(config.segment); }
    }
} // namespace commitlog::engine::log
