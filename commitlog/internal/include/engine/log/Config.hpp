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

// internal/include/engine/log/Config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace commitlog::engine::log {
    /**
 * Config - Options consumed by a segment.
 *
 * Loading these from disk or the command line is the caller's business;
 * the JSON mapping only covers conversion from an already parsed document:
 *
 * ```json
 * { "segment": { "maxStoreBytes": 1048576, "maxIndexBytes": 1200 } }
 * ```
 *
 * Missing keys keep their defaults.
 */
    struct Config {
        struct SegmentOptions {
            /// Segment reports maxed once its store reaches this many bytes.
            uint64_t max_store_bytes = 1024;
            /// Segment reports maxed once its index reaches this many bytes.
            /// Rounded down to a multiple of the index entry width for the
            /// pre-allocated region.
            uint64_t max_index_bytes = 1024;
            /// Base offset of the first segment; used by the owning log.
            uint64_t initial_offset = 0;
            /// Store write buffer; appends are flushed once it fills up.
            size_t write_buffer_bytes = 4096;
        };

        SegmentOptions segment;

        /**
     * Checks option ranges.
     *
     * @throws std::invalid_argument naming the offending option
     */
        void validate() const;
    };

    void to_json(nlohmann::json& j, const Config::SegmentOptions& opts);
    void from_json(const nlohmann::json& j, Config::SegmentOptions& opts);

    void to_json(nlohmann::json& j, const Config& config);
    void from_json(const nlohmann::json& j, Config& config);
} // namespace commitlog::engine::log
