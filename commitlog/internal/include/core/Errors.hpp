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

// internal/include/core/Errors.hpp
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace commitlog::core {
    /**
 * Error taxonomy of the storage core.
 *
 * Every type derives from a standard exception so that callers which only
 * care about "something failed" can keep catching std::exception, while the
 * higher-level log can tell the conditions apart:
 *
 * - IoError:         filesystem call failed or came up short (carries errno)
 * - NotFoundError:   offset/slot was never written
 * - CapacityError:   index is full; the caller should rotate, not retry
 * - CorruptionError: bytes on disk do not decode
 * - ClosedError:     operation on a closed store/index/segment
 *
 * Nothing in the core retries; all of these propagate unchanged.
 */
    class IoError : public std::system_error {
        public:
            IoError(const std::string& what, int err) : std::system_error{err, std::generic_category(), what} {}

            IoError(const std::string& what, const std::filesystem::path& path, int err)
                : std::system_error{err, std::generic_category(), what + ": " + path.string()} {}
    };

    class NotFoundError : public std::out_of_range {
        public:
            using std::out_of_range::out_of_range;
    };

    class CapacityError : public std::length_error {
        public:
            using std::length_error::length_error;
    };

    class CorruptionError : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
    };

    class ClosedError : public std::logic_error {
        public:
            using std::logic_error::logic_error;
    };
} // namespace commitlog::core
