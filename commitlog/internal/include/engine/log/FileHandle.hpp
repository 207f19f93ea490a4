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

// internal/include/engine/log/FileHandle.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <utility>

namespace commitlog::engine::log {
    /**
 * FileHandle - Move-only RAII wrapper around a POSIX file descriptor.
 *
 * All I/O is positional (pread/pwrite), so the kernel file offset is never
 * relied upon and a failed write can simply be retried at the same position.
 * Every failure is reported as core::IoError carrying the path and errno.
 *
 * Thread-safety: NOT thread-safe. Owners serialize access.
 */
    class FileHandle {
        public:
            using NativeHandle = int;
            static constexpr NativeHandle INVALID = -1;

            FileHandle() noexcept : handle_{INVALID} {}

            ~FileHandle() { reset(); }

            FileHandle(const FileHandle&) = delete;
            FileHandle& operator=(const FileHandle&) = delete;

            FileHandle(FileHandle&& other) noexcept : handle_{other.handle_}, path_{std::move(other.path_)} { other.handle_ = INVALID; }

            FileHandle& operator=(FileHandle&& other) noexcept {
                if (this != &other) {
                    reset();
                    handle_ = other.handle_;
                    path_ = std::move(other.path_);
                    other.handle_ = INVALID;
                }
                return *this;
            }

            /**
         * Opens (creating if needed) a file for reading and writing.
         *
         * @throws core::IoError if the file cannot be opened
         */
            [[nodiscard]] static FileHandle open_rw(const std::filesystem::path& path);

            /**
         * Writes all of `data` at `offset`, looping over short writes.
         *
         * @throws core::IoError on failure
         */
            void pwrite_all(const void* data, size_t size, uint64_t offset);

            /**
         * Reads up to `size` bytes at `offset`.
         * Returns bytes actually read (less than `size` only at EOF).
         *
         * @throws core::IoError on failure
         */
            [[nodiscard]] size_t pread_some(void* buf, size_t size, uint64_t offset);

            /**
         * Returns the current file length (fstat).
         */
            [[nodiscard]] uint64_t file_size() const;

            /**
         * Sets the file length (ftruncate); grows with zeros or shrinks.
         */
            void truncate(uint64_t length);

            void fsync_data();

            /**
         * Closes the descriptor. Idempotent.
         *
         * @throws core::IoError if close(2) reports an error
         */
            void close();

            [[nodiscard]] bool is_open() const noexcept { return handle_ != INVALID; }

            [[nodiscard]] NativeHandle native() const noexcept { return handle_; }

            [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

        private:
            void reset() noexcept;

            NativeHandle handle_;
            std::filesystem::path path_;
    };
} // namespace commitlog::engine::log
