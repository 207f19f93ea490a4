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

// internal/include/engine/log/Store.hpp
#pragma once

#include "commitlog/Export.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include "engine/log/FileHandle.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace commitlog::engine::log {
    /**
 * Store - Append-only file of length-prefixed payloads.
 *
 * On-disk format (no header):
 *   [len:u64 BE][payload][len:u64 BE][payload]...
 *
 * Writes land in a user-space buffer and reach the file when the buffer
 * fills up, on any read, on sync() and on close(). Every read path flushes
 * first, so a reader always observes every append made earlier on the same
 * instance. Nothing is fsync'd unless sync() is called.
 *
 * size() counts buffered bytes too: it is always the position at which the
 * next entry will start.
 *
 * Thread-safety: Fully thread-safe. append/read/read_at/sync/close are
 * mutually exclusive on one instance.
 */
    class COMMITLOG_API Store {
    public:
        /// Width of the length prefix.
        static constexpr uint64_t LEN_WIDTH = 8;

        struct AppendResult {
            uint64_t bytes_written; ///< LEN_WIDTH + payload size
            uint64_t position; ///< Start of the entry (length prefix)
        };

        /**
     * Opens or creates a store file. Size is taken from the file length so
     * an existing store resumes where it left off.
     *
     * @param path Store file path (e.g., "./data/0.store")
     * @param write_buffer_bytes Capacity of the write buffer
     * @throws core::IoError if the file cannot be opened or stat'd
     */
        [[nodiscard]] static std::unique_ptr<Store> open(const std::filesystem::path& path, size_t write_buffer_bytes = 4096);

        ~Store();

        Store(const Store&) = delete;
        Store& operator=(const Store&) = delete;

        /**
     * Appends one length-prefixed entry.
     *
     * Payloads larger than the write buffer bypass it (after flushing what is
     * already buffered). On failure size() is unchanged.
     *
     * @throws core::IoError if a write fails
     * @throws core::ClosedError after close()
     */
        [[nodiscard]] AppendResult append(std::span<const uint8_t> payload);

        /**
     * Reads the payload of the entry starting at `position`.
     *
     * @throws core::IoError on filesystem failure or short read
     * @throws core::ClosedError after close()
     */
        [[nodiscard]] std::vector<uint8_t> read(uint64_t position);

        /**
     * Raw positional read, no framing. Used to stream a store file wholesale.
     *
     * @return Bytes read; less than buffer.size() only at end of file
     * @throws core::IoError on filesystem failure
     * @throws core::ClosedError after close()
     */
        [[nodiscard]] size_t read_at(std::span<uint8_t> buffer, uint64_t offset);

        /**
     * Flushes the write buffer and fdatasync's the file.
     */
        void sync();

        /**
     * Flushes the write buffer and closes the file. Idempotent.
     *
     * The store counts as closed even if this throws.
     */
        void close();

        [[nodiscard]] uint64_t size() const;

        [[nodiscard]] const std::filesystem::path& name() const noexcept { return path_; }

    private:
        Store(FileHandle file, uint64_t size, size_t write_buffer_bytes);

        void flush_locked();
        void ensure_open() const;

        FileHandle file_;
        std::filesystem::path path_;

        core::OwnedBuffer buffer_;
        size_t buffered_; ///< Bytes pending in buffer_
        uint64_t flushed_; ///< Bytes already in the file
        uint64_t size_; ///< flushed_ + buffered_
        bool closed_;

        mutable std::mutex mutex_;
    };
} // namespace commitlog::engine::log
