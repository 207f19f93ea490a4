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

// internal/include/engine/log/Index.hpp
#pragma once

#include "commitlog/Export.hpp"
#include "engine/log/FileHandle.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

namespace commitlog::engine::log {
    /**
 * Rounds `j` down to the nearest multiple of `k` (k > 0).
 */
    [[nodiscard]] constexpr uint64_t nearest_multiple(uint64_t j, uint64_t k) noexcept { return (j / k) * k; }

    /**
 * IndexEntry - One decoded index slot.
 */
    struct IndexEntry {
        uint32_t offset; ///< Offset relative to the segment's base offset
        uint64_t position; ///< Byte position of the entry in the store

        friend bool operator==(const IndexEntry&, const IndexEntry&) = default;
    };

    /**
 * IndexSlot - Addresses an index entry: either the last written one or a
 * specific relative offset.
 */
    class IndexSlot {
    public:
        [[nodiscard]] static constexpr IndexSlot last() noexcept { return IndexSlot{true, 0}; }

        [[nodiscard]] static constexpr IndexSlot at(uint32_t relative) noexcept { return IndexSlot{false, relative}; }

        [[nodiscard]] constexpr bool is_last() const noexcept { return last_; }

        [[nodiscard]] constexpr uint32_t relative() const noexcept { return relative_; }

    private:
        constexpr IndexSlot(bool last, uint32_t relative) noexcept : last_{last}, relative_{relative} {}

        bool last_;
        uint32_t relative_;
    };

    /**
 * Index - Memory-mapped, fixed-width map from relative offset to store position.
 *
 * On-disk format (no header, no padding):
 *   [rel_offset:u32 BE][position:u64 BE]   12 bytes per entry
 *
 * Entry i lives at byte i * ENTRY_WIDTH, so lookups are O(1).
 *
 * Lifecycle:
 * - open(): the file is grown to the capacity (max_index_bytes rounded down
 *   to a multiple of ENTRY_WIDTH) and mapped MAP_SHARED.
 * - close(): msync → munmap → ftruncate(size) → fsync → close, so a reopen
 *   sees only real entries.
 *
 * If the process died before close(), the file is still at full capacity.
 * open() drops trailing all-zero slots after the first one; entry 0 can
 * legitimately be (0, 0), so deciding about it is left to the segment.
 *
 * Thread-safety: Fully thread-safe (single mutex).
 */
    class COMMITLOG_API Index {
    public:
        static constexpr uint64_t OFFSET_WIDTH = 4;
        static constexpr uint64_t POSITION_WIDTH = 8;
        static constexpr uint64_t ENTRY_WIDTH = OFFSET_WIDTH + POSITION_WIDTH;

        /**
     * Opens or creates an index file and maps it.
     *
     * @param path Index file path (e.g., "./data/0.index")
     * @param max_index_bytes Configured maximum; rounded down to ENTRY_WIDTH
     * @throws std::invalid_argument if max_index_bytes < ENTRY_WIDTH
     * @throws core::CorruptionError if the file length is not a multiple of ENTRY_WIDTH
     * @throws core::CapacityError if the file already exceeds the capacity
     * @throws core::IoError on open/stat/truncate/mmap failure
     */
        [[nodiscard]] static std::unique_ptr<Index> open(const std::filesystem::path& path, uint64_t max_index_bytes);

        ~Index();

        Index(const Index&) = delete;
        Index& operator=(const Index&) = delete;

        /**
     * Reads one entry.
     *
     * @throws core::NotFoundError if the index is empty or the slot was never written
     * @throws core::ClosedError after close()
     */
        [[nodiscard]] IndexEntry read(IndexSlot slot) const;

        /**
     * Appends an entry at the end.
     *
     * @throws core::CapacityError if the mapped region is full
     * @throws std::invalid_argument if position does not follow the last entry's
     * @throws core::ClosedError after close()
     */
        void write(uint32_t offset, uint64_t position);

        /**
     * Keeps only the first `entries` entries; the dropped slots are zeroed.
     *
     * @throws std::invalid_argument if entries exceeds entries()
     * @throws core::ClosedError after close()
     */
        void truncate(uint64_t entries);

        /**
     * Forgets all entries (size becomes 0).
     */
        void reset() { truncate(0); }

        /**
     * Syncs the mapping and shrinks the file to size(). Idempotent.
     *
     * The index counts as closed even if this throws.
     */
        void close();

        [[nodiscard]] uint64_t size() const;

        [[nodiscard]] uint64_t entries() const { return size() / ENTRY_WIDTH; }

        [[nodiscard]] uint64_t capacity() const noexcept { return capacity_; }

        [[nodiscard]] bool is_full() const { return size() + ENTRY_WIDTH > capacity_; }

        [[nodiscard]] const std::filesystem::path& name() const noexcept { return path_; }

    private:
        Index(FileHandle file, std::byte* map, uint64_t capacity, uint64_t size);

        void ensure_open() const;

        FileHandle file_;
        std::filesystem::path path_;

        std::byte* map_;
        uint64_t capacity_;
        uint64_t size_;
        bool closed_;

        mutable std::mutex mutex_;
    };
} // namespace commitlog::engine::log
