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

// internal/include/engine/log/Segment.hpp
#pragma once

#include "commitlog/Export.hpp"
#include "core/record/Record.hpp"
#include "engine/log/Config.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace commitlog::engine::log {
    /**
 * Segment - One store plus one index sharing a base offset.
 *
 * Files (in `dir`):
 *   <base_offset>.store   length-prefixed serialized records
 *   <base_offset>.index   (relative offset, store position) pairs
 *
 * The segment assigns absolute offsets base, base+1, ... and keeps them
 * relative (32-bit) in the index. On open the next offset is recovered from
 * the index's last entry, so a reopened segment continues where it stopped.
 *
 * Rotation is the owning log's job: is_maxed() only reports that either the
 * store or the index reached its configured limit. Reads stay valid on a
 * maxed segment.
 *
 * Typical usage:
 * ```cpp
 * auto segment = Segment::open("./data", 16, config);
 * auto record = core::Record::of("hello");
 * const uint64_t off = segment->append(record);   // 16, record.offset == 16
 * auto back = segment->read(off);
 * if (segment->is_maxed()) { ... open the next segment at segment->next_offset() ... }
 * ```
 *
 * Thread-safety: append/close/remove are serialized per segment; read,
 * is_maxed and the accessors may run concurrently with them.
 */
    class COMMITLOG_API Segment {
    public:
        /**
     * Opens or creates the segment starting at `base_offset` in `dir`.
     *
     * @param dir Directory holding the segment files (created if missing)
     * @param base_offset Absolute offset of the segment's first record
     * @param config Segment limits (validated)
     * @return Unique pointer to Segment
     * @throws std::invalid_argument on invalid config
     * @throws core::IoError, core::CorruptionError, core::CapacityError from the store/index
     */
        [[nodiscard]] static std::unique_ptr<Segment> open(
            const std::filesystem::path& dir,
            uint64_t base_offset,
            const Config& config
        );

        ~Segment();

        Segment(const Segment&) = delete;
        Segment& operator=(const Segment&) = delete;

        /**
     * Appends a record and returns its absolute offset.
     *
     * Sets record.offset to the assigned offset before serializing it. If the
     * store write fails nothing is indexed and the next offset is unchanged.
     *
     * @throws core::CapacityError if the index is full or relative offsets are exhausted
     * @throws core::IoError if the store write fails
     * @throws core::ClosedError after close()/remove()
     */
        [[nodiscard]] uint64_t append(core::Record& record);

        /**
     * Reads the record at an absolute offset.
     *
     * @throws core::NotFoundError if the offset is outside [base_offset, next_offset)
     * @throws core::CorruptionError if the stored bytes do not decode to that offset
     * @throws core::IoError on store read failure
     * @throws core::ClosedError after close()/remove()
     */
        [[nodiscard]] core::Record read(uint64_t offset) const;

        /**
     * True once the store or the index reached its configured size.
     */
        [[nodiscard]] bool is_maxed() const;

        /**
     * Closes the segment and deletes both files.
     *
     * @throws core::IoError if closing or deleting either file fails; the
     *         segment's on-disk state is then unknown
     */
        void remove();

        /**
     * Closes index then store. Both are attempted; the first error is rethrown.
     * Idempotent.
     */
        void close();

        [[nodiscard]] uint64_t base_offset() const noexcept;

        [[nodiscard]] uint64_t next_offset() const noexcept;

        [[nodiscard]] const std::filesystem::path& store_path() const noexcept;

        [[nodiscard]] const std::filesystem::path& index_path() const noexcept;

        /**
     * File names used for a base offset ("<base>.store", "<base>.index").
     */
        [[nodiscard]] static std::string store_file_name(uint64_t base_offset);
        [[nodiscard]] static std::string index_file_name(uint64_t base_offset);

    private:
        Segment(const std::filesystem::path& dir, uint64_t base_offset, const Config& config);

        class Impl;
        std::unique_ptr<Impl> impl_;
    };
} // namespace commitlog::engine::log
