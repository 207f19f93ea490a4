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

// internal/include/core/buffer/BufferView.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace commitlog::core {
    /**
     * BufferView - Zero-copy, non-owning view over a contiguous byte region.
     *
     * All multi-byte accessors are Big-Endian (network order), which is the
     * byte order of every on-disk structure in the commit log:
     * - store entries:  [len:u64][payload]
     * - index entries:  [rel_offset:u32][position:u64]
     * - record payload: [offset:u64][value_len:u32][value][crc32c:u32]
     *
     * Design principles:
     * - No ownership: lifetime managed externally
     * - Stack-allocated: trivial copy/move
     * - Bounds-checked: every accessor throws std::out_of_range on overrun
     *
     * Thread-safety: Read-only operations are thread-safe. Concurrent writes
     * to the same region require external synchronization.
     */
    class BufferView {
        public:
            /**
         * Constructs an empty BufferView.
         */
            constexpr BufferView() noexcept : data_{nullptr}, size_{0} {}

            /**
         * Constructs a BufferView from raw pointer and size.
         *
         * @param data Pointer to the beginning of the buffer
         * @param size Size in bytes
         */
            constexpr BufferView(std::byte* data, size_t size) noexcept : data_{data}, size_{size} {}

            /**
         * Constructs a BufferView from a std::span.
         */
            constexpr explicit BufferView(std::span<std::byte> span) noexcept : data_{span.data()}, size_{span.size()} {}

            /**
         * Constructs a BufferView over a byte vector or array of uint8_t.
         */
            explicit BufferView(std::span<uint8_t> span) noexcept
                : data_{reinterpret_cast<std::byte*>(span.data())}, size_{span.size()} {}

            // ==================== Basic Accessors ====================

            [[nodiscard]] constexpr std::byte* data() const noexcept { return data_; }

            [[nodiscard]] constexpr size_t size() const noexcept { return size_; }

            [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

            /**
         * Returns a typed span view of the buffer.
         * T must be a byte-sized trivial type.
         */
            template <typename T>
            [[nodiscard]] constexpr std::span<const T> as_span() const noexcept {
                static_assert(sizeof(T) == 1);
                return {reinterpret_cast<const T*>(data_), size_};
            }

            // ==================== Slicing ====================

            /**
         * Creates a sub-view starting at offset with specified length.
         *
         * @throws std::out_of_range if offset + length > size()
         */
            [[nodiscard]] BufferView slice(size_t offset, size_t length) const;

            /**
         * Creates a sub-view starting at offset to the end.
         *
         * @throws std::out_of_range if offset > size()
         */
            [[nodiscard]] BufferView slice(size_t offset) const;

            // ==================== Big-Endian Read Operations ====================

            /**
         * Reads an unsigned 32-bit integer (Big-Endian).
         *
         * @throws std::out_of_range if offset + 4 > size()
         */
            [[nodiscard]] uint32_t read_u32_be(size_t offset) const;

            /**
         * Reads an unsigned 64-bit integer (Big-Endian).
         *
         * @throws std::out_of_range if offset + 8 > size()
         */
            [[nodiscard]] uint64_t read_u64_be(size_t offset) const;

            // ==================== Big-Endian Write Operations ====================

            /**
         * Writes an unsigned 32-bit integer (Big-Endian).
         *
         * @throws std::out_of_range if offset + 4 > size()
         */
            void write_u32_be(size_t offset, uint32_t value) const;

            /**
         * Writes an unsigned 64-bit integer (Big-Endian).
         *
         * @throws std::out_of_range if offset + 8 > size()
         */
            void write_u64_be(size_t offset, uint64_t value) const;

            // ==================== Bulk Operations ====================

            /**
         * Copies raw bytes into this buffer.
         *
         * @param offset Destination offset
         * @param src Source bytes
         * @throws std::out_of_range if offset + src.size() > size()
         */
            void copy_from(size_t offset, std::span<const uint8_t> src) const;

            /**
         * Returns true if every byte in [offset, offset + length) is zero.
         *
         * @throws std::out_of_range if offset + length > size()
         */
            [[nodiscard]] bool is_zero(size_t offset, size_t length) const;

            // ==================== CRC Computation ====================

            /**
         * Computes CRC32C (Castagnoli) over a range.
         *
         * Uses the SSE4.2 crc32 instruction when available.
         *
         * @throws std::out_of_range if offset + length > size()
         */
            [[nodiscard]] uint32_t crc32c(size_t offset, size_t length) const;

            [[nodiscard]] uint32_t crc32c() const { return crc32c(0, size_); }

            [[nodiscard]] std::string_view as_string_view() const noexcept { return {reinterpret_cast<const char*>(data_), size_}; }

        private:
            std::byte* data_;
            size_t size_;

            void check_bounds(size_t offset, size_t length) const;
    };
} // namespace commitlog::core
