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

// internal/include/core/buffer/OwnedBuffer.hpp
#pragma once

#include "BufferView.hpp"
#include <memory>
#include <span>

namespace commitlog::core {
    /**
 * OwnedBuffer - RAII-managed buffer with aligned allocation.
 *
 * Used for the store's write buffer and for serialized records on their
 * way into the store.
 *
 * Design principles:
 * - RAII: Automatic memory management via unique_ptr
 * - Move-only: Non-copyable to prevent accidental duplications
 * - Aligned allocation: page-aligned by default so flushes hand the kernel
 *   whole pages
 *
 * Typical usage:
 * ```cpp
 * auto buf = OwnedBuffer::allocate(4096);
 * buf.view().write_u64_be(0, payload.size());
 * ```
 *
 * Thread-safety: NOT thread-safe. Caller must ensure exclusive access.
 */
    class OwnedBuffer {
        public:
            OwnedBuffer() noexcept = default;

            /**
     * Allocates a new buffer with specified size and alignment.
     *
     * @param size Size in bytes
     * @param alignment Buffer alignment (must be power of 2)
     * @return Newly allocated buffer
     * @throws std::bad_alloc if allocation fails
     * @throws std::invalid_argument if alignment is not power of 2
     */
            [[nodiscard]] static OwnedBuffer allocate(size_t size, size_t alignment = 4096);

            OwnedBuffer(OwnedBuffer&& other) noexcept = default;
            OwnedBuffer& operator=(OwnedBuffer&& other) noexcept = default;

            OwnedBuffer(const OwnedBuffer&) = delete;
            OwnedBuffer& operator=(const OwnedBuffer&) = delete;

            /**
     * Returns a BufferView over the entire buffer.
     */
            [[nodiscard]] BufferView view() const noexcept { return BufferView{data_.get(), size_}; }

            /**
     * Returns the contents as bytes, e.g. for Store::append.
     */
            [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
                return {reinterpret_cast<const uint8_t*>(data_.get()), size_};
            }

            [[nodiscard]] std::byte* data() noexcept { return data_.get(); }

            [[nodiscard]] const std::byte* data() const noexcept { return data_.get(); }

            [[nodiscard]] size_t size() const noexcept { return size_; }

            [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

        private:
            /**
     * Custom deleter for aligned memory.
     */
            struct AlignedDeleter {
                void operator()(std::byte* ptr) const noexcept;
            };

            std::unique_ptr<std::byte[], AlignedDeleter> data_;
            size_t size_{0};

            OwnedBuffer(std::byte* data, size_t size) noexcept : data_{data}, size_{size} {}
    };
} // namespace commitlog::core
