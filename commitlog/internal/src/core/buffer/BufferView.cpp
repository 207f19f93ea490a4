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

// internal/src/core/buffer/BufferView.cpp
#include "core/buffer/BufferView.hpp"

#include <algorithm>
#include <stdexcept>
#include <cstring>

#if defined(__SSE4_2__) || \
(defined(_MSC_VER) && (defined(_M_X64) || defined(_M_IX86)))
#define COMMITLOG_HAS_SSE42 1
#else
#define COMMITLOG_HAS_SSE42 0
#endif

#if COMMITLOG_HAS_SSE42
#include <nmmintrin.h>
#endif


namespace commitlog::core {
    // ==================== Slicing ====================

    BufferView BufferView::slice(size_t offset, size_t length) const {
        check_bounds(offset, length);
        return BufferView{data_ + offset, length};
    }

    BufferView BufferView::slice(size_t offset) const {
        if (offset > size_) { throw std::out_of_range("BufferView::slice: offset out of range"); }
        return BufferView{data_ + offset, size_ - offset};
    }

    // ==================== Big-Endian Read Operations ====================

    uint32_t BufferView::read_u32_be(size_t offset) const {
        check_bounds(offset, 4);
        const auto* p = reinterpret_cast<const uint8_t*>(data_ + offset);
        return (static_cast<uint32_t>(p[0]) << 24) |
            (static_cast<uint32_t>(p[1]) << 16) |
            (static_cast<uint32_t>(p[2]) << 8) |
            static_cast<uint32_t>(p[3]);
    }

    uint64_t BufferView::read_u64_be(size_t offset) const {
        check_bounds(offset, 8);
        const auto* p = reinterpret_cast<const uint8_t*>(data_ + offset);
        uint64_t value = 0;
        for (size_t i = 0; i < 8; ++i) { value = (value << 8) | p[i]; }
        return value;
    }

    // ==================== Big-Endian Write Operations ====================

    void BufferView::write_u32_be(size_t offset, uint32_t value) const {
        check_bounds(offset, 4);
        auto* p = reinterpret_cast<uint8_t*>(data_ + offset);
        p[0] = static_cast<uint8_t>(value >> 24);
        p[1] = static_cast<uint8_t>(value >> 16);
        p[2] = static_cast<uint8_t>(value >> 8);
        p[3] = static_cast<uint8_t>(value);
    }

    void BufferView::write_u64_be(size_t offset, uint64_t value) const {
        check_bounds(offset, 8);
        auto* p = reinterpret_cast<uint8_t*>(data_ + offset);
        for (size_t i = 0; i < 8; ++i) { p[i] = static_cast<uint8_t>(value >> (56 - 8 * i)); }
    }

    // ==================== Bulk Operations ====================

    void BufferView::copy_from(size_t offset, std::span<const uint8_t> src) const {
        check_bounds(offset, src.size());
        if (!src.empty()) { std::memmove(data_ + offset, src.data(), src.size()); }
    }

    bool BufferView::is_zero(size_t offset, size_t length) const {
        check_bounds(offset, length);
        return std::all_of(data_ + offset, data_ + offset + length, [](std::byte b) { return b == std::byte{0}; });
    }

    // ==================== CRC Computation ====================

    uint32_t BufferView::crc32c(size_t offset, size_t length) const {
        check_bounds(offset, length);

        uint32_t crc = 0xFFFFFFFF;
        const auto* ptr = reinterpret_cast<const uint8_t*>(data_ + offset);

#if COMMITLOG_HAS_SSE42
        size_t remaining = length;

        while (remaining >= 8) {
            uint64_t chunk;
            std::memcpy(&chunk, ptr, 8);
            crc = static_cast<uint32_t>(_mm_crc32_u64(crc, chunk));
            ptr += 8;
            remaining -= 8;
        }

        while (remaining > 0) {
            crc = _mm_crc32_u8(crc, *ptr);
            ++ptr;
            --remaining;
        }
#else
        static constexpr uint32_t poly = 0x82F63B78;

        for (size_t i = 0; i < length; ++i) {
            crc ^= ptr[i];
            for (int j = 0; j < 8; ++j) { crc = (crc >> 1) ^ (poly & (0u - (crc & 1u))); }
        }
#endif

        return ~crc;
    }

    // ==================== Bounds Checking ====================

    void BufferView::check_bounds(size_t offset, size_t length) const {
        if (offset + length > size_ || offset + length < offset) { throw std::out_of_range("BufferView: access out of range"); }
    }
} // namespace commitlog::core
