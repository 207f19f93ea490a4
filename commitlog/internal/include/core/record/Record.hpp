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

// internal/include/core/record/Record.hpp
#pragma once

#include "core/buffer/BufferView.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace commitlog::core {
    /**
 * Record - A single entry of the commit log.
 *
 * The value is an opaque byte payload. The offset is assigned by the
 * segment on append and overwritten on the caller's instance.
 *
 * Binary format (Big-Endian, variable length):
 * [offset:u64][valueLen:u32][value][crc32c:u32]
 *
 * The CRC covers every byte before it, so a torn or bit-flipped store entry
 * is detected on read instead of being handed back as a record.
 */
    struct Record {
        static constexpr size_t HEADER_SIZE = 12; ///< offset + valueLen
        static constexpr size_t FOOTER_SIZE = 4; ///< crc32c

        uint64_t offset{0};
        std::vector<uint8_t> value;

        /**
     * Creates a record from a string value (offset left at 0).
     */
        [[nodiscard]] static Record of(std::string_view value);

        /**
     * Creates a record from raw bytes (offset left at 0).
     */
        [[nodiscard]] static Record of(std::span<const uint8_t> value);

        [[nodiscard]] std::string_view value_string() const noexcept {
            return {reinterpret_cast<const char*>(value.data()), value.size()};
        }

        [[nodiscard]] size_t serialized_size() const noexcept { return HEADER_SIZE + value.size() + FOOTER_SIZE; }

        /**
     * Serializes this record into a new OwnedBuffer.
     *
     * @throws std::length_error if the value does not fit a u32 length
     */
        [[nodiscard]] OwnedBuffer serialize() const;

        /**
     * Decodes a record.
     *
     * @param src Exactly one serialized record
     * @return Record, or std::nullopt if truncated, mis-sized or CRC mismatch
     */
        [[nodiscard]] static std::optional<Record> deserialize(BufferView src);

        friend bool operator==(const Record&, const Record&) = default;
    };
} // namespace commitlog::core
