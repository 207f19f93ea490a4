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

// internal/src/core/record/Record.cpp
#include "core/record/Record.hpp"

#include <cstddef>
#include <limits>
#include <stdexcept>

namespace commitlog::core {
    Record Record::of(std::string_view value) {
        const auto* p = reinterpret_cast<const uint8_t*>(value.data());
        return Record{0, std::vector<uint8_t>(p, p + value.size())};
    }

    Record Record::of(std::span<const uint8_t> value) { return Record{0, std::vector<uint8_t>(value.begin(), value.end())}; }

    OwnedBuffer Record::serialize() const {
        if (value.size() > std::numeric_limits<uint32_t>::max()) { throw std::length_error("Record::serialize: value too large"); }

        auto buffer = OwnedBuffer::allocate(serialized_size(), alignof(std::max_align_t));
        const auto dst = buffer.view();

        dst.write_u64_be(0, offset);
        dst.write_u32_be(8, static_cast<uint32_t>(value.size()));
        dst.copy_from(HEADER_SIZE, value);

        const size_t crc_offset = HEADER_SIZE + value.size();
        dst.write_u32_be(crc_offset, dst.crc32c(0, crc_offset));

        return buffer;
    }

    std::optional<Record> Record::deserialize(BufferView src) {
        if (src.size() < HEADER_SIZE + FOOTER_SIZE) { return std::nullopt; }

        const uint32_t value_len = src.read_u32_be(8);
        if (src.size() != HEADER_SIZE + static_cast<size_t>(value_len) + FOOTER_SIZE) { return std::nullopt; }

        const size_t crc_offset = HEADER_SIZE + value_len;
        if (src.read_u32_be(crc_offset) != src.crc32c(0, crc_offset)) { return std::nullopt; }

        const auto bytes = src.slice(HEADER_SIZE, value_len).as_span<uint8_t>();
        return Record{src.read_u64_be(0), std::vector<uint8_t>(bytes.begin(), bytes.end())};
    }
} // namespace commitlog::core
