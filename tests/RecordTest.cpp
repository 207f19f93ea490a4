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

// tests/RecordTest.cpp
#include "core/record/Record.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <span>
#include <vector>

using namespace commitlog::core;

namespace {
    std::vector<uint8_t> encode(const Record& record) {
        const auto buffer = record.serialize();
        return {buffer.bytes().begin(), buffer.bytes().end()};
    }

    std::optional<Record> decode(std::vector<uint8_t>& bytes) { return Record::deserialize(BufferView{std::span<uint8_t>{bytes}}); }
} // anonymous namespace

TEST(RecordTest, SerializedLayout) {
    auto record = Record::of("abc");
    record.offset = 7;

    auto bytes = encode(record);
    ASSERT_EQ(bytes.size(), record.serialized_size());
    ASSERT_EQ(bytes.size(), Record::HEADER_SIZE + 3 + Record::FOOTER_SIZE);

    const BufferView view{std::span<uint8_t>{bytes}};
    EXPECT_EQ(view.read_u64_be(0), 7u);
    EXPECT_EQ(view.read_u32_be(8), 3u);
    EXPECT_EQ(view.slice(12, 3).as_string_view(), "abc");
    EXPECT_EQ(view.read_u32_be(15), view.crc32c(0, 15));
}

TEST(RecordTest, DecodesWhatWasEncoded) {
    auto record = Record::of("hello world");
    record.offset = 1'000'000'007;

    auto bytes = encode(record);
    const auto decoded = decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, record);
    EXPECT_EQ(decoded->value_string(), "hello world");
}

TEST(RecordTest, EmptyValue) {
    const Record record{};
    auto bytes = encode(record);
    EXPECT_EQ(bytes.size(), Record::HEADER_SIZE + Record::FOOTER_SIZE);

    const auto decoded = decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->value.empty());
}

TEST(RecordTest, RejectsFlippedBit) {
    auto bytes = encode(Record::of("payload"));
    bytes[Record::HEADER_SIZE + 2] ^= 0x40;
    EXPECT_FALSE(decode(bytes).has_value());
}

TEST(RecordTest, RejectsWrongLength) {
    auto bytes = encode(Record::of("payload"));

    auto truncated = std::vector<uint8_t>(bytes.begin(), bytes.end() - 1);
    EXPECT_FALSE(decode(truncated).has_value());

    auto padded = bytes;
    padded.push_back(0);
    EXPECT_FALSE(decode(padded).has_value());

    std::vector<uint8_t> tiny(Record::HEADER_SIZE);
    EXPECT_FALSE(decode(tiny).has_value());
}

TEST(RecordTest, OfBytesCopiesValue) {
    std::vector<uint8_t> raw{0x00, 0xFF, 0x10};
    const auto record = Record::of(std::span<const uint8_t>{raw});
    raw[0] = 0x55;

    EXPECT_EQ(record.offset, 0u);
    EXPECT_EQ(record.value, (std::vector<uint8_t>{0x00, 0xFF, 0x10}));
}
