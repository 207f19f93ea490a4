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

// tests/StoreTest.cpp
#include "engine/log/Store.hpp"
#include "core/Errors.hpp"
#include "core/buffer/BufferView.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

using namespace commitlog;
using engine::log::Store;
using test::bytes_of;

class StoreTest : public test::TempDirTest {
protected:
    std::filesystem::path path() const { return dir_ / "0.store"; }
};

TEST_F(StoreTest, AppendReturnsPositionAndWidth) {
    auto store = Store::open(path());
    const auto payload = bytes_of("hello world");
    const uint64_t width = Store::LEN_WIDTH + payload.size();

    for (uint64_t i = 0; i < 3; ++i) {
        const auto [written, position] = store->append(payload);
        EXPECT_EQ(written, width);
        EXPECT_EQ(position, i * width);
        EXPECT_EQ(store->size(), (i + 1) * width);
    }
}

TEST_F(StoreTest, ReadSeesBufferedAppends) {
    auto store = Store::open(path());
    const auto first = store->append(bytes_of("first"));
    const auto second = store->append(bytes_of("second"));

    // Nothing reached the file yet; read must flush first.
    EXPECT_EQ(std::filesystem::file_size(path()), 0u);

    EXPECT_EQ(store->read(first.position), bytes_of("first"));
    EXPECT_EQ(store->read(second.position), bytes_of("second"));
    EXPECT_EQ(std::filesystem::file_size(path()), store->size());
}

TEST_F(StoreTest, ReadAtReturnsRawFraming) {
    auto store = Store::open(path());
    const auto [written, position] = store->append(bytes_of("abc"));

    std::vector<uint8_t> raw(written);
    ASSERT_EQ(store->read_at(raw, position), written);

    const core::BufferView view{std::span<uint8_t>{raw}};
    EXPECT_EQ(view.read_u64_be(0), 3u);
    EXPECT_EQ(view.slice(Store::LEN_WIDTH).as_string_view(), "abc");

    // Short only at end of file.
    std::vector<uint8_t> past(32);
    EXPECT_EQ(store->read_at(past, 4), written - 4);
    EXPECT_EQ(store->read_at(past, written), 0u);
}

TEST_F(StoreTest, LargePayloadBypassesBuffer) {
    auto store = Store::open(path(), 64);
    const auto small = store->append(bytes_of("small"));
    const std::vector<uint8_t> big(1000, 0xAB);
    const auto large = store->append(big);
    const auto after = store->append(bytes_of("after"));

    EXPECT_EQ(large.position, small.position + small.bytes_written);
    EXPECT_EQ(after.position, large.position + Store::LEN_WIDTH + big.size());

    EXPECT_EQ(store->read(small.position), bytes_of("small"));
    EXPECT_EQ(store->read(large.position), big);
    EXPECT_EQ(store->read(after.position), bytes_of("after"));
}

TEST_F(StoreTest, EmptyPayload) {
    auto store = Store::open(path());
    const auto [written, position] = store->append({});
    EXPECT_EQ(written, Store::LEN_WIDTH);
    EXPECT_TRUE(store->read(position).empty());
}

TEST_F(StoreTest, ResumesFromFileLength) {
    uint64_t second_position = 0;
    {
        auto store = Store::open(path());
        (void)store->append(bytes_of("one"));
        second_position = store->append(bytes_of("two")).position;
        store->close();
    }

    auto store = Store::open(path());
    EXPECT_EQ(store->size(), std::filesystem::file_size(path()));
    EXPECT_EQ(store->read(second_position), bytes_of("two"));

    const auto third = store->append(bytes_of("three"));
    EXPECT_EQ(third.position, second_position + Store::LEN_WIDTH + 3);
    EXPECT_EQ(store->read(third.position), bytes_of("three"));
}

TEST_F(StoreTest, DestructorFlushes) {
    {
        auto store = Store::open(path());
        (void)store->append(bytes_of("pending"));
    }
    EXPECT_EQ(std::filesystem::file_size(path()), Store::LEN_WIDTH + 7);
}

TEST_F(StoreTest, ReadPastEndIsShortRead) {
    auto store = Store::open(path());
    const auto [written, position] = store->append(bytes_of("abc"));

    EXPECT_THROW((void)store->read(written), core::IoError);
    EXPECT_THROW((void)store->read(written + 100), core::IoError);
    EXPECT_THROW((void)store->read(position + 4), core::IoError);
}

TEST_F(StoreTest, TruncatedPayloadIsShortRead) {
    auto data = std::vector<uint8_t>(Store::LEN_WIDTH + 2);
    core::BufferView{std::span<uint8_t>{data}}.write_u64_be(0, 50);
    test::write_file(path(), data);

    auto store = Store::open(path());
    try {
        (void)store->read(0);
        FAIL() << "expected IoError";
    }
    catch (const core::IoError& e) { EXPECT_EQ(e.code(), std::errc::io_error); }
}

TEST_F(StoreTest, OperationsAfterCloseFail) {
    auto store = Store::open(path());
    (void)store->append(bytes_of("x"));
    store->close();
    EXPECT_NO_THROW(store->close());

    std::vector<uint8_t> buf(8);
    EXPECT_THROW((void)store->append(bytes_of("y")), core::ClosedError);
    EXPECT_THROW((void)store->read(0), core::ClosedError);
    EXPECT_THROW((void)store->read_at(buf, 0), core::ClosedError);
    EXPECT_THROW(store->sync(), core::ClosedError);
}

TEST_F(StoreTest, SyncFlushes) {
    auto store = Store::open(path());
    (void)store->append(bytes_of("durable"));
    store->sync();
    EXPECT_EQ(std::filesystem::file_size(path()), store->size());
    EXPECT_EQ(store->name(), path());
}

TEST_F(StoreTest, OpenFailsInMissingDirectory) {
    EXPECT_THROW((void)Store::open(dir_ / "missing" / "0.store"), core::IoError);
}
