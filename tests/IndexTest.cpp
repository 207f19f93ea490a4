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

// tests/IndexTest.cpp
#include "engine/log/Index.hpp"
#include "core/Errors.hpp"
#include "core/buffer/BufferView.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace commitlog;
using engine::log::Index;
using engine::log::IndexEntry;
using engine::log::IndexSlot;
using engine::log::nearest_multiple;

class IndexTest : public test::TempDirTest {
protected:
    std::filesystem::path path() const { return dir_ / "0.index"; }
};

TEST(NearestMultipleTest, RoundsDown) {
    EXPECT_EQ(nearest_multiple(9, 4), 8u);
    EXPECT_EQ(nearest_multiple(1024, 12), 1020u);
    EXPECT_EQ(nearest_multiple(120, 12), 120u);
    EXPECT_EQ(nearest_multiple(11, 12), 0u);
}

TEST_F(IndexTest, PreallocatesRoundedCapacity) {
    auto index = Index::open(path(), 1024);
    EXPECT_EQ(index->capacity(), 1020u);
    EXPECT_EQ(std::filesystem::file_size(path()), 1020u);
    EXPECT_EQ(index->size(), 0u);
    EXPECT_EQ(index->name(), path());
}

TEST_F(IndexTest, WriteAndRead) {
    auto index = Index::open(path(), 1024);
    EXPECT_THROW((void)index->read(IndexSlot::last()), core::NotFoundError);

    const IndexEntry entries[] = {{0, 0}, {1, 10}, {2, 25}};
    for (const auto& e : entries) {
        index->write(e.offset, e.position);
        EXPECT_EQ(index->read(IndexSlot::last()), e);
    }

    EXPECT_EQ(index->entries(), 3u);
    EXPECT_EQ(index->size(), 3 * Index::ENTRY_WIDTH);
    for (uint32_t i = 0; i < 3; ++i) { EXPECT_EQ(index->read(IndexSlot::at(i)), entries[i]); }
    EXPECT_THROW((void)index->read(IndexSlot::at(3)), core::NotFoundError);
}

TEST_F(IndexTest, EntriesAreBigEndianOnDisk) {
    {
        auto index = Index::open(path(), 1024);
        index->write(0, 0);
        index->write(1, 0x0102030405060708ull);
        index->close();
    }

    auto raw = test::read_file(path());
    ASSERT_EQ(raw.size(), 2 * Index::ENTRY_WIDTH);
    const core::BufferView view{std::span<uint8_t>{raw}};
    EXPECT_EQ(view.read_u32_be(12), 1u);
    EXPECT_EQ(view.read_u64_be(16), 0x0102030405060708ull);
}

TEST_F(IndexTest, FullIndexRejectsWrites) {
    auto index = Index::open(path(), 40);
    ASSERT_EQ(index->capacity(), 36u);

    for (uint32_t i = 0; i < 3; ++i) {
        EXPECT_FALSE(index->is_full());
        index->write(i, i * 100);
    }
    EXPECT_TRUE(index->is_full());
    EXPECT_THROW(index->write(3, 300), core::CapacityError);
    EXPECT_EQ(index->entries(), 3u);
}

TEST_F(IndexTest, PositionsMustIncrease) {
    auto index = Index::open(path(), 1024);
    index->write(0, 50);
    EXPECT_THROW(index->write(1, 50), std::invalid_argument);
    EXPECT_THROW(index->write(1, 10), std::invalid_argument);
    EXPECT_EQ(index->entries(), 1u);
}

TEST_F(IndexTest, CloseTruncatesAndReopenResumes) {
    {
        auto index = Index::open(path(), 1024);
        index->write(0, 0);
        index->write(1, 19);
        index->close();
    }
    EXPECT_EQ(std::filesystem::file_size(path()), 2 * Index::ENTRY_WIDTH);

    auto index = Index::open(path(), 1024);
    EXPECT_EQ(index->entries(), 2u);
    EXPECT_EQ(index->read(IndexSlot::last()), (IndexEntry{1, 19}));

    index->write(2, 40);
    EXPECT_EQ(index->read(IndexSlot::at(2)), (IndexEntry{2, 40}));
}

TEST_F(IndexTest, EmptyIndexReopensEmpty) {
    Index::open(path(), 1024)->close();
    EXPECT_EQ(std::filesystem::file_size(path()), 0u);

    auto index = Index::open(path(), 1024);
    EXPECT_EQ(index->entries(), 0u);
}

TEST_F(IndexTest, RecoversFromUncleanShutdown) {
    // A crashed process leaves the pre-allocated length with zeroed tail slots.
    std::vector<uint8_t> raw(10 * Index::ENTRY_WIDTH, 0);
    const core::BufferView view{std::span<uint8_t>{raw}};
    view.write_u32_be(12, 1);
    view.write_u64_be(16, 30);
    view.write_u32_be(24, 2);
    view.write_u64_be(28, 61);
    test::write_file(path(), raw);

    auto index = Index::open(path(), 120);
    EXPECT_EQ(index->entries(), 3u);
    EXPECT_EQ(index->read(IndexSlot::at(0)), (IndexEntry{0, 0}));
    EXPECT_EQ(index->read(IndexSlot::last()), (IndexEntry{2, 61}));
}

TEST_F(IndexTest, AllZeroFileKeepsFirstEntry) {
    test::write_file(path(), std::vector<uint8_t>(5 * Index::ENTRY_WIDTH, 0));

    auto index = Index::open(path(), 120);
    EXPECT_EQ(index->entries(), 1u);
    EXPECT_EQ(index->read(IndexSlot::last()), (IndexEntry{0, 0}));
}

TEST_F(IndexTest, TornFileIsCorruption) {
    test::write_file(path(), std::vector<uint8_t>(Index::ENTRY_WIDTH + 5, 1));
    EXPECT_THROW((void)Index::open(path(), 1024), core::CorruptionError);
}

TEST_F(IndexTest, FileLargerThanCapacity) {
    test::write_file(path(), std::vector<uint8_t>(4 * Index::ENTRY_WIDTH, 1));
    EXPECT_THROW((void)Index::open(path(), 36), core::CapacityError);
    EXPECT_EQ(std::filesystem::file_size(path()), 4 * Index::ENTRY_WIDTH);
}

TEST_F(IndexTest, MaxBelowEntryWidth) { EXPECT_THROW((void)Index::open(path(), 11), std::invalid_argument); }

TEST_F(IndexTest, Reset) {
    auto index = Index::open(path(), 120);
    index->write(0, 0);
    index->write(1, 10);
    index->reset();

    EXPECT_EQ(index->size(), 0u);
    EXPECT_THROW((void)index->read(IndexSlot::last()), core::NotFoundError);
    index->write(0, 0);
    EXPECT_EQ(index->entries(), 1u);
}

TEST_F(IndexTest, TruncateDropsTailEntries) {
    {
        auto index = Index::open(path(), 120);
        for (uint32_t i = 0; i < 4; ++i) { index->write(i, i * 10); }

        index->truncate(2);
        EXPECT_EQ(index->entries(), 2u);
        EXPECT_EQ(index->read(IndexSlot::last()), (IndexEntry{1, 10}));
        EXPECT_THROW(index->truncate(3), std::invalid_argument);

        index->write(2, 15);
        EXPECT_EQ(index->read(IndexSlot::last()), (IndexEntry{2, 15}));
        index->close();
    }
    EXPECT_EQ(std::filesystem::file_size(path()), 3 * Index::ENTRY_WIDTH);
}

TEST_F(IndexTest, OperationsAfterCloseFail) {
    auto index = Index::open(path(), 120);
    index->write(0, 0);
    index->close();
    EXPECT_NO_THROW(index->close());

    EXPECT_THROW((void)index->read(IndexSlot::last()), core::ClosedError);
    EXPECT_THROW(index->write(1, 10), core::ClosedError);
    EXPECT_THROW(index->reset(), core::ClosedError);
    EXPECT_THROW(index->truncate(0), core::ClosedError);
}
