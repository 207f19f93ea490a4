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

// internal/src/engine/log/Index.cpp
#include "engine/log/Index.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/buffer/BufferView.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <sys/mman.h>

namespace commitlog::engine::log {
    std::unique_ptr<Index> Index::open(const std::filesystem::path& path, uint64_t max_index_bytes) {
        if (max_index_bytes < ENTRY_WIDTH) { throw std::invalid_argument("Index: max_index_bytes must be at least one entry wide"); }
        const uint64_t capacity = nearest_multiple(max_index_bytes, ENTRY_WIDTH);

        auto file = FileHandle::open_rw(path);
        uint64_t size = file.file_size();

        if (size % ENTRY_WIDTH != 0) {
            throw core::CorruptionError(
                "Index: length " + std::to_string(size) + " is not a multiple of the entry width: " + path.string()
            );
        }
        if (size > capacity) {
            throw core::CapacityError(
                "Index: " + std::to_string(size) + " bytes on disk exceed capacity " + std::to_string(capacity) + ": " + path.string()
            );
        }

        // Pre-allocate the whole region once; the hot path never grows the file.
        file.truncate(capacity);

        void* mapped = ::mmap(nullptr, capacity, PROT_READ | PROT_WRITE, MAP_SHARED, file.native(), 0);
        if (mapped == MAP_FAILED) {
            const int err = errno;
            throw core::IoError{"Index: mmap failed", path, err};
        }
        auto* map = static_cast<std::byte*>(mapped);

        // Unused pre-allocated slots left behind by a crash are all zero.
        const core::BufferView view{map, capacity};
        const uint64_t on_disk = size;
        while (size > ENTRY_WIDTH && view.is_zero(size - ENTRY_WIDTH, ENTRY_WIDTH)) { size -= ENTRY_WIDTH; }
        if (size != on_disk) {
            COMMITLOG_WARN("Index {}: ignoring {} zeroed slots from an unclean shutdown", path.string(), (on_disk - size) / ENTRY_WIDTH);
        }

        COMMITLOG_TRACE("Index {}: opened with {} entries, capacity {} bytes", path.string(), size / ENTRY_WIDTH, capacity);
        return std::unique_ptr<Index>(new Index(std::move(file), map, capacity, size));
    }

    Index::Index(FileHandle file, std::byte* map, uint64_t capacity, uint64_t size)
        : file_{std::move(file)}
        , path_{file_.path()}
        , map_{map}
        , capacity_{capacity}
        , size_{size}
        , closed_{false} {}

    Index::~Index() {
        try { close(); }
        catch (const std::exception& e) { COMMITLOG_ERROR("Index {}: close on destruction failed: {}", path_.string(), e.what()); }
    }

    IndexEntry Index::read(IndexSlot slot) const {
        std::lock_guard lock{mutex_};
        ensure_open();

        const uint64_t count = size_ / ENTRY_WIDTH;
        if (count == 0) { throw core::NotFoundError("Index: empty: " + path_.string()); }

        const uint64_t slot_index = slot.is_last() ? count - 1 : slot.relative();
        if (slot_index >= count) {
            throw core::NotFoundError("Index: slot " + std::to_string(slot_index) + " not written (" + std::to_string(count) + " entries)");
        }

        const uint64_t pos = slot_index * ENTRY_WIDTH;
        const core::BufferView view{map_, capacity_};
        return IndexEntry{view.read_u32_be(pos), view.read_u64_be(pos + OFFSET_WIDTH)};
    }

    void Index::write(uint32_t offset, uint64_t position) {
        std::lock_guard lock{mutex_};
        ensure_open();

        if (size_ + ENTRY_WIDTH > capacity_) {
            throw core::CapacityError("Index: full at " + std::to_string(capacity_) + " bytes: " + path_.string());
        }

        const core::BufferView view{map_, capacity_};
        if (size_ > 0 && position <= view.read_u64_be(size_ - POSITION_WIDTH)) {
            throw std::invalid_argument("Index: position " + std::to_string(position) + " does not follow the last entry");
        }

        view.write_u32_be(size_, offset);
        view.write_u64_be(size_ + OFFSET_WIDTH, position);
        size_ += ENTRY_WIDTH;
    }

    void Index::truncate(uint64_t entries) {
        std::lock_guard lock{mutex_};
        ensure_open();

        if (entries > size_ / ENTRY_WIDTH) {
            throw std::invalid_argument(
                "Index: cannot truncate to " + std::to_string(entries) + " entries, only " + std::to_string(size_ / ENTRY_WIDTH) + " written"
            );
        }
        const uint64_t keep = entries * ENTRY_WIDTH;
        std::memset(map_ + keep, 0, size_ - keep);
        size_ = keep;
    }

    void Index::close() {
        std::lock_guard lock{mutex_};
        if (closed_) { return; }
        closed_ = true;

        std::exception_ptr first;
        auto keep_first = [&first](std::exception_ptr e) { if (!first) { first = std::move(e); } };

        // Order matters: mapping flushed and gone before the file shrinks under it.
        if (::msync(map_, capacity_, MS_SYNC) < 0) {
            const int err = errno;
            keep_first(std::make_exception_ptr(core::IoError{"Index: msync failed", path_, err}));
        }
        if (::munmap(map_, capacity_) < 0) {
            const int err = errno;
            keep_first(std::make_exception_ptr(core::IoError{"Index: munmap failed", path_, err}));
        }
        map_ = nullptr;

        try {
            file_.truncate(size_);
            file_.fsync_data();
        }
        catch (...) { keep_first(std::current_exception()); }
        try { file_.close(); }
        catch (...) { keep_first(std::current_exception()); }

        if (first) { std::rethrow_exception(first); }
    }

    uint64_t Index::size() const {
        std::lock_guard lock{mutex_};
        return size_;
    }

    void Index::ensure_open() const {
        if (closed_) { throw core::ClosedError("Index is closed: " + path_.string()); }
    }
} // namespace commitlog::engine::log
