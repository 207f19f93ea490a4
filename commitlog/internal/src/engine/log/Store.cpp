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

// internal/src/engine/log/Store.cpp
#include "engine/log/Store.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <cerrno>
#include <exception>
#include <string>

namespace commitlog::engine::log {
    std::unique_ptr<Store> Store::open(const std::filesystem::path& path, size_t write_buffer_bytes) {
        auto file = FileHandle::open_rw(path);
        const uint64_t size = file.file_size();

        COMMITLOG_TRACE("Store {}: opened at size {}", path.string(), size);
        return std::unique_ptr<Store>(new Store(std::move(file), size, write_buffer_bytes));
    }

    Store::Store(FileHandle file, uint64_t size, size_t write_buffer_bytes)
        : file_{std::move(file)}
        , path_{file_.path()}
        , buffer_{core::OwnedBuffer::allocate(write_buffer_bytes)}
        , buffered_{0}
        , flushed_{size}
        , size_{size}
        , closed_{false} {}

    Store::~Store() {
        try { close(); }
        catch (const std::exception& e) { COMMITLOG_ERROR("Store {}: close on destruction failed: {}", path_.string(), e.what()); }
    }

    Store::AppendResult Store::append(std::span<const uint8_t> payload) {
        std::lock_guard lock{mutex_};
        ensure_open();

        const uint64_t position = size_;
        const size_t total = LEN_WIDTH + payload.size();

        if (buffered_ + total > buffer_.size()) { flush_locked(); }

        if (total > buffer_.size()) {
            // Oversized entry: straight to the file, buffer is empty by now.
            uint8_t len_be[LEN_WIDTH];
            core::BufferView{std::span<uint8_t>{len_be}}.write_u64_be(0, payload.size());
            file_.pwrite_all(len_be, LEN_WIDTH, flushed_);
            file_.pwrite_all(payload.data(), payload.size(), flushed_ + LEN_WIDTH);
            flushed_ += total;
        }
        else {
            const auto view = buffer_.view();
            view.write_u64_be(buffered_, payload.size());
            view.copy_from(buffered_ + LEN_WIDTH, payload);
            buffered_ += total;
        }

        size_ += total;
        return AppendResult{total, position};
    }

    std::vector<uint8_t> Store::read(uint64_t position) {
        std::lock_guard lock{mutex_};
        ensure_open();
        flush_locked();

        uint8_t len_be[LEN_WIDTH];
        if (position > size_ || size_ - position < LEN_WIDTH || file_.pread_some(len_be, LEN_WIDTH, position) < LEN_WIDTH) {
            throw core::IoError{"Store: short read of length at position " + std::to_string(position), path_, EIO};
        }
        const uint64_t len = core::BufferView{std::span<uint8_t>{len_be}}.read_u64_be(0);

        // Reject before allocating: a garbage length must not turn into a huge vector.
        if (len > size_ - position - LEN_WIDTH) {
            throw core::IoError{"Store: short read of " + std::to_string(len) + " bytes at position " + std::to_string(position), path_, EIO};
        }

        std::vector<uint8_t> payload(static_cast<size_t>(len));
        if (file_.pread_some(payload.data(), payload.size(), position + LEN_WIDTH) < payload.size()) {
            throw core::IoError{"Store: short read of payload at position " + std::to_string(position), path_, EIO};
        }
        return payload;
    }

    size_t Store::read_at(std::span<uint8_t> buffer, uint64_t offset) {
        std::lock_guard lock{mutex_};
        ensure_open();
        flush_locked();
        return file_.pread_some(buffer.data(), buffer.size(), offset);
    }

    void Store::sync() {
        std::lock_guard lock{mutex_};
        ensure_open();
        flush_locked();
        file_.fsync_data();
    }

    void Store::close() {
        std::lock_guard lock{mutex_};
        if (closed_) { return; }
        closed_ = true;

        std::exception_ptr first;
        try { flush_locked(); }
        catch (...) { first = std::current_exception(); }
        try { file_.close(); }
        catch (...) { if (!first) { first = std::current_exception(); } }

        if (first) { std::rethrow_exception(first); }
    }

    uint64_t Store::size() const {
        std::lock_guard lock{mutex_};
        return size_;
    }

    void Store::flush_locked() {
        if (buffered_ == 0) { return; }
        file_.pwrite_all(buffer_.data(), buffered_, flushed_);
        flushed_ += buffered_;
        buffered_ = 0;
    }

    void Store::ensure_open() const {
        if (closed_) { throw core::ClosedError("Store is closed: " + path_.string()); }
    }
} // namespace commitlog::engine::log
