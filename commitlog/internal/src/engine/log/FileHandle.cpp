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

// internal/src/engine/log/FileHandle.cpp
#include "engine/log/FileHandle.hpp"
#include "core/Errors.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace commitlog::engine::log {
    FileHandle FileHandle::open_rw(const std::filesystem::path& path) {
        FileHandle fh;
        fh.handle_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fh.handle_ < 0) {
            const int err = errno;
            throw core::IoError{"open failed", path, err};
        }
        fh.path_ = path;
        return fh;
    }

    void FileHandle::pwrite_all(const void* data, size_t size, uint64_t offset) {
        const auto* ptr = static_cast<const uint8_t*>(data);
        size_t total = 0;
        while (total < size) {
            const ssize_t n = ::pwrite(handle_, ptr + total, size - total, static_cast<off_t>(offset + total));
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                throw core::IoError{"write failed", path_, err};
            }
            total += static_cast<size_t>(n);
        }
    }

    size_t FileHandle::pread_some(void* buf, size_t size, uint64_t offset) {
        auto* ptr = static_cast<uint8_t*>(buf);
        size_t total = 0;
        while (total < size) {
            const ssize_t n = ::pread(handle_, ptr + total, size - total, static_cast<off_t>(offset + total));
            if (n == 0) break; // EOF
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                throw core::IoError{"read failed", path_, err};
            }
            total += static_cast<size_t>(n);
        }
        return total;
    }

    uint64_t FileHandle::file_size() const {
        struct stat st{};
        if (::fstat(handle_, &st) < 0) {
            const int err = errno;
            throw core::IoError{"stat failed", path_, err};
        }
        return static_cast<uint64_t>(st.st_size);
    }

    void FileHandle::truncate(uint64_t length) {
        if (::ftruncate(handle_, static_cast<off_t>(length)) < 0) {
            const int err = errno;
            throw core::IoError{"truncate failed", path_, err};
        }
    }

    void FileHandle::fsync_data() {
#if defined(__APPLE__)
        if (::fcntl(handle_, F_FULLFSYNC) < 0) {
#else
        if (::fdatasync(handle_) < 0) {
#endif
            const int err = errno;
            throw core::IoError{"fsync failed", path_, err};
        }
    }

    void FileHandle::close() {
        if (handle_ == INVALID) { return; }
        const int result = ::close(handle_);
        handle_ = INVALID;
        if (result < 0) {
            const int err = errno;
            throw core::IoError{"close failed", path_, err};
        }
    }

    void FileHandle::reset() noexcept {
        if (handle_ != INVALID) {
            ::close(handle_);
            handle_ = INVALID;
        }
    }
} // namespace commitlog::engine::log
