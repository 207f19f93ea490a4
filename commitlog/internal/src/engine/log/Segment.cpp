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

// internal/src/engine/log/Segment.cpp
#include "engine/log/Segment.hpp"
#include "engine/log/Index.hpp"
#include "engine/log/Store.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <atomic>
#include <cerrno>
#include <exception>
#include <limits>
#include <mutex>
#include <span>
#include <system_error>
#include <utility>

namespace commitlog::engine::log {
    namespace {
        void remove_file(const std::filesystem::path& path) {
            std::error_code ec;
            if (!std::filesystem::remove(path, ec)) {
                throw core::IoError{"Segment: remove failed", path, ec ? ec.value() : ENOENT};
            }
        }
    } // anonymous namespace

    /**
 * Segment::Impl - Private implementation.
 */
    class Segment::Impl {
    public:
        Impl(const std::filesystem::path& dir, uint64_t base_offset, const Config& config)
            : base_offset_{base_offset}
            , config_{config}
            , closed_{false} {
            config_.validate();

            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) { throw core::IoError{"Segment: cannot create directory", dir, ec.value()}; }

            store_ = Store::open(dir / store_file_name(base_offset), config_.segment.write_buffer_bytes);
            index_ = Index::open(dir / index_file_name(base_offset), config_.segment.max_index_bytes);

            next_offset_ = recover_next_offset();
            COMMITLOG_DEBUG(
                "Segment {}: opened in {} (next offset {}, store {} bytes, index {} entries)",
                base_offset_, dir.string(), next_offset_.load(), store_->size(), index_->entries()
            );
        }

        ~Impl() {
            try { close(); }
            catch (const std::exception& e) { COMMITLOG_ERROR("Segment {}: close on destruction failed: {}", base_offset_, e.what()); }
        }

        uint64_t append(core::Record& record) {
            std::lock_guard lock{append_mutex_};
            ensure_open();

            const uint64_t cursor = next_offset_.load();
            const uint64_t relative = cursor - base_offset_;

            // Refuse before touching the store so no unindexed entry is left behind.
            if (relative > std::numeric_limits<uint32_t>::max()) {
                throw core::CapacityError("Segment " + std::to_string(base_offset_) + ": relative offsets exhausted");
            }
            if (index_->is_full()) { throw core::CapacityError("Segment " + std::to_string(base_offset_) + ": index is full"); }

            record.offset = cursor;
            const auto bytes = record.serialize();

            const auto [written, position] = store_->append(bytes.bytes());
            index_->write(static_cast<uint32_t>(relative), position);

            next_offset_.store(cursor + 1);
            COMMITLOG_TRACE("Segment {}: appended offset {} ({} bytes at {})", base_offset_, cursor, written, position);
            return cursor;
        }

        core::Record read(uint64_t offset) const {
            ensure_open();

            if (offset < base_offset_ || offset >= next_offset_.load()) {
                throw core::NotFoundError(
                    "Segment " + std::to_string(base_offset_) + ": offset " + std::to_string(offset) + " out of range [" +
                    std::to_string(base_offset_) + ", " + std::to_string(next_offset_.load()) + ")"
                );
            }

            const auto entry = index_->read(IndexSlot::at(static_cast<uint32_t>(offset - base_offset_)));
            return decode_at(offset, entry.position);
        }

        bool is_maxed() const {
            // The index holds capacity() bytes, max_index_bytes rounded down to whole entries.
            return store_->size() >= config_.segment.max_store_bytes || index_->size() >= index_->capacity();
        }

        void remove() {
            close();
            remove_file(index_->name());
            remove_file(store_->name());
            COMMITLOG_DEBUG("Segment {}: removed", base_offset_);
        }

        void close() {
            std::lock_guard lock{append_mutex_};
            if (closed_.exchange(true)) { return; }

            std::exception_ptr first;
            try { index_->close(); }
            catch (...) { first = std::current_exception(); }
            try { store_->close(); }
            catch (...) { if (!first) { first = std::current_exception(); } }

            if (first) { std::rethrow_exception(first); }
            COMMITLOG_DEBUG("Segment {}: closed at next offset {}", base_offset_, next_offset_.load());
        }

        [[nodiscard]] uint64_t base_offset() const noexcept { return base_offset_; }

        [[nodiscard]] uint64_t next_offset() const noexcept { return next_offset_.load(); }

        [[nodiscard]] const std::filesystem::path& store_path() const noexcept { return store_->name(); }

        [[nodiscard]] const std::filesystem::path& index_path() const noexcept { return index_->name(); }

    private:
        uint64_t recover_next_offset() {
            // The mapped index outlives a crash, the store's unflushed buffer
            // does not: drop tail entries whose frame never reached the file.
            const uint64_t on_disk = index_->entries();
            const uint64_t store_size = store_->size();
            uint64_t kept = on_disk;
            while (kept > 0 && !frame_fits(index_->read(IndexSlot::at(static_cast<uint32_t>(kept - 1))).position, store_size)) {
                --kept;
            }
            if (kept != on_disk) {
                COMMITLOG_WARN(
                    "Segment {}: discarding {} index entries past the end of the store ({} bytes)",
                    base_offset_, on_disk - kept, store_size
                );
                index_->truncate(kept);
            }
            if (kept == 0) { return base_offset_; }

            const auto last = index_->read(IndexSlot::last());
            const uint64_t last_offset = base_offset_ + static_cast<uint64_t>(last.offset);
            (void)decode_at(last_offset, last.position);
            return last_offset + 1;
        }

        /**
     * True if a complete store frame starts at `position`.
     */
        bool frame_fits(uint64_t position, uint64_t store_size) const {
            if (position > store_size || store_size - position < Store::LEN_WIDTH) { return false; }

            uint8_t len_be[Store::LEN_WIDTH];
            if (store_->read_at(std::span<uint8_t>{len_be}, position) < Store::LEN_WIDTH) { return false; }
            const uint64_t len = core::BufferView{std::span<uint8_t>{len_be}}.read_u64_be(0);
            return len <= store_size - position - Store::LEN_WIDTH;
        }

        core::Record decode_at(uint64_t offset, uint64_t position) const {
            auto bytes = store_->read(position);

            auto record = core::Record::deserialize(core::BufferView{std::span<uint8_t>{bytes}});
            if (!record) {
                throw core::CorruptionError(
                    "Segment " + std::to_string(base_offset_) + ": malformed record at offset " + std::to_string(offset)
                );
            }
            if (record->offset != offset) {
                throw core::CorruptionError(
                    "Segment " + std::to_string(base_offset_) + ": expected offset " + std::to_string(offset) + ", found " +
                    std::to_string(record->offset)
                );
            }
            return std::move(*record);
        }

        void ensure_open() const {
            if (closed_.load()) { throw core::ClosedError("Segment " + std::to_string(base_offset_) + " is closed"); }
        }

        const uint64_t base_offset_;
        std::atomic<uint64_t> next_offset_{0};
        Config config_;

        std::unique_ptr<Store> store_;
        std::unique_ptr<Index> index_;

        std::mutex append_mutex_;
        std::atomic<bool> closed_;
    };

    // ==================== Segment Public API ====================

    std::unique_ptr<Segment> Segment::open(
        const std::filesystem::path& dir,
        uint64_t base_offset,
        const Config& config
    ) { return std::unique_ptr<Segment>(new Segment(dir, base_offset, config)); }

    Segment::Segment(const std::filesystem::path& dir, uint64_t base_offset, const Config& config)
        : impl_{std::make_unique<Impl>(dir, base_offset, config)} {}

    Segment::~Segment() = default;

    uint64_t Segment::append(core::Record& record) { return impl_->append(record); }

    core::Record Segment::read(uint64_t offset) const { return impl_->read(offset); }

    bool Segment::is_maxed() const { return impl_->is_maxed(); }

    void Segment::remove() { impl_->remove(); }

    void Segment::close() { impl_->close(); }

    uint64_t Segment::base_offset() const noexcept { return impl_->base_offset(); }

    uint64_t Segment::next_offset() const noexcept { return impl_->next_offset(); }

    const std::filesystem::path& Segment::store_path() const noexcept { return impl_->store_path(); }

    const std::filesystem::path& Segment::index_path() const noexcept { return impl_->index_path(); }

    std::string Segment::store_file_name(uint64_t base_offset) { return std::to_string(base_offset) + ".store"; }

    std::string Segment::index_file_name(uint64_t base_offset) { return std::to_string(base_offset) + ".index"; }
} // namespace commitlog::engine::log
