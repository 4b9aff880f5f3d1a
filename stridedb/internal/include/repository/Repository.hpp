/*
 * StrideDB
 * Copyright (C) 2026 Swift Storm Studio
 *
 * This file is part of StrideDB.
 *
 * StrideDB is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * StrideDB is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with StrideDB.  If not, see <https://www.gnu.org/licenses/>.
 */

// internal/include/repository/Repository.hpp
#pragma once

#include "record/FieldValue.hpp"
#include "record/RecordView.hpp"
#include "schema/Layout.hpp"
#include "core/buffer/BufferView.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace stridedb::repository {
    /**
     * Repository - Fixed-capacity, append-only store of records of one Layout.
     *
     * Owns one zero-filled buffer of capacity slots:
     *
     * [0]                        slot 0 (stride bytes + slot_padding)
     * [stride + slot_padding]    slot 1
     * ...
     *
     * Tracks key -> offset, the set of occupied offsets, and one
     * SecondaryIndex per indexed field. Records are reached through a
     * single shared cursor (RecordView) that every append and lookup
     * rebinds; the returned pointer is valid until the next such call.
     *
     * Recoverable outcomes (full, duplicate key, unknown key, unique
     * violation) are reported as nullptr / false, never as exceptions.
     *
     * Typical usage:
     * ```cpp
     * auto repo = Repository::create_with_capacity(layout, 1024);
     * if (auto* order = repo->append_with_key(42)) {
     *     order->write_i32(layout->require_field("qty"), 10);
     * }
     * ```
     *
     * Thread-safety: NOT thread-safe. Single writer, no internal locking.
     */
    class Repository {
            class Impl;

        public:
            /**
             * Configuration options.
             */
            struct Options {
                size_t slot_padding = 1; ///< Bytes between consecutive slots
                size_t buffer_alignment = 64; ///< Alignment of the owned buffer (power of 2)
            };

            /**
             * Shared, stateful cursor over all appended slots, in append order.
             *
             * The view returned by next() is rebound on every call. Nested or
             * concurrent traversal is not supported.
             */
            class Iterator {
                public:
                    [[nodiscard]] bool has_next() const noexcept;

                    /**
                     * @throws std::out_of_range if has_next() is false
                     */
                    record::RecordView& next();

                    /**
                     * Rewinds to the first slot.
                     */
                    Iterator& reset() noexcept;

                private:
                    friend class Repository;
                    explicit Iterator(Repository::Impl& repo);

                    Repository::Impl* repo_;
                    record::RecordView view_;
                    size_t current_offset_{0};
            };

            // ==================== Factory ====================

            /**
             * Creates a repository holding at most capacity records.
             *
             * @throws std::invalid_argument if layout is null, has no integer key field,
             *         capacity is 0 or options are invalid
             */
            [[nodiscard]] static std::unique_ptr<Repository> create_with_capacity(std::shared_ptr<const schema::Layout> layout, size_t capacity);

            [[nodiscard]] static std::unique_ptr<Repository> create_with_capacity(std::shared_ptr<const schema::Layout> layout, size_t capacity,
                                                                                  const Options& options);

            ~Repository();

            Repository(const Repository&) = delete;
            Repository& operator=(const Repository&) = delete;
            Repository(Repository&&) = delete;
            Repository& operator=(Repository&&) = delete;

            // ==================== Append ====================

            /**
             * Claims the next free slot for key, writes the header and the key,
             * and locks the key.
             *
             * @return Bound cursor, or nullptr if full or key already present
             */
            [[nodiscard]] record::RecordView* append_with_key(int64_t key);

            /**
             * Copies stride bytes from source[offset] into the next free slot
             * and indexes every indexed field from the copied bytes.
             * Unique constraints are not checked on this path.
             *
             * @return Bound cursor, or nullptr if full or the source key is already present
             * @throws std::out_of_range if the source region is shorter than stride
             */
            [[nodiscard]] record::RecordView* append_by_copy_from_buffer(core::BufferView source, size_t offset);

            // ==================== Lookup ====================

            [[nodiscard]] bool contains_key(int64_t key) const;
            [[nodiscard]] size_t current_count() const noexcept;
            [[nodiscard]] size_t capacity() const noexcept;

            /**
             * @return Cursor bound to key's slot with the key locked, or nullptr
             */
            [[nodiscard]] record::RecordView* get_by_key(int64_t key);

            /**
             * @return Cursor bound to the index-th appended slot, or nullptr if index >= current_count()
             */
            [[nodiscard]] record::RecordView* get_by_buffer_index(size_t index);

            [[nodiscard]] std::optional<size_t> get_offset_by_buffer_index(size_t index) const noexcept;

            /**
             * @return Cursor bound to offset, or nullptr unless offset is an occupied slot
             */
            [[nodiscard]] record::RecordView* get_by_buffer_offset(size_t offset);

            /**
             * Offsets whose last written value of field_id equals value, ascending.
             *
             * @throws std::invalid_argument if field_id is not indexed
             */
            [[nodiscard]] std::vector<size_t> get_all_with_index_value(size_t field_id, const record::FieldValue& value) const;

            /**
             * Shared iterator; see Iterator.
             */
            [[nodiscard]] Iterator& all_items() noexcept;

            // ==================== Buffer ====================

            [[nodiscard]] core::BufferView underlying_buffer() const noexcept;

            /**
             * IEEE CRC-32 over the entire allocated buffer, unused tail included.
             * Full scan; not for hot paths.
             */
            [[nodiscard]] uint32_t crc32() const noexcept;

            /**
             * Allocates and returns a copy of the entire buffer.
             */
            [[nodiscard]] std::vector<std::byte> dump_buffer() const;

            [[nodiscard]] const schema::Layout& layout() const noexcept;

            [[nodiscard]] size_t slot_stride() const noexcept;

            // ==================== Transactions ====================

            [[nodiscard]] bool supports_transactions() const noexcept;

            /**
             * Snapshots the buffer, key map, occupied offsets, counters and all indexes.
             *
             * @throws std::logic_error if the layout is not transactional
             */
            void begin_transaction();

            /**
             * Drops the pending snapshot.
             */
            void commit() noexcept;

            /**
             * Restores everything captured by begin_transaction().
             *
             * @return true if restored; false if no snapshot was pending
             */
            bool rollback();

            [[nodiscard]] bool transaction_pending() const noexcept;

        private:
            Repository(std::shared_ptr<const schema::Layout> layout, size_t capacity, const Options& options);
            std::unique_ptr<Impl> impl_;
            std::unique_ptr<Iterator> iterator_;
    };
} // namespace stridedb::repository
