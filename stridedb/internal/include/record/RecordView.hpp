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

// internal/include/record/RecordView.hpp
#pragma once

#include "FieldValue.hpp"
#include "IndexSink.hpp"
#include "core/buffer/BufferView.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include "core/record/RecordHeader.hpp"
#include "schema/Layout.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace stridedb::record {
    /**
     * RecordView - Rebindable flyweight over one fixed-length record.
     *
     * Binds to a (buffer, offset) pair it does not own and provides typed
     * field access at the offsets computed by the Layout:
     *
     * [offset]                 RecordHeader (8 bytes)
     * [offset + field.offset]  field bytes, Little-Endian
     *
     * Write path (fixed order):
     *   immutable buffer     -> std::logic_error
     *   string too long      -> std::length_error
     *   key locked           -> std::logic_error
     *   unique value taken   -> returns false, nothing written
     *   bytes written, then the IndexSink is notified
     *
     * Mutability and atomic capability come from the bound BufferView.
     * Rebinding resets the key lock and any pending record transaction.
     *
     * Typical usage:
     * ```cpp
     * RecordView view{layout};
     * view.bind_and_write_header(buf.view(), 0);
     * view.write_i32(layout->require_field("id"), 42);
     * view.lock_key();
     * ```
     *
     * Thread-safety: NOT thread-safe. One logical writer per view.
     */
    class RecordView {
        public:
            /**
             * @param layout Layout of the records this view reads
             * @param index_sink Optional index owner, consulted on indexed writes
             * @throws std::invalid_argument if layout is null
             */
            explicit RecordView(std::shared_ptr<const schema::Layout> layout, IndexSink* index_sink = nullptr);

            RecordView(RecordView&&) noexcept = default;
            RecordView& operator=(RecordView&&) noexcept = default;
            RecordView(const RecordView&) = delete;
            RecordView& operator=(const RecordView&) = delete;

            // ==================== Binding ====================

            /**
             * Moves the view onto buffer at offset.
             *
             * A view constructed with an IndexSink is pinned to the first buffer
             * it binds to; it may move between offsets of that buffer only.
             *
             * @throws std::out_of_range if offset + stride > buffer.size()
             * @throws std::logic_error if an index-attached view is moved to another buffer
             */
            void bind(core::BufferView buffer, size_t offset);

            /**
             * bind() followed by write_header().
             */
            void bind_and_write_header(core::BufferView buffer, size_t offset);

            [[nodiscard]] bool is_bound() const noexcept { return bound_; }
            [[nodiscard]] size_t offset() const noexcept { return offset_; }
            [[nodiscard]] core::BufferView buffer() const noexcept { return buffer_; }
            [[nodiscard]] bool is_mutable() const noexcept { return buffer_.is_mutable(); }
            [[nodiscard]] bool is_atomic() const noexcept { return buffer_.is_atomic(); }

            [[nodiscard]] const schema::Layout& layout() const noexcept { return *layout_; }
            [[nodiscard]] const std::shared_ptr<const schema::Layout>& layout_ptr() const noexcept { return layout_; }

            // ==================== Header ====================

            /**
             * Writes type_id, group_id and stride into the header.
             *
             * @throws std::logic_error if unbound or the buffer is immutable
             */
            void write_header() const;

            /**
             * Returns true iff the bound header matches this layout's
             * type_id, group_id and stride. Never throws.
             */
            [[nodiscard]] bool validate_header() const noexcept;

            [[nodiscard]] core::RecordHeader read_header() const;

            [[nodiscard]] int16_t type_id() const noexcept { return layout_->type_id(); }
            [[nodiscard]] int16_t group_id() const noexcept { return layout_->group_id(); }

            // ==================== Reads ====================

            [[nodiscard]] FieldValue read(size_t field_id) const;

            [[nodiscard]] int32_t read_i32(size_t field_id) const;
            [[nodiscard]] int64_t read_i64(size_t field_id) const;
            [[nodiscard]] int16_t read_i16(size_t field_id) const;
            [[nodiscard]] bool read_bool(size_t field_id) const;
            [[nodiscard]] char16_t read_char16(size_t field_id) const;

            /**
             * Reads a fixed string; leading and trailing bytes <= ' ' are trimmed.
             */
            [[nodiscard]] std::string read_string(size_t field_id) const;

            // ==================== Writes ====================

            /**
             * Writes value into field_id. The alternative held by value must
             * match the field type.
             *
             * @return true on success; false if a unique constraint rejected it
             * @throws std::invalid_argument on a type mismatch
             * @throws std::logic_error on a sequence field, a locked key or an immutable buffer
             * @throws std::length_error if a string exceeds the field length
             */
            bool write(size_t field_id, const FieldValue& value);

            bool write_i32(size_t field_id, int32_t value) { return write(field_id, FieldValue{value}); }
            bool write_i64(size_t field_id, int64_t value) { return write(field_id, FieldValue{value}); }
            bool write_i16(size_t field_id, int16_t value) { return write(field_id, FieldValue{value}); }
            bool write_bool(size_t field_id, bool value) { return write(field_id, FieldValue{value}); }
            bool write_char16(size_t field_id, char16_t value) { return write(field_id, FieldValue{value}); }

            /**
             * Writes an ASCII string. Bytes past value.size() are cleared to 0,
             * so a shorter overwrite never leaves stale characters behind.
             */
            bool write_string(size_t field_id, std::string_view value) { return write(field_id, FieldValue{std::string{value}}); }

            /**
             * Pads value with trailing spaces to the field's max length, then writes.
             */
            bool write_string_padded(size_t field_id, std::string_view value);

            // ==================== Key Lock ====================

            /**
             * Prevents any further writes to the key field until the next bind.
             */
            void lock_key() noexcept { key_locked_ = true; }

            [[nodiscard]] bool key_locked() const noexcept { return key_locked_; }

            // ==================== Sequences ====================

            /**
             * Directly sets a sequence field. Subject to the key lock.
             */
            void initialize(size_t field_id, int64_t value);

            /**
             * Increments a sequence field and returns the new value.
             * Atomic when the buffer is atomic-capable and the field is
             * naturally aligned; otherwise read-increment-write.
             */
            int64_t next_sequence(size_t field_id);

            // ==================== Record Transactions ====================

            [[nodiscard]] bool supports_transactions() const noexcept { return layout_->transactional(); }

            /**
             * Snapshots the bound record's bytes. Index state is not captured.
             *
             * @throws std::logic_error if the layout is not transactional or the view is unbound
             */
            void begin_transaction();

            /**
             * Discards the snapshot; a later rollback() returns false.
             */
            void commit() noexcept { transaction_pending_ = false; }

            /**
             * Restores the bytes captured by begin_transaction().
             *
             * @return true if restored; false if no snapshot was pending
             * @throws std::logic_error if the buffer is immutable
             */
            bool rollback();

            [[nodiscard]] bool transaction_pending() const noexcept { return transaction_pending_; }

        private:
            std::shared_ptr<const schema::Layout> layout_;
            IndexSink* index_sink_;
            core::BufferView buffer_;
            size_t offset_{0};
            bool bound_{false};
            bool key_locked_{false};
            bool transaction_pending_{false};
            core::OwnedBuffer transaction_copy_;

            void require_bound(const char* op) const;
            void require_mutable(const char* op) const;
            [[nodiscard]] const schema::FieldLayout& typed_field(size_t field_id, schema::FieldType type) const;
            [[nodiscard]] int64_t read_integer(const schema::FieldLayout& field) const;
            void encode(const schema::FieldLayout& field, const FieldValue& value) const;
    };
} // namespace stridedb::record
