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

// internal/include/record/OwnedRecord.hpp
#pragma once

#include "RecordView.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include <memory>

namespace stridedb::record {
    /**
     * OwnedRecord - A standalone record with its own stride-sized buffer.
     *
     * Used for records that live outside any Repository, e.g. staging an
     * object before append_by_copy_from_buffer().
     *
     * Move-only. The view stays valid across moves since the buffer memory
     * is heap-allocated and never reallocated.
     */
    class OwnedRecord {
        public:
            /**
             * Allocates a zeroed buffer of exactly layout->stride() bytes,
             * writes the header and sets every sequence field to 1.
             */
            [[nodiscard]] static OwnedRecord instance(std::shared_ptr<const schema::Layout> layout);

            OwnedRecord(OwnedRecord&&) noexcept = default;
            OwnedRecord& operator=(OwnedRecord&&) noexcept = default;
            OwnedRecord(const OwnedRecord&) = delete;
            OwnedRecord& operator=(const OwnedRecord&) = delete;

            [[nodiscard]] RecordView& view() noexcept { return view_; }
            [[nodiscard]] const RecordView& view() const noexcept { return view_; }

            RecordView* operator->() noexcept { return &view_; }
            const RecordView* operator->() const noexcept { return &view_; }

            [[nodiscard]] core::BufferView buffer() const noexcept { return buffer_.view(); }

        private:
            OwnedRecord(core::OwnedBuffer buffer, RecordView view) noexcept : buffer_{std::move(buffer)}, view_{std::move(view)} {}

            core::OwnedBuffer buffer_;
            RecordView view_;
    };
} // namespace stridedb::record
