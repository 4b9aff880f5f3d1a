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

// internal/include/record/IndexSink.hpp
#pragma once

#include "FieldValue.hpp"
#include <cstddef>

namespace stridedb::record {
    /**
     * IndexSink - Narrow index-maintenance capability handed to a RecordView.
     *
     * A RecordView consults the sink on every write to an indexed field:
     *   1. is_unique_value()            (unique fields only, before the write)
     *   2. on_indexed_field_updated()   (after the bytes are committed)
     *
     * The owner of the sink must outlive every view it is given to.
     */
    class IndexSink {
        public:
            virtual ~IndexSink() = default;

            /**
             * Returns false if value is already taken on the unique field.
             */
            [[nodiscard]] virtual bool is_unique_value(size_t field_id, const FieldValue& value) const = 0;

            /**
             * Notifies that the record at offset now holds value in field_id.
             */
            virtual void on_indexed_field_updated(size_t field_id, size_t offset, const FieldValue& value) = 0;
    };
} // namespace stridedb::record
