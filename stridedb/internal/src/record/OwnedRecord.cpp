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

// internal/src/record/OwnedRecord.cpp
#include "record/OwnedRecord.hpp"

namespace stridedb::record {
    OwnedRecord OwnedRecord::instance(std::shared_ptr<const schema::Layout> layout) {
        RecordView view{std::move(layout)};
        auto buffer = core::OwnedBuffer::allocate(view.layout().stride());
        buffer.zero_fill();

        view.bind_and_write_header(buffer.view(), 0);
        for (size_t id = 0; id < view.layout().field_count(); ++id) {
            if (view.layout().field(id).attrs.sequence) { view.initialize(id, 1); }
        }

        return OwnedRecord{std::move(buffer), std::move(view)};
    }
} // namespace stridedb::record
