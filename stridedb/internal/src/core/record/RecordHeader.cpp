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

// internal/src/core/record/RecordHeader.cpp
#include "core/record/RecordHeader.hpp"

namespace stridedb::core {
    RecordHeader RecordHeader::read_from(BufferView buffer, size_t offset) {
        const auto view = buffer.slice(offset, SIZE);
        return RecordHeader{
            static_cast<int16_t>(view.read_u16_le(TYPE_ID_OFFSET)),
            static_cast<int16_t>(view.read_u16_le(GROUP_ID_OFFSET)),
            static_cast<int32_t>(view.read_u32_le(BODY_LENGTH_OFFSET))
        };
    }

    void RecordHeader::write_to(BufferView buffer, size_t offset) const {
        const auto view = buffer.slice(offset, SIZE);
        view.write_u16_le(TYPE_ID_OFFSET, static_cast<uint16_t>(type_id));
        view.write_u16_le(GROUP_ID_OFFSET, static_cast<uint16_t>(group_id));
        view.write_u32_le(BODY_LENGTH_OFFSET, static_cast<uint32_t>(body_length));
    }
} // namespace stridedb::core
