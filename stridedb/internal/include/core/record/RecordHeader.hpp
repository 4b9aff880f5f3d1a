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

// internal/include/core/record/RecordHeader.hpp
#pragma once

#include "core/buffer/BufferView.hpp"
#include <cstdint>
#include <type_traits>

namespace stridedb::core {
    #pragma pack(push, 1)
    /**
     * RecordHeader - 8-byte fixed-size header that brands every record.
     *
     * Binary layout (Little-Endian, 8 bytes total):
     * [0..1]   type_id (i16)      - Schema type id
     * [2..3]   group_id (i16)     - Schema group id
     * [4..7]   body_length (i32)  - Total record stride, header included
     *
     * The header is always decoded field-by-field through BufferView so
     * that records at unaligned offsets are read safely. The struct only
     * fixes the wire layout.
     */
    struct RecordHeader {
        // ==================== Fields ====================

        int16_t type_id; ///< Schema type id
        int16_t group_id; ///< Schema group id
        int32_t body_length; ///< Total encoded length of the record

        // ==================== Layout Constants ====================

        static constexpr size_t TYPE_ID_OFFSET = 0;
        static constexpr size_t GROUP_ID_OFFSET = 2;
        static constexpr size_t BODY_LENGTH_OFFSET = 4;
        static constexpr size_t SIZE = 8;

        // ==================== Methods ====================

        /**
         * Decodes a header starting at offset.
         *
         * @throws std::out_of_range if offset + SIZE > buffer.size()
         */
        [[nodiscard]] static RecordHeader read_from(BufferView buffer, size_t offset);

        /**
         * Encodes this header starting at offset.
         *
         * @throws std::out_of_range if offset + SIZE > buffer.size()
         * @throws std::logic_error if the buffer is not mutable
         */
        void write_to(BufferView buffer, size_t offset) const;

        [[nodiscard]] constexpr bool operator==(const RecordHeader&) const noexcept = default;
    };
    #pragma pack(pop)

    static_assert(sizeof(RecordHeader) == RecordHeader::SIZE, "RecordHeader must be exactly 8 bytes");
    static_assert(std::is_standard_layout_v<RecordHeader>, "RecordHeader must be standard layout");
    static_assert(std::is_trivially_copyable_v<RecordHeader>, "RecordHeader must be trivially copyable");
} // namespace stridedb::core
