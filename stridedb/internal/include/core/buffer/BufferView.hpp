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

// internal/include/core/buffer/BufferView.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace stridedb::core {
    /**
     * BufferView - Zero-copy, non-owning view over a contiguous byte region.
     *
     * Provides Little-Endian (LE) accessors and carries the capability flags
     * a record view discovers when it binds:
     * - CAP_MUTABLE: writes are permitted
     * - CAP_ATOMIC:  the memory supports lock-free atomic increments
     *                (naturally aligned fields only)
     *
     * Design principles:
     * - No ownership: lifetime managed externally
     * - Stack-allocated: trivial copy/move
     * - LE-only: all multi-byte reads/writes are Little-Endian
     *
     * Thread-safety: Read-only operations are thread-safe. Concurrent writes
     * to the same region require external synchronization.
     */
    class BufferView {
        public:
            // ==================== Capability Flags ====================

            static constexpr uint8_t CAP_NONE = 0x00; ///< Read-only
            static constexpr uint8_t CAP_MUTABLE = 0x01; ///< Writable
            static constexpr uint8_t CAP_ATOMIC = 0x02; ///< Atomic increment capable
            static constexpr uint8_t CAP_ALL = CAP_MUTABLE | CAP_ATOMIC;

            /**
             * Constructs an empty BufferView.
             */
            constexpr BufferView() noexcept : data_{nullptr}, size_{0}, caps_{CAP_NONE} {}

            /**
             * Constructs a BufferView from raw pointer and size.
             *
             * Caller-supplied memory is writable but not assumed to be
             * atomic-capable unless CAP_ATOMIC is passed explicitly.
             *
             * @param data Pointer to the beginning of the buffer
             * @param size Size in bytes
             * @param caps Capability flags
             */
            constexpr BufferView(std::byte* data, size_t size, uint8_t caps = CAP_MUTABLE) noexcept : data_{data}, size_{size}, caps_{caps} {}

            /**
             * Constructs a BufferView from a std::span.
             */
            constexpr explicit BufferView(std::span<std::byte> span, uint8_t caps = CAP_MUTABLE) noexcept : data_{span.data()}, size_{span.size()}, caps_{caps} {}

            /**
             * Wraps read-only memory. All write operations on the result throw.
             */
            [[nodiscard]] static BufferView read_only(const std::byte* data, size_t size) noexcept {
                return BufferView{const_cast<std::byte*>(data), size, CAP_NONE};
            }

            // ==================== Basic Accessors ====================

            [[nodiscard]] constexpr std::byte* data() const noexcept { return data_; }

            [[nodiscard]] constexpr size_t size() const noexcept { return size_; }

            [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

            [[nodiscard]] constexpr uint8_t capabilities() const noexcept { return caps_; }

            /**
             * Returns true if writes are permitted.
             */
            [[nodiscard]] constexpr bool is_mutable() const noexcept { return (caps_ & CAP_MUTABLE) != 0; }

            /**
             * Returns true if the memory supports atomic increments.
             */
            [[nodiscard]] constexpr bool is_atomic() const noexcept { return (caps_ & CAP_ATOMIC) != 0; }

            /**
             * Returns a copy of this view with write and atomic capabilities removed.
             */
            [[nodiscard]] constexpr BufferView as_read_only() const noexcept { return BufferView{data_, size_, CAP_NONE}; }

            // ==================== Slicing ====================

            /**
             * Creates a sub-view starting at offset with specified length.
             * Capabilities are inherited.
             *
             * @throws std::out_of_range if offset + length > size()
             */
            [[nodiscard]] BufferView slice(size_t offset, size_t length) const;

            // ==================== Little-Endian Read Operations ====================

            /**
             * Reads an unsigned 8-bit integer.
             *
             * @throws std::out_of_range if offset >= size()
             */
            [[nodiscard]] uint8_t read_u8(size_t offset) const;

            /**
             * Reads an unsigned 16-bit integer (Little-Endian).
             *
             * @throws std::out_of_range if offset + 2 > size()
             */
            [[nodiscard]] uint16_t read_u16_le(size_t offset) const;

            /**
             * Reads an unsigned 32-bit integer (Little-Endian).
             *
             * @throws std::out_of_range if offset + 4 > size()
             */
            [[nodiscard]] uint32_t read_u32_le(size_t offset) const;

            /**
             * Reads an unsigned 64-bit integer (Little-Endian).
             *
             * @throws std::out_of_range if offset + 8 > size()
             */
            [[nodiscard]] uint64_t read_u64_le(size_t offset) const;

            // ==================== Little-Endian Write Operations ====================

            /**
             * Writes an unsigned 8-bit integer.
             *
             * @throws std::out_of_range if offset >= size()
             * @throws std::logic_error if the view is not mutable
             */
            void write_u8(size_t offset, uint8_t value) const;

            /**
             * Writes an unsigned 16-bit integer (Little-Endian).
             *
             * @throws std::out_of_range if offset + 2 > size()
             * @throws std::logic_error if the view is not mutable
             */
            void write_u16_le(size_t offset, uint16_t value) const;

            /**
             * Writes an unsigned 32-bit integer (Little-Endian).
             *
             * @throws std::out_of_range if offset + 4 > size()
             * @throws std::logic_error if the view is not mutable
             */
            void write_u32_le(size_t offset, uint32_t value) const;

            /**
             * Writes an unsigned 64-bit integer (Little-Endian).
             *
             * @throws std::out_of_range if offset + 8 > size()
             * @throws std::logic_error if the view is not mutable
             */
            void write_u64_le(size_t offset, uint64_t value) const;

            /**
             * Writes ASCII bytes without a length prefix.
             * Characters outside 0..127 are written as '?'.
             *
             * @throws std::out_of_range if offset + value.size() > size()
             * @throws std::logic_error if the view is not mutable
             */
            void write_ascii(size_t offset, std::string_view value) const;

            // ==================== Atomic Operations ====================

            /**
             * Returns true if a width-byte atomic operation is possible at offset:
             * the view is atomic-capable and the address is naturally aligned.
             */
            [[nodiscard]] bool can_fetch_add(size_t offset, size_t width) const noexcept;

            /**
             * Atomically adds delta and returns the previous value.
             *
             * @throws std::logic_error if can_fetch_add(offset, N) is false
             */
            uint16_t fetch_add_u16(size_t offset, uint16_t delta) const;
            uint32_t fetch_add_u32(size_t offset, uint32_t delta) const;
            uint64_t fetch_add_u64(size_t offset, uint64_t delta) const;

            // ==================== Bulk Operations ====================

            /**
             * Copies data from source buffer to this buffer.
             *
             * @throws std::out_of_range if bounds are violated
             * @throws std::logic_error if the view is not mutable
             */
            void copy_from(size_t offset, BufferView src, size_t src_offset, size_t length) const;

            /**
             * Fills a region with a specific byte value.
             *
             * @throws std::out_of_range if offset + length > size()
             * @throws std::logic_error if the view is not mutable
             */
            void fill(size_t offset, size_t length, std::byte value) const;

            /**
             * Fills the entire buffer with zeros. No-op on read-only views.
             */
            void zero_fill() const noexcept;

            // ==================== CRC Computation ====================

            /**
             * Computes CRC32C checksum over a range.
             *
             * Uses hardware acceleration (SSE4.2 crc32c instruction) when available.
             *
             * @throws std::out_of_range if offset + length > size()
             */
            [[nodiscard]] uint32_t crc32c(size_t offset, size_t length) const;

            /**
             * Computes CRC32C checksum over the entire buffer.
             */
            [[nodiscard]] uint32_t crc32c() const noexcept { return crc32c(0, size_); }

            /**
             * Computes the IEEE 802.3 CRC-32 (reflected polynomial 0xEDB88320)
             * over a range. Matches zlib crc32() and java.util.zip.CRC32.
             *
             * @throws std::out_of_range if offset + length > size()
             */
            [[nodiscard]] uint32_t crc32(size_t offset, size_t length) const;

            [[nodiscard]] uint32_t crc32() const noexcept { return crc32(0, size_); }

            // ==================== String Operations ====================

            /**
             * Creates a string_view from a region of the buffer.
             *
             * @throws std::out_of_range if offset + length > size()
             */
            [[nodiscard]] std::string_view as_string_view(size_t offset, size_t length) const;

        private:
            std::byte* data_;
            size_t size_;
            uint8_t caps_;

            void check_bounds(size_t offset, size_t length) const;
            void check_writable() const;
    };
} // namespace stridedb::core
