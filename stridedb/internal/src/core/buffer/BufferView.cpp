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

// internal/src/core/buffer/BufferView.cpp
#include "core/buffer/BufferView.hpp"

#include <array>
#include <atomic>
#include <bit>
#include <stdexcept>
#include <cstring>

static_assert(std::endian::native == std::endian::little, "StrideDB requires Little-Endian architecture");


#if defined(__SSE4_2__) || \
(defined(_MSC_VER) && (defined(_M_X64) || defined(_M_IX86)))
#define STRIDEDB_HAS_SSE42 1
#else
#define STRIDEDB_HAS_SSE42 0
#endif

#if STRIDEDB_HAS_SSE42
#include <nmmintrin.h>
#endif


namespace stridedb::core {
    namespace {
        template <typename T>
        T fetch_add_impl(std::byte* ptr, T delta) {
            std::atomic_ref<T> ref{*reinterpret_cast<T*>(ptr)};
            return ref.fetch_add(delta, std::memory_order_acq_rel);
        }

        constexpr std::array<uint32_t, 256> make_crc32_table() noexcept {
            constexpr uint32_t POLY = 0xEDB88320;
            std::array<uint32_t, 256> table{};
            for (uint32_t i = 0; i < 256; ++i) {
                uint32_t crc = i;
                for (int j = 0; j < 8; ++j) { crc = (crc >> 1) ^ (POLY & (0u - (crc & 1u))); }
                table[i] = crc;
            }
            return table;
        }

        constexpr auto CRC32_TABLE = make_crc32_table();
    } // anonymous namespace

    // ==================== Slicing ====================

    BufferView BufferView::slice(size_t offset, size_t length) const {
        check_bounds(offset, length);
        return BufferView{data_ + offset, length, caps_};
    }

    // ==================== Little-Endian Read Operations ====================

    uint8_t BufferView::read_u8(size_t offset) const {
        check_bounds(offset, 1);
        return static_cast<uint8_t>(data_[offset]);
    }

    uint16_t BufferView::read_u16_le(size_t offset) const {
        check_bounds(offset, 2);
        uint16_t value;
        std::memcpy(&value, data_ + offset, 2);
        return value;
    }

    uint32_t BufferView::read_u32_le(size_t offset) const {
        check_bounds(offset, 4);
        uint32_t value;
        std::memcpy(&value, data_ + offset, 4);
        return value;
    }

    uint64_t BufferView::read_u64_le(size_t offset) const {
        check_bounds(offset, 8);
        uint64_t value;
        std::memcpy(&value, data_ + offset, 8);
        return value;
    }

    // ==================== Little-Endian Write Operations ====================

    void BufferView::write_u8(size_t offset, uint8_t value) const {
        check_writable();
        check_bounds(offset, 1);
        data_[offset] = static_cast<std::byte>(value);
    }

    void BufferView::write_u16_le(size_t offset, uint16_t value) const {
        check_writable();
        check_bounds(offset, 2);
        std::memcpy(data_ + offset, &value, 2);
    }

    void BufferView::write_u32_le(size_t offset, uint32_t value) const {
        check_writable();
        check_bounds(offset, 4);
        std::memcpy(data_ + offset, &value, 4);
    }

    void BufferView::write_u64_le(size_t offset, uint64_t value) const {
        check_writable();
        check_bounds(offset, 8);
        std::memcpy(data_ + offset, &value, 8);
    }

    void BufferView::write_ascii(size_t offset, std::string_view value) const {
        check_writable();
        check_bounds(offset, value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            const auto c = static_cast<unsigned char>(value[i]);
            data_[offset + i] = static_cast<std::byte>(c > 127 ? '?' : c);
        }
    }

    // ==================== Atomic Operations ====================

    bool BufferView::can_fetch_add(size_t offset, size_t width) const noexcept {
        if (!is_atomic() || !is_mutable()) { return false; }
        if (offset + width > size_ || offset + width < offset) { return false; }
        return (reinterpret_cast<uintptr_t>(data_ + offset) % width) == 0;
    }

    uint16_t BufferView::fetch_add_u16(size_t offset, uint16_t delta) const {
        if (!can_fetch_add(offset, 2)) { throw std::logic_error("BufferView::fetch_add_u16: atomic access not supported at offset"); }
        return fetch_add_impl<uint16_t>(data_ + offset, delta);
    }

    uint32_t BufferView::fetch_add_u32(size_t offset, uint32_t delta) const {
        if (!can_fetch_add(offset, 4)) { throw std::logic_error("BufferView::fetch_add_u32: atomic access not supported at offset"); }
        return fetch_add_impl<uint32_t>(data_ + offset, delta);
    }

    uint64_t BufferView::fetch_add_u64(size_t offset, uint64_t delta) const {
        if (!can_fetch_add(offset, 8)) { throw std::logic_error("BufferView::fetch_add_u64: atomic access not supported at offset"); }
        return fetch_add_impl<uint64_t>(data_ + offset, delta);
    }

    // ==================== Bulk Operations ====================

    void BufferView::copy_from(size_t offset, BufferView src, size_t src_offset, size_t length) const {
        check_writable();
        check_bounds(offset, length);
        src.check_bounds(src_offset, length);
        std::memmove(data_ + offset, src.data_ + src_offset, length);
    }

    void BufferView::fill(size_t offset, size_t length, std::byte value) const {
        check_writable();
        check_bounds(offset, length);
        std::memset(data_ + offset, static_cast<int>(value), length);
    }

    void BufferView::zero_fill() const noexcept {
        if (data_ && size_ > 0 && is_mutable()) {
            std::memset(data_, 0, size_);
        }
    }

    // ==================== CRC Computation ====================

    uint32_t BufferView::crc32c(size_t offset, size_t length) const {
        check_bounds(offset, length);

        uint32_t crc = 0xFFFFFFFF;
        const auto* ptr = reinterpret_cast<const uint8_t*>(data_ + offset);

#if STRIDEDB_HAS_SSE42
        size_t remaining = length;

        while (remaining >= 8) {
            uint64_t chunk;
            std::memcpy(&chunk, ptr, 8);
            crc = static_cast<uint32_t>(_mm_crc32_u64(crc, chunk));
            ptr += 8;
            remaining -= 8;
        }

        while (remaining > 0) {
            crc = _mm_crc32_u8(crc, *ptr);
            ++ptr;
            --remaining;
        }
#else
        static constexpr uint32_t poly = 0x82F63B78;

        for (size_t i = 0; i < length; ++i) {
            crc ^= ptr[i];
            for (int j = 0; j < 8; ++j) { crc = (crc >> 1) ^ (poly & (0u - (crc & 1u))); }
        }
#endif

        return ~crc;
    }

    uint32_t BufferView::crc32(size_t offset, size_t length) const {
        check_bounds(offset, length);

        uint32_t crc = 0xFFFFFFFF;
        const auto* ptr = reinterpret_cast<const uint8_t*>(data_ + offset);
        for (size_t i = 0; i < length; ++i) { crc = CRC32_TABLE[(crc ^ ptr[i]) & 0xFFu] ^ (crc >> 8); }

        return ~crc;
    }

    // ==================== String Operations ====================

    std::string_view BufferView::as_string_view(size_t offset, size_t length) const {
        check_bounds(offset, length);
        return {reinterpret_cast<const char*>(data_ + offset), length};
    }

    // ==================== Checks ====================

    void BufferView::check_bounds(size_t offset, size_t length) const {
        if (offset + length > size_ || offset + length < offset) { throw std::out_of_range("BufferView: access out of range"); }
    }

    void BufferView::check_writable() const {
        if (!is_mutable()) { throw std::logic_error("BufferView: cannot write to immutable buffer"); }
    }
} // namespace stridedb::core
