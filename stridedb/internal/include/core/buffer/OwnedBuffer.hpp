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

// internal/include/core/buffer/OwnedBuffer.hpp
#pragma once

#include "BufferView.hpp"
#include <memory>

namespace stridedb::core {
    /**
     * OwnedBuffer - RAII-managed buffer with aligned allocation.
     *
     * Owns a contiguous block of memory with the requested alignment.
     * Memory is freed when the buffer is destroyed or moved from.
     *
     * Views handed out by an OwnedBuffer carry CAP_ALL: the memory is
     * private, writable and suitable for atomic increments on aligned fields.
     *
     * Typical usage:
     * ```cpp
     * auto buf = OwnedBuffer::allocate(capacity * slot_size, 64);
     * buf.zero_fill();
     * auto view = buf.view();
     * view.write_u32_le(4, stride);
     * ```
     *
     * Thread-safety: NOT thread-safe. Caller must ensure exclusive access.
     */
    class OwnedBuffer {
        public:
            /**
             * Constructs an empty buffer.
             */
            OwnedBuffer() noexcept = default;

            /**
             * Allocates a new buffer with specified size and alignment.
             *
             * @param size Size in bytes
             * @param alignment Buffer alignment (must be power of 2)
             * @return Newly allocated buffer
             * @throws std::bad_alloc if allocation fails
             * @throws std::invalid_argument if alignment is not power of 2
             */
            [[nodiscard]] static OwnedBuffer allocate(size_t size, size_t alignment = 64);

            OwnedBuffer(OwnedBuffer&& other) noexcept = default;
            OwnedBuffer& operator=(OwnedBuffer&& other) noexcept = default;

            OwnedBuffer(const OwnedBuffer&) = delete;
            OwnedBuffer& operator=(const OwnedBuffer&) = delete;

            /**
             * Returns a BufferView over the entire buffer.
             */
            [[nodiscard]] BufferView view() const noexcept { return BufferView{data_.get(), size_, BufferView::CAP_ALL}; }

            [[nodiscard]] std::byte* data() noexcept { return data_.get(); }

            [[nodiscard]] const std::byte* data() const noexcept { return data_.get(); }

            [[nodiscard]] size_t size() const noexcept { return size_; }

            [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

            /**
             * Fills the entire buffer with zeros.
             */
            void zero_fill() noexcept { if (data_ && size_ > 0) { view().zero_fill(); } }

        private:
            /**
             * Custom deleter for aligned memory.
             *
             * Uses platform-specific aligned deallocation:
             * - Windows: _aligned_free
             * - POSIX: free
             */
            struct AlignedDeleter {
                void operator()(std::byte* ptr) const noexcept;
            };

            std::unique_ptr<std::byte[], AlignedDeleter> data_;
            size_t size_{0};

            OwnedBuffer(std::byte* data, size_t size) noexcept : data_{data}, size_{size} {}
    };
} // namespace stridedb::core
