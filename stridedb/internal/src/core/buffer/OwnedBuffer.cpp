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

// internal/src/core/buffer/OwnedBuffer.cpp
#include "core/buffer/OwnedBuffer.hpp"
#include <stdexcept>
#include <new>
#include <cstdlib>

#if defined(_WIN32)
#include <malloc.h>  // _aligned_malloc, _aligned_free
#endif

namespace stridedb::core {
    namespace {
        void* allocate_aligned(size_t size, size_t alignment) {
            #if defined(_WIN32)
            return _aligned_malloc(size, alignment);

            #elif defined(__APPLE__) || (defined(__ANDROID__) && __ANDROID_API__ < 28)
            void* ptr = nullptr; if (posix_memalign(&ptr, alignment, size) != 0) { return nullptr; } return ptr;

            #else
            // aligned_alloc requires size to be a multiple of alignment
            const size_t adjusted_size = (size + alignment - 1) & ~(alignment - 1); return std::aligned_alloc(alignment, adjusted_size);
            #endif
        }

        void deallocate_aligned(void* ptr) noexcept {
            #if defined(_WIN32)
            _aligned_free(ptr);
            #else
            std::free(ptr);
            #endif
        }
    } // anonymous namespace

    void OwnedBuffer::AlignedDeleter::operator()(std::byte* ptr) const noexcept {
        if (ptr) { deallocate_aligned(ptr); }
    }

    OwnedBuffer OwnedBuffer::allocate(size_t size, size_t alignment) {
        // Zero-sized buffer is represented as empty OwnedBuffer
        if (size == 0) { return OwnedBuffer{}; }

        if (alignment == 0 || (alignment & (alignment - 1)) != 0) { throw std::invalid_argument("Alignment must be a power of 2"); }

        if (alignment < alignof(std::max_align_t)) { alignment = alignof(std::max_align_t); }

        void* raw_ptr = allocate_aligned(size, alignment);
        if (!raw_ptr) { throw std::bad_alloc{}; }

        return OwnedBuffer{static_cast<std::byte*>(raw_ptr), size};
    }
} // namespace stridedb::core
