#pragma once

#include <memory>
#include <cstdlib>
#include <cstddef>
#include <new>

namespace core {

struct AlignedDeleter {
    void operator()(void* ptr) const {
        std::free(ptr);
    }
};

/**
 * Allocates memory aligned to the specified boundary.
 * Default alignment is 64 bytes (one cache line, enough for SIMD row copies).
 * Throws std::bad_alloc on failure.
 */
template<typename T>
std::unique_ptr<T, AlignedDeleter> allocate_aligned(size_t count, size_t alignment = 64) {
    size_t size = count * sizeof(T);
    // aligned_alloc requires size to be a multiple of alignment
    if (size == 0 || size % alignment != 0) {
        size = ((size / alignment) + 1) * alignment;
    }

    void* ptr = std::aligned_alloc(alignment, size);
    if (!ptr) {
        throw std::bad_alloc();
    }

    return std::unique_ptr<T, AlignedDeleter>(static_cast<T*>(ptr));
}

} // namespace core
