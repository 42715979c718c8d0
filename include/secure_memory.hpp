/**
 * @file secure_memory.hpp
 * @brief Zeroization helpers for key material.
 * @author Keytree Project
 * @date 2026
 */

#ifndef SECURE_MEMORY_HPP
#define SECURE_MEMORY_HPP

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <vector>

#if defined(_WIN32) || defined(_WIN64)
    #include <windows.h>
#endif

namespace Keytree {

    /**
     * @brief Optimization-resistant memory zeroization.
     */
    inline void secure_memzero(void* ptr, size_t size) noexcept {
        if (!ptr || size == 0) return;

#if defined(_WIN32) || defined(_WIN64)
        RtlSecureZeroMemory(ptr, size);
#elif defined(__STDC_LIB_EXT1__)
        memset_s(ptr, size, 0, size);
#else
        volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
        while (size--) *p++ = 0;
        std::atomic_thread_fence(std::memory_order_seq_cst);
#endif
    }

    /**
     * @brief Allocator that wipes every block it releases.
     * Used for the HMAC input buffers, which hold private scalars during
     * hardened derivation.
     */
    template <typename T>
    struct zero_allocator {
        using value_type = T;
        zero_allocator() = default;
        template <class U> constexpr zero_allocator(const zero_allocator<U>&) noexcept {}

        T* allocate(std::size_t n) {
            if (n > std::size_t(-1) / sizeof(T)) throw std::bad_alloc();
            if (auto p = static_cast<T*>(std::malloc(n * sizeof(T)))) return p;
            throw std::bad_alloc();
        }

        void deallocate(T* p, std::size_t n) noexcept {
            secure_memzero(p, n * sizeof(T));
            std::free(p);
        }
    };

    template <class T, class U>
    bool operator==(const zero_allocator<T>&, const zero_allocator<U>&) noexcept { return true; }

    template <class T, class U>
    bool operator!=(const zero_allocator<T>&, const zero_allocator<U>&) noexcept { return false; }

    /// Byte buffer wiped on release, including after internal reallocation.
    using SecureBytes = std::vector<uint8_t, zero_allocator<uint8_t>>;

} // namespace Keytree

#endif // SECURE_MEMORY_HPP
