/**
 * @file secure_memory.hpp
 * @brief Byte buffer types and scrubbing helpers for key material.
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

namespace Sigil {

    /// @brief Plain byte buffer used for public data (messages, public keys, signatures).
    using Bytes = std::vector<uint8_t>;

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
     * @brief Zeroize the contents of a byte vector, then empty it.
     */
    template <typename Vector>
    inline void secure_clear(Vector& v) noexcept {
        secure_memzero(v.data(), v.size() * sizeof(typename Vector::value_type));
        v.clear();
    }

    /**
     * @brief Custom allocator ensuring internal reallocations are zeroized.
     * Prevents "ghost data" from remaining in RAM after vector growth.
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

    /// @brief Byte buffer for seeds and scratch secrets; wiped when released.
    using SecureBytes = std::vector<uint8_t, zero_allocator<uint8_t>>;

    /**
     * @brief Constant-time comparison to prevent timing side-channel attacks.
     */
    inline bool constant_time_equal(const uint8_t* a, const uint8_t* b, size_t size) noexcept {
        volatile unsigned char diff = 0;
        for (size_t i = 0; i < size; ++i) {
            diff |= (a[i] ^ b[i]);
        }
        return diff == 0;
    }

} // namespace Sigil

#endif // SECURE_MEMORY_HPP
