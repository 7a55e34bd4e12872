/**
 * @file secure_string.hpp
 * @brief Memory-hardened containers for secrets, share values and passphrases.
 * @author Arkenstone Project
 * @date 2026
 */

#ifndef SECURE_STRING_HPP
#define SECURE_STRING_HPP

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string>
#include <vector>

#if defined(_WIN32) || defined(_WIN64)
    #include <windows.h>
#endif

namespace Arkenstone {

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
     * Reallocations during vector growth leave no copy of the old contents behind.
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

    /**
     * @brief Byte buffer for master secrets, fragments and cipher halves.
     */
    using SecureBytes = std::vector<uint8_t, zero_allocator<uint8_t>>;

    /**
     * @brief Constant-time equality of two byte ranges of the same length.
     */
    inline bool constant_time_equal(const uint8_t* a, const uint8_t* b, size_t size) noexcept {
        volatile unsigned char diff = 0;
        for (size_t i = 0; i < size; ++i) {
            diff |= (a[i] ^ b[i]);
        }
        return diff == 0;
    }

    /**
     * @class secure_string
     * @brief RAII container for passphrases and mnemonic text.
     * Copying is deleted so a secret has a single owner.
     */
    class secure_string {
    private:
        std::vector<char, zero_allocator<char>> buffer;

    public:
        secure_string() = default;

        explicit secure_string(const std::string& str)
            : buffer(str.begin(), str.end()) {}

        secure_string(const char* str) {
            if (str) buffer.assign(str, str + std::strlen(str));
        }

        ~secure_string() = default; // Zeroization handled by allocator

        secure_string(const secure_string&) = delete;
        secure_string& operator=(const secure_string&) = delete;

        secure_string(secure_string&&) noexcept = default;
        secure_string& operator=(secure_string&&) noexcept = default;

        char* data() { return buffer.data(); }
        const char* data() const { return buffer.data(); }
        size_t size() const { return buffer.size(); }
        bool empty() const { return buffer.empty(); }

        void push_back(char c) { buffer.push_back(c); }

        void clear() { buffer.clear(); }

        /**
         * @brief True if every character is printable 7-bit ASCII (32..126).
         */
        bool isPrintableAscii() const {
            for (char c : buffer) {
                const auto u = static_cast<unsigned char>(c);
                if (u < 32 || u > 126) return false;
            }
            return true;
        }

        /**
         * @brief Copy of the contents as raw bytes, held in zeroizing memory.
         */
        SecureBytes bytes() const {
            return SecureBytes(buffer.begin(), buffer.end());
        }

        /**
         * @brief Constant-time comparison to prevent timing side-channel attacks.
         */
        bool operator==(const secure_string& other) const {
            if (size() != other.size()) return false;
            return constant_time_equal(reinterpret_cast<const uint8_t*>(buffer.data()),
                                       reinterpret_cast<const uint8_t*>(other.buffer.data()),
                                       size());
        }
    };

} // namespace Arkenstone

#endif
