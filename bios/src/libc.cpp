/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <cstddef>
#include <cstdint>
#include "lib.h"

/*
 * The firmware image has no C or C++ runtime, but the compiler may still emit
 * calls to these when copying or clearing memory, registering destructors of
 * globals or failing a std::visit.
 */
namespace
{
    // Helper for memset
    template<typename T>
    size_t Fill(void*& d, size_t sz, T v)
    {
        auto ptr = reinterpret_cast<T*>(d);
        for (size_t n = 0; n < sz / sizeof(T); ++n, ++ptr)
            *ptr = v;
        d = reinterpret_cast<void*>(ptr);
        return (sz / sizeof(T)) * sizeof(T);
    }

    template<typename T>
    size_t Copy(void*& d, const void*& s, size_t sz)
    {
        auto dst = reinterpret_cast<T*>(d);
        auto src = reinterpret_cast<const T*>(s);
        for (size_t n = 0; n < sz / sizeof(T); ++n)
            *dst++ = *src++;
        d = reinterpret_cast<void*>(dst);
        s = reinterpret_cast<const void*>(src);
        return (sz / sizeof(T)) * sizeof(T);
    }
} // namespace

extern "C" {

void* memset(void* p, int c, size_t len)
{
    // Optimised by aligning to a 32-bit address and doing 32-bit operations
    // while possible
    auto dest = p;

    if (len >= 4 && (reinterpret_cast<uintptr_t>(dest) & 3))
        len -= Fill(dest, 4 - (reinterpret_cast<uintptr_t>(dest) & 3), static_cast<uint8_t>(c));
    const uint32_t c32 = static_cast<uint32_t>(c & 0xff) * 0x0101'0101;
    len -= Fill(dest, len, c32);
    Fill(dest, len, static_cast<uint8_t>(c));

    return p;
}

void* memcpy(void* dst, const void* src, size_t len)
{
    auto ret = dst;

    // Only word copies if both sides share the same alignment
    if (((reinterpret_cast<uintptr_t>(dst) ^ reinterpret_cast<uintptr_t>(src)) & 3) == 0) {
        if (len >= 4 && (reinterpret_cast<uintptr_t>(dst) & 3))
            len -= Copy<uint8_t>(dst, src, 4 - (reinterpret_cast<uintptr_t>(dst) & 3));
        len -= Copy<uint32_t>(dst, src, len);
    }
    Copy<uint8_t>(dst, src, len);
    return ret;
}

void* memmove(void* dst, const void* src, size_t len)
{
    auto d = reinterpret_cast<uint8_t*>(dst);
    auto s = reinterpret_cast<const uint8_t*>(src);
    if (d <= s || d >= s + len)
        return memcpy(dst, src, len);

    while (len > 0) {
        --len;
        d[len] = s[len];
    }
    return dst;
}

int memcmp(const void* a, const void* b, size_t len)
{
    auto x = reinterpret_cast<const uint8_t*>(a);
    auto y = reinterpret_cast<const uint8_t*>(b);
    for (size_t n = 0; n < len; ++n) {
        if (x[n] != y[n])
            return x[n] - y[n];
    }
    return 0;
}

[[noreturn]] void abort()
{
    panic("BIOS: internal error");
}

// Globals are never destroyed; the host discards the instance instead
int __cxa_atexit(void (*)(void*), void*, void*)
{
    return 0;
}

}
