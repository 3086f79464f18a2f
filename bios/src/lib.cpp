/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "lib.h"
#include <ocbios/host.h>
#include "component.h"
#include "console.h"

namespace
{
    const char hextab[] = "0123456789abcdef";

    template<typename Emitter>
    void put8(const uint8_t v, Emitter emit)
    {
        emit(hextab[v >> 4]);
        emit(hextab[v & 0xf]);
    }

    template<typename Emitter>
    void putint(const unsigned int base, const uintmax_t n, Emitter emit)
    {
        // Determine the number of digits we need to print and the maximum divisor
        uintmax_t divisor = 1;
        unsigned int p = 0;
        for (uintmax_t i = n; i >= base; i /= base, p++, divisor *= base)
            /* nothing */;

        // Print from most-to-least significant digit
        for (unsigned int i = 0; i <= p; i++, divisor /= base)
            emit(hextab[(n / divisor) % base]);
    }

    size_t Length(const char* s)
    {
        size_t n = 0;
        while (s[n] != '\0')
            ++n;
        return n;
    }
} // namespace

namespace print::detail
{
    void Print(const char* s)
    {
        for (; *s != '\0'; ++s)
            console::put_char(*s);
    }

    void Print(std::string_view s)
    {
        for (const auto ch : s)
            console::put_char(ch);
    }

    void Print(uintmax_t n) { putint(10, n, console::put_char); }

    void Print(Hex hex) { putint(16, hex.v, console::put_char); }

    // Canonical 8-4-4-4-12 UUID form
    void Print(const component::Address& address)
    {
        for (size_t n = 0; n < address.bytes.size(); ++n) {
            if (n == 4 || n == 6 || n == 8 || n == 10)
                console::put_char('-');
            put8(address.bytes[n], console::put_char);
        }
    }
}

void panic(const char* s)
{
    Print("panic: ", s, "\n");
    host_computer_error(s, Length(s));
}
