/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#define TS(x) _TS(x)
#define _TS(x) #x
#define _PANIC_LOCATION __FILE__ ":" TS(__LINE__)

#undef assert
#define assert(x) \
    ((x) ? (void)0 : panic("assertion failure: " _PANIC_LOCATION " condition: " TS(x)))

[[noreturn]] void panic(const char* s);

namespace component { struct Address; }

namespace print {
    struct Hex { uintmax_t v; };

    namespace detail {
        void Print(const char*);
        void Print(std::string_view);
        void Print(uintmax_t);
        void Print(Hex);
        void Print(const component::Address&);
    }
}

template<typename... Ts> void Print(Ts... t)
{
    (print::detail::Print(t), ...);
}
