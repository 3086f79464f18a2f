/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <cstddef>
#include <span>
#include <utility>

namespace console
{
    inline constexpr size_t TraceSize = 1024;

    void put_char(int ch);

    // Returns the oldest part of the trace ring first; the second span is
    // empty unless the ring has wrapped
    std::pair<std::span<const char>, std::span<const char>> GetTrace();
} // namespace console
