/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <cstdint>

namespace descriptor
{
    using Number = uint32_t;

    /*
     * Owns a descriptor handed out by the host; the descriptor is closed once
     * the Owned goes away. Only construct this from a number that arrived as
     * an Identifier-tagged item in a host reply, as nothing else hands
     * ownership to the BIOS.
     */
    class Owned
    {
      public:
        explicit Owned(Number number) : number(number), valid(true) {}
        ~Owned() { Release(); }

        Owned(Owned&& other) noexcept : number(other.number), valid(other.valid) { other.valid = false; }
        Owned& operator=(Owned&& other) noexcept;
        Owned(const Owned&) = delete;
        Owned& operator=(const Owned&) = delete;

        Number AsRaw() const { return number; }

        // Closes the descriptor now rather than on destruction
        void Release();

      private:
        Number number;
        bool valid;
    };
}
