/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "descriptor.h"
#include <ocbios/host.h>

namespace descriptor
{
    Owned& Owned::operator=(Owned&& other) noexcept
    {
        if (this != &other) {
            Release();
            number = other.number;
            valid = other.valid;
            other.valid = false;
        }
        return *this;
    }

    void Owned::Release()
    {
        if (!valid)
            return;
        valid = false;
        // Only fails for a descriptor that is not ours
        static_cast<void>(host_descriptor_close(number));
    }
}
