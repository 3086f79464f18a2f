/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ocbios/host.h>

namespace error {
    enum class Code {
        MemoryFault = HOST_EMEMORYFAULT,
        CborDecode = HOST_ECBORDECODE,
        StringDecode = HOST_ESTRINGDECODE,
        BufferTooShort = HOST_EBUFFERTOOSHORT,
        NoSuchComponent = HOST_ENOSUCHCOMPONENT,
        NoSuchMethod = HOST_ENOSUCHMETHOD,
        BadParameters = HOST_EBADPARAMETERS,
        QueueFull = HOST_EQUEUEFULL,
        QueueEmpty = HOST_EQUEUEEMPTY,
        BadDescriptor = HOST_EBADDESCRIPTOR,
        TooManyDescriptors = HOST_ETOOMANYDESCRIPTORS,
        Other = HOST_EOTHER,
        Unknown = HOST_EUNKNOWN,
    };

    // Maps a negative host return value to an error code
    inline constexpr Code FromHost(const int rc)
    {
        if (rc < HOST_EUNKNOWN || rc >= 0)
            return Code::Unknown;
        return static_cast<Code>(rc);
    }
}
