/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "execute.h"
#include <ocbios/host.h>

namespace execute
{
    result::Maybe<void> Add(std::span<const uint8_t> data)
    {
        const auto rc = host_execute_add(data.data(), data.size());
        if (rc < 0)
            return result::Error(error::FromHost(rc));
        return {};
    }

    void Execute()
    {
        host_execute_execute();
    }
}
