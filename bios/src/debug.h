/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <utility>
#include "lib.h"

namespace debug
{
    template<bool Enabled>
    struct Trace
    {
        template<typename... Args>
        void operator()(Args&&... args) const
        {
            if constexpr (Enabled) {
                Print(std::forward<Args>(args)...);
            }
        }
    };
}
