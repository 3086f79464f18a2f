/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "boot.h"

namespace
{
    // Survives between timeslices; the host calls run() once per timeslice
    boot::State currentState;
}

extern "C" int run(int)
{
    boot::Run(currentState);
    return 0;
}
