/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <cstdint>
#include <span>
#include "result.h"

namespace execute
{
    // Appends data to the image the host will run
    result::Maybe<void> Add(std::span<const uint8_t> data);

    // Hands the accumulated image to the host; does not return
    [[noreturn]] void Execute();
}
