/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <cstddef>
#include <string_view>

#ifndef OCBIOS_TRACE
#define OCBIOS_TRACE 0
#endif

namespace config
{
    inline constexpr std::string_view BootFile = "/init.wasm";
    inline constexpr std::string_view BootableComponentType = "filesystem";
    inline constexpr std::string_view EepromComponentType = "eeprom";

    // Bytes requested per filesystem.read call
    inline constexpr size_t ChunkSize = 16384;

    // An EEPROM data area is at most 256 bytes; the rest is CBOR overhead
    inline constexpr size_t EepromResultSize = 300;
    // Either a descriptor, or null followed by the filename
    inline constexpr size_t OpenResultSize = 32 + BootFile.size();
    inline constexpr size_t ReadResultSize = 32 + ChunkSize;

    inline constexpr bool TraceBoot = OCBIOS_TRACE != 0;
    inline constexpr bool TraceComponent = OCBIOS_TRACE != 0;
}
