/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include "result.h"

namespace cbor
{
    enum class MajorType {
        UnsignedInteger, // value is the count, no payload
        NegativeInteger, // value is -1 - count, no payload
        Bytes,           // count is the number of payload bytes
        String,          // count is the number of UTF-8 payload bytes
        Array,           // count is the number of items following
        Map,             // count is the number of key/value pairs following
        Tag,             // count is the tag number, the tagged item follows
        Special,         // count is the simple value, no payload
        Float,           // count holds the raw IEEE 754 bits, no payload
    };

    namespace tag {
        inline constexpr uint64_t Identifier = 39;
    }

    namespace special {
        inline constexpr uint64_t False = 20;
        inline constexpr uint64_t True = 21;
        inline constexpr uint64_t Null = 22;
        inline constexpr uint64_t Undefined = 23;
    }

    struct Header {
        MajorType type;
        uint64_t count;
        // Everything following the header; this is the payload, if any
        std::span<const uint8_t> rest;
    };

    /*
     * Decodes a single data item header. Only the header is validated: it is
     * up to the caller to verify that rest holds enough bytes for the payload.
     *
     * Fails with BufferTooShort if data is empty, and with CborDecode if the
     * header is truncated or uses a reserved count encoding.
     */
    result::Maybe<Header> DecodeHeader(std::span<const uint8_t> data);

    // Number of bytes the shortest header encoding of count occupies
    constexpr size_t HeaderSize(const uint64_t count)
    {
        if (count <= 23) return 1;
        if (count <= 0xff) return 2;
        if (count <= 0xffff) return 3;
        if (count <= 0xffff'ffff) return 5;
        return 9;
    }

    // Header with the count always stored in four bytes
    inline constexpr size_t FixedHeaderSize = 5;

    class Writer
    {
      public:
        explicit Writer(std::span<uint8_t> buffer) : buffer(buffer) {}

        void Header(MajorType type, uint64_t count);
        void FixedHeader(MajorType type, uint32_t count);
        void String(std::string_view s);

        size_t Length() const { return offset; }
        std::span<const uint8_t> Data() const { return buffer.first(offset); }

      private:
        void Put(uint8_t byte);

        std::span<uint8_t> buffer;
        size_t offset = 0;
    };
}
