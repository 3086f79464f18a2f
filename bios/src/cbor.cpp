/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "cbor.h"
#include "lib.h"

namespace cbor
{
    namespace
    {
        // Count selector values that move the count out of the initial byte
        inline constexpr uint8_t OneByteCount = 24;
        inline constexpr uint8_t TwoByteCount = 25;
        inline constexpr uint8_t FourByteCount = 26;
        inline constexpr uint8_t EightByteCount = 27;

        constexpr uint8_t InitialByte(const MajorType type, const uint8_t selector)
        {
            auto major = static_cast<uint8_t>(type);
            if (type == MajorType::Float)
                major = static_cast<uint8_t>(MajorType::Special);
            return (major << 5) | selector;
        }

        MajorType DecodeMajorType(const uint8_t initial)
        {
            const auto selector = initial & 31;
            switch (initial >> 5) {
                case 0:
                    return MajorType::UnsignedInteger;
                case 1:
                    return MajorType::NegativeInteger;
                case 2:
                    return MajorType::Bytes;
                case 3:
                    return MajorType::String;
                case 4:
                    return MajorType::Array;
                case 5:
                    return MajorType::Map;
                case 6:
                    return MajorType::Tag;
                default:
                    if (selector >= TwoByteCount && selector <= EightByteCount)
                        return MajorType::Float;
                    return MajorType::Special;
            }
        }
    } // namespace

    result::Maybe<Header> DecodeHeader(std::span<const uint8_t> data)
    {
        if (data.empty())
            return result::Error(error::Code::BufferTooShort);

        const auto initial = data.front();
        data = data.subspan(1);

        const auto type = DecodeMajorType(initial);
        const uint8_t selector = initial & 31;
        if (selector < OneByteCount)
            return Header{ type, selector, data };

        size_t countBytes;
        switch (selector) {
            case OneByteCount:
                countBytes = 1;
                break;
            case TwoByteCount:
                countBytes = 2;
                break;
            case FourByteCount:
                countBytes = 4;
                break;
            case EightByteCount:
                countBytes = 8;
                break;
            default:
                return result::Error(error::Code::CborDecode);
        }
        if (data.size() < countBytes)
            return result::Error(error::Code::CborDecode);

        uint64_t count = 0;
        for (const auto byte : data.first(countBytes))
            count = (count << 8) | byte;
        return Header{ type, count, data.subspan(countBytes) };
    }

    void Writer::Put(const uint8_t byte)
    {
        assert(offset < buffer.size());
        buffer[offset++] = byte;
    }

    void Writer::Header(const MajorType type, const uint64_t count)
    {
        switch (HeaderSize(count)) {
            case 1:
                Put(InitialByte(type, static_cast<uint8_t>(count)));
                return;
            case 2:
                Put(InitialByte(type, OneByteCount));
                break;
            case 3:
                Put(InitialByte(type, TwoByteCount));
                break;
            case 5:
                Put(InitialByte(type, FourByteCount));
                break;
            default:
                Put(InitialByte(type, EightByteCount));
                break;
        }
        for (auto shift = 8 * (HeaderSize(count) - 1); shift > 0; shift -= 8)
            Put(static_cast<uint8_t>(count >> (shift - 8)));
    }

    void Writer::FixedHeader(const MajorType type, const uint32_t count)
    {
        Put(InitialByte(type, FourByteCount));
        for (int shift = 24; shift >= 0; shift -= 8)
            Put(static_cast<uint8_t>(count >> shift));
    }

    void Writer::String(std::string_view s)
    {
        Header(MajorType::String, s.size());
        for (const auto ch : s)
            Put(static_cast<uint8_t>(ch));
    }
}
