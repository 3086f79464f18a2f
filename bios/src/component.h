/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <ocbios/host.h>
#include "result.h"

namespace component
{
    struct Address {
        std::array<uint8_t, HOST_UUID_LENGTH> bytes{};

        static std::optional<Address> FromBytes(std::span<const uint8_t> data);

        bool operator==(const Address&) const = default;
    };

    /*
     * A component listing in progress. The host keeps a single listing
     * cursor, so only one Listing should be advanced at any given time.
     */
    class Listing
    {
      public:
        Listing(Listing&& other) noexcept : active(other.active) { other.active = false; }
        Listing& operator=(Listing&& other) noexcept;
        Listing(const Listing&) = delete;
        Listing& operator=(const Listing&) = delete;

        std::optional<Address> Next();

      private:
        friend Listing StartListing(std::optional<std::string_view>);
        Listing() = default;

        bool active = false;
    };

    Listing StartListing(std::optional<std::string_view> type);

    // Retrieves the type of a component into buffer
    result::Maybe<std::string_view> Type(const Address& address, std::span<char> buffer);

    // Starts a method call; yields true if the result can be collected now
    result::Maybe<bool> Invoke(const Address& address, std::string_view method, std::span<const uint8_t> params);
    result::Maybe<bool> Invoke(const Address& address, std::string_view method);

    // Collects the result of the method call started last
    result::Maybe<std::span<const uint8_t>> InvokeEnd(std::span<uint8_t> buffer);
}
