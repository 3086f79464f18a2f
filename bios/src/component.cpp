/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "component.h"
#include <algorithm>
#include "config.h"
#include "debug.h"
#include "lib.h"

namespace component
{
    namespace
    {
        constexpr debug::Trace<config::TraceComponent> Debug;

        result::Maybe<bool> ConvertInvokeResult(const int32_t rc)
        {
            if (rc < 0)
                return result::Error(error::FromHost(rc));
            return rc != 0;
        }
    }

    std::optional<Address> Address::FromBytes(std::span<const uint8_t> data)
    {
        Address address;
        if (data.size() != address.bytes.size())
            return {};
        std::copy(data.begin(), data.end(), address.bytes.begin());
        return address;
    }

    Listing& Listing::operator=(Listing&& other) noexcept
    {
        active = other.active;
        other.active = false;
        return *this;
    }

    std::optional<Address> Listing::Next()
    {
        if (!active)
            return {};

        Address address;
        const auto rc = host_component_list_next(address.bytes.data());
        if (rc < 0)
            panic("BIOS: internal error");
        if (rc == 0) {
            active = false;
            return {};
        }
        Debug("component: listed ", address, "\n");
        return address;
    }

    Listing StartListing(std::optional<std::string_view> type)
    {
        const auto rc = type ? host_component_list_start(type->data(), type->size())
                             : host_component_list_start(nullptr, 0);
        if (rc < 0)
            panic("BIOS: internal error");

        Listing listing;
        listing.active = true;
        return listing;
    }

    result::Maybe<std::string_view> Type(const Address& address, std::span<char> buffer)
    {
        const auto rc = host_component_type(address.bytes.data(), buffer.data(), buffer.size());
        if (rc < 0)
            return result::Error(error::FromHost(rc));
        return std::string_view{ buffer.data(), static_cast<size_t>(rc) };
    }

    result::Maybe<bool> Invoke(const Address& address, std::string_view method, std::span<const uint8_t> params)
    {
        Debug("component: ", address, ".", method, "\n");
        return ConvertInvokeResult(
            host_component_invoke(address.bytes.data(), method.data(), method.size(), params.data()));
    }

    result::Maybe<bool> Invoke(const Address& address, std::string_view method)
    {
        Debug("component: ", address, ".", method, "\n");
        return ConvertInvokeResult(
            host_component_invoke(address.bytes.data(), method.data(), method.size(), nullptr));
    }

    result::Maybe<std::span<const uint8_t>> InvokeEnd(std::span<uint8_t> buffer)
    {
        const auto rc = host_component_invoke_end(buffer.data(), buffer.size());
        if (rc < 0)
            return result::Error(error::FromHost(rc));
        return std::span<const uint8_t>{ buffer.first(static_cast<size_t>(rc)) };
    }
}
