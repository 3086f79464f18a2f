/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "boot.h"
#include <array>
#include <utility>
#include "cbor.h"
#include "config.h"
#include "debug.h"
#include "execute.h"
#include "lib.h"

namespace boot
{
    namespace
    {
        constexpr debug::Trace<config::TraceBoot> Debug;

        // [ "/init.wasm" ]
        constexpr auto OpenArgumentsSize = cbor::HeaderSize(1) +
            cbor::HeaderSize(config::BootFile.size()) + config::BootFile.size();
        // [ 39(descriptor), count ]
        constexpr auto ReadArgumentsSize = cbor::HeaderSize(2) +
            cbor::HeaderSize(cbor::tag::Identifier) + 2 * cbor::FixedHeaderSize;
        static_assert(config::ChunkSize <= 0xffff'ffff);

        [[noreturn]] void InternalError() { panic("BIOS: internal error"); }

        // The host only refuses to start a call if the BIOS passed bad arguments
        RunResult Started(const result::Maybe<bool>& completedNow)
        {
            if (!completedNow)
                InternalError();
            return *completedNow ? RunResult::RunNext : RunResult::Return;
        }

        RunResult InvokeOpen(const component::Address& address)
        {
            std::array<uint8_t, OpenArgumentsSize> buffer;
            cbor::Writer writer(buffer);
            writer.Header(cbor::MajorType::Array, 1);
            writer.String(config::BootFile);
            assert(writer.Length() == buffer.size());

            Debug("boot: opening ", config::BootFile, " on ", address, "\n");
            return Started(component::Invoke(address, "open", writer.Data()));
        }

        RunResult InvokeRead(const component::Address& address, const descriptor::Owned& descriptor)
        {
            std::array<uint8_t, ReadArgumentsSize> buffer;
            cbor::Writer writer(buffer);
            writer.Header(cbor::MajorType::Array, 2);
            writer.Header(cbor::MajorType::Tag, cbor::tag::Identifier);
            writer.FixedHeader(cbor::MajorType::UnsignedInteger, descriptor.AsRaw());
            writer.FixedHeader(cbor::MajorType::UnsignedInteger, static_cast<uint32_t>(config::ChunkSize));
            assert(writer.Length() == buffer.size());
            return Started(component::Invoke(address, "read", writer.Data()));
        }

        /*
         * Decodes the header of the only item of a call result, which is
         * encoded as an array holding the return values. Panics with
         * message if there is not exactly one return value.
         */
        result::Maybe<cbor::Header> DecodeSingleResult(std::span<const uint8_t> data, const char* message)
        {
            const auto array = cbor::DecodeHeader(data);
            if (!array)
                return result::Error(array.error());
            if (array->type != cbor::MajorType::Array || array->count != 1)
                panic(message);
            return cbor::DecodeHeader(array->rest);
        }

        // Where to continue once the boot file cannot be opened
        State NextCandidate(UuidSource source)
        {
            if (auto scan = std::get_if<FromScan>(&source); scan != nullptr)
                return state::Scanning{ std::move(scan->listing) };
            return state::StartScan{};
        }

        result::Maybe<Step> Handle(state::Init)
        {
            auto listing = component::StartListing(config::EepromComponentType);
            const auto eeprom = listing.Next();
            if (!eeprom)
                panic("BIOS: no EEPROM");

            Debug("boot: reading boot device from ", *eeprom, "\n");
            return Step{ Started(component::Invoke(*eeprom, "getData")), state::ReadingBootDeviceUuid{} };
        }

        result::Maybe<Step> Handle(state::ReadingBootDeviceUuid)
        {
            std::array<uint8_t, config::EepromResultSize> buffer;
            const auto reply = component::InvokeEnd(buffer);
            if (!reply)
                return result::Error(reply.error());

            const auto data = DecodeSingleResult(*reply, "BIOS: eeprom.getData bad");
            if (!data)
                return result::Error(data.error());
            if (data->type != cbor::MajorType::Bytes || data->rest.size() != data->count)
                panic("BIOS: eeprom.getData bad");

            // Anything but a binary UUID means there is no boot device set
            if (const auto bootDevice = component::Address::FromBytes(data->rest); bootDevice) {
                // The buffer only fits the type we are after, so any failure
                // means the device is missing or of a different type
                std::array<char, config::BootableComponentType.size()> typeBuffer;
                const auto type = component::Type(*bootDevice, typeBuffer);
                if (type && *type == config::BootableComponentType) {
                    return Step{ InvokeOpen(*bootDevice),
                                 state::OpeningFile{ *bootDevice, FromConfiguredDevice{} } };
                }
                Debug("boot: configured boot device ", *bootDevice, " unusable\n");
            }

            return Step{ RunResult::RunNext, state::StartScan{} };
        }

        result::Maybe<Step> Handle(state::StartScan)
        {
            Debug("boot: scanning for bootable media\n");
            return Step{ RunResult::RunNext,
                         state::Scanning{ component::StartListing(config::BootableComponentType) } };
        }

        result::Maybe<Step> Handle(state::Scanning scanning)
        {
            const auto address = scanning.listing.Next();
            if (!address)
                panic("BIOS: no bootable medium");

            return Step{ InvokeOpen(*address),
                         state::OpeningFile{ *address, FromScan{ std::move(scanning.listing) } } };
        }

        result::Maybe<Step> Handle(state::OpeningFile opening)
        {
            std::array<uint8_t, config::OpenResultSize> buffer;
            const auto reply = component::InvokeEnd(buffer);
            if (!reply) {
                if (reply.error() != error::Code::Other)
                    panic("BIOS: filesystem.open bad");
                // Open failed, most likely because the file does not exist
                Debug("boot: cannot open ", config::BootFile, " on ", opening.address, "\n");
                return Step{ RunResult::RunNext, NextCandidate(std::move(opening.source)) };
            }

            const auto item = DecodeSingleResult(*reply, "BIOS: filesystem.open bad");
            if (!item)
                return result::Error(item.error());
            if (item->type != cbor::MajorType::Tag || item->count != cbor::tag::Identifier)
                panic("BIOS: filesystem.open bad");

            const auto value = cbor::DecodeHeader(item->rest);
            if (!value)
                return result::Error(value.error());
            if (value->type != cbor::MajorType::UnsignedInteger || value->count > 0xffff'ffff)
                panic("BIOS: filesystem.open bad");

            // An Identifier-tagged integer is only ever a freshly handed out descriptor
            descriptor::Owned descriptor{ static_cast<descriptor::Number>(value->count) };
            const auto completion = InvokeRead(opening.address, descriptor);
            return Step{ completion, state::ReadingFile{ std::move(descriptor), opening.address } };
        }

        result::Maybe<Step> Handle(state::ReadingFile reading)
        {
            std::array<uint8_t, config::ReadResultSize> buffer;
            const auto reply = component::InvokeEnd(buffer);
            if (!reply)
                return result::Error(reply.error());

            const auto item = DecodeSingleResult(*reply, "BIOS: I/O error reading /init.wasm");
            if (!item)
                return result::Error(item.error());

            if (item->type == cbor::MajorType::Bytes && item->count <= item->rest.size()) {
                const auto added = execute::Add(item->rest.first(item->count));
                if (!added)
                    return result::Error(added.error());
                const auto completion = InvokeRead(reading.address, reading.descriptor);
                return Step{ completion, std::move(reading) };
            }
            if (item->type == cbor::MajorType::Special && item->count == cbor::special::Null) {
                Debug("boot: starting ", config::BootFile, "\n");
                reading.descriptor.Release();
                execute::Execute();
            }
            panic("BIOS: I/O error reading /init.wasm");
        }
    } // namespace

    result::Maybe<Step> RunStep(State current)
    {
        return std::visit([](auto&& s) { return Handle(std::move(s)); }, std::move(current));
    }

    void Run(State& slot)
    {
        while (true) {
            auto step = RunStep(std::exchange(slot, state::Init{}));
            if (!step)
                InternalError();

            slot = std::move(step->next);
            if (step->result == RunResult::Return)
                return;
        }
    }
}
