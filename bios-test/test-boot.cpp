#include "gtest/gtest.h"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include "stub.h"
#include "../bios/src/boot.h"
#include "../bios/src/config.h"

namespace {
    using Bytes = std::vector<uint8_t>;
    namespace reply = test_stubs::reply;

    const auto eepromAddress = test_stubs::MakeAddress(0x10);
    const auto bootAddress = test_stubs::MakeAddress(0x20);
    const auto otherAddress = test_stubs::MakeAddress(0x30);
    const auto missingAddress = test_stubs::MakeAddress(0x40);
    constexpr uint32_t descriptorNumber = 0x0102'0304;

    Bytes AddressBytes(const component::Address& address)
    {
        return Bytes(address.bytes.begin(), address.bytes.end());
    }

    Bytes OpenArguments()
    {
        return Bytes{ 0x81, 0x6a, '/', 'i', 'n', 'i', 't', '.', 'w', 'a', 's', 'm' };
    }

    Bytes ReadArguments()
    {
        return Bytes{ 0x82, 0xd8, 0x27, 0x1a, 0x01, 0x02, 0x03, 0x04, 0x1a, 0x00, 0x00, 0x40, 0x00 };
    }

    Bytes MakeChunk(size_t length, uint8_t seed)
    {
        Bytes chunk(length);
        for (size_t n = 0; n < length; ++n)
            chunk[n] = static_cast<uint8_t>(seed + n * 7);
        return chunk;
    }

    struct File {
        component::Address filesystem;
        std::vector<Bytes> chunks;
    };

    /*
     * Answers getData, open and read like an EEPROM and a set of filesystems
     * would. Filesystems without an entry in files have no boot file.
     */
    struct Host
    {
        Bytes eepromData;
        std::vector<File> files;
        bool immediate = true;
        std::optional<test_stubs::Reply> openReply;
        std::optional<test_stubs::Reply> readReply;

        size_t chunkIndex = 0;

        void Install()
        {
            test_stubs::SetInvokeFunction([this](const test_stubs::Call& call) { return Handle(call); });
        }

        test_stubs::Reply Handle(const test_stubs::Call& call)
        {
            test_stubs::Reply r;
            r.immediate = immediate;
            if (call.method == "getData") {
                r.data = reply::Single(reply::Bytes(eepromData));
            } else if (call.method == "open") {
                if (openReply) {
                    r = *openReply;
                    r.immediate = immediate;
                } else if (FindFile(call.address) != nullptr) {
                    r.data = reply::Single(reply::Descriptor(descriptorNumber));
                    chunkIndex = 0;
                } else {
                    r.rc = HOST_EOTHER;
                }
            } else if (call.method == "read") {
                const auto file = FindFile(call.address);
                if (readReply) {
                    r = *readReply;
                    r.immediate = immediate;
                } else if (file != nullptr && chunkIndex < file->chunks.size()) {
                    r.data = reply::Single(reply::Bytes(file->chunks[chunkIndex++]));
                } else {
                    r.data = reply::Single(reply::Null());
                }
            } else {
                ADD_FAILURE() << "unexpected method " << call.method;
            }
            return r;
        }

        const File* FindFile(const component::Address& address) const
        {
            auto it = std::find_if(files.begin(), files.end(), [&](const auto& f) {
                return f.filesystem == address;
            });
            return it != files.end() ? &*it : nullptr;
        }
    };

    template<typename Fn>
    std::string CatchAbort(Fn fn)
    {
        try {
            fn();
        } catch (const test_stubs::Aborted& aborted) {
            return aborted.message;
        }
        ADD_FAILURE() << "BIOS did not abort";
        return {};
    }

    // Runs timeslices until the host takes over; yields the number of timeslices
    int RunUntilHandOff(boot::State& slot)
    {
        int timeslices = 0;
        try {
            while (timeslices < 1000) {
                ++timeslices;
                boot::Run(slot);
                EXPECT_TRUE(test_stubs::IsCallOutstanding());
                test_stubs::NextTimeslice();
            }
            ADD_FAILURE() << "BIOS never handed off";
        } catch (const test_stubs::Executed&) {
        }
        return timeslices;
    }

    std::vector<std::string> CalledMethods()
    {
        std::vector<std::string> methods;
        for (const auto& call : test_stubs::GetCalls())
            methods.push_back(call.method);
        return methods;
    }

    struct Boot : ::testing::Test
    {
        Boot()
        {
            test_stubs::ResetFunctions();
            host.Install();
        }

        ~Boot()
        {
            test_stubs::ResetFunctions();
        }

        void SetMachine(std::vector<test_stubs::Component> filesystems)
        {
            filesystems.insert(filesystems.begin(), test_stubs::Component{ eepromAddress, "eeprom" });
            test_stubs::SetComponents(std::move(filesystems));
        }

        // Takes steps from Init up to and including the EEPROM reply
        boot::Step StepThroughEeprom()
        {
            auto init = boot::RunStep(boot::state::Init{});
            EXPECT_TRUE(init.has_value());
            auto step = boot::RunStep(std::move(init->next));
            EXPECT_TRUE(step.has_value());
            return std::move(*step);
        }

        Host host;
    };
}

TEST_F(Boot, Init_Without_Eeprom_Aborts)
{
    test_stubs::SetComponents({ { bootAddress, "filesystem" } });

    EXPECT_EQ("BIOS: no EEPROM", CatchAbort([] { boot::RunStep(boot::state::Init{}); }));
    EXPECT_TRUE(test_stubs::GetCalls().empty());
}

TEST_F(Boot, Init_Reads_Eeprom_Data)
{
    SetMachine({});

    auto step = boot::RunStep(boot::state::Init{});
    ASSERT_TRUE(step.has_value());
    EXPECT_EQ(boot::RunResult::RunNext, step->result);
    EXPECT_TRUE(std::holds_alternative<boot::state::ReadingBootDeviceUuid>(step->next));

    EXPECT_EQ((std::vector<std::string>{ "eeprom" }), test_stubs::GetListingFilters());
    ASSERT_EQ(1u, test_stubs::GetCalls().size());
    const auto& call = test_stubs::GetCalls().front();
    EXPECT_EQ(eepromAddress, call.address);
    EXPECT_EQ("getData", call.method);
    EXPECT_TRUE(call.params.empty());
}

TEST_F(Boot, Init_Yields_While_Call_Is_Pending)
{
    SetMachine({});
    host.immediate = false;

    auto step = boot::RunStep(boot::state::Init{});
    ASSERT_TRUE(step.has_value());
    EXPECT_EQ(boot::RunResult::Return, step->result);
    EXPECT_TRUE(std::holds_alternative<boot::state::ReadingBootDeviceUuid>(step->next));
}

TEST_F(Boot, Configured_Filesystem_Is_Opened)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.eepromData = AddressBytes(bootAddress);

    auto step = StepThroughEeprom();
    EXPECT_EQ(boot::RunResult::RunNext, step.result);
    ASSERT_TRUE(std::holds_alternative<boot::state::OpeningFile>(step.next));
    const auto& opening = std::get<boot::state::OpeningFile>(step.next);
    EXPECT_EQ(bootAddress, opening.address);
    EXPECT_TRUE(std::holds_alternative<boot::FromConfiguredDevice>(opening.source));

    ASSERT_EQ(2u, test_stubs::GetCalls().size());
    const auto& call = test_stubs::GetCalls().back();
    EXPECT_EQ(bootAddress, call.address);
    EXPECT_EQ("open", call.method);
    EXPECT_EQ(OpenArguments(), call.params);
}

TEST_F(Boot, Missing_Configured_Device_Starts_Scan)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.eepromData = AddressBytes(missingAddress);

    auto step = StepThroughEeprom();
    EXPECT_EQ(boot::RunResult::RunNext, step.result);
    ASSERT_TRUE(std::holds_alternative<boot::state::StartScan>(step.next));
    EXPECT_EQ(1u, test_stubs::GetCalls().size());

    auto scan = boot::RunStep(std::move(step.next));
    ASSERT_TRUE(scan.has_value());
    EXPECT_EQ(boot::RunResult::RunNext, scan->result);
    EXPECT_TRUE(std::holds_alternative<boot::state::Scanning>(scan->next));
    EXPECT_EQ((std::vector<std::string>{ "eeprom", "filesystem" }), test_stubs::GetListingFilters());
    EXPECT_EQ(1u, test_stubs::GetCalls().size());
}

TEST_F(Boot, Configured_Device_Of_Other_Type_Starts_Scan)
{
    SetMachine({ { bootAddress, "screen" } });
    host.eepromData = AddressBytes(bootAddress);

    auto step = StepThroughEeprom();
    EXPECT_TRUE(std::holds_alternative<boot::state::StartScan>(step.next));
}

TEST_F(Boot, Configured_Device_With_Longer_Type_Starts_Scan)
{
    // Does not fit the type buffer
    SetMachine({ { bootAddress, "filesystem2" } });
    host.eepromData = AddressBytes(bootAddress);

    auto step = StepThroughEeprom();
    EXPECT_TRUE(std::holds_alternative<boot::state::StartScan>(step.next));
}

TEST_F(Boot, No_Configured_Device_Starts_Scan)
{
    for (const auto& data : { Bytes{}, Bytes(15, 0x20), Bytes(17, 0x20) }) {
        test_stubs::ResetFunctions();
        host.Install();
        SetMachine({ { bootAddress, "filesystem" } });
        host.eepromData = data;

        auto step = StepThroughEeprom();
        EXPECT_TRUE(std::holds_alternative<boot::state::StartScan>(step.next));
    }
}

TEST_F(Boot, Malformed_Eeprom_Reply_Aborts)
{
    SetMachine({});
    const std::vector<Bytes> replies{
        reply::Bytes(AddressBytes(bootAddress)),                 // not wrapped in an array
        { 0x82, 0x40, 0x40 },                                    // two values
        reply::Single({ 0x61, 'a' }),                            // text rather than bytes
        reply::Single({ 0x50, 1, 2, 3 }),                        // truncated byte string
        [] { auto r = reply::Single(reply::Bytes({ 1 })); r.push_back(0); return r; }(), // trailing data
    };
    for (const auto& r : replies) {
        test_stubs::ResetFunctions();
        SetMachine({});
        test_stubs::SetInvokeFunction([&](const test_stubs::Call&) { return test_stubs::Reply{ 0, r, true }; });

        auto init = boot::RunStep(boot::state::Init{});
        ASSERT_TRUE(init.has_value());
        EXPECT_EQ("BIOS: eeprom.getData bad", CatchAbort([&] { boot::RunStep(std::move(init->next)); }));
    }
}

TEST_F(Boot, Undecodable_Eeprom_Reply_Is_An_Error)
{
    SetMachine({});
    test_stubs::SetInvokeFunction([](const test_stubs::Call&) { return test_stubs::Reply{ 0, { 0x81, 0x5c }, true }; });

    auto init = boot::RunStep(boot::state::Init{});
    ASSERT_TRUE(init.has_value());
    auto step = boot::RunStep(std::move(init->next));
    ASSERT_FALSE(step.has_value());
    EXPECT_EQ(error::Code::CborDecode, step.error());
}

TEST_F(Boot, Scan_Opens_Listed_Filesystem)
{
    SetMachine({ { otherAddress, "filesystem" } });

    auto scan = boot::RunStep(boot::state::StartScan{});
    ASSERT_TRUE(scan.has_value());
    auto step = boot::RunStep(std::move(scan->next));
    ASSERT_TRUE(step.has_value());
    ASSERT_TRUE(std::holds_alternative<boot::state::OpeningFile>(step->next));
    const auto& opening = std::get<boot::state::OpeningFile>(step->next);
    EXPECT_EQ(otherAddress, opening.address);
    EXPECT_TRUE(std::holds_alternative<boot::FromScan>(opening.source));

    ASSERT_EQ(1u, test_stubs::GetCalls().size());
    EXPECT_EQ("open", test_stubs::GetCalls().front().method);
    EXPECT_EQ(OpenArguments(), test_stubs::GetCalls().front().params);
}

TEST_F(Boot, Exhausted_Scan_Aborts)
{
    SetMachine({});

    auto scan = boot::RunStep(boot::state::StartScan{});
    ASSERT_TRUE(scan.has_value());
    EXPECT_EQ("BIOS: no bootable medium", CatchAbort([&] { boot::RunStep(std::move(scan->next)); }));
    EXPECT_TRUE(test_stubs::GetCalls().empty());
}

TEST_F(Boot, Failed_Open_On_Configured_Device_Starts_Scan)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.eepromData = AddressBytes(bootAddress);

    auto opening = StepThroughEeprom();
    auto step = boot::RunStep(std::move(opening.next));
    ASSERT_TRUE(step.has_value());
    EXPECT_EQ(boot::RunResult::RunNext, step->result);
    EXPECT_TRUE(std::holds_alternative<boot::state::StartScan>(step->next));
}

TEST_F(Boot, Failed_Open_During_Scan_Continues_Scan)
{
    SetMachine({ { bootAddress, "filesystem" }, { otherAddress, "filesystem" } });
    host.files.push_back(File{ otherAddress, {} });

    boot::State slot{ boot::state::StartScan{} };
    RunUntilHandOff(slot);

    EXPECT_EQ((std::vector<std::string>{ "filesystem" }), test_stubs::GetListingFilters());
    const auto& calls = test_stubs::GetCalls();
    ASSERT_EQ(3u, calls.size());
    EXPECT_EQ(bootAddress, calls[0].address);
    EXPECT_EQ("open", calls[0].method);
    EXPECT_EQ(otherAddress, calls[1].address);
    EXPECT_EQ("open", calls[1].method);
    EXPECT_EQ(otherAddress, calls[2].address);
    EXPECT_EQ("read", calls[2].method);
}

TEST_F(Boot, Other_Open_Errors_Abort)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.openReply = test_stubs::Reply{ HOST_EBADPARAMETERS, {}, true };

    auto scan = boot::RunStep(boot::state::StartScan{});
    ASSERT_TRUE(scan.has_value());
    auto opening = boot::RunStep(std::move(scan->next));
    ASSERT_TRUE(opening.has_value());
    EXPECT_EQ("BIOS: filesystem.open bad", CatchAbort([&] { boot::RunStep(std::move(opening->next)); }));
}

TEST_F(Boot, Unexpected_Open_Reply_Aborts)
{
    const std::vector<Bytes> replies{
        reply::Descriptor(descriptorNumber),         // not wrapped in an array
        reply::Single(reply::Null()),                // no descriptor
        reply::Single({ 0xd8, 0x28, 0x01 }),         // wrong tag
        reply::Single({ 0xd8, 0x27, 0x61, 'a' }),    // tagged text
        reply::Single({ 0xd8, 0x27, 0x1b, 0, 0, 0, 1, 0, 0, 0, 0 }), // out of range
    };
    for (const auto& r : replies) {
        test_stubs::ResetFunctions();
        host.Install();
        SetMachine({ { bootAddress, "filesystem" } });
        host.openReply = test_stubs::Reply{ 0, r, true };

        auto scan = boot::RunStep(boot::state::StartScan{});
        ASSERT_TRUE(scan.has_value());
        auto opening = boot::RunStep(std::move(scan->next));
        ASSERT_TRUE(opening.has_value());
        EXPECT_EQ("BIOS: filesystem.open bad", CatchAbort([&] { boot::RunStep(std::move(opening->next)); }));
        EXPECT_TRUE(test_stubs::GetClosedDescriptors().empty());
    }
}

TEST_F(Boot, Open_Starts_Reading)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.files.push_back(File{ bootAddress, {} });

    auto scan = boot::RunStep(boot::state::StartScan{});
    ASSERT_TRUE(scan.has_value());
    auto opening = boot::RunStep(std::move(scan->next));
    ASSERT_TRUE(opening.has_value());
    auto step = boot::RunStep(std::move(opening->next));
    ASSERT_TRUE(step.has_value());
    ASSERT_TRUE(std::holds_alternative<boot::state::ReadingFile>(step->next));
    const auto& reading = std::get<boot::state::ReadingFile>(step->next);
    EXPECT_EQ(descriptorNumber, reading.descriptor.AsRaw());
    EXPECT_EQ(bootAddress, reading.address);

    const auto& call = test_stubs::GetCalls().back();
    EXPECT_EQ("read", call.method);
    EXPECT_EQ(bootAddress, call.address);
    EXPECT_EQ(ReadArguments(), call.params);
    EXPECT_TRUE(test_stubs::GetClosedDescriptors().empty());
}

TEST_F(Boot, Chunked_Read_Until_End_Of_File)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.eepromData = AddressBytes(bootAddress);
    const auto chunk1 = MakeChunk(4096, 1);
    const auto chunk2 = MakeChunk(1, 99);
    host.files.push_back(File{ bootAddress, { chunk1, chunk2 } });

    boot::State slot;
    RunUntilHandOff(slot);

    Bytes expected(chunk1);
    expected.insert(expected.end(), chunk2.begin(), chunk2.end());
    EXPECT_EQ(expected, test_stubs::GetImage());
    EXPECT_EQ(1, test_stubs::GetNumberOfExecutions());
    EXPECT_EQ((std::vector<uint32_t>{ descriptorNumber }), test_stubs::GetClosedDescriptors());
    EXPECT_EQ(
        (std::vector<std::string>{ "getData", "open", "read", "read", "read" }), CalledMethods());
    EXPECT_EQ((std::vector<std::string>{ "eeprom" }), test_stubs::GetListingFilters());
}

TEST_F(Boot, Unexpected_Read_Reply_Aborts)
{
    const std::vector<Bytes> replies{
        reply::Bytes({ 1, 2, 3 }),                   // not wrapped in an array
        reply::Single({ 0x63, 'a', 'b', 'c' }),      // text
        reply::Single({ 0x45, 1, 2 }),               // truncated bytes
        reply::Single({ 0xf5 }),                     // true rather than null
    };
    for (const auto& r : replies) {
        test_stubs::ResetFunctions();
        host.Install();
        SetMachine({ { bootAddress, "filesystem" } });
        host.files.push_back(File{ bootAddress, {} });
        host.readReply = test_stubs::Reply{ 0, r, true };

        boot::State slot{ boot::state::StartScan{} };
        EXPECT_EQ("BIOS: I/O error reading /init.wasm", CatchAbort([&] { boot::Run(slot); }));
        EXPECT_EQ(0, test_stubs::GetNumberOfExecutions());
        EXPECT_TRUE(test_stubs::GetImage().empty());
        host.files.clear();
    }
}

TEST_F(Boot, Failed_Read_Is_An_Internal_Error)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.files.push_back(File{ bootAddress, {} });
    host.readReply = test_stubs::Reply{ HOST_EOTHER, {}, true };

    boot::State slot{ boot::state::StartScan{} };
    EXPECT_EQ("BIOS: internal error", CatchAbort([&] { boot::Run(slot); }));
}

TEST_F(Boot, Deferred_Calls_Yield_Every_Timeslice)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.eepromData = AddressBytes(bootAddress);
    host.immediate = false;
    host.files.push_back(File{ bootAddress, { MakeChunk(100, 5) } });

    boot::State slot;
    const auto timeslices = RunUntilHandOff(slot);

    // getData, open, read (data), read (end of file), hand-off
    EXPECT_EQ(5, timeslices);
    EXPECT_EQ(4u, test_stubs::GetCalls().size());
    EXPECT_EQ(0, test_stubs::GetNumberOfProtocolViolations());
    EXPECT_EQ(MakeChunk(100, 5), test_stubs::GetImage());
    EXPECT_EQ(1, test_stubs::GetNumberOfExecutions());
}

TEST_F(Boot, Immediate_Calls_Finish_In_One_Timeslice)
{
    SetMachine({ { bootAddress, "filesystem" }, { otherAddress, "filesystem" } });
    host.files.push_back(File{ otherAddress, { MakeChunk(16384, 3), MakeChunk(16384, 4), MakeChunk(10, 5) } });

    boot::State slot;
    EXPECT_EQ(1, RunUntilHandOff(slot));
    EXPECT_EQ(0, test_stubs::GetNumberOfProtocolViolations());
    EXPECT_EQ(16384u * 2 + 10, test_stubs::GetImage().size());
}

TEST_F(Boot, At_Most_One_Call_Outstanding)
{
    host.eepromData = AddressBytes(missingAddress);
    host.files.push_back(File{ otherAddress, { MakeChunk(20, 1), MakeChunk(30, 2) } });

    for (const auto immediate : { true, false }) {
        test_stubs::ResetFunctions();
        host.Install();
        SetMachine({ { missingAddress, "screen" }, { bootAddress, "filesystem" }, { otherAddress, "filesystem" } });
        host.immediate = immediate;

        boot::State slot;
        RunUntilHandOff(slot);
        EXPECT_EQ(0, test_stubs::GetNumberOfProtocolViolations());
        EXPECT_EQ(1, test_stubs::GetNumberOfExecutions());
    }
}

TEST_F(Boot, Internal_Error_From_Step_Aborts_Run)
{
    SetMachine({});
    test_stubs::SetInvokeFunction([](const test_stubs::Call&) { return test_stubs::Reply{ 0, {}, true }; });

    boot::State slot;
    EXPECT_EQ("BIOS: internal error", CatchAbort([&] { boot::Run(slot); }));
}

TEST_F(Boot, Empty_Chunk_Continues_Reading)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.files.push_back(File{ bootAddress, { Bytes{}, MakeChunk(5, 9) } });

    boot::State slot{ boot::state::StartScan{} };
    RunUntilHandOff(slot);

    EXPECT_EQ(MakeChunk(5, 9), test_stubs::GetImage());
    EXPECT_EQ((std::vector<std::string>{ "open", "read", "read", "read" }), CalledMethods());
    EXPECT_EQ(1, test_stubs::GetNumberOfExecutions());
}

TEST_F(Boot, Open_Reply_Without_Tagged_Item_Is_An_Internal_Error)
{
    SetMachine({ { bootAddress, "filesystem" } });
    host.openReply = test_stubs::Reply{ 0, { 0x81, 0xd8, 0x27 }, true };

    boot::State slot{ boot::state::StartScan{} };
    EXPECT_EQ("BIOS: internal error", CatchAbort([&] { boot::Run(slot); }));
    EXPECT_TRUE(test_stubs::GetClosedDescriptors().empty());
}
