#include "gtest/gtest.h"
#include <array>
#include <string>
#include <vector>
#include "stub.h"
#include "../bios/src/component.h"
#include "../bios/src/console.h"
#include "../bios/src/descriptor.h"
#include "../bios/src/execute.h"
#include "../bios/src/lib.h"

namespace {
    const auto eepromAddress = test_stubs::MakeAddress(0x10);
    const auto fs1Address = test_stubs::MakeAddress(0x20);
    const auto fs2Address = test_stubs::MakeAddress(0x30);

    std::string TraceContents()
    {
        const auto [oldest, newest] = console::GetTrace();
        return std::string(oldest.begin(), oldest.end()) + std::string(newest.begin(), newest.end());
    }

    struct Host : ::testing::Test
    {
        Host()
        {
            test_stubs::ResetFunctions();
            test_stubs::SetComponents({ { eepromAddress, "eeprom" },
                                        { fs1Address, "filesystem" },
                                        { fs2Address, "filesystem" } });
        }

        ~Host()
        {
            test_stubs::ResetFunctions();
        }
    };
}

TEST_F(Host, Address_From_Bytes)
{
    std::vector<uint8_t> data(16);
    for (size_t n = 0; n < data.size(); ++n)
        data[n] = static_cast<uint8_t>(0x20 + n);

    const auto address = component::Address::FromBytes(data);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(fs1Address, *address);

    data.pop_back();
    EXPECT_FALSE(component::Address::FromBytes(data).has_value());
    data.resize(17);
    EXPECT_FALSE(component::Address::FromBytes(data).has_value());
}

TEST_F(Host, Listing_By_Type)
{
    auto listing = component::StartListing("filesystem");
    EXPECT_EQ(fs1Address, listing.Next());
    EXPECT_EQ(fs2Address, listing.Next());
    EXPECT_FALSE(listing.Next().has_value());
    // Stays exhausted without asking the host again
    EXPECT_FALSE(listing.Next().has_value());
    EXPECT_EQ((std::vector<std::string>{ "filesystem" }), test_stubs::GetListingFilters());
}

TEST_F(Host, Listing_All)
{
    auto listing = component::StartListing({});
    int count = 0;
    while (listing.Next())
        ++count;
    EXPECT_EQ(3, count);
}

TEST_F(Host, Moved_From_Listing_Is_Exhausted)
{
    auto listing = component::StartListing("eeprom");
    auto other = std::move(listing);
    EXPECT_FALSE(listing.Next().has_value());
    EXPECT_EQ(eepromAddress, other.Next());
}

TEST_F(Host, Type)
{
    std::array<char, 16> buffer;
    const auto type = component::Type(fs1Address, buffer);
    ASSERT_TRUE(type.has_value());
    EXPECT_EQ("filesystem", *type);
}

TEST_F(Host, Type_Buffer_Too_Short)
{
    std::array<char, 6> buffer;
    const auto type = component::Type(fs1Address, buffer);
    ASSERT_FALSE(type.has_value());
    EXPECT_EQ(error::Code::BufferTooShort, type.error());
}

TEST_F(Host, Type_Of_Missing_Component)
{
    std::array<char, 16> buffer;
    const auto type = component::Type(test_stubs::MakeAddress(0x99), buffer);
    ASSERT_FALSE(type.has_value());
    EXPECT_EQ(error::Code::NoSuchComponent, type.error());
}

TEST_F(Host, Invoke_And_Collect)
{
    test_stubs::SetInvokeFunction([](const test_stubs::Call& call) {
        return test_stubs::Reply{ 0, test_stubs::reply::Single(test_stubs::reply::Null()), call.method == "now" };
    });

    const auto now = component::Invoke(eepromAddress, "now");
    ASSERT_TRUE(now.has_value());
    EXPECT_TRUE(*now);

    std::array<uint8_t, 8> buffer;
    const auto data = component::InvokeEnd(buffer);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ((std::vector<uint8_t>{ 0x81, 0xf6 }), std::vector<uint8_t>(data->begin(), data->end()));

    const std::array<uint8_t, 1> params{ 0x80 };
    const auto later = component::Invoke(eepromAddress, "later", params);
    ASSERT_TRUE(later.has_value());
    EXPECT_FALSE(*later);
    EXPECT_TRUE(test_stubs::IsCallOutstanding());
    EXPECT_EQ((std::vector<uint8_t>{ 0x80 }), test_stubs::GetCalls().back().params);

    test_stubs::NextTimeslice();
    EXPECT_TRUE(component::InvokeEnd(buffer).has_value());
    EXPECT_EQ(0, test_stubs::GetNumberOfProtocolViolations());
}

TEST_F(Host, Invoke_Missing_Component)
{
    const auto completion = component::Invoke(test_stubs::MakeAddress(0x99), "getData");
    ASSERT_FALSE(completion.has_value());
    EXPECT_EQ(error::Code::NoSuchComponent, completion.error());
}

TEST_F(Host, Invoke_End_Errors)
{
    test_stubs::SetInvokeFunction([](const test_stubs::Call&) {
        return test_stubs::Reply{ 0, std::vector<uint8_t>(32, 0x40), true };
    });
    ASSERT_TRUE(component::Invoke(eepromAddress, "getData").has_value());

    std::array<uint8_t, 16> buffer;
    const auto tooShort = component::InvokeEnd(buffer);
    ASSERT_FALSE(tooShort.has_value());
    EXPECT_EQ(error::Code::BufferTooShort, tooShort.error());

    test_stubs::SetInvokeFunction([](const test_stubs::Call&) {
        return test_stubs::Reply{ HOST_EOTHER, {}, true };
    });
    ASSERT_TRUE(component::Invoke(eepromAddress, "getData").has_value());
    const auto other = component::InvokeEnd(buffer);
    ASSERT_FALSE(other.has_value());
    EXPECT_EQ(error::Code::Other, other.error());
}

TEST(Error, FromHost)
{
    EXPECT_EQ(error::Code::MemoryFault, error::FromHost(HOST_EMEMORYFAULT));
    EXPECT_EQ(error::Code::Other, error::FromHost(HOST_EOTHER));
    EXPECT_EQ(error::Code::Unknown, error::FromHost(HOST_EUNKNOWN));
    EXPECT_EQ(error::Code::Unknown, error::FromHost(-100));
}

TEST_F(Host, Descriptor_Closed_On_Destruction)
{
    {
        descriptor::Owned descriptor{ 7 };
        EXPECT_EQ(7u, descriptor.AsRaw());
        EXPECT_TRUE(test_stubs::GetClosedDescriptors().empty());
    }
    EXPECT_EQ((std::vector<uint32_t>{ 7 }), test_stubs::GetClosedDescriptors());
}

TEST_F(Host, Descriptor_Release_Closes_Once)
{
    {
        descriptor::Owned descriptor{ 7 };
        descriptor.Release();
        descriptor.Release();
    }
    EXPECT_EQ((std::vector<uint32_t>{ 7 }), test_stubs::GetClosedDescriptors());
}

TEST_F(Host, Descriptor_Move_Transfers_Ownership)
{
    {
        descriptor::Owned a{ 1 };
        descriptor::Owned b{ std::move(a) };
        EXPECT_TRUE(test_stubs::GetClosedDescriptors().empty());

        descriptor::Owned c{ 2 };
        c = std::move(b);
        EXPECT_EQ((std::vector<uint32_t>{ 2 }), test_stubs::GetClosedDescriptors());
        EXPECT_EQ(1u, c.AsRaw());
    }
    EXPECT_EQ((std::vector<uint32_t>{ 2, 1 }), test_stubs::GetClosedDescriptors());
}

TEST_F(Host, Execute_Add_Appends)
{
    const std::array<uint8_t, 3> first{ 0x00, 0x61, 0x73 };
    const std::array<uint8_t, 1> second{ 0x6d };
    EXPECT_TRUE(execute::Add(first).has_value());
    EXPECT_TRUE(execute::Add(second).has_value());
    EXPECT_TRUE(execute::Add({}).has_value());
    EXPECT_EQ((std::vector<uint8_t>{ 0x00, 0x61, 0x73, 0x6d }), test_stubs::GetImage());

    EXPECT_THROW(execute::Execute(), test_stubs::Executed);
    EXPECT_EQ(1, test_stubs::GetNumberOfExecutions());
}

TEST_F(Host, Panic_Reports_To_Host_And_Trace)
{
    try {
        panic("BIOS: no EEPROM");
        FAIL() << "panic returned";
    } catch (const test_stubs::Aborted& aborted) {
        EXPECT_EQ("BIOS: no EEPROM", aborted.message);
    }
    const auto trace = TraceContents();
    EXPECT_NE(std::string::npos, trace.find("panic: BIOS: no EEPROM\n"));
}

TEST(Console, Print_Formats_Values)
{
    Print("value ", 1234u, " hex ", print::Hex{ 0xbeef }, " uuid ", test_stubs::MakeAddress(0), "\n");
    const auto trace = TraceContents();
    EXPECT_NE(
        std::string::npos,
        trace.find("value 1234 hex beef uuid 00010203-0405-0607-0809-0a0b0c0d0e0f\n"));
}

TEST(Console, Trace_Ring_Keeps_Newest_Output)
{
    for (size_t n = 0; n < console::TraceSize + 10; ++n)
        console::put_char('a' + n % 26);
    console::put_char('!');

    const auto trace = TraceContents();
    ASSERT_EQ(console::TraceSize, trace.size());
    EXPECT_EQ('!', trace.back());
    EXPECT_EQ(static_cast<char>('a' + (console::TraceSize + 9) % 26), trace[trace.size() - 2]);
}
