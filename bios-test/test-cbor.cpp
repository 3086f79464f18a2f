#include "gtest/gtest.h"
#include <array>
#include <cstdint>
#include <vector>
#include "../bios/src/cbor.h"

namespace {
    using Bytes = std::vector<uint8_t>;

    constexpr std::array<cbor::MajorType, 8> majorTypesBySelector{
        cbor::MajorType::UnsignedInteger, cbor::MajorType::NegativeInteger,
        cbor::MajorType::Bytes, cbor::MajorType::String,
        cbor::MajorType::Array, cbor::MajorType::Map,
        cbor::MajorType::Tag, cbor::MajorType::Special,
    };

    Bytes Encode(cbor::MajorType type, uint64_t count)
    {
        Bytes data(9);
        cbor::Writer writer(data);
        writer.Header(type, count);
        data.resize(writer.Length());
        return data;
    }

    void VerifyHeader(const Bytes& data, cbor::MajorType type, uint64_t count, size_t consumed)
    {
        const auto header = cbor::DecodeHeader(data);
        ASSERT_TRUE(header.has_value());
        EXPECT_EQ(type, header->type);
        EXPECT_EQ(count, header->count);
        EXPECT_EQ(data.size() - consumed, header->rest.size());
        if (!header->rest.empty()) {
            EXPECT_EQ(&data[consumed], header->rest.data());
        }
    }

    void VerifyError(const Bytes& data, error::Code code)
    {
        const auto header = cbor::DecodeHeader(data);
        ASSERT_FALSE(header.has_value());
        EXPECT_EQ(code, header.error());
    }
}

TEST(Cbor, Decode_Empty_Input)
{
    VerifyError({}, error::Code::BufferTooShort);
}

TEST(Cbor, Decode_Literal_Counts_For_All_Major_Types)
{
    for (uint8_t major = 0; major < 8; ++major) {
        for (uint8_t count = 0; count <= 23; ++count) {
            SCOPED_TRACE(testing::Message() << "major " << int(major) << " count " << int(count));
            VerifyHeader({ static_cast<uint8_t>(major << 5 | count), 0xaa }, majorTypesBySelector[major], count, 1);
        }
    }
}

TEST(Cbor, Decode_Float_And_Special_Share_Major_Type_Seven)
{
    VerifyHeader({ 0xf6 }, cbor::MajorType::Special, cbor::special::Null, 1);
    VerifyHeader({ 0xf8, 0x20 }, cbor::MajorType::Special, 0x20, 2);
    VerifyHeader({ 0xf9, 0x3c, 0x00 }, cbor::MajorType::Float, 0x3c00, 3);
    VerifyHeader({ 0xfa, 0x3f, 0x80, 0x00, 0x00 }, cbor::MajorType::Float, 0x3f80'0000, 5);
    VerifyHeader(
        { 0xfb, 0x3f, 0xf0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 }, cbor::MajorType::Float,
        0x3ff0'0000'0000'0000, 9);
}

TEST(Cbor, Decode_Extended_Counts_Are_Big_Endian)
{
    VerifyHeader({ 0x18, 0xfe }, cbor::MajorType::UnsignedInteger, 0xfe, 2);
    VerifyHeader({ 0x59, 0x12, 0x34, 0x99 }, cbor::MajorType::Bytes, 0x1234, 3);
    VerifyHeader({ 0x9a, 0x01, 0x02, 0x03, 0x04 }, cbor::MajorType::Array, 0x0102'0304, 5);
    VerifyHeader(
        { 0x3b, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08 }, cbor::MajorType::NegativeInteger,
        0x0102'0304'0506'0708, 9);
    VerifyHeader({ 0xd8, 0x27, 0x1a }, cbor::MajorType::Tag, cbor::tag::Identifier, 2);
}

TEST(Cbor, Decode_Truncated_Extended_Count)
{
    VerifyError({ 0x18 }, error::Code::CborDecode);
    VerifyError({ 0x79, 0x01 }, error::Code::CborDecode);
    VerifyError({ 0x9a, 0x01, 0x02, 0x03 }, error::Code::CborDecode);
    VerifyError({ 0x1b, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07 }, error::Code::CborDecode);
}

TEST(Cbor, Decode_Reserved_Count_Selectors)
{
    for (uint8_t selector = 28; selector <= 31; ++selector) {
        VerifyError({ selector, 0, 0, 0, 0, 0, 0, 0, 0 }, error::Code::CborDecode);
        VerifyError({ static_cast<uint8_t>(0xe0 | selector) }, error::Code::CborDecode);
    }
}

TEST(Cbor, Decode_Does_Not_Check_Payload)
{
    // A 100 byte string with only two bytes present
    VerifyHeader({ 0x78, 100, 'a', 'b' }, cbor::MajorType::String, 100, 2);
}

TEST(Cbor, Header_Uses_Shortest_Encoding_At_Boundaries)
{
    struct Case { uint64_t count; size_t length; };
    const Case cases[] = {
        { 0, 1 }, { 23, 1 }, { 24, 2 }, { 255, 2 }, { 256, 3 }, { 65535, 3 },
        { 65536, 5 }, { 0xffff'ffff, 5 }, { 0x1'0000'0000, 9 }, { UINT64_MAX, 9 },
    };
    for (const auto& c : cases) {
        SCOPED_TRACE(testing::Message() << "count " << c.count);
        const auto data = Encode(cbor::MajorType::UnsignedInteger, c.count);
        EXPECT_EQ(c.length, data.size());
        EXPECT_EQ(c.length, cbor::HeaderSize(c.count));
        VerifyHeader(data, cbor::MajorType::UnsignedInteger, c.count, c.length);
    }
}

TEST(Cbor, FixedHeader_Always_Uses_Four_Bytes)
{
    Bytes data(cbor::FixedHeaderSize);
    cbor::Writer writer(data);
    writer.FixedHeader(cbor::MajorType::UnsignedInteger, 7);
    EXPECT_EQ(cbor::FixedHeaderSize, writer.Length());
    EXPECT_EQ((Bytes{ 0x1a, 0x00, 0x00, 0x00, 0x07 }), data);
    VerifyHeader(data, cbor::MajorType::UnsignedInteger, 7, 5);
}

TEST(Cbor, Writer_String)
{
    Bytes data(16);
    cbor::Writer writer(data);
    writer.Header(cbor::MajorType::Array, 1);
    writer.String("/init.wasm");
    const auto written = writer.Data();
    EXPECT_EQ(
        (Bytes{ 0x81, 0x6a, '/', 'i', 'n', 'i', 't', '.', 'w', 'a', 's', 'm' }),
        Bytes(written.begin(), written.end()));
}
