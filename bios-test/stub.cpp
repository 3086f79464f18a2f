#include "stub.h"
#include <algorithm>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <ocbios/host.h>
#include "cbor.h"

namespace test_stubs {
    namespace {
        std::vector<Component> components;
        std::function<Reply(const Call&)> invokeFunction;

        std::vector<Component> listing;
        size_t listingOffset = 0;

        std::optional<Reply> pendingReply;
        bool pendingCompleted = false;

        std::vector<Call> calls;
        std::vector<std::string> listingFilters;
        std::vector<uint8_t> image;
        std::vector<uint32_t> closedDescriptors;
        int executions = 0;
        int protocolViolations = 0;

        const Component* FindComponent(const uint8_t* address)
        {
            auto it = std::find_if(components.begin(), components.end(), [&](const auto& c) {
                return std::equal(c.address.bytes.begin(), c.address.bytes.end(), address);
            });
            return it != components.end() ? &*it : nullptr;
        }

        // Length of the data item at the start of data
        size_t ItemLength(std::span<const uint8_t> data)
        {
            const auto header = cbor::DecodeHeader(data);
            if (!header) throw std::runtime_error("bad CBOR in call parameters");
            size_t length = data.size() - header->rest.size();
            auto skipItems = [&](uint64_t count) {
                for (uint64_t n = 0; n < count; ++n)
                    length += ItemLength(data.subspan(length));
            };
            switch (header->type) {
                case cbor::MajorType::Bytes:
                case cbor::MajorType::String:
                    length += header->count;
                    break;
                case cbor::MajorType::Array:
                    skipItems(header->count);
                    break;
                case cbor::MajorType::Map:
                    skipItems(2 * header->count);
                    break;
                case cbor::MajorType::Tag:
                    skipItems(1);
                    break;
                default:
                    break;
            }
            return length;
        }

        std::vector<uint8_t> Encode(size_t maxLength, std::function<void(cbor::Writer&)> fn)
        {
            std::vector<uint8_t> data(maxLength);
            cbor::Writer writer(data);
            fn(writer);
            data.resize(writer.Length());
            return data;
        }
    }

    void ResetFunctions()
    {
        components.clear();
        invokeFunction = nullptr;
        listing.clear();
        listingOffset = 0;
        pendingReply.reset();
        pendingCompleted = false;
        calls.clear();
        listingFilters.clear();
        image.clear();
        closedDescriptors.clear();
        executions = 0;
        protocolViolations = 0;
    }

    void SetComponents(std::vector<Component> c)
    {
        components = std::move(c);
    }

    void SetInvokeFunction(std::function<Reply(const Call&)>&& fn)
    {
        invokeFunction = std::move(fn);
    }

    void NextTimeslice()
    {
        if (pendingReply)
            pendingCompleted = true;
    }

    const std::vector<Call>& GetCalls() { return calls; }
    const std::vector<std::string>& GetListingFilters() { return listingFilters; }
    const std::vector<uint8_t>& GetImage() { return image; }
    const std::vector<uint32_t>& GetClosedDescriptors() { return closedDescriptors; }
    int GetNumberOfExecutions() { return executions; }
    int GetNumberOfProtocolViolations() { return protocolViolations; }
    bool IsCallOutstanding() { return pendingReply.has_value(); }

    component::Address MakeAddress(uint8_t seed)
    {
        component::Address address;
        for (size_t n = 0; n < address.bytes.size(); ++n)
            address.bytes[n] = static_cast<uint8_t>(seed + n);
        return address;
    }

    namespace reply {
        std::vector<uint8_t> Single(const std::vector<uint8_t>& item)
        {
            auto data = Encode(1, [](auto& w) { w.Header(cbor::MajorType::Array, 1); });
            data.insert(data.end(), item.begin(), item.end());
            return data;
        }

        std::vector<uint8_t> Bytes(const std::vector<uint8_t>& bytes)
        {
            auto data = Encode(9, [&](auto& w) { w.Header(cbor::MajorType::Bytes, bytes.size()); });
            data.insert(data.end(), bytes.begin(), bytes.end());
            return data;
        }

        std::vector<uint8_t> Descriptor(uint32_t descriptor)
        {
            return Encode(16, [&](auto& w) {
                w.Header(cbor::MajorType::Tag, cbor::tag::Identifier);
                w.Header(cbor::MajorType::UnsignedInteger, descriptor);
            });
        }

        std::vector<uint8_t> Null()
        {
            return Encode(1, [](auto& w) { w.Header(cbor::MajorType::Special, cbor::special::Null); });
        }
    }
}

using namespace test_stubs;

extern "C" {

int32_t host_component_list_start(const char* type, size_t type_len)
{
    listing.clear();
    listingOffset = 0;
    const auto filter = type != nullptr ? std::string(type, type_len) : std::string();
    listingFilters.push_back(filter);
    std::copy_if(components.begin(), components.end(), std::back_inserter(listing), [&](const auto& c) {
        return type == nullptr || c.type == filter;
    });
    return 0;
}

int32_t host_component_list_next(uint8_t* address)
{
    if (listingOffset >= listing.size())
        return 0;
    const auto& c = listing[listingOffset++];
    std::copy(c.address.bytes.begin(), c.address.bytes.end(), address);
    return 1;
}

int32_t host_component_type(const uint8_t* address, char* buffer, size_t len)
{
    const auto c = FindComponent(address);
    if (c == nullptr)
        return HOST_ENOSUCHCOMPONENT;
    if (c->type.size() > len)
        return HOST_EBUFFERTOOSHORT;
    std::copy(c->type.begin(), c->type.end(), buffer);
    return static_cast<int32_t>(c->type.size());
}

int32_t host_component_invoke(const uint8_t* address, const char* method, size_t method_len, const uint8_t* params)
{
    if (pendingReply)
        ++protocolViolations;

    Call call;
    std::copy(address, address + HOST_UUID_LENGTH, call.address.bytes.begin());
    call.method = std::string(method, method_len);
    if (params != nullptr) {
        // Parameters are a CBOR sequence; ours always consist of a single array
        std::span<const uint8_t> data{ params, 65536 };
        call.params.assign(params, params + ItemLength(data));
    }
    calls.push_back(call);

    if (FindComponent(address) == nullptr)
        return HOST_ENOSUCHCOMPONENT;
    if (!invokeFunction)
        throw std::runtime_error("unexpected call " + call.method);

    pendingReply = invokeFunction(call);
    pendingCompleted = pendingReply->immediate;
    return pendingCompleted ? 1 : 0;
}

int32_t host_component_invoke_end(uint8_t* buffer, size_t len)
{
    if (!pendingReply) {
        ++protocolViolations;
        return HOST_EQUEUEEMPTY;
    }
    if (!pendingCompleted)
        ++protocolViolations;

    const auto reply = std::move(*pendingReply);
    pendingReply.reset();
    if (reply.rc < 0)
        return reply.rc;
    if (reply.data.size() > len)
        return HOST_EBUFFERTOOSHORT;
    std::copy(reply.data.begin(), reply.data.end(), buffer);
    return static_cast<int32_t>(reply.data.size());
}

void host_computer_error(const char* message, size_t len)
{
    throw Aborted{ std::string(message, len) };
}

int32_t host_descriptor_close(uint32_t descriptor)
{
    closedDescriptors.push_back(descriptor);
    return 0;
}

int32_t host_execute_add(const uint8_t* data, size_t len)
{
    image.insert(image.end(), data, data + len);
    return 0;
}

void host_execute_execute(void)
{
    ++executions;
    throw Executed{};
}

}
