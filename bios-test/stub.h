#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "component.h"

namespace test_stubs {
    // Thrown by computer.error
    struct Aborted { std::string message; };
    // Thrown by execute.execute
    struct Executed {};

    struct Component {
        component::Address address;
        std::string type;
    };

    struct Call {
        component::Address address;
        std::string method;
        std::vector<uint8_t> params;
    };

    struct Reply {
        int32_t rc = 0; // returned by invoke_end if negative
        std::vector<uint8_t> data;
        bool immediate = true;
    };

    void ResetFunctions();
    void SetComponents(std::vector<Component> components);
    void SetInvokeFunction(std::function<Reply(const Call&)>&& fn);

    // Completes any call that was left pending at the end of a timeslice
    void NextTimeslice();

    const std::vector<Call>& GetCalls();
    const std::vector<std::string>& GetListingFilters();
    const std::vector<uint8_t>& GetImage();
    const std::vector<uint32_t>& GetClosedDescriptors();
    int GetNumberOfExecutions();
    // Host calls made while another call was outstanding, or results
    // collected that were not available
    int GetNumberOfProtocolViolations();
    bool IsCallOutstanding();

    component::Address MakeAddress(uint8_t seed);

    namespace reply {
        std::vector<uint8_t> Single(const std::vector<uint8_t>& item);
        std::vector<uint8_t> Bytes(const std::vector<uint8_t>& bytes);
        std::vector<uint8_t> Descriptor(uint32_t descriptor);
        std::vector<uint8_t> Null();
    }
}
