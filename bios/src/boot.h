/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <variant>
#include "component.h"
#include "descriptor.h"
#include "result.h"

namespace boot
{
    // Boot device UUID came from the EEPROM
    struct FromConfiguredDevice {};

    // Boot device UUID came from a scan over all filesystem components
    struct FromScan {
        component::Listing listing;
    };

    using UuidSource = std::variant<FromConfiguredDevice, FromScan>;

    namespace state
    {
        struct Init {};

        // eeprom.getData has been invoked
        struct ReadingBootDeviceUuid {};

        struct StartScan {};

        struct Scanning {
            component::Listing listing;
        };

        // filesystem.open has been invoked on address
        struct OpeningFile {
            component::Address address;
            UuidSource source;
        };

        // The boot file is open; filesystem.read has been invoked
        struct ReadingFile {
            descriptor::Owned descriptor;
            component::Address address;
        };
    }

    using State = std::variant<
        state::Init, state::ReadingBootDeviceUuid, state::StartScan,
        state::Scanning, state::OpeningFile, state::ReadingFile>;

    enum class RunResult {
        RunNext, // take the next step immediately
        Return,  // yield to the host until the outstanding call completes
    };

    struct Step {
        RunResult result;
        State next;
    };

    /*
     * Performs a single step of the boot process, consuming the current
     * state. At most one host call is started per step; the call is always
     * completed by the step that handles the returned state.
     *
     * Protocol violations by the host are fatal and do not return.
     */
    result::Maybe<Step> RunStep(State current);

    /*
     * Runs steps on the state held in slot until one needs to wait for the
     * host. Called once per timeslice.
     */
    void Run(State& slot);
}
