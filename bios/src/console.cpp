/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "console.h"

namespace console
{
    namespace trace_buffer {
        char data[TraceSize];
        size_t write_offset = 0;
        bool wrapped = false;
    }

    void put_char(int ch)
    {
        trace_buffer::data[trace_buffer::write_offset] = static_cast<char>(ch);
        if (++trace_buffer::write_offset == TraceSize) {
            trace_buffer::write_offset = 0;
            trace_buffer::wrapped = true;
        }
    }

    std::pair<std::span<const char>, std::span<const char>> GetTrace()
    {
        std::span<const char> data{ trace_buffer::data };
        if (!trace_buffer::wrapped)
            return { data.first(trace_buffer::write_offset), {} };
        return { data.subspan(trace_buffer::write_offset), data.first(trace_buffer::write_offset) };
    }
}
