#pragma once

#include <source_location>
#include <string_view>

namespace Recycler::memory
{
    /**
     * Logs a critical diagnostic on the default logger and aborts. Used for
     * conditions the pool cannot continue from: zero-size requests, an
     * exhausted allocator or a pool torn down under live blocks.
     */
    [[noreturn]] void fail_fast(std::string_view message,
                                std::source_location location = std::source_location::current()) noexcept;
}
