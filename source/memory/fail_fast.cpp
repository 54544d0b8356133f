#include "memory/fail_fast.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

void Recycler::memory::fail_fast(std::string_view message, std::source_location location) noexcept
{
    // The default logger may already be gone during static destruction
    if (auto* logger = spdlog::default_logger_raw())
    {
        logger->critical("{} ({}:{} in {})", message, location.file_name(), location.line(), location.function_name());
        logger->flush();
    }

    std::abort();
}
