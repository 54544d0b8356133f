#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <spdlog/logger.h>

#ifndef RECYCLER_DEFAULT_SCAN_WINDOW
#define RECYCLER_DEFAULT_SCAN_WINDOW 4
#endif

#ifndef RECYCLER_DEFAULT_SIZE_CLASS_THRESHOLD
#define RECYCLER_DEFAULT_SIZE_CLASS_THRESHOLD 4096
#endif

namespace Recycler::memory
{
    struct pool_options
    {
        /**
         * How many of the most recently released entries acquisition looks at
         * (recent_scan_store).
         */
        std::size_t scan_window = RECYCLER_DEFAULT_SCAN_WINDOW;

        /**
         * Ascending partition boundaries (partitioned_store). A size s lands in
         * the first partition whose threshold is greater than s, or in the last.
         */
        std::vector<std::size_t> size_class_thresholds{ RECYCLER_DEFAULT_SIZE_CLASS_THRESHOLD };

        /**
         * Clear the contents of an instance before it goes back to the store.
         */
        bool reset_on_release = false;

        /**
         * Falls back to the spdlog default logger when empty.
         */
        std::shared_ptr<spdlog::logger> logger{};
    };
}
