#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace Recycler::logging
{
    class logger final
    {
    public:
        logger() = default;

        void init_logger(int argc, char const** argv);

        [[nodiscard]] std::shared_ptr<spdlog::logger> get_system_logger();
        [[nodiscard]] std::shared_ptr<spdlog::logger> get_pool_logger();

        ~logger();
    private:
        std::shared_ptr<spdlog::logger> m_system_logger;
        std::shared_ptr<spdlog::logger> m_pool_logger;

        /**
         * Default logger that was installed before init_logger, put back on shutdown.
         */
        std::shared_ptr<spdlog::logger> m_previous_default;
    };
}
