#include "logging/logger.hpp"

#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/cfg/argv.h>

namespace Recycler::logging
{
    std::shared_ptr<spdlog::logger> logger::get_system_logger()
    {
        return m_system_logger;
    }

    std::shared_ptr<spdlog::logger> logger::get_pool_logger()
    {
        return m_pool_logger;
    }
}

void Recycler::logging::logger::init_logger(int argc, char const **argv)
{
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    auto constexpr max_size = 1048576 * 5;
    auto constexpr max_files = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>("logs/recycler_log.txt", max_size, max_files);
    file_sink->set_level(spdlog::level::trace);

    std::vector<spdlog::sink_ptr> sinks = { console_sink, file_sink };

    m_system_logger = std::make_shared<spdlog::logger>("System", sinks.begin(), sinks.end());
    m_pool_logger = std::make_shared<spdlog::logger>("Pool", sinks.begin(), sinks.end());

    m_system_logger->set_level(spdlog::level::info);
    m_pool_logger->set_level(spdlog::level::info);

    spdlog::register_logger(m_system_logger);
    spdlog::register_logger(m_pool_logger);

    m_previous_default = spdlog::default_logger();
    spdlog::set_default_logger(m_system_logger);

    spdlog::cfg::load_argv_levels(argc, argv);

    m_system_logger->info("Logging engine initialized");
}

Recycler::logging::logger::~logger()
{
    if (not m_system_logger)
    {
        return;
    }

    m_system_logger->info("Shutting down logging system");

    m_system_logger->flush();
    m_pool_logger->flush();

    spdlog::set_default_logger(m_previous_default);
    spdlog::drop(m_pool_logger->name());
    spdlog::drop(m_system_logger->name());
}
