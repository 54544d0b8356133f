#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <tracy/Tracy.hpp>

#include <CLI/CLI.hpp>

#include "logging/logger.hpp"
#include "memory/pool.hpp"

namespace
{
    struct bench_options
    {
        std::size_t size = 4 * 1024;
        std::size_t iterations = 100000;
        std::size_t threads = 1;
        std::string store = "scan";
        Recycler::memory::pool_options pool{};
    };

    std::unique_ptr<bench_options> add_arguments(CLI::App& app)
    {
        auto options = std::make_unique<bench_options>();

        // To allow arguments to be passed to spdlog we need to ignore extra commands
        app.allow_extras();

        app.add_option("-s,--size", options->size, "The buffer size in bytes")->capture_default_str()->check(CLI::PositiveNumber);
        app.add_option("-i,--iterations", options->iterations, "Iterations per thread")->capture_default_str()->check(CLI::PositiveNumber);
        app.add_option("-t,--threads", options->threads, "Number of threads sharing one pool")->capture_default_str()->check(CLI::PositiveNumber);
        app.add_option("-w,--scan-window", options->pool.scan_window, "Number of recently released buffers scanned for a match")->capture_default_str()->check(CLI::PositiveNumber);
        app.add_option("--thresholds", options->pool.size_class_thresholds, "Size class boundaries of the partitioned store")->capture_default_str();
        app.add_option("--store", options->store, "Free list layout")->capture_default_str()->check(CLI::IsMember({"scan", "partitioned"}));

        return options;
    }

    // Write every byte, simulating a Write::write style fill of the buffer
    template<typename TBuffer>
    void touch(TBuffer& buffer, std::size_t size)
    {
        for (std::size_t i = 0; i < size; ++i)
        {
            buffer[i] = 1;
        }
    }

    template<typename TWork>
    double run_timed(std::size_t threads, TWork const& work)
    {
        auto const start = std::chrono::steady_clock::now();
        {
            std::vector<std::jthread> workers{};
            workers.reserve(threads);
            for (std::size_t i = 0; i < threads; ++i)
            {
                workers.emplace_back(work);
            }
        }
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

    void report(std::shared_ptr<spdlog::logger> const& logger, std::string_view name, bench_options const& options, double seconds)
    {
        auto const bytes = static_cast<double>(options.size * options.iterations * options.threads);
        logger->info("{:<24} {:>10.3f} ms {:>10.1f} MiB/s", name, seconds * 1000.0, bytes / seconds / (1024.0 * 1024.0));
    }

    double base_line_vec(bench_options const& options)
    {
        return run_timed(options.threads, [&options]()
        {
            ZoneScopedN("base_line_vec");
            for (std::size_t n = 0; n < options.iterations; ++n)
            {
                std::vector<std::uint8_t> buffer(options.size, 0);
                touch(buffer, options.size);
            }
        });
    }

    template<template<typename> typename TStore>
    double byte_pool(bench_options const& options)
    {
        Recycler::memory::pool<Recycler::memory::raw_buffer, TStore> pool(options.pool);

        auto const seconds = run_timed(options.threads, [&options, &pool]()
        {
            ZoneScopedN("byte_pool");
            for (std::size_t n = 0; n < options.iterations; ++n)
            {
                auto buffer = pool.alloc(options.size);
                touch(buffer, options.size);
            }
        });

        options.pool.logger->debug("{} idle buffers left after the run", pool.idle_count());
        return seconds;
    }
}

int main(int argc, char const** argv)
{
    ZoneScoped;

    CLI::App app{"Measures buffer acquisition through the recycling pool against plain allocation."};
    auto options = add_arguments(app);
    CLI11_PARSE(app, argc, argv);

    auto logger = std::make_shared<Recycler::logging::logger>();
    logger->init_logger(argc, argv);

    logger->get_system_logger()->info("The benchmark is starting, the version is {}", RECYCLER_VERSION);
    options->pool.logger = logger->get_pool_logger();

    try
    {
        report(logger->get_system_logger(), "base_line_vec", *options, base_line_vec(*options));

        if (options->store == "partitioned")
        {
            report(logger->get_system_logger(), "byte_pool (partitioned)", *options,
                   byte_pool<Recycler::memory::partitioned_store>(*options));
        }
        else
        {
            report(logger->get_system_logger(), "byte_pool (scan)", *options,
                   byte_pool<Recycler::memory::recent_scan_store>(*options));
        }
    }
    catch (std::invalid_argument const& e)
    {
        logger->get_system_logger()->error("Invalid pool configuration: {}", e.what());
        return 1;
    }

    return 0;
}
