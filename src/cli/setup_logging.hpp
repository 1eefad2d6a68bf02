//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_CLI_SETUP_LOGGING_HPP_INCLUDED
#define ZCLI_CLI_SETUP_LOGGING_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace detail
{

/// Maps numeric log level (`10=DEBUG` ... `50=CRITICAL`, `0` for everything) to the spdlog one.
///
inline spdlog::level::level_enum levelFromNumber(const int level)
{
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
    if (level <= 0)
    {
        return spdlog::level::trace;
    }
    if (level <= 10)
    {
        return spdlog::level::debug;
    }
    if (level <= 20)
    {
        return spdlog::level::info;
    }
    if (level <= 30)
    {
        return spdlog::level::warn;
    }
    if (level <= 40)
    {
        return spdlog::level::err;
    }
    return spdlog::level::critical;
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
}

}  // namespace detail

/// Sets up the logging system.
///
/// All loggers write to the standard error (the standard output is reserved for data),
/// and optionally to a rotating log file. Levels may be overridden per logger
/// with `SPDLOG_LEVEL` environment variable (like `SPDLOG_LEVEL=info,codec=trace`).
///
inline void setupLogging(const int log_level, const cetl::optional<std::string>& log_file)
{
    using spdlog::sinks::rotating_file_sink_mt;
    using spdlog::sinks::stderr_color_sink_mt;

    try
    {
        constexpr std::size_t log_max_files     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<stderr_color_sink_mt>());
        if (log_file)
        {
            sinks.push_back(std::make_shared<rotating_file_sink_mt>(*log_file, log_file_max_size, log_max_files));
        }
        for (const auto& sink : sinks)
        {
            sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");
        }

        const auto default_logger = std::make_shared<spdlog::logger>("", sinks.begin(), sinks.end());
        register_logger(default_logger);
        set_default_logger(default_logger);

        // Register specific subsystem loggers.
        //
        register_logger(std::make_shared<spdlog::logger>("io", sinks.begin(), sinks.end()));
        register_logger(std::make_shared<spdlog::logger>("sdk", sinks.begin(), sinks.end()));
        register_logger(std::make_shared<spdlog::logger>("codec", sinks.begin(), sinks.end()));
        register_logger(std::make_shared<spdlog::logger>("cli", sinks.begin(), sinks.end()));

        spdlog::set_level(detail::levelFromNumber(log_level));
        spdlog::flush_on(spdlog::level::err);

        // Accept `SPDLOG_LEVEL` environment variable (like `SPDLOG_LEVEL=debug,sdk=trace`).
        //
        spdlog::cfg::load_env_levels();

        if (log_file)
        {
            // Insert "--…--" just to have clearer separation in the log file between two different process runs.
            spdlog::info("--------------------------");
        }

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

#endif  // ZCLI_CLI_SETUP_LOGGING_HPP_INCLUDED
