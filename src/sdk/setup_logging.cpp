//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "remoting/sdk/setup_logging.hpp"

#include "remoting/sdk/config.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace remoting
{
namespace sdk
{
namespace
{

void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_levels_len))
    {
        return;
    }

    auto key_vals = spdlog::cfg::helpers::extract_key_vals_(flush_levels);  // NOLINT
    for (auto& name_level : key_vals)
    {
        const auto& logger_name = name_level.first;
        auto&       level_name  = spdlog::cfg::helpers::to_lower_(name_level.second);  // NOLINT
        const auto  level       = spdlog::level::from_str(level_name);
        // Ignore unrecognized level names.
        if (level == spdlog::level::off && level_name != "off")
        {
            continue;
        }

        if (logger_name.empty())
        {
            spdlog::default_logger()->flush_on(level);
        }
        else if (const auto logger = spdlog::get(logger_name))
        {
            logger->flush_on(level);
        }
    }

    // Apply default flush level to all other loggers (if not specified in the `key_vals`).
    //
    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&key_vals, default_flush_level](const auto& logger) {
        //
        // Skip default logger and loggers with explicit flush levels.
        if (!logger->name().empty() && (key_vals.find(logger->name()) == key_vals.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Search for SPDLOG_FLUSH_LEVEL= in the args and use it to init the flush levels.
///
void loadArgvFlushLevels(const int argc, const char** const argv)
{
    const std::string spdlog_level_prefix = "SPDLOG_FLUSH_LEVEL=";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg_str.find(spdlog_level_prefix) == 0)
        {
            loadFlushLevels(arg_str.substr(spdlog_level_prefix.size()));
        }
    }
}

}  // namespace

int setupLogging(const Config::Ptr& config, const int argc, const char** const argv)
{
    using spdlog::sinks::rotating_file_sink_mt;

    try
    {
        constexpr std::size_t log_files_max     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        std::string log_file_path = "./remoting.log";
        if (config)
        {
            if (const auto logging_file = config->getLoggingFile())
            {
                log_file_path = logging_file.value();
            }
        }

        const auto file_sink = std::make_shared<rotating_file_sink_mt>(log_file_path, log_file_max_size, log_files_max);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P:%t] [%n] [%l] %v");

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        const auto default_logger = std::make_shared<spdlog::logger>("", file_sink);
        register_logger(default_logger);
        set_default_logger(default_logger);

        // Register specific subsystem loggers.
        //
        register_logger(std::make_shared<spdlog::logger>("sdk", file_sink));
        register_logger(std::make_shared<spdlog::logger>("ipc", file_sink));

        // Setup log levels from the configuration file.
        // Also accept `SPDLOG_LEVEL` & `SPDLOG_FLUSH_LEVEL` arguments if any (like `SPDLOG_LEVEL=info,sdk=trace`).
        //
        if (config)
        {
            if (const auto logging_level = config->getLoggingLevel())
            {
                spdlog::cfg::helpers::load_levels(logging_level.value());
            }
            if (const auto logging_flush_level = config->getLoggingFlushLevel())
            {
                loadFlushLevels(logging_flush_level.value());
            }
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        loadArgvFlushLevels(argc, argv);

        // Insert "--…--" just to have clearer separation in the log file between two different process runs.
        //
        if (spdlog::default_logger()->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }
        return 0;

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        return EINVAL;
    }
}

}  // namespace sdk
}  // namespace remoting
