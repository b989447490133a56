/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cm/config.hpp>
#include <cm/error.hpp>
#include <cm/logger.hpp>

namespace chain_mirror::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("CM_DEBUG") != nullptr;
        return enabled;
    }

    static std::string log_path()
    {
        const char *env_log_path = std::getenv("CM_LOG");
        return install_path(env_log_path ? env_log_path : "./log/cm.log");
    }

    static bool console_enabled()
    {
        return !std::getenv("CM_LOG_NO_CONSOLE");
    }

    static spdlog::logger create(const std::string &path)
    {
        std::cerr << fmt::format("CM_INIT: log path: {}\n", path);
        {
            const auto dir = std::filesystem::path { path }.parent_path();
            if (!dir.empty())
                std::filesystem::create_directories(dir);
            std::ofstream os { path, std::ios_base::app };
            if (!os) {
                std::cerr << fmt::format("CM_INIT: Unable to write to the log file: {}; terminating.\n", path);
                std::terminate();
            }
        }

        std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink {};
        if (console_enabled()) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        auto logger = console_sink
            ? spdlog::logger("cm", { console_sink, file_sink })
            : spdlog::logger("cm", { file_sink });
        logger.set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        logger.debug("installation directory: {}", install_path(""));
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    void log(const level lev, const std::string &msg)
    {
        switch (lev) {
            case level::trace:
                get().trace(msg);
                break;
            case level::debug:
                get().debug(msg);
                break;
            case level::info:
                get().info(msg);
                break;
            case level::warn:
                get().warn(msg);
                break;
            case level::error:
                get().error(msg);
                break;
            default:
                throw chain_mirror::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}
