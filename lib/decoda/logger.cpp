/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <decoda/logger.hpp>

namespace decoda::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("DECODA_DEBUG") != nullptr;
        return enabled;
    }

    static std::string log_path()
    {
        const char *env_log_path = std::getenv("DECODA_LOG");
        return env_log_path ? env_log_path : "./log/decoda.log";
    }

    static bool console_enabled()
    {
        return !std::getenv("DECODA_LOG_NO_CONSOLE");
    }

    static bool file_writable(const std::string &path)
    {
        std::error_code ec {};
        if (const auto dir = std::filesystem::path { path }.parent_path(); !dir.empty())
            std::filesystem::create_directories(dir, ec);
        std::ofstream os { path, std::ios_base::app };
        return static_cast<bool>(os);
    }

    static spdlog::logger create(const std::string &path)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (console_enabled()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (file_writable(path)) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        } else {
            std::cerr << fmt::format("DECODA_INIT: unable to write to the log file: {}; file logging is disabled\n", path);
        }
        spdlog::logger logger { "decoda", sinks.begin(), sinks.end() };
        if (tracing_enabled()) {
            logger.set_level(spdlog::level::trace);
        } else {
            logger.set_level(spdlog::level::debug);
        }
        logger.flush_on(spdlog::level::debug);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    void log(level lev, const std::string &msg)
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
                throw decoda::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}
