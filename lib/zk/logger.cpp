/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <zk/common/error.hpp>
#include <zk/logger.hpp>

namespace zerokit::logger {
    static std::mutex last_error_mutex {};
    static std::shared_ptr<std::string> last_error_ptr {};

    std::shared_ptr<std::string> last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        return last_error_ptr;
    }

    void reset_last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        last_error_ptr.reset();
    }

    config config::from_env()
    {
        config cfg {};
        if (const char *path = std::getenv("ZK_LOG"); path && *path)
            cfg.path = path;
        cfg.console = std::getenv("ZK_LOG_NO_CONSOLE") == nullptr;
        cfg.trace = std::getenv("ZK_DEBUG") != nullptr;
        return cfg;
    }

    const config &active_config()
    {
        static const config cfg = config::from_env();
        return cfg;
    }

    static spdlog::logger create(const config &cfg)
    {
        {
            const auto dir = std::filesystem::path { cfg.path }.parent_path();
            std::error_code ec {};
            if (!dir.empty())
                std::filesystem::create_directories(dir, ec);
            std::ofstream os { cfg.path, std::ios_base::app };
            // there is no log to report the failure to yet
            if (!os) {
                std::cerr << fmt::format("zerokit: cannot write to the log file {}\n", cfg.path);
                std::terminate();
            }
        }
        std::vector<spdlog::sink_ptr> sinks {};
        if (cfg.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.path);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        sinks.emplace_back(std::move(file_sink));
        spdlog::logger logger { "zk", sinks.begin(), sinks.end() };
        logger.set_level(cfg.trace ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        logger.debug("log path: {} console: {} trace: {}", cfg.path, cfg.console, cfg.trace);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(active_config());
        return logger;
    }

    static spdlog::level::level_enum native_level(const level lev)
    {
        switch (lev) {
            case level::trace: return spdlog::level::trace;
            case level::debug: return spdlog::level::debug;
            case level::info: return spdlog::level::info;
            case level::warn: return spdlog::level::warn;
            case level::error: return spdlog::level::err;
            default: throw zerokit::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }

    void log(const level lev, const std::string &msg)
    {
        get().log(native_level(lev), msg);
        if (lev == level::error) {
            std::scoped_lock lk { last_error_mutex };
            last_error_ptr = std::make_shared<std::string>(msg);
        }
    }
}
