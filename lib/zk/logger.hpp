/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_LOGGER_HPP
#define ZEROKIT_LOGGER_HPP

#include <memory>
#include <string>
#include <string_view>
#include <zk/common/format.hpp>

namespace zerokit::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    /*
     * Read once from the environment before the first message is logged:
     *   ZK_LOG             - the log file, ./log/zk.log by default
     *   ZK_DEBUG           - enables trace messages
     *   ZK_LOG_NO_CONSOLE  - disables the stderr output
     */
    struct config {
        std::string path = "./log/zk.log";
        bool console = true;
        bool trace = false;

        static config from_env();
    };

    extern const config &active_config();
    extern void log(level lev, const std::string &msg);
    extern std::shared_ptr<std::string> last_error();
    extern void reset_last_error();

    inline bool tracing_enabled()
    {
        return active_config().trace;
    }

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        log(lev, fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    // formatting is skipped when the trace output is disabled
    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        if (tracing_enabled())
            log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    // also remembered as the last error
    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }
}

#endif // !ZEROKIT_LOGGER_HPP
