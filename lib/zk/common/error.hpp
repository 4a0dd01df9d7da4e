/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_COMMON_ERROR_HPP
#define ZEROKIT_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zerokit {
    // Untrusted input is rejected in tight loops, so errors about malformed bytes are created without a stack trace.
    enum class trace_mode { capture, skip };

    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg, trace_mode mode=trace_mode::capture);
        const char *what() const noexcept override;

        bool has_trace() const noexcept
        {
            return _has_trace;
        }
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
        bool _has_trace = false;
    };

    struct error: base_error {
        explicit error(std::string_view msg, trace_mode mode=trace_mode::capture);
        explicit error(std::string_view msg, const std::exception &cause);
    };

    // appends errno and its description to the message
    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !ZEROKIT_COMMON_ERROR_HPP
