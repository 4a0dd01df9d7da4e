/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <cstring>
#include <typeinfo>
#include <boost/core/demangle.hpp>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <zk/logger.hpp>

namespace zerokit {
    base_error::base_error(const std::string_view msg, const trace_mode mode):
        _msg { msg }
    {
        if (mode == trace_mode::capture) {
            // the top frames are safe_dump_to and the constructors of the error hierarchy
            const auto frames = boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
            _has_trace = frames > 0;
        }
    }

    const char *base_error::what() const noexcept
    {
        if (_has_trace) {
            thread_local std::array<char, 0x2000> buf {};
            boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
            os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
            // one byte is always left for the terminator
            buf[os.buffer().second] = 0;
            logger::debug("{} raised at:\n{}", _msg, buf.data());
        }
        return _msg.c_str();
    }

    error::error(const std::string_view msg, const trace_mode mode):
        base_error { msg, mode }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause):
        error { fmt::format("{} caused by {}: {}", msg, boost::core::demangle(typeid(cause).name()), cause.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg):
        error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}
