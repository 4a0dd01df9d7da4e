/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_FILE_HPP
#define ZEROKIT_FILE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <zk/common/bytes.hpp>

namespace zerokit::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, buffer data);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    // the whole file as an immutable shared buffer suitable for a yoke's cart
    inline std::shared_ptr<const uint8_vector> read_shared(const std::string &path)
    {
        return std::make_shared<const uint8_vector>(read(path));
    }

    // A scratch file in the system's temporary directory removed when this object is destroyed
    struct tmp {
        explicit tmp(const std::string &name);
        ~tmp();
        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !ZEROKIT_FILE_HPP
