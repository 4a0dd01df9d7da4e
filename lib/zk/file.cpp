/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdio>
#include <system_error>
#include <zk/file.hpp>
#include <zk/logger.hpp>

namespace zerokit::file {
    namespace {
        struct file_handle {
            file_handle(const std::string &path, const char *mode):
                _f { std::fopen(path.c_str(), mode) }
            {
                if (_f == nullptr) [[unlikely]]
                    throw error_sys(fmt::format("failed to open {} in mode {}", path, mode));
            }

            ~file_handle()
            {
                if (_f != nullptr)
                    std::fclose(_f);
            }

            file_handle(const file_handle &) =delete;
            file_handle &operator=(const file_handle &) =delete;

            std::FILE *get() const noexcept
            {
                return _f;
            }

            void close(const std::string &path)
            {
                auto *f = _f;
                _f = nullptr;
                if (std::fclose(f) != 0) [[unlikely]]
                    throw error_sys(fmt::format("failed to close {}", path));
            }
        private:
            std::FILE *_f;
        };
    }

    void read(const std::string &path, uint8_vector &buf)
    {
        std::error_code ec {};
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("failed to determine the size of {}: {}", path, ec.message()));
        file_handle f { path, "rb" };
        buf.resize(size);
        if (size > 0 && std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", buf.size(), path));
        logger::trace("read {} bytes from {}", buf.size(), path);
    }

    void write(const std::string &path, const buffer data)
    {
        const std::filesystem::path p { path };
        if (p.has_parent_path())
            std::filesystem::create_directories(p.parent_path());
        file_handle f { path, "wb" };
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
        f.close(path);
        logger::trace("wrote {} bytes to {}", data.size(), path);
    }

    tmp::tmp(const std::string &name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        if (!std::filesystem::remove(_path, ec) && ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}
