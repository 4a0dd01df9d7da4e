/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_ZSTD_HPP
#define ZEROKIT_ZSTD_HPP

extern "C" {
#   include <zstd.h>
#   include <zstd_errors.h>
};
#include <memory>
#include <string>
#include <string_view>
#include <zk/file.hpp>

/*
 * Compressed datasets: a single zstd frame with the content size recorded in its header,
 * so the whole decompressed dataset lands in one allocation that can serve as a cart.
 */
namespace zerokit::zstd {
    static constexpr int default_level = 3;
    static constexpr size_t default_max_size = static_cast<size_t>(1) << 28;

    template<typename T, size_t (*FREE)(T *)>
    struct context_deleter {
        void operator()(T *ctx) const noexcept
        {
            FREE(ctx);
        }
    };

    using compress_context = std::unique_ptr<ZSTD_CCtx, context_deleter<ZSTD_CCtx, ZSTD_freeCCtx>>;
    using decompress_context = std::unique_ptr<ZSTD_DCtx, context_deleter<ZSTD_DCtx, ZSTD_freeDCtx>>;

    inline size_t check(const size_t res, const std::string_view op)
    {
        if (ZSTD_isError(res)) [[unlikely]]
            throw error(fmt::format("zstd {} failed: {}", op, ZSTD_getErrorName(res)));
        return res;
    }

    // contexts are reused by all calls made from the same thread
    inline ZSTD_CCtx &thread_compressor(const int level)
    {
        thread_local compress_context ctx { ZSTD_createCCtx() };
        if (!ctx) [[unlikely]]
            throw error("zstd could not allocate a compression context");
        check(ZSTD_CCtx_reset(ctx.get(), ZSTD_reset_session_only), "context reset");
        check(ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_compressionLevel, level), fmt::format("setting level {}", level));
        return *ctx;
    }

    inline ZSTD_DCtx &thread_decompressor()
    {
        thread_local decompress_context ctx { ZSTD_createDCtx() };
        if (!ctx) [[unlikely]]
            throw error("zstd could not allocate a decompression context");
        check(ZSTD_DCtx_reset(ctx.get(), ZSTD_reset_session_only), "context reset");
        return *ctx;
    }

    inline void compress(uint8_vector &out, const buffer orig, const int level=default_level)
    {
        out.resize(ZSTD_compressBound(orig.size()));
        const auto sz = check(ZSTD_compress2(&thread_compressor(level), out.data(), out.size(), orig.data(), orig.size()), "compression");
        out.resize(sz);
    }

    inline uint8_vector compress(const buffer orig, const int level=default_level)
    {
        uint8_vector res {};
        compress(res, orig, level);
        return res;
    }

    // Throws error when the frame does not record its content size
    inline uint64_t decompressed_size(const buffer compressed)
    {
        const auto sz = ZSTD_getFrameContentSize(compressed.data(), compressed.size());
        if (sz == ZSTD_CONTENTSIZE_UNKNOWN) [[unlikely]]
            throw error("the zstd frame does not record its content size");
        if (sz == ZSTD_CONTENTSIZE_ERROR) [[unlikely]]
            throw error(fmt::format("{} bytes do not start with a valid zstd frame", compressed.size()));
        return sz;
    }

    // max_size bounds the allocation a crafted frame header could request
    inline void decompress(uint8_vector &out, const buffer compressed, const size_t max_size=default_max_size)
    {
        const auto expected_size = decompressed_size(compressed);
        if (expected_size > max_size) [[unlikely]]
            throw error(fmt::format("the zstd frame declares {} bytes but at most {} are allowed", expected_size, max_size));
        out.resize(expected_size);
        const auto sz = check(ZSTD_decompressDCtx(&thread_decompressor(), out.data(), out.size(), compressed.data(), compressed.size()), "decompression");
        if (sz != expected_size) [[unlikely]]
            throw error(fmt::format("the zstd frame declares {} bytes but produced {}", expected_size, sz));
    }

    inline uint8_vector decompress(const buffer compressed, const size_t max_size=default_max_size)
    {
        uint8_vector out {};
        decompress(out, compressed, max_size);
        return out;
    }

    inline uint8_vector read(const std::string &path, const size_t max_size=default_max_size)
    {
        return decompress(file::read(path), max_size);
    }

    // the decompressed contents as an immutable shared buffer suitable for a yoke's cart
    inline std::shared_ptr<const uint8_vector> read_shared(const std::string &path, const size_t max_size=default_max_size)
    {
        return std::make_shared<const uint8_vector>(read(path, max_size));
    }

    inline void write(const std::string &path, const buffer data, const int level=default_level)
    {
        file::write(path, compress(data, level));
    }
}

#endif // !ZEROKIT_ZSTD_HPP
