/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_ZERO_ERROR_HPP
#define ZEROKIT_ZERO_ERROR_HPP

#include <string_view>
#include <zk/common/error.hpp>
#include <zk/common/format.hpp>

namespace zerokit {
    enum class zero_error_kind {
        length_mismatch,
        invalid_offset_table,
        invalid_element,
        unsorted_keys,
        index_out_of_range,
        duplicate_key
    };

    // Base of all failures reported by the zero-copy containers.
    // Constructors that accept untrusted bytes throw only exceptions of this family, and these carry no stack trace.
    struct zero_copy_error: error {
        explicit zero_copy_error(const zero_error_kind kind, const std::string_view msg):
            error { msg, trace_mode::skip }, _kind { kind }
        {
        }

        zero_error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        zero_error_kind _kind;
    };

    template<zero_error_kind K>
    struct zero_copy_error_of: zero_copy_error {
        static constexpr zero_error_kind error_kind = K;

        explicit zero_copy_error_of(const std::string_view msg):
            zero_copy_error { K, msg }
        {
        }
    };

    using length_mismatch_error = zero_copy_error_of<zero_error_kind::length_mismatch>;
    using invalid_offset_table_error = zero_copy_error_of<zero_error_kind::invalid_offset_table>;
    using invalid_element_error = zero_copy_error_of<zero_error_kind::invalid_element>;
    using unsorted_keys_error = zero_copy_error_of<zero_error_kind::unsorted_keys>;
    using index_out_of_range_error = zero_copy_error_of<zero_error_kind::index_out_of_range>;
    using duplicate_key_error = zero_copy_error_of<zero_error_kind::duplicate_key>;
}

namespace fmt {
    template<>
    struct formatter<zerokit::zero_error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const zerokit::zero_error_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using zerokit::zero_error_kind;
            switch (v) {
                case zero_error_kind::length_mismatch: return fmt::format_to(ctx.out(), "length_mismatch");
                case zero_error_kind::invalid_offset_table: return fmt::format_to(ctx.out(), "invalid_offset_table");
                case zero_error_kind::invalid_element: return fmt::format_to(ctx.out(), "invalid_element");
                case zero_error_kind::unsorted_keys: return fmt::format_to(ctx.out(), "unsorted_keys");
                case zero_error_kind::index_out_of_range: return fmt::format_to(ctx.out(), "index_out_of_range");
                case zero_error_kind::duplicate_key: return fmt::format_to(ctx.out(), "duplicate_key");
                default: throw zerokit::error(fmt::format("unsupported zero_error_kind: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !ZEROKIT_ZERO_ERROR_HPP
