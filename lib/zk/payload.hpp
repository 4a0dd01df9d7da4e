/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_PAYLOAD_HPP
#define ZEROKIT_PAYLOAD_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <boost/core/demangle.hpp>
#include <zk/yoke.hpp>

namespace zerokit {
    enum class data_error_kind {
        missing_payload,
        mismatched_type,
        invalid_state,
        custom,
        io
    };

    struct data_error: error {
        explicit data_error(const data_error_kind kind, const std::string_view msg):
            error { msg }, _kind { kind }
        {
        }

        data_error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        data_error_kind _kind;
    };

    using shared_buffer = std::shared_ptr<const uint8_vector>;
    // an empty cart means the payload owns its data or borrows only static data
    using buffer_cart = std::optional<shared_buffer>;

    template<typename Y>
    struct payload {
        using yokeable_type = Y;
        using yoke_type = yoke<Y, buffer_cart>;

        // v must not borrow from anything but static data
        static payload from_owned(Y v)
        {
            return payload { yoke_type::unchecked_attach(std::nullopt, std::move(v)) };
        }

        // parse(buffer) -> Y views the shared bytes, which stay alive as long as the payload or its projections
        template<typename F>
        static payload from_shared_buffer(shared_buffer bytes, F &&parse)
        {
            auto y = yoke<Y, shared_buffer>::attach(std::move(bytes), [&](const uint8_vector &data) -> Y {
                return std::invoke(std::forward<F>(parse), static_cast<buffer>(data));
            });
            return payload { std::move(y).wrap_cart_in_option() };
        }

        // bytes must have the static storage duration
        template<typename F>
        static payload from_static_buffer(const buffer bytes, F &&parse)
        {
            return from_owned(std::invoke(std::forward<F>(parse), bytes));
        }

        explicit payload(yoke_type &&y):
            _yoke { std::move(y) }
        {
        }

        const Y &get() const & noexcept
        {
            return _yoke.get();
        }

        const Y &get() const && =delete;

        bool has_cart() const noexcept
        {
            return _yoke.backing_cart().has_value();
        }

        const yoke_type &as_yoke() const noexcept
        {
            return _yoke;
        }

        template<typename F>
        auto map_project(F &&f) && -> payload<projection_result_t<F, Y &&, buffer_cart>>
        {
            using result_type = payload<projection_result_t<F, Y &&, buffer_cart>>;
            return result_type { std::move(_yoke).map_project(std::forward<F>(f)) };
        }

        template<typename F>
        auto map_project_cloned(F &&f) const & -> payload<projection_result_t<F, const Y &, buffer_cart>>
        {
            using result_type = payload<projection_result_t<F, const Y &, buffer_cart>>;
            return result_type { _yoke.map_project_cloned(std::forward<F>(f)) };
        }

        template<typename F>
        auto try_map_project(F &&f) && -> std::optional<payload<typename projection_result_t<F, Y &&, buffer_cart>::value_type>>
        {
            using result_type = payload<typename projection_result_t<F, Y &&, buffer_cart>::value_type>;
            auto res = std::move(_yoke).try_map_project(std::forward<F>(f));
            if (!res)
                return {};
            return result_type { std::move(*res) };
        }

        // Throws data_error(invalid_state) when the value borrows from a buffer
        Y try_unwrap_owned() &&
        {
            auto res = std::move(_yoke).try_into_yokeable();
            if (!res) [[unlikely]]
                throw data_error(data_error_kind::invalid_state, "the payload borrows from a buffer and cannot be unwrapped");
            return std::move(*res);
        }
    private:
        yoke_type _yoke;
    };

    // A payload of any type that remembers the type it was created with.
    struct any_payload {
        template<typename Y>
        static any_payload from(payload<Y> p)
        {
            return any_payload { std::make_shared<const payload<Y>>(std::move(p)), typeid(Y) };
        }

        std::string type_name() const
        {
            return boost::core::demangle(_type.name());
        }

        template<typename Y>
        bool is() const noexcept
        {
            return _type == std::type_index { typeid(Y) };
        }

        // A copy of the stored payload sharing its buffer. Throws data_error(mismatched_type).
        template<typename Y>
        payload<Y> downcast() const
        {
            if (!is<Y>()) [[unlikely]]
                throw data_error(data_error_kind::mismatched_type,
                    fmt::format("tried to downcast with {} but the actual type is {}", boost::core::demangle(typeid(Y).name()), type_name()));
            return *std::static_pointer_cast<const payload<Y>>(_ptr);
        }
    private:
        erased_cart _ptr;
        std::type_index _type;

        any_payload(erased_cart &&ptr, const std::type_info &type):
            _ptr { std::move(ptr) }, _type { type }
        {
        }
    };

    struct response_metadata {
        std::optional<std::string> locale {};
    };

    template<typename Y>
    struct data_response {
        response_metadata metadata {};
        std::optional<zerokit::payload<Y>> payload {};

        // Throws data_error(missing_payload)
        zerokit::payload<Y> take_payload() &&
        {
            if (!payload) [[unlikely]]
                throw data_error(data_error_kind::missing_payload, "the response has no payload");
            auto res = std::move(*payload);
            payload.reset();
            return res;
        }
    };
}

namespace fmt {
    template<>
    struct formatter<zerokit::data_error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const zerokit::data_error_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using zerokit::data_error_kind;
            switch (v) {
                case data_error_kind::missing_payload: return fmt::format_to(ctx.out(), "missing_payload");
                case data_error_kind::mismatched_type: return fmt::format_to(ctx.out(), "mismatched_type");
                case data_error_kind::invalid_state: return fmt::format_to(ctx.out(), "invalid_state");
                case data_error_kind::custom: return fmt::format_to(ctx.out(), "custom");
                case data_error_kind::io: return fmt::format_to(ctx.out(), "io");
                default: throw zerokit::error(fmt::format("unsupported data_error_kind: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !ZEROKIT_PAYLOAD_HPP
