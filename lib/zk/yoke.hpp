/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZEROKIT_YOKE_HPP
#define ZEROKIT_YOKE_HPP

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <zk/common/bytes.hpp>

namespace zerokit {
    // Static data that lives until the end of the program
    struct static_cart {
        buffer bytes {};
    };

    // A shared owner whose type is no longer known; keeps the contents alive and nothing else
    using erased_cart = std::shared_ptr<const void>;

    /*
     * A cart owns the data a yoke's derived value borrows from. Only pointer-like owners qualify:
     * the address of the contents must not change when the cart itself is moved.
     *   static constexpr bool cloneable;                - copies share the same contents
     *   static const target_type *target(const C &);    - nullptr when the cart holds nothing
     */
    template<typename C>
    struct cart_traits;

    template<typename T, typename D>
    struct cart_traits<std::unique_ptr<T, D>> {
        using target_type = T;
        static constexpr bool cloneable = false;

        static const target_type *target(const std::unique_ptr<T, D> &c) noexcept
        {
            return c.get();
        }
    };

    template<typename T>
    struct cart_traits<std::shared_ptr<T>> {
        using target_type = T;
        static constexpr bool cloneable = true;

        static const target_type *target(const std::shared_ptr<T> &c) noexcept
        {
            return c.get();
        }
    };

    template<>
    struct cart_traits<std::shared_ptr<const void>> {
        static constexpr bool cloneable = true;
    };

    template<>
    struct cart_traits<static_cart> {
        using target_type = buffer;
        static constexpr bool cloneable = true;

        static const target_type *target(const static_cart &c) noexcept
        {
            return &c.bytes;
        }
    };

    template<typename C>
    struct cart_traits<std::optional<C>> {
        using target_type = typename cart_traits<C>::target_type;
        static constexpr bool cloneable = cart_traits<C>::cloneable;

        static const target_type *target(const std::optional<C> &c) noexcept
        {
            return c ? cart_traits<C>::target(*c) : nullptr;
        }
    };

    template<typename C>
    concept cart = std::movable<C> && requires {
        { cart_traits<C>::cloneable } -> std::convertible_to<bool>;
    };

    template<typename C>
    concept cloneable_cart = cart<C> && cart_traits<C>::cloneable && std::copy_constructible<C>;

    template<typename C>
    concept dereferenceable_cart = cart<C> && requires(const C &c) {
        { cart_traits<C>::target(c) };
    };

    // The bytes a derived value borrows: its bytes() when it has one, or itself when it is a byte view
    template<typename Y>
    buffer borrowed_bytes(const Y &v)
    {
        if constexpr (requires { { v.bytes() } -> std::convertible_to<buffer>; })
            return v.bytes();
        else
            return buffer { v };
    }

    // A projection is either f(derived) or f(derived, cart) where the cart is passed for reading only
    template<typename F, typename Y, typename C>
    decltype(auto) invoke_projection(F &&f, Y &&derived, const C &c)
    {
        if constexpr (std::is_invocable_v<F, Y &&, const C &>)
            return std::invoke(std::forward<F>(f), std::forward<Y>(derived), c);
        else
            return std::invoke(std::forward<F>(f), std::forward<Y>(derived));
    }

    template<typename F, typename Y, typename C>
    using projection_result_t = std::decay_t<decltype(invoke_projection(std::declval<F>(), std::declval<Y>(), std::declval<const C &>()))>;

    /*
     * A derived value together with the cart it borrows from. The cart is declared before the derived value,
     * so the derived value is destroyed first and can never outlive its cart. The two are never handed out
     * separately: get() exposes the derived value only for the lifetime of the yoke, and map_project
     * produces a new derived value from the same cart without copying or reallocating the cart's contents.
     * A moved-from yoke may only be destroyed or assigned to.
     */
    template<typename Y, cart C>
    struct yoke {
        using yokeable_type = Y;
        using cart_type = C;

        // borrow receives the cart's contents and returns a value viewing them
        template<typename F>
            requires dereferenceable_cart<C> && std::is_invocable_r_v<Y, F, const typename cart_traits<C>::target_type &>
        static yoke attach(C c, F &&borrow)
        {
            const auto *target = cart_traits<C>::target(c);
            if (!target) [[unlikely]]
                throw error("cannot attach to an empty cart");
            Y derived = std::invoke(std::forward<F>(borrow), *target);
            return yoke { std::move(c), std::move(derived) };
        }

        // Like attach but additionally verifies that the derived value's bytes lie within the cart's contents.
        template<typename F>
            requires dereferenceable_cart<C> && std::is_invocable_r_v<Y, F, const typename cart_traits<C>::target_type &>
        static yoke attach_borrowed(C c, F &&borrow)
        {
            yoke res = attach(std::move(c), std::forward<F>(borrow));
            const buffer cart_bytes { *cart_traits<C>::target(res._cart) };
            if (!cart_bytes.contains(borrowed_bytes(res._derived))) [[unlikely]]
                throw error(fmt::format("the derived value's {} bytes are not within the cart's {} bytes", borrowed_bytes(res._derived).size(), cart_bytes.size()));
            return res;
        }

        /*
         * The caller guarantees that derived references only the data owned by c, or no borrowed data at all,
         * and that this data keeps its address while c is alive. Nothing here verifies it.
         */
        static yoke unchecked_attach(C c, Y derived)
        {
            return yoke { std::move(c), std::move(derived) };
        }

        yoke(yoke &&) =default;
        yoke(const yoke &) requires cloneable_cart<C> && std::copy_constructible<Y> =default;

        // The old derived value is replaced while its cart is still alive, and only then the old cart is released.
        yoke &operator=(yoke &&o)
        {
            if (this != &o) {
                _derived = std::move(o._derived);
                _cart = std::move(o._cart);
            }
            return *this;
        }

        yoke &operator=(const yoke &o) requires cloneable_cart<C> && std::copy_constructible<Y>
        {
            if (this != &o) {
                _derived = o._derived;
                _cart = o._cart;
            }
            return *this;
        }

        const Y &get() const & noexcept
        {
            return _derived;
        }

        // a reference into a temporary yoke would outlive its cart
        const Y &get() const && =delete;

        const C &backing_cart() const noexcept
        {
            return _cart;
        }

        // f(Y &&) -> Y2 or f(Y &&, const C &) -> Y2 must only borrow from what the derived value or the cart owns
        template<typename F>
        auto map_project(F &&f) && -> yoke<projection_result_t<F, Y &&, C>, C>
        {
            using result_type = yoke<projection_result_t<F, Y &&, C>, C>;
            auto derived = invoke_projection(std::forward<F>(f), std::move(_derived), _cart);
            return result_type::unchecked_attach(std::move(_cart), std::move(derived));
        }

        // shares the cart; f(const Y &) -> Y2 or f(const Y &, const C &) -> Y2
        template<typename F>
            requires cloneable_cart<C>
        auto map_project_cloned(F &&f) const & -> yoke<projection_result_t<F, const Y &, C>, C>
        {
            using result_type = yoke<projection_result_t<F, const Y &, C>, C>;
            return result_type::unchecked_attach(_cart, invoke_projection(std::forward<F>(f), _derived, _cart));
        }

        // f returns std::optional<Y2>; an empty result releases the cart
        template<typename F>
        auto try_map_project(F &&f) && -> std::optional<yoke<typename projection_result_t<F, Y &&, C>::value_type, C>>
        {
            using result_type = yoke<typename projection_result_t<F, Y &&, C>::value_type, C>;
            auto derived = invoke_projection(std::forward<F>(f), std::move(_derived), _cart);
            if (!derived)
                return {};
            return result_type::unchecked_attach(std::move(_cart), std::move(*derived));
        }

        yoke<Y, erased_cart> erase_cart() &&
            requires std::convertible_to<C, erased_cart>
        {
            return yoke<Y, erased_cart>::unchecked_attach(erased_cart { std::move(_cart) }, std::move(_derived));
        }

        yoke<Y, std::optional<C>> wrap_cart_in_option() &&
        {
            return yoke<Y, std::optional<C>>::unchecked_attach(std::optional<C> { std::move(_cart) }, std::move(_derived));
        }

        // The derived value when the cart is an empty optional, so nothing is borrowed.
        std::optional<Y> try_into_yokeable() &&
            requires requires(const C &c) { { c.has_value() } -> std::convertible_to<bool>; }
        {
            if (_cart.has_value())
                return {};
            return std::move(_derived);
        }
    private:
        C _cart;
        Y _derived;

        yoke(C &&c, Y &&derived):
            _cart { std::move(c) }, _derived { std::move(derived) }
        {
        }
    };
}

#endif // !ZEROKIT_YOKE_HPP
