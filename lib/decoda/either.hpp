/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_EITHER_HPP
#define DECODA_EITHER_HPP

#include <variant>
#include <decoda/common/format.hpp>

namespace decoda {
    // Tagged alternatives stay distinguishable even when both sides have the same type
    template<typename T>
    struct left {
        T value;

        bool operator==(const left &) const =default;
    };

    template<typename T>
    struct right {
        T value;

        bool operator==(const right &) const =default;
    };

    template<typename L, typename R>
    using either = std::variant<left<L>, right<R>>;

    template<typename E>
    struct invalid {
        E value;

        bool operator==(const invalid &) const =default;
    };

    template<typename A>
    struct valid {
        A value;

        bool operator==(const valid &) const =default;
    };

    template<typename E, typename A>
    using validated = std::variant<invalid<E>, valid<A>>;

    template<typename L, typename R>
    bool is_left(const either<L, R> &v) noexcept
    {
        return v.index() == 0;
    }

    template<typename L, typename R>
    bool is_right(const either<L, R> &v) noexcept
    {
        return v.index() == 1;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<decoda::left<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "left({})", v.value);
        }
    };

    template<typename T>
    struct formatter<decoda::right<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "right({})", v.value);
        }
    };

    template<typename E>
    struct formatter<decoda::invalid<E>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "invalid({})", v.value);
        }
    };

    template<typename A>
    struct formatter<decoda::valid<A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "valid({})", v.value);
        }
    };

    template<typename L, typename R>
    struct formatter<std::variant<decoda::left<L>, decoda::right<R>>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return std::visit([&](const auto &alt) { return fmt::format_to(ctx.out(), "{}", alt); }, v);
        }
    };

    template<typename E, typename A>
    struct formatter<std::variant<decoda::invalid<E>, decoda::valid<A>>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return std::visit([&](const auto &alt) { return fmt::format_to(ctx.out(), "{}", alt); }, v);
        }
    };
}

#endif // !DECODA_EITHER_HPP
