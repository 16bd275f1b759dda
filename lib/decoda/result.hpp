/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_RESULT_HPP
#define DECODA_RESULT_HPP

#include <type_traits>
#include <utility>
#include <variant>
#include <decoda/failure.hpp>

namespace decoda {
    template<typename T>
    struct result;

    template<typename T>
    struct accumulating_result;

    template<typename T>
    struct is_result: std::false_type {};

    template<typename T>
    struct is_result<result<T>>: std::true_type {};

    template<typename T>
    struct is_accumulating_result: std::false_type {};

    template<typename T>
    struct is_accumulating_result<accumulating_result<T>>: std::true_type {};

    /*
     * The outcome of a fail-fast decode: either a value or exactly one failure.
     * Composition short-circuits on the first failure.
     */
    template<typename T>
    struct result {
        using value_type = T;

        result(const T &v): _val { std::in_place_index<0>, v }
        {
        }

        result(T &&v): _val { std::in_place_index<0>, std::move(v) }
        {
        }

        result(decoding_failure f): _val { std::in_place_index<1>, std::move(f) }
        {
        }

        [[nodiscard]] bool ok() const noexcept
        {
            return _val.index() == 0;
        }

        explicit operator bool() const noexcept
        {
            return ok();
        }

        [[nodiscard]] const T &value() const &
        {
            if (!ok()) [[unlikely]]
                throw error(fmt::format("value requested from a failed result: {}", failure()));
            return std::get<0>(_val);
        }

        [[nodiscard]] T &&value() &&
        {
            if (!ok()) [[unlikely]]
                throw error(fmt::format("value requested from a failed result: {}", failure()));
            return std::get<0>(std::move(_val));
        }

        [[nodiscard]] const decoding_failure &failure() const
        {
            if (ok()) [[unlikely]]
                throw error("failure requested from a successful result!");
            return std::get<1>(_val);
        }

        template<typename F>
        auto map(F &&f) const -> result<std::decay_t<std::invoke_result_t<F, const T &>>>
        {
            if (ok())
                return std::invoke(std::forward<F>(f), std::get<0>(_val));
            return std::get<1>(_val);
        }

        template<typename F>
        auto flat_map(F &&f) const -> std::invoke_result_t<F, const T &>
        {
            using res_type = std::invoke_result_t<F, const T &>;
            static_assert(is_result<res_type>::value, "flat_map expects a function returning a result");
            if (ok())
                return std::invoke(std::forward<F>(f), std::get<0>(_val));
            return res_type { std::get<1>(_val) };
        }

        template<typename F>
        result handle_error_with(F &&f) const
        {
            if (ok())
                return *this;
            return std::invoke(std::forward<F>(f), std::get<1>(_val));
        }

        // fails with this result's failure first, else the other's
        template<typename U>
        result<std::pair<T, U>> product(const result<U> &o) const
        {
            if (!ok())
                return std::get<1>(_val);
            if (!o.ok())
                return o.failure();
            return std::pair<T, U> { std::get<0>(_val), o.value() };
        }

        bool operator==(const result &) const =default;
    private:
        std::variant<T, decoding_failure> _val;
    };

    /*
     * The outcome of an accumulating decode: either a value or a non-empty list of failures
     * in the order in which the failing decoders were invoked.
     */
    template<typename T>
    struct accumulating_result {
        using value_type = T;

        static accumulating_result from(const result<T> &r)
        {
            if (r.ok())
                return r.value();
            return r.failure();
        }

        accumulating_result(const T &v): _val { std::in_place_index<0>, v }
        {
        }

        accumulating_result(T &&v): _val { std::in_place_index<0>, std::move(v) }
        {
        }

        accumulating_result(decoding_failure f): _val { std::in_place_index<1>, failure_list { std::move(f) } }
        {
        }

        accumulating_result(failure_list fl): _val { std::in_place_index<1>, std::move(fl) }
        {
            if (std::get<1>(_val).empty()) [[unlikely]]
                throw error("an accumulating result cannot be built from an empty failure list!");
        }

        [[nodiscard]] bool ok() const noexcept
        {
            return _val.index() == 0;
        }

        explicit operator bool() const noexcept
        {
            return ok();
        }

        [[nodiscard]] const T &value() const &
        {
            if (!ok()) [[unlikely]]
                throw error(fmt::format("value requested from a failed result: {}", failures()));
            return std::get<0>(_val);
        }

        [[nodiscard]] T &&value() &&
        {
            if (!ok()) [[unlikely]]
                throw error(fmt::format("value requested from a failed result: {}", failures()));
            return std::get<0>(std::move(_val));
        }

        [[nodiscard]] const failure_list &failures() const
        {
            if (ok()) [[unlikely]]
                throw error("failures requested from a successful result!");
            return std::get<1>(_val);
        }

        // keeps only the first failure
        [[nodiscard]] result<T> to_result() const
        {
            if (ok())
                return std::get<0>(_val);
            return std::get<1>(_val).front();
        }

        template<typename F>
        auto map(F &&f) const -> accumulating_result<std::decay_t<std::invoke_result_t<F, const T &>>>
        {
            if (ok())
                return std::invoke(std::forward<F>(f), std::get<0>(_val));
            return std::get<1>(_val);
        }

        // runs no matter what: when both sides fail the failures of this one come first
        template<typename U, typename F>
        auto map2(const accumulating_result<U> &o, F &&f) const
            -> accumulating_result<std::decay_t<std::invoke_result_t<F, const T &, const U &>>>
        {
            if (ok() && o.ok())
                return std::invoke(std::forward<F>(f), std::get<0>(_val), o.value());
            failure_list fl {};
            if (!ok())
                fl = std::get<1>(_val);
            if (!o.ok())
                fl.insert(fl.end(), o.failures().begin(), o.failures().end());
            return fl;
        }

        template<typename U>
        accumulating_result<std::pair<T, U>> product(const accumulating_result<U> &o) const
        {
            return map2(o, [](const T &a, const U &b) { return std::pair<T, U> { a, b }; });
        }

        // the next step may depend on this value, so accumulation stops once a failure is known
        template<typename F>
        auto and_then(F &&f) const -> std::invoke_result_t<F, const T &>
        {
            using res_type = std::invoke_result_t<F, const T &>;
            static_assert(is_accumulating_result<res_type>::value, "and_then expects a function returning an accumulating_result");
            if (ok())
                return std::invoke(std::forward<F>(f), std::get<0>(_val));
            return res_type { std::get<1>(_val) };
        }

        template<typename F>
        accumulating_result handle_error_with(F &&f) const
        {
            if (ok())
                return *this;
            return std::invoke(std::forward<F>(f), std::get<1>(_val));
        }

        template<typename F>
        accumulating_result map_failures(F &&f) const
        {
            if (ok())
                return *this;
            failure_list fl {};
            fl.reserve(std::get<1>(_val).size());
            for (const auto &df: std::get<1>(_val))
                fl.emplace_back(std::invoke(f, df));
            return fl;
        }

        bool operator==(const accumulating_result &) const =default;
    private:
        std::variant<T, failure_list> _val;
    };
}

namespace fmt {
    template<typename T>
    struct formatter<decoda::result<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "ok({})", v.value());
            return fmt::format_to(ctx.out(), "failure({})", v.failure());
        }
    };

    template<typename T>
    struct formatter<decoda::accumulating_result<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "ok({})", v.value());
            return fmt::format_to(ctx.out(), "failures({})", v.failures());
        }
    };
}

#endif // !DECODA_RESULT_HPP
