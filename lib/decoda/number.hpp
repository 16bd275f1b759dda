/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_NUMBER_HPP
#define DECODA_NUMBER_HPP

#include <charconv>
#include <cmath>
#include <concepts>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <decoda/json.hpp>

namespace decoda {
    // A numeric leaf kept as the tree value for callers that need to choose the conversion themselves
    struct json_number {
        json::value value;

        [[nodiscard]] double to_double() const;
        [[nodiscard]] std::string to_string() const;

        bool operator==(const json_number &o) const
        {
            return value == o.value;
        }
    };

    // The components of a text matching the JSON number grammar
    struct number_parts {
        bool negative = false;
        std::string_view int_digits {};
        std::string_view frac_digits {};
        std::string_view exp_digits {};
        bool exp_negative = false;
    };

    // Strictly the JSON grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    extern std::optional<number_parts> parse_json_number(std::string_view text);
    // Out-of-range magnitudes saturate to an infinity or a zero
    extern std::optional<double> double_from_text(std::string_view text);

    // An optional sign followed by decimal digits only
    template<std::integral T>
    std::optional<T> integral_from_text(std::string_view text)
    {
        if (text.size() > 1 && text.front() == '+' && text[1] != '-')
            text.remove_prefix(1);
        if (text.empty())
            return {};
        T val {};
        const auto *end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, val, 10);
        if (ec != std::errc {} || ptr != end)
            return {};
        return val;
    }

    // Succeeds only when the leaf represents a whole number that fits into T exactly
    template<std::integral T>
    std::optional<T> integral_from_json(const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::int64:
                if (std::in_range<T>(v.get_int64()))
                    return static_cast<T>(v.get_int64());
                return {};
            case json::kind::uint64:
                if (std::in_range<T>(v.get_uint64()))
                    return static_cast<T>(v.get_uint64());
                return {};
            case json::kind::double_: {
                const auto d = v.get_double();
                if (!std::isfinite(d) || std::trunc(d) != d)
                    return {};
                // both bounds are powers of two and thus exact as doubles
                const auto lo = static_cast<double>(std::numeric_limits<T>::min());
                const auto hi = std::ldexp(1.0, std::numeric_limits<T>::digits);
                if (d < lo || d >= hi)
                    return {};
                return static_cast<T>(d);
            }
            default:
                return {};
        }
    }
}

namespace fmt {
    template<>
    struct formatter<decoda::json_number>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::json_number &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !DECODA_NUMBER_HPP
