/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_BIG_INT_HPP
#define DECODA_BIG_INT_HPP

#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <decoda/number.hpp>

namespace decoda {
    using boost::multiprecision::cpp_int;

    // Both functions return no value when the input is malformed or has more than max_digits digits
    extern std::optional<cpp_int> big_int_from_text(std::string_view text, size_t max_digits);
    extern std::optional<cpp_int> big_int_from_json(const json::value &v, size_t max_digits);
    // The exact value of a JSON numeral such as 1.50e2, no value when it has a non-zero fractional part.
    // max_text_digits bounds the digits of the numeral and max_digits those of the result.
    extern std::optional<cpp_int> big_int_from_numeral(std::string_view text, size_t max_digits, size_t max_text_digits);

    /*
     * An arbitrary-precision decimal: unscaled * 10^-scale.
     * The scale is limited by decode_limits::big_decimal_max_exponent, so some values that are
     * representable in principle are rejected by the parser.
     */
    struct big_decimal {
        cpp_int unscaled {};
        int64_t scale = 0;

        static std::optional<big_decimal> from_text(std::string_view text, size_t max_digits, int64_t max_exponent);
        static std::optional<big_decimal> from_json(const json::value &v, size_t max_digits, int64_t max_exponent);

        // the same value with the trailing zeros of the unscaled part removed
        [[nodiscard]] big_decimal normalized() const;
        [[nodiscard]] double to_double() const;
        [[nodiscard]] std::string to_string() const;

        // numeric equality: 1.50 == 1.5
        bool operator==(const big_decimal &o) const;
    };
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.str());
        }
    };

    template<>
    struct formatter<decoda::big_decimal>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::big_decimal &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !DECODA_BIG_INT_HPP
