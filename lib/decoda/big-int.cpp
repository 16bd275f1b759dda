/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/big-int.hpp>

namespace decoda {
    static cpp_int cpp_int_from_digits(const std::string_view digits)
    {
        cpp_int val = 0;
        for (const auto c: digits) {
            val *= 10;
            val += c - '0';
        }
        return val;
    }

    static bool all_digits(const std::string_view text)
    {
        return !text.empty() && text.find_first_not_of("0123456789") == std::string_view::npos;
    }

    // decimal digits of a double that is finite and whole
    static std::string whole_double_digits(const double d)
    {
        return fmt::format("{:.0f}", std::fabs(d));
    }

    std::optional<cpp_int> big_int_from_text(std::string_view text, const size_t max_digits)
    {
        bool negative = false;
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }
        if (!all_digits(text) || text.size() > max_digits)
            return {};
        auto val = cpp_int_from_digits(text);
        if (negative)
            val = -val;
        return val;
    }

    std::optional<cpp_int> big_int_from_json(const json::value &v, const size_t max_digits)
    {
        switch (v.kind()) {
            case json::kind::int64: return cpp_int { v.get_int64() };
            case json::kind::uint64: return cpp_int { v.get_uint64() };
            case json::kind::double_: {
                const auto d = v.get_double();
                if (!std::isfinite(d) || std::trunc(d) != d)
                    return {};
                const auto digits = whole_double_digits(d);
                if (digits.size() > max_digits)
                    return {};
                auto val = cpp_int_from_digits(digits);
                if (d < 0)
                    val = -val;
                return val;
            }
            default:
                return {};
        }
    }

    std::optional<cpp_int> big_int_from_numeral(const std::string_view text, const size_t max_digits, const size_t max_text_digits)
    {
        const auto parts = parse_json_number(text);
        if (!parts)
            return {};
        const auto total = parts->int_digits.size() + parts->frac_digits.size();
        if (total > max_text_digits)
            return {};
        std::string digits { parts->int_digits };
        digits.append(parts->frac_digits);
        const auto first = digits.find_first_not_of('0');
        if (first == std::string::npos)
            return cpp_int { 0 };
        const auto last = digits.find_last_not_of('0');
        const auto exp = integral_from_text<int64_t>(parts->exp_digits.empty() ? std::string_view { "0" } : parts->exp_digits);
        // a non-zero value with such an exponent is either fractional or too long
        if (!exp || *exp > static_cast<int64_t>(max_digits + max_text_digits))
            return {};
        const auto shift = (parts->exp_negative ? -*exp : *exp) - static_cast<int64_t>(parts->frac_digits.size())
            + static_cast<int64_t>(total - 1 - last);
        const auto significant = std::string_view { digits }.substr(first, last + 1 - first);
        if (shift < 0 || significant.size() + static_cast<size_t>(shift) > max_digits)
            return {};
        cpp_int val = cpp_int_from_digits(significant) * boost::multiprecision::pow(cpp_int { 10 }, static_cast<unsigned>(shift));
        if (parts->negative)
            val = -val;
        return val;
    }

    std::optional<big_decimal> big_decimal::from_text(std::string_view text, const size_t max_digits, const int64_t max_exponent)
    {
        bool negative = false;
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }
        std::string_view mantissa = text;
        std::string_view exp_text {};
        if (const auto e_pos = text.find_first_of("eE"); e_pos != std::string_view::npos) {
            mantissa = text.substr(0, e_pos);
            exp_text = text.substr(e_pos + 1);
            if (exp_text.empty())
                return {};
        }
        std::string_view int_part = mantissa;
        std::string_view frac_part {};
        if (const auto dot_pos = mantissa.find('.'); dot_pos != std::string_view::npos) {
            int_part = mantissa.substr(0, dot_pos);
            frac_part = mantissa.substr(dot_pos + 1);
        }
        if (int_part.empty() && frac_part.empty())
            return {};
        if ((!int_part.empty() && !all_digits(int_part)) || (!frac_part.empty() && !all_digits(frac_part)))
            return {};
        if (int_part.size() + frac_part.size() > max_digits)
            return {};
        int64_t exp = 0;
        if (!exp_text.empty()) {
            const auto parsed = integral_from_text<int64_t>(exp_text);
            if (!parsed)
                return {};
            exp = *parsed;
        }
        if (exp < -max_exponent || exp > max_exponent)
            return {};
        const auto scale = static_cast<int64_t>(frac_part.size()) - exp;
        if (scale < -max_exponent || scale > max_exponent)
            return {};
        auto unscaled = cpp_int_from_digits(int_part);
        for (const auto c: frac_part) {
            unscaled *= 10;
            unscaled += c - '0';
        }
        if (negative)
            unscaled = -unscaled;
        return big_decimal { std::move(unscaled), scale };
    }

    std::optional<big_decimal> big_decimal::from_json(const json::value &v, const size_t max_digits, const int64_t max_exponent)
    {
        switch (v.kind()) {
            case json::kind::int64: return big_decimal { cpp_int { v.get_int64() }, 0 };
            case json::kind::uint64: return big_decimal { cpp_int { v.get_uint64() }, 0 };
            case json::kind::double_: {
                const auto d = v.get_double();
                if (!std::isfinite(d))
                    return {};
                auto res = from_text(json::serialize(v), max_digits, max_exponent);
                if (res)
                    return res->normalized();
                return res;
            }
            default:
                return {};
        }
    }

    big_decimal big_decimal::normalized() const
    {
        big_decimal res { unscaled, scale };
        if (res.unscaled == 0) {
            res.scale = 0;
            return res;
        }
        while (res.unscaled % 10 == 0) {
            res.unscaled /= 10;
            --res.scale;
        }
        return res;
    }

    double big_decimal::to_double() const
    {
        const auto text = to_string();
        if (const auto d = double_from_text(text); d)
            return *d;
        throw error(fmt::format("cannot convert {} to double", text));
    }

    std::string big_decimal::to_string() const
    {
        const auto n = normalized();
        if (n.scale == 0)
            return n.unscaled.str();
        return fmt::format("{}e{}", n.unscaled.str(), -n.scale);
    }

    bool big_decimal::operator==(const big_decimal &o) const
    {
        const auto a = normalized();
        const auto b = o.normalized();
        return a.unscaled == b.unscaled && a.scale == b.scale;
    }
}
