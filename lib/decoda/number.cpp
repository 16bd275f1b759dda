/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/number.hpp>

namespace decoda {
    double json_number::to_double() const
    {
        switch (value.kind()) {
            case json::kind::int64: return static_cast<double>(value.get_int64());
            case json::kind::uint64: return static_cast<double>(value.get_uint64());
            case json::kind::double_: return value.get_double();
            default: throw error(fmt::format("json_number contains a non-numeric value: {}", json::kind_name(value.kind())));
        }
    }

    std::string json_number::to_string() const
    {
        return json::serialize(value);
    }

    static size_t count_digits(const std::string_view text, size_t pos)
    {
        const auto start = pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            ++pos;
        return pos - start;
    }

    std::optional<number_parts> parse_json_number(const std::string_view text)
    {
        number_parts res {};
        size_t pos = 0;
        if (pos < text.size() && text[pos] == '-') {
            res.negative = true;
            ++pos;
        }
        const auto int_sz = count_digits(text, pos);
        if (int_sz == 0 || (int_sz > 1 && text[pos] == '0'))
            return {};
        res.int_digits = text.substr(pos, int_sz);
        pos += int_sz;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            const auto frac_sz = count_digits(text, pos);
            if (frac_sz == 0)
                return {};
            res.frac_digits = text.substr(pos, frac_sz);
            pos += frac_sz;
        }
        if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
            ++pos;
            if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
                res.exp_negative = text[pos] == '-';
                ++pos;
            }
            const auto exp_sz = count_digits(text, pos);
            if (exp_sz == 0)
                return {};
            res.exp_digits = text.substr(pos, exp_sz);
            pos += exp_sz;
        }
        if (pos != text.size())
            return {};
        return res;
    }

    // the decimal exponent of the most significant non-zero digit, saturated to the int64 range
    static int64_t magnitude(const number_parts &p)
    {
        int64_t exp = 0;
        for (const auto c: p.exp_digits) {
            if (exp > std::numeric_limits<int64_t>::max() / 20)
                break;
            exp = exp * 10 + (c - '0');
        }
        if (p.exp_negative)
            exp = -exp;
        const auto nz_int = p.int_digits.find_first_not_of('0');
        if (nz_int != std::string_view::npos)
            return exp + static_cast<int64_t>(p.int_digits.size() - nz_int);
        const auto nz_frac = p.frac_digits.find_first_not_of('0');
        if (nz_frac == std::string_view::npos)
            return std::numeric_limits<int64_t>::min();
        return exp - static_cast<int64_t>(nz_frac);
    }

    std::optional<double> double_from_text(const std::string_view text)
    {
        const auto parts = parse_json_number(text);
        if (!parts)
            return {};
        double val = 0;
        const auto *end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, val);
        if (ec == std::errc::result_out_of_range) {
            const auto sign = parts->negative ? -1.0 : 1.0;
            if (magnitude(*parts) > 0)
                return sign * std::numeric_limits<double>::infinity();
            return sign * 0.0;
        }
        if (ec != std::errc {} || ptr != end)
            return {};
        return val;
    }
}
