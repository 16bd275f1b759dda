/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/common/test.hpp>
#include <decoda/big-int.hpp>

using namespace decoda;

suite number_suite = [] {
    "number"_test = [] {
        "json number grammar"_test = [] {
            for (const auto text: { "0", "-0", "12", "1.5", "-1.5e10", "1E+2", "0.001e-3" })
                expect(static_cast<bool>(parse_json_number(text))) << text;
            for (const auto text: { "", "-", "01", "1.", ".5", "+1", "1e", "1e+", "0x10", "1.5.5", " 1", "NaN", "Infinity" })
                expect(!parse_json_number(text)) << text;
            const auto parts = parse_json_number("-12.50e-3");
            expect(static_cast<bool>(parts));
            if (parts) {
                expect(parts->negative);
                test_same(std::string_view { "12" }, parts->int_digits);
                test_same(std::string_view { "50" }, parts->frac_digits);
                test_same(std::string_view { "3" }, parts->exp_digits);
                expect(parts->exp_negative);
            }
        };
        "double_from_text saturates"_test = [] {
            test_same(std::optional<double> { 1.25 }, double_from_text("1.25"));
            expect(std::isinf(*double_from_text("1e999")));
            expect(*double_from_text("-1e999") < 0);
            test_same(std::optional<double> { 0.0 }, double_from_text("0.00001e-999"));
            test_same(std::optional<double> { 0.0 }, double_from_text("0e999999999999999999999"));
            expect(!double_from_text("1e"));
        };
        "integral_from_text"_test = [] {
            test_same(std::optional<int16_t> { -300 }, integral_from_text<int16_t>("-300"));
            test_same(std::optional<uint16_t> { 300 }, integral_from_text<uint16_t>("+300"));
            expect(!integral_from_text<uint16_t>("70000"));
            expect(!integral_from_text<int16_t>("1 "));
            expect(!integral_from_text<int16_t>("+"));
        };
        "integral_from_json"_test = [] {
            test_same(std::optional<int32_t> { 3 }, integral_from_json<int32_t>(json::value(3.0)));
            expect(!integral_from_json<int32_t>(json::value(3.5)));
            expect(!integral_from_json<int32_t>(json::value(std::numeric_limits<double>::infinity())));
            expect(!integral_from_json<int32_t>(json::value(2147483648.0)));
            test_same(std::optional<int32_t> { std::numeric_limits<int32_t>::min() }, integral_from_json<int32_t>(json::value(-2147483648.0)));
            expect(!integral_from_json<uint32_t>(json::value(int64_t { -1 })));
            test_same(std::optional<uint64_t> { 18446744073709551615ULL }, integral_from_json<uint64_t>(json::value(uint64_t { 18446744073709551615ULL })));
            expect(!integral_from_json<int32_t>(json::value("1")));
        };
        "big int"_test = [] {
            const auto v = big_int_from_text("-98765432109876543210", 100);
            expect(static_cast<bool>(v));
            if (v)
                test_same(std::string { "-98765432109876543210" }, v->str());
            expect(!big_int_from_text("123", 2));
            expect(!big_int_from_text("", 10));
            expect(!big_int_from_text("-", 10));
            test_same(std::optional<cpp_int> { cpp_int { 1 } << 70 }, big_int_from_json(json::value(std::ldexp(1.0, 70)), 100));
        };
        "big decimal"_test = [] {
            test_same(std::optional<big_decimal> { big_decimal { cpp_int { 5 }, 1 } }, big_decimal::from_text(".5", 100, 100));
            test_same(std::optional<big_decimal> { big_decimal { cpp_int { -1 }, 0 } }, big_decimal::from_text("-1.", 100, 100));
            test_same(std::string { "0" }, big_decimal { cpp_int { 0 }, 5 }.to_string());
            test_same(std::string { "12e3" }, big_decimal { cpp_int { 12000 }, 0 }.to_string());
            expect(big_decimal { cpp_int { 100 }, 2 } == big_decimal { cpp_int { 1 }, 0 });
            expect(!big_decimal::from_text("1e5", 100, 4));
            expect(!big_decimal::from_text(".", 100, 100));
        };
        "big int from numeral"_test = [] {
            test_same(std::optional<cpp_int> { 150 }, big_int_from_numeral("1.50e2", 100, 100));
            test_same(std::optional<cpp_int> { 1 }, big_int_from_numeral("1000e-3", 100, 100));
            test_same(std::optional<cpp_int> { -7 }, big_int_from_numeral("-7.000", 100, 100));
            test_same(std::optional<cpp_int> { 0 }, big_int_from_numeral("-0.0e99999999999999999999", 100, 100));
            test_same(std::optional<cpp_int> { cpp_int { "12345678901234567890123" } }, big_int_from_numeral("12345678901234567890123", 100, 100));
            expect(!big_int_from_numeral("1.5", 100, 100));
            expect(!big_int_from_numeral("1.0000000000000001", 100, 100));
            expect(!big_int_from_numeral("1e-1", 100, 100));
            expect(!big_int_from_numeral("1e99999999999999999999", 100, 100));
            // digits of the value and of the text are bounded separately
            expect(!big_int_from_numeral("1e5", 5, 100));
            expect(static_cast<bool>(big_int_from_numeral("1e4", 5, 100)));
            expect(!big_int_from_numeral("1.0000", 100, 4));
        };
    };
};
