/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <filesystem>
#include <fstream>
#include <decoda/common/test.hpp>
#include <decoda/config.hpp>

using namespace decoda;

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const decode_limits lim {};
            test_same(size_t { 512 }, lim.max_depth);
            test_same(size_t { 1 << 18 }, lim.big_int_max_digits);
            test_same(int64_t { std::numeric_limits<int32_t>::max() }, lim.big_decimal_max_exponent);
            expect(decode_limits::from_json(json::object {}) == lim);
        };
        "from_json"_test = [] {
            const auto lim = decode_limits::from_json(json::parse(R"({"maxDepth":16,"bigIntMaxDigits":100})").as_object());
            test_same(size_t { 16 }, lim.max_depth);
            test_same(size_t { 100 }, lim.big_int_max_digits);
            test_same(decode_limits::default_big_decimal_max_exponent, lim.big_decimal_max_exponent);
        };
        "invalid values"_test = [] {
            expect(throws([] { decode_limits::from_json(json::parse(R"({"maxDepth":"deep"})").as_object()); }));
            expect(throws([] { decode_limits::from_json(json::parse(R"({"maxDepth":0})").as_object()); }));
            expect(throws([] { decode_limits::from_json(json::parse(R"({"bigDecimalMaxExponent":-5})").as_object()); }));
            expect(throws([] { decode_limits::from_json(json::parse(R"({"bigIntMaxDigits":1.5})").as_object()); }));
        };
        "load"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "decoda-config-test.json").string();
            {
                std::ofstream os { path };
                os << R"({"maxDepth":64})";
            }
            const auto lim = decode_limits::load(path);
            test_same(size_t { 64 }, lim.max_depth);
            std::filesystem::remove(path);
            expect(throws([&] { decode_limits::load(path); }));
        };
        "process-wide limits are stable"_test = [] {
            expect(&decode_limits::get() == &decode_limits::get());
        };
    };
};
