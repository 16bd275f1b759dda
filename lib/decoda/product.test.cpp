/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/common/test.hpp>
#include <decoda/product.hpp>

using namespace decoda;

namespace {
    struct person {
        std::string name;
        uint32_t age;
        std::optional<std::string> email;

        bool operator==(const person &) const =default;
    };

    enum class color { red, green };
}

namespace fmt {
    template<>
    struct formatter<person>: formatter<int> {
        template<typename FormatContext>
        auto format(const person &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "person({}, {}, {})", v.name, v.age, v.email);
        }
    };

    template<>
    struct formatter<color>: formatter<int> {
        template<typename FormatContext>
        auto format(const color &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v == color::red ? "red" : "green");
        }
    };
}

namespace decoda {
    template<>
    struct decoder_for<person> {
        static decoder<person> get()
        {
            return for_product<std::string, uint32_t, std::optional<std::string>>({ "name", "age", "email" },
                [](std::string name, uint32_t age, std::optional<std::string> email) {
                    return person { std::move(name), age, std::move(email) };
                });
        }
    };
}

suite product_suite = [] {
    "product"_test = [] {
        "for_product"_test = [] {
            test_same(person { "Ann", 33, "ann@example.com" },
                decode<person>(json::parse(R"({"name":"Ann","age":33,"email":"ann@example.com"})")).value());
            test_same(person { "Bob", 41, {} }, decode<person>(json::parse(R"({"name":"Bob","age":41})")).value());
        };
        "for_product failures"_test = [] {
            const auto doc = json::parse(R"({"name":1,"age":-3,"email":5})");
            const auto fast = decode<person>(doc);
            test_same(std::string { "String" }, fast.failure().message());
            test_same(std::string { ".name" }, fast.failure().path());
            const auto acc = decode_accumulating<person>(doc);
            test_same(size_t { 3 }, acc.failures().size());
            test_same(std::string { ".name" }, acc.failures()[0].path());
            test_same(std::string { ".age" }, acc.failures()[1].path());
            test_same(std::string { "UInt" }, acc.failures()[1].message());
            test_same(std::string { ".email" }, acc.failures()[2].path());
            const auto missing = decode<person>(json::parse(R"({"age":1})"));
            test_same(std::string { decoding_failure::failed_cursor_message }, missing.failure().message());
            test_same(std::string { ".name" }, missing.failure().path());
        };
        "for_product with explicit decoders"_test = [] {
            const auto positive = decoder_of<int32_t>().validate([](const cursor &c) {
                return c.focus().is_int64() && c.focus().get_int64() > 0;
            }, "must be positive");
            const auto d = for_product({ "w", "h" }, [](int32_t w, int32_t h) { return w * h; }, positive, positive);
            test_same(result<int32_t> { 6 }, d.decode_json(json::parse(R"({"w":2,"h":3})")));
            const auto acc = d.decode_json_accumulating(json::parse(R"({"w":0,"h":-1})"));
            test_same(size_t { 2 }, acc.failures().size());
            test_same(std::string { "must be positive" }, acc.failures()[1].message());
        };
        "tuples"_test = [] {
            const auto t = decode<std::tuple<int32_t, std::string, bool>>(json::parse(R"([1,"a",true])"));
            expect(t.ok());
            if (t)
                expect(t.value() == std::tuple<int32_t, std::string, bool> { 1, "a", true });
            test_same(std::string { "Tuple3" }, decode<std::tuple<int32_t, std::string, bool>>(json::parse(R"([1,"a"])")).failure().message());
            test_same(std::string { "Tuple3" }, decode<std::tuple<int32_t, std::string, bool>>(json::parse(R"({"a":1})")).failure().message());
            const auto acc = decode_accumulating<std::tuple<int32_t, std::string, bool>>(json::parse(R"(["x",2,true])"));
            test_same(size_t { 2 }, acc.failures().size());
            test_same(std::string { "[0]" }, acc.failures()[0].path());
            test_same(std::string { "[1]" }, acc.failures()[1].path());
            test_same(std::pair<std::string, int32_t> { "k", 7 }, decode<std::pair<std::string, int32_t>>(json::parse(R"(["k",7])")).value());
            test_same(std::string { "Tuple3[Int, String, Boolean]" }, type_name<std::tuple<int32_t, std::string, bool>>());
        };
        "enumerations"_test = [] {
            const auto d = decode_enum<color>({ { "red", color::red }, { "green", color::green } });
            test_same(result<color> { color::green }, d.decode_json(json::parse(R"("green")")));
            const auto r = d.decode_json(json::parse(R"("blue")"));
            expect(!r);
            expect(r.failure().message().find("blue") != std::string::npos);
            test_same(std::string { "String" }, d.decode_json(json::parse("1")).failure().message());
        };
    };
};
