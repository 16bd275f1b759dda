/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/common/test.hpp>
#include <decoda/decoda.hpp>

using namespace decoda;

namespace {
    struct tree_node {
        std::vector<tree_node> children {};

        bool operator==(const tree_node &) const =default;
    };

    template<typename T>
    void test_agreement(const decoder<T> &d, const json::value &v, const std::source_location &loc=std::source_location::current())
    {
        const auto c = cursor::from(v);
        const auto fast = d.decode(c);
        const auto acc = d.decode_accumulating(c);
        expect(fast.ok() == acc.ok(), loc) << fmt::format("protocol disagreement on {}", v);
        if (fast.ok() && acc.ok())
            expect(fast.value() == acc.value(), loc) << fmt::format("different values on {}", v);
        if (!fast.ok() && !acc.ok())
            test_same(fast.failure(), acc.failures().front(), loc);
    }
}

namespace fmt {
    template<>
    struct formatter<tree_node>: formatter<int> {
        template<typename FormatContext>
        auto format(const tree_node &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "node{}", v.children);
        }
    };
}

namespace decoda {
    template<>
    struct decoder_for<tree_node> {
        static decoder<tree_node> get()
        {
            return sequence_decoder<std::vector<tree_node>>(deferred<tree_node>()).map([](const std::vector<tree_node> &ch) {
                return tree_node { ch };
            });
        }
    };
}

suite decoder_suite = [] {
    "decoder"_test = [] {
        const auto &int_d = decoder_of<int32_t>();
        const auto &str_d = decoder_of<std::string>();
        "protocol agreement"_test = [&] {
            const std::vector<json::value> inputs {
                json::parse("1"), json::parse("1.5"), json::parse(R"("12")"), json::parse("null"),
                json::parse("[1,2,3]"), json::parse(R"([1,"x",3,"y"])"), json::parse(R"({"a":1,"b":"x"})"),
                json::parse("[]"), json::parse("{}")
            };
            for (const auto &v: inputs) {
                test_agreement(int_d, v);
                test_agreement(str_d, v);
                test_agreement(decoder_of<std::vector<int32_t>>(), v);
                test_agreement(decoder_of<std::map<std::string, int32_t>>(), v);
                test_agreement(decoder_of<std::optional<int32_t>>(), v);
                test_agreement(decoder_of<non_empty_vector<int32_t>>(), v);
                test_agreement(int_d.and_(str_d), v);
                test_agreement(int_d.map([](int32_t x) { return x * 2; }).or_(str_d.map([](const std::string &s) { return static_cast<int32_t>(s.size()); })), v);
                test_agreement(int_d.emap([](int32_t x) -> either<std::string, int32_t> {
                    if (x > 0)
                        return right<int32_t> { x };
                    return left<std::string> { "not positive" };
                }), v);
            }
        };
        "map identity and composition"_test = [&] {
            const auto v = json::parse("21");
            const auto id = [](const int32_t x) { return x; };
            const auto f = [](const int32_t x) { return x * 2; };
            const auto g = [](const int32_t x) { return std::to_string(x); };
            test_same(int_d.decode_json(v), int_d.map(id).decode_json(v));
            test_same(int_d.map(f).map(g).decode_json(v), int_d.map([&](const int32_t x) { return g(f(x)); }).decode_json(v));
            test_same(result<std::string> { std::string { "42" } }, int_d.map(f).map(g).decode_json(v));
            const auto bad = json::parse("true");
            test_same(int_d.decode_json(bad).failure(), int_d.map(f).map(g).decode_json(bad).failure());
        };
        "flat_map decodes at the same position"_test = [&] {
            const auto doc = json::parse(R"({"kind":"num","value":5})");
            const auto d = decoder_of<std::string>().prepare([](const cursor &c) { return c.down_field("kind"); })
                .flat_map([](const std::string &kind) {
                    if (kind == "num")
                        return decoder_of<int32_t>().prepare([](const cursor &c) { return c.down_field("value"); });
                    return failed_with_message<int32_t>("unknown kind");
                });
            test_same(result<int32_t> { 5 }, d.decode_json(doc));
            const auto other = json::parse(R"({"kind":"str","value":5})");
            test_same(std::string { "unknown kind" }, d.decode_json(other).failure().message());
        };
        "handle_error_with"_test = [&] {
            const auto d = int_d.handle_error_with([](const decoding_failure &f) {
                return const_value(static_cast<int32_t>(f.message().size()));
            });
            test_same(result<int32_t> { 3 }, d.decode_json(json::parse("3")));
            test_same(result<int32_t> { 3 }, d.decode_json(json::parse("true")));
            // accumulating recovery receives the first failure only
            size_t seen = 0;
            const auto seq = decoder_of<std::vector<int32_t>>().handle_error_with([&](const decoding_failure &) {
                ++seen;
                return const_value(std::vector<int32_t> {});
            });
            const auto r = seq.decode_json_accumulating(json::parse(R"(["a","b"])"));
            expect(r.ok());
            test_same(size_t { 1 }, seen);
        };
        "with_error_message"_test = [&] {
            const auto d = decoder_of<std::vector<int32_t>>().with_error_message("numbers please");
            const auto r = d.decode_json_accumulating(json::parse(R"(["a",1,"b"])"));
            expect(!r);
            test_same(size_t { 2 }, r.failures().size());
            test_same(std::string { "numbers please" }, r.failures()[0].message());
            test_same(std::string { "[0]" }, r.failures()[0].path());
            test_same(std::string { "[2]" }, r.failures()[1].path());
        };
        "validate"_test = [&] {
            const auto d = int_d.validate([](const cursor &c) { return c.focus().is_int64(); }, "must be an integer");
            test_same(result<int32_t> { 4 }, d.decode_json(json::parse("4")));
            // rejected independently of the wrapped decoder
            test_same(std::string { "must be an integer" }, d.decode_json(json::parse("4.0")).failure().message());
            test_same(std::string { "must be an integer" }, d.decode_json(json::parse(R"("x")")).failure().message());
        };
        "and_"_test = [&] {
            const auto d = int_d.and_(decoder_of<double>());
            const auto r = d.decode_json(json::parse("2"));
            expect(r.ok());
            if (r) {
                test_same(int32_t { 2 }, r.value().first);
                test_close(2.0, r.value().second);
            }
            const auto both_bad = int_d.and_(decoder_of<bool>()).decode_json_accumulating(json::parse(R"("x")"));
            test_same(size_t { 2 }, both_bad.failures().size());
            test_same(std::string { "Int" }, both_bad.failures()[0].message());
            test_same(std::string { "Boolean" }, both_bad.failures()[1].message());
            test_same(std::string { "Int" }, int_d.and_(decoder_of<bool>()).decode_json(json::parse(R"("x")")).failure().message());
        };
        "or_"_test = [&] {
            const auto d = int_d.or_(str_d.map([](const std::string &s) { return static_cast<int32_t>(s.size()); }));
            test_same(result<int32_t> { 7 }, d.decode_json(json::parse("7")));
            test_same(result<int32_t> { 3 }, d.decode_json(json::parse(R"("abc")")));
            // only the last attempted failure surfaces
            test_same(std::string { "String" }, d.decode_json(json::parse("true")).failure().message());
            test_same(failure_list { decoding_failure { "String" } }, d.decode_json_accumulating(json::parse("true")).failures());
            test_same(result<int32_t> { 7 }, combine_k(int_d, failed_with_message<int32_t>("never")).decode_json(json::parse("7")));
        };
        "split and product"_test = [&] {
            const auto doc = json::parse(R"({"a":1,"b":"two"})");
            const auto root = cursor::from(doc);
            const auto split = int_d.split(str_d);
            const auto l = split(either<cursor, cursor> { std::in_place_index<0>, left<cursor> { root.down_field("a") } });
            test_same(result<either<int32_t, std::string>> { either<int32_t, std::string> { std::in_place_index<0>, left<int32_t> { 1 } } }, l);
            const auto r = split(either<cursor, cursor> { std::in_place_index<1>, right<cursor> { root.down_field("b") } });
            test_same(result<either<int32_t, std::string>> { either<int32_t, std::string> { std::in_place_index<1>, right<std::string> { "two" } } }, r);
            const auto prod = int_d.product(str_d);
            test_same(result<std::pair<int32_t, std::string>> { std::pair<int32_t, std::string> { 1, "two" } }, prod(root.down_field("a"), root.down_field("b")));
            test_same(std::string { ".b" }, prod(root.down_field("b"), root.down_field("b")).failure().path());
        };
        "prepare on a failed cursor"_test = [&] {
            const auto d = int_d.prepare([](const cursor &c) { return c.down_field("missing"); });
            const auto r = d.decode_json(json::parse(R"({"a":1})"));
            expect(!r);
            test_same(std::string { decoding_failure::failed_cursor_message }, r.failure().message());
            test_same(std::string { ".missing" }, r.failure().path());
            const auto acc = d.decode_json_accumulating(json::parse(R"({"a":1})"));
            test_same(r.failure(), acc.failures().front());
        };
        "emap reports the current position"_test = [&] {
            const auto d = int_d.prepare([](const cursor &c) { return c.down_field("x"); })
                .emap([](const int32_t v) -> either<std::string, uint32_t> {
                    if (v >= 0)
                        return right<uint32_t> { static_cast<uint32_t>(v) };
                    return left<std::string> { "negative" };
                });
            const auto doc = json::parse(R"({"outer":{"x":-1}})");
            const auto r = d.decode(cursor::from(doc).down_field("outer"));
            expect(!r);
            test_same(std::string { "negative" }, r.failure().message());
            test_same(std::string { ".outer" }, r.failure().path());
            test_same(result<uint32_t> { 5 }, d.decode_json(json::parse(R"({"x":5})")));
        };
        "emap_try"_test = [&] {
            const auto d = str_d.emap_try([](const std::string &s) { return std::stoi(s); });
            test_same(result<int> { 12 }, d.decode_json(json::parse(R"("12")")));
            const auto r = d.decode_json(json::parse(R"("twelve")"));
            expect(!r);
            expect(!r.failure().message().empty());
            test_same(std::string { "String" }, d.decode_json(json::parse("12")).failure().message());
        };
        "constructors"_test = [&] {
            test_same(result<int> { 42 }, const_value(42).decode_json(json::parse(R"({"any":"thing"})")));
            test_same(result<int> { 42 }, pure(42).decode_json(json::parse("null")));
            const decoding_failure f { "boom" };
            test_same(result<int> { f }, failed<int>(f).decode_json(json::parse("1")));
            test_same(accumulating_result<int> { f }, raise_error<int>(f).decode_json_accumulating(json::parse("1")));
            const auto throwing = instance_try<int>([](const cursor &c) -> int {
                if (c.focus().is_null())
                    throw error("null is not welcome");
                return 1;
            });
            test_same(std::string { "null is not welcome" }, throwing.decode_json(json::parse("null")).failure().message());
            test_same(result<int> { 1 }, throwing.decode_json(json::parse("0")));
        };
        "failed cursors"_test = [&] {
            const auto c = cursor::from(json::parse("{}")).down_field("x");
            test_same(std::string { decoding_failure::failed_cursor_message }, const_value(1).decode(c).failure().message());
            const auto reattempt = with_reattempt<bool>([](const cursor &cur) -> result<bool> { return cur.succeeded(); });
            test_same(result<bool> { false }, reattempt.decode(c));
            expect(reattempt.reattempt());
            expect(!int_d.reattempt());
        };
        "combinators on a failed cursor"_test = [&] {
            const auto root = cursor::from(json::parse(R"({"a":1})"));
            const auto missing = root.down_field("missing");
            static const std::string failed_msg { decoding_failure::failed_cursor_message };
            const auto &opt_d = decoder_of<std::optional<int32_t>>();
            // map and prepare let an optional see the absent field
            test_same(result<bool> { false }, opt_d.map([](const std::optional<int32_t> &v) { return v.has_value(); }).decode(missing));
            const auto prepared = opt_d.prepare([](const cursor &c) { return c.down_field("missing"); });
            test_same(result<std::optional<int32_t>> { std::optional<int32_t> {} }, prepared.decode(root));
            // the other combinators require a successful cursor
            const auto recovered = opt_d.handle_error_with([](const decoding_failure &) { return const_value(std::optional<int32_t> { 7 }); });
            test_same(failed_msg, recovered.decode(missing).failure().message());
            test_same(failed_msg, opt_d.with_error_message("renamed").decode(missing).failure().message());
            test_same(failed_msg, opt_d.validate([](const cursor &) { return true; }, "rejected").decode(missing).failure().message());
            test_same(failed_msg, opt_d.and_(opt_d).decode(missing).failure().message());
            test_same(failed_msg, opt_d.or_(opt_d).decode(missing).failure().message());
            test_same(failed_msg, opt_d.or_(opt_d).decode_accumulating(missing).failures().front().message());
            bool called = false;
            const auto em = opt_d.emap([&called](const std::optional<int32_t> &v) -> either<std::string, int32_t> {
                called = true;
                return right<int32_t> { v.value_or(0) };
            });
            test_same(failed_msg, em.decode(missing).failure().message());
            expect(!called);
            test_same(failed_msg, opt_d.emap_try([](const std::optional<int32_t> &v) { return v.value_or(0); }).decode(missing).failure().message());
            test_same(std::string { ".missing" }, em.decode(missing).failure().path());
            test_same(result<int32_t> { 1 }, em.decode(root.down_field("a")));
            expect(called);
        };
        "accumulating view"_test = [&] {
            const auto acc = int_d.accumulating().and_(str_d.accumulating());
            const auto r = acc.decode_json(json::parse("null"));
            test_same(size_t { 2 }, r.failures().size());
            const auto doubled = int_d.accumulating().map([](int32_t v) { return v * 2; });
            test_same(accumulating_result<int32_t> { 8 }, doubled.decode_json(json::parse("4")));
        };
        "recursive decoding"_test = [] {
            const auto r = decode<tree_node>(json::parse("[[],[[]]]"));
            expect(r.ok());
            if (r) {
                test_same(size_t { 2 }, r.value().children.size());
                test_same(size_t { 1 }, r.value().children[1].children.size());
            }
        };
        "maximum depth"_test = [] {
            decode_limits limits {};
            limits.max_depth = 3;
            const auto shallow = json::parse("[[[]]]");
            expect(decoder_of<tree_node>().decode(cursor::from(shallow, limits)).ok());
            const auto deep = json::parse("[[[[[]]]]]");
            const auto r = decoder_of<tree_node>().decode(cursor::from(deep, limits));
            expect(!r);
            test_same(std::string { decoding_failure::max_depth_message }, r.failure().message());
            test_same(std::string { "[0][0][0][0]" }, r.failure().path());
        };
        "decode_or_throw"_test = [] {
            test_same(std::vector<int32_t> { 1, 2 }, decode_or_throw<std::vector<int32_t>>(json::parse("[1,2]")));
            try {
                decode_or_throw<std::vector<int32_t>>(json::parse(R"(["a",2,"c"])"));
                expect(false) << "no exception has been thrown";
            } catch (const decoding_error &ex) {
                test_same(size_t { 2 }, ex.failures().size());
            }
        };
        "decode_field"_test = [] {
            const auto c = cursor::from(json::parse(R"({"name":"decoda"})"));
            test_same(result<std::string> { std::string { "decoda" } }, decode_field<std::string>(c, "name"));
            test_same(std::string { decoding_failure::failed_cursor_message }, decode_field<std::string>(c, "other").failure().message());
        };
    };
};
