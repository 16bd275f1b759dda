/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_PRIMITIVES_HPP
#define DECODA_PRIMITIVES_HPP

#include <concepts>
#include <variant>
#include <decoda/big-int.hpp>
#include <decoda/decoder.hpp>
#include <decoda/key-decoder.hpp>

namespace decoda {
    template<typename T>
    concept decodable_integral = std::integral<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>
        && !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t>
        && !std::is_same_v<T, char32_t>;

    // the UTF-8 code point when the text consists of exactly one
    extern std::optional<char32_t> single_code_point(std::string_view text);

    template<> struct type_name_for<bool> { static std::string get() { return "Boolean"; } };
    template<> struct type_name_for<std::string> { static std::string get() { return "String"; } };
    template<> struct type_name_for<char32_t> { static std::string get() { return "Char"; } };
    template<> struct type_name_for<std::monostate> { static std::string get() { return "Unit"; } };
    template<> struct type_name_for<float> { static std::string get() { return "Float"; } };
    template<> struct type_name_for<double> { static std::string get() { return "Double"; } };
    template<> struct type_name_for<cpp_int> { static std::string get() { return "BigInt"; } };
    template<> struct type_name_for<big_decimal> { static std::string get() { return "BigDecimal"; } };
    template<> struct type_name_for<uuid> { static std::string get() { return "UUID"; } };
    template<> struct type_name_for<cursor> { static std::string get() { return "Cursor"; } };
    template<> struct type_name_for<json::value> { static std::string get() { return "Json"; } };
    template<> struct type_name_for<json::object> { static std::string get() { return "JsonObject"; } };
    template<> struct type_name_for<json::array> { static std::string get() { return "JsonArray"; } };
    template<> struct type_name_for<json_number> { static std::string get() { return "JsonNumber"; } };
    template<> struct type_name_for<std::nullopt_t> { static std::string get() { return "None"; } };

    template<decodable_integral T>
    struct type_name_for<T> {
        static std::string get()
        {
            std::string name { std::is_signed_v<T> ? "" : "U" };
            switch (sizeof(T)) {
                case 1: return name + "Byte";
                case 2: return name + "Short";
                case 4: return name + "Int";
                case 8: return name + "Long";
                default: throw error(fmt::format("unsupported integer size: {}", sizeof(T)));
            }
        }
    };

    template<decodable_integral T>
    std::optional<T> integral_from_numeral(const std::string_view text, const size_t max_text_digits)
    {
        const auto val = big_int_from_numeral(text, std::numeric_limits<T>::digits10 + 1, max_text_digits);
        if (!val || *val < std::numeric_limits<T>::min() || *val > std::numeric_limits<T>::max())
            return {};
        return static_cast<T>(*val);
    }

    // A numeric leaf must be an exact whole number within T's range, a string must be decimal text
    template<decodable_integral T>
    decoder<T> integral_decoder()
    {
        return instance<T>([name=type_name<T>()](const cursor &c) -> result<T> {
            const auto &v = c.focus();
            std::optional<T> res {};
            if (v.is_string())
                res = integral_from_text<T>(v.get_string());
            else if (const auto text = c.numeral_text(); text)
                res = integral_from_numeral<T>(*text, c.limits().big_int_max_digits);
            else
                res = integral_from_json<T>(v);
            if (res)
                return *res;
            return decoding_failure { name, c.history() };
        });
    }

    template<decodable_integral T>
    struct decoder_for<T> {
        static decoder<T> get()
        {
            return integral_decoder<T>();
        }
    };

    template<> struct decoder_for<bool> { static decoder<bool> get(); };
    template<> struct decoder_for<std::string> { static decoder<std::string> get(); };
    template<> struct decoder_for<char32_t> { static decoder<char32_t> get(); };
    template<> struct decoder_for<std::monostate> { static decoder<std::monostate> get(); };
    // null decodes to NaN, magnitudes out of range saturate to an infinity
    template<> struct decoder_for<float> { static decoder<float> get(); };
    template<> struct decoder_for<double> { static decoder<double> get(); };
    template<> struct decoder_for<cpp_int> { static decoder<cpp_int> get(); };
    template<> struct decoder_for<big_decimal> { static decoder<big_decimal> get(); };
    template<> struct decoder_for<uuid> { static decoder<uuid> get(); };
    template<> struct decoder_for<cursor> { static decoder<cursor> get(); };
    template<> struct decoder_for<json::value> { static decoder<json::value> get(); };
    template<> struct decoder_for<json::object> { static decoder<json::object> get(); };
    template<> struct decoder_for<json::array> { static decoder<json::array> get(); };
    template<> struct decoder_for<json_number> { static decoder<json_number> get(); };
    template<> struct decoder_for<std::nullopt_t> { static decoder<std::nullopt_t> get(); };
}

#endif // !DECODA_PRIMITIVES_HPP
