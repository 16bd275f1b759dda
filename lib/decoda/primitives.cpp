/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <boost/uuid/string_generator.hpp>
#include <decoda/primitives.hpp>

namespace decoda {
    std::optional<uuid> uuid_from_text(const std::string_view text)
    {
        static constexpr size_t canonical_size = 36;
        if (text.size() != canonical_size)
            return {};
        try {
            return boost::uuids::string_generator {}(text.begin(), text.end());
        } catch (const std::runtime_error &ex) {
            logger::trace("uuid_from_text: {}: {}", text, ex.what());
            return {};
        }
    }

    std::optional<char32_t> single_code_point(const std::string_view text)
    {
        if (text.empty())
            return {};
        const auto lead = static_cast<uint8_t>(text[0]);
        size_t sz;
        char32_t cp;
        if (lead < 0x80) {
            sz = 1;
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            sz = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            sz = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            sz = 4;
            cp = lead & 0x07;
        } else {
            return {};
        }
        if (text.size() != sz)
            return {};
        for (size_t i = 1; i < sz; ++i) {
            const auto b = static_cast<uint8_t>(text[i]);
            if ((b & 0xC0) != 0x80)
                return {};
            cp = (cp << 6) | (b & 0x3F);
        }
        return cp;
    }

    template<typename T>
    static decoding_failure shape_failure(const cursor &c)
    {
        return decoding_failure { type_name<T>(), c.history() };
    }

    template<typename T>
    static result<T> floating_from_json(const cursor &c)
    {
        const auto &v = c.focus();
        double d;
        switch (v.kind()) {
            case json::kind::null:
                return std::numeric_limits<T>::quiet_NaN();
            case json::kind::int64:
            case json::kind::uint64:
            case json::kind::double_:
                d = json_number { v }.to_double();
                break;
            case json::kind::string: {
                const auto parsed = double_from_text(v.get_string());
                if (!parsed)
                    return shape_failure<T>(c);
                d = *parsed;
                break;
            }
            default:
                return shape_failure<T>(c);
        }
        if constexpr (std::is_same_v<T, float>) {
            // magnitudes from FLT_MAX up to half an ulp above it round to FLT_MAX, larger ones overflow
            static const double overflow_threshold = std::ldexp(2.0 - std::ldexp(1.0, -24), 127);
            if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max()) {
                const auto mag = std::fabs(d) < overflow_threshold ? std::numeric_limits<float>::max() : std::numeric_limits<float>::infinity();
                return std::signbit(d) ? -mag : mag;
            }
        }
        return static_cast<T>(d);
    }

    decoder<bool> decoder_for<bool>::get()
    {
        return instance<bool>([](const cursor &c) -> result<bool> {
            if (c.focus().is_bool())
                return c.focus().get_bool();
            return shape_failure<bool>(c);
        });
    }

    decoder<std::string> decoder_for<std::string>::get()
    {
        return instance<std::string>([](const cursor &c) -> result<std::string> {
            if (c.focus().is_string())
                return std::string { c.focus().get_string() };
            return shape_failure<std::string>(c);
        });
    }

    decoder<char32_t> decoder_for<char32_t>::get()
    {
        return instance<char32_t>([](const cursor &c) -> result<char32_t> {
            if (c.focus().is_string()) {
                if (const auto cp = single_code_point(c.focus().get_string()); cp)
                    return *cp;
            }
            return shape_failure<char32_t>(c);
        });
    }

    decoder<std::monostate> decoder_for<std::monostate>::get()
    {
        return instance<std::monostate>([](const cursor &c) -> result<std::monostate> {
            const auto &v = c.focus();
            if (v.is_null() || (v.is_object() && v.get_object().empty()) || (v.is_array() && v.get_array().empty()))
                return std::monostate {};
            return shape_failure<std::monostate>(c);
        });
    }

    decoder<float> decoder_for<float>::get()
    {
        return instance<float>(floating_from_json<float>);
    }

    decoder<double> decoder_for<double>::get()
    {
        return instance<double>(floating_from_json<double>);
    }

    decoder<cpp_int> decoder_for<cpp_int>::get()
    {
        return instance<cpp_int>([](const cursor &c) -> result<cpp_int> {
            const auto &v = c.focus();
            const auto max_digits = c.limits().big_int_max_digits;
            std::optional<cpp_int> res {};
            if (v.is_string())
                res = big_int_from_text(v.get_string(), max_digits);
            else if (const auto text = c.numeral_text(); text)
                res = big_int_from_numeral(*text, max_digits, max_digits);
            else
                res = big_int_from_json(v, max_digits);
            if (res)
                return std::move(*res);
            return shape_failure<cpp_int>(c);
        });
    }

    decoder<big_decimal> decoder_for<big_decimal>::get()
    {
        return instance<big_decimal>([](const cursor &c) -> result<big_decimal> {
            const auto &v = c.focus();
            const auto &lim = c.limits();
            std::optional<big_decimal> res {};
            if (v.is_string())
                res = big_decimal::from_text(v.get_string(), lim.big_int_max_digits, lim.big_decimal_max_exponent);
            else if (const auto text = c.numeral_text(); text)
                res = big_decimal::from_text(*text, lim.big_int_max_digits, lim.big_decimal_max_exponent);
            else
                res = big_decimal::from_json(v, lim.big_int_max_digits, lim.big_decimal_max_exponent);
            if (res)
                return std::move(*res);
            return shape_failure<big_decimal>(c);
        });
    }

    decoder<uuid> decoder_for<uuid>::get()
    {
        return instance<uuid>([](const cursor &c) -> result<uuid> {
            if (c.focus().is_string()) {
                if (const auto id = uuid_from_text(c.focus().get_string()); id)
                    return *id;
            }
            return shape_failure<uuid>(c);
        });
    }

    decoder<cursor> decoder_for<cursor>::get()
    {
        return instance<cursor>([](const cursor &c) -> result<cursor> {
            return c;
        });
    }

    decoder<json::value> decoder_for<json::value>::get()
    {
        return instance<json::value>([](const cursor &c) -> result<json::value> {
            return c.focus();
        });
    }

    decoder<json::object> decoder_for<json::object>::get()
    {
        return instance<json::object>([](const cursor &c) -> result<json::object> {
            if (c.focus().is_object())
                return c.focus().get_object();
            return shape_failure<json::object>(c);
        });
    }

    decoder<json::array> decoder_for<json::array>::get()
    {
        return instance<json::array>([](const cursor &c) -> result<json::array> {
            if (c.focus().is_array())
                return c.focus().get_array();
            return shape_failure<json::array>(c);
        });
    }

    decoder<json_number> decoder_for<json_number>::get()
    {
        return instance<json_number>([](const cursor &c) -> result<json_number> {
            if (c.focus().is_number())
                return json_number { c.focus() };
            return shape_failure<json_number>(c);
        });
    }

    decoder<std::nullopt_t> decoder_for<std::nullopt_t>::get()
    {
        return instance<std::nullopt_t>([](const cursor &c) -> result<std::nullopt_t> {
            if (c.focus().is_null())
                return std::nullopt;
            return shape_failure<std::nullopt_t>(c);
        });
    }
}
