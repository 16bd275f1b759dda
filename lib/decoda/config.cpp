/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/config.hpp>
#include <decoda/logger.hpp>

namespace decoda {
    template<typename T>
    static T _positive(const json::object &obj, const std::string_view name, const T def)
    {
        const auto it = obj.find(name);
        if (it == obj.end())
            return def;
        if (!it->value().is_number())
            throw error(fmt::format("configuration element {} must be a number but got {}!", name, json::kind_name(it->value().kind())));
        boost::json::error_code ec {};
        const auto v = it->value().to_number<T>(ec);
        if (ec || v <= 0)
            throw error(fmt::format("configuration element {} must be a positive integer but got {}!", name, it->value()));
        return v;
    }

    decode_limits decode_limits::from_json(const json::object &obj)
    {
        decode_limits res {};
        res.max_depth = _positive<size_t>(obj, "maxDepth", res.max_depth);
        res.big_int_max_digits = _positive<size_t>(obj, "bigIntMaxDigits", res.big_int_max_digits);
        res.big_decimal_max_exponent = _positive<int64_t>(obj, "bigDecimalMaxExponent", res.big_decimal_max_exponent);
        return res;
    }

    decode_limits decode_limits::load(const std::string &path)
    {
        const auto j = json::load(path);
        if (!j.is_object())
            throw error(fmt::format("the configuration file {} must contain a JSON object!", path));
        return from_json(j.get_object());
    }

    std::optional<std::string> decode_limits::default_path()
    {
        if (const char *env_path = std::getenv("DECODA_CONFIG"); env_path)
            return std::string { env_path };
        return {};
    }

    const decode_limits &decode_limits::get()
    {
        static decode_limits limits = [] {
            if (const auto path = default_path(); path) {
                logger::debug("decode limits configuration: {}", *path);
                return load(*path);
            }
            return decode_limits {};
        }();
        return limits;
    }
}
