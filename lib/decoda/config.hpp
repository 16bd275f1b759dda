/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_CONFIG_HPP
#define DECODA_CONFIG_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <decoda/json.hpp>

namespace decoda {
    struct decode_limits {
        static constexpr size_t default_max_depth = 512;
        static constexpr size_t default_big_int_max_digits = 1 << 18;
        static constexpr int64_t default_big_decimal_max_exponent = std::numeric_limits<int32_t>::max();

        size_t max_depth = default_max_depth;
        size_t big_int_max_digits = default_big_int_max_digits;
        int64_t big_decimal_max_exponent = default_big_decimal_max_exponent;

        // Missing elements keep their defaults
        static decode_limits from_json(const json::object &obj);
        static decode_limits load(const std::string &path);

        // The process-wide limits: loaded from the file named by DECODA_CONFIG or the defaults
        static const decode_limits &get();
        static std::optional<std::string> default_path();

        bool operator==(const decode_limits &) const =default;
    };
}

#endif // !DECODA_CONFIG_HPP
