/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_BYTES_HPP
#define DECODA_BYTES_HPP

#include <cstdint>
#include <string_view>
#include <vector>
#include <boost/dynamic_bitset.hpp>
#include <decoda/common/error.hpp>
#include <decoda/common/format.hpp>

namespace decoda {
    // A binary payload, kept distinct from std::vector<uint8_t> which decodes from an array of numbers
    struct byte_vector: std::vector<uint8_t> {
        using std::vector<uint8_t>::vector;

        static byte_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0)
                throw error(fmt::format("hex string must have an even number of characters: {}", hex));
            const auto nibble = [&](const char c) -> uint8_t {
                if (c >= '0' && c <= '9')
                    return c - '0';
                if (c >= 'a' && c <= 'f')
                    return c - 'a' + 10;
                if (c >= 'A' && c <= 'F')
                    return c - 'A' + 10;
                throw error(fmt::format("unexpected character in a hex string: {}", hex));
            };
            byte_vector res {};
            res.reserve(hex.size() / 2);
            for (size_t i = 0; i < hex.size(); i += 2)
                res.emplace_back((nibble(hex[i]) << 4) | nibble(hex[i + 1]));
            return res;
        }

        bool operator==(const byte_vector &o) const
        {
            return static_cast<const std::vector<uint8_t> &>(*this) == o;
        }
    };

    // Bit 0 is the most significant bit of the first byte
    using bit_vector = boost::dynamic_bitset<uint8_t>;

    extern bit_vector bit_vector_from_bytes(const byte_vector &bytes, size_t num_bits);
}

namespace fmt {
    template<>
    struct formatter<decoda::byte_vector>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::byte_vector &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (const auto b: v)
                out_it = fmt::format_to(out_it, "{:02X}", b);
            return out_it;
        }
    };

    template<>
    struct formatter<decoda::bit_vector>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::bit_vector &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (size_t i = 0; i < v.size(); ++i)
                *out_it++ = v[i] ? '1' : '0';
            return out_it;
        }
    };
}

#endif // !DECODA_BYTES_HPP
