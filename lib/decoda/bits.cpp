/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/base64.hpp>
#include <decoda/bits.hpp>

namespace decoda {
    bit_vector bit_vector_from_bytes(const byte_vector &bytes, const size_t num_bits)
    {
        if (num_bits > bytes.size() * 8)
            throw error(fmt::format("requested {} bits but only {} bytes are available", num_bits, bytes.size()));
        bit_vector res(num_bits);
        for (size_t i = 0; i < num_bits; ++i)
            res[i] = (bytes[i / 8] >> (7 - i % 8)) & 1;
        return res;
    }

    static result<byte_vector> base64_at(const std::string_view text, const cursor &c)
    {
        try {
            return base64::decode(text);
        } catch (const error &ex) {
            return decoding_failure::from_exception(ex, c.history());
        }
    }

    decoder<byte_vector> decoder_for<byte_vector>::get()
    {
        return instance<byte_vector>([](const cursor &c) -> result<byte_vector> {
            return decoder_of<std::string>().decode(c).flat_map([&](const std::string &s) {
                return base64_at(s, c);
            });
        });
    }

    decoder<bit_vector> decoder_for<bit_vector>::get()
    {
        static const std::string bad_format_msg { "Incorrect format for BitVector field" };
        return instance<bit_vector>([](const cursor &c) -> result<bit_vector> {
            auto s = decoder_of<std::string>().decode(c);
            if (!s)
                return s.failure();
            const std::string_view text { s.value() };
            auto bytes = base64_at(text.empty() ? text : text.substr(1), c);
            if (!bytes)
                return bytes.failure();
            if (text.empty() || text[0] < '0' || text[0] > '8')
                return decoding_failure { bad_format_msg, c.history() };
            const size_t ignored = 8 - static_cast<size_t>(text[0] - '0');
            const auto total = bytes.value().size() * 8;
            return bit_vector_from_bytes(bytes.value(), total > ignored ? total - ignored : 0);
        });
    }
}
