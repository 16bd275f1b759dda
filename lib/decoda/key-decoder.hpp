/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_KEY_DECODER_HPP
#define DECODA_KEY_DECODER_HPP

#include <functional>
#include <optional>
#include <string>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <decoda/number.hpp>

namespace decoda {
    using uuid = boost::uuids::uuid;

    // parses the canonical 36-character textual form only
    extern std::optional<uuid> uuid_from_text(std::string_view text);

    /*
     * Turns an object field name into a map key.
     * Independent of the decoder algebra: a key has no cursor, so a rejection carries no message.
     */
    template<typename K>
    struct key_decoder {
        using value_type = K;
        using decode_func = std::function<std::optional<K>(std::string_view)>;

        explicit key_decoder(decode_func f): _f { std::move(f) }
        {
        }

        [[nodiscard]] std::optional<K> decode(const std::string_view key) const
        {
            return _f(key);
        }

        template<typename F>
        auto map(F f) const -> key_decoder<std::decay_t<std::invoke_result_t<F, const K &>>>
        {
            using U = std::decay_t<std::invoke_result_t<F, const K &>>;
            return key_decoder<U> {
                [self=*this, f](const std::string_view key) -> std::optional<U> {
                    if (auto k = self.decode(key); k)
                        return f(*k);
                    return {};
                }
            };
        }
    private:
        decode_func _f;
    };

    template<typename K, typename Enable=void>
    struct key_decoder_for;

    template<typename K>
    const key_decoder<K> &key_decoder_of()
    {
        static const key_decoder<K> d = key_decoder_for<K>::get();
        return d;
    }

    template<>
    struct key_decoder_for<std::string> {
        static key_decoder<std::string> get()
        {
            return key_decoder<std::string> { [](const std::string_view key) { return std::optional<std::string> { key }; } };
        }
    };

    template<std::integral K>
    struct key_decoder_for<K, std::enable_if_t<!std::is_same_v<K, bool>>> {
        static key_decoder<K> get()
        {
            return key_decoder<K> { [](const std::string_view key) { return integral_from_text<K>(key); } };
        }
    };

    template<>
    struct key_decoder_for<uuid> {
        static key_decoder<uuid> get()
        {
            return key_decoder<uuid> { [](const std::string_view key) { return uuid_from_text(key); } };
        }
    };
}

namespace fmt {
    template<>
    struct formatter<decoda::uuid>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::uuid &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", boost::uuids::to_string(v));
        }
    };
}

#endif // !DECODA_KEY_DECODER_HPP
