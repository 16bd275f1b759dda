/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_PRODUCT_HPP
#define DECODA_PRODUCT_HPP

#include <array>
#include <tuple>
#include <decoda/containers.hpp>

namespace decoda {
    namespace detail {
        template<typename... Ts>
        using decoded_parts = std::variant<std::tuple<Ts...>, failure_list>;

        /*
         * Decodes the I-th part with the I-th decoder at the cursor returned by cursor_at(I).
         * Stops at the first failure unless accumulate is set, in which case every part is visited.
         */
        template<typename... Ts, size_t... Is, typename CF>
        decoded_parts<Ts...> decode_parts(const std::tuple<decoder<Ts>...> &ds, const CF &cursor_at, const bool accumulate, std::index_sequence<Is...>)
        {
            failure_list fl {};
            std::tuple<std::optional<Ts>...> vals {};
            const auto step = [&]<size_t I>(std::integral_constant<size_t, I>) {
                if (!fl.empty() && !accumulate)
                    return;
                const auto &d = std::get<I>(ds);
                const cursor c = cursor_at(I);
                if (accumulate) {
                    auto r = d.decode_accumulating(c);
                    if (r)
                        std::get<I>(vals).emplace(std::move(r).value());
                    else
                        fl.insert(fl.end(), r.failures().begin(), r.failures().end());
                } else {
                    auto r = d.decode(c);
                    if (r)
                        std::get<I>(vals).emplace(std::move(r).value());
                    else
                        fl.emplace_back(r.failure());
                }
            };
            (step(std::integral_constant<size_t, Is> {}), ...);
            if (!fl.empty())
                return fl;
            return std::tuple<Ts...> { std::move(*std::get<Is>(vals))... };
        }

        template<typename R, typename... Ts, typename CF, typename F>
        decoder<R> parts_decoder(const std::tuple<decoder<Ts>...> &ds, const CF &cursor_at, const F &f)
        {
            using idx_t = std::index_sequence_for<Ts...>;
            return decoder<R> {
                [ds, cursor_at, f](const cursor &c) -> result<R> {
                    auto parts = decode_parts(ds, [&](const size_t i) { return cursor_at(c, i); }, false, idx_t {});
                    if (parts.index() == 1)
                        return std::get<1>(parts).front();
                    return std::apply(f, std::move(std::get<0>(parts)));
                },
                [ds, cursor_at, f](const cursor &c) -> accumulating_result<R> {
                    auto parts = decode_parts(ds, [&](const size_t i) { return cursor_at(c, i); }, true, idx_t {});
                    if (parts.index() == 1)
                        return std::move(std::get<1>(parts));
                    return std::apply(f, std::move(std::get<0>(parts)));
                }
            };
        }
    }

    /*
     * Decodes the named fields of an object and combines them with f.
     * Fail-fast mode stops at the first field failure, accumulating mode reports all of them in order.
     */
    template<typename F, typename... Ts>
    auto for_product(const std::array<std::string, sizeof...(Ts)> &names, F f, const decoder<Ts> &...ds)
        -> decoder<std::decay_t<std::invoke_result_t<F, Ts...>>>
    {
        using R = std::decay_t<std::invoke_result_t<F, Ts...>>;
        const auto cursor_at = [names](const cursor &c, const size_t i) { return c.down_field(names[i]); };
        return detail::parts_decoder<R>(std::tuple<decoder<Ts>...> { ds... }, cursor_at, f);
    }

    template<typename... Ts, typename F>
    auto for_product(const std::array<std::string, sizeof...(Ts)> &names, F f)
    {
        return for_product(names, std::move(f), decoder_of<Ts>()...);
    }

    // An array of exactly sizeof...(Ts) elements
    template<typename... Ts>
    decoder<std::tuple<Ts...>> tuple_decoder(const decoder<Ts> &...ds)
    {
        static constexpr size_t arity = sizeof...(Ts);
        const auto cursor_at = [](const cursor &c, const size_t i) { return c.down_n(i); };
        const auto parts = detail::parts_decoder<std::tuple<Ts...>>(std::tuple<decoder<Ts>...> { ds... }, cursor_at,
            [](Ts... vals) { return std::tuple<Ts...> { std::move(vals)... }; });
        return parts.validate([](const cursor &c) {
            return c.focus().is_array() && c.focus().get_array().size() == arity;
        }, fmt::format("Tuple{}", arity));
    }

    template<typename... Ts>
    struct type_name_for<std::tuple<Ts...>> {
        static std::string get()
        {
            std::vector<std::string> names { type_name<Ts>()... };
            std::string res = fmt::format("Tuple{}[", sizeof...(Ts));
            format_range(names.begin(), names.end(), std::back_inserter(res));
            return res + "]";
        }
    };

    template<typename A, typename B>
    struct type_name_for<std::pair<A, B>> {
        static std::string get()
        {
            return fmt::format("Tuple2[{}, {}]", type_name<A>(), type_name<B>());
        }
    };

    template<typename... Ts>
    struct decoder_for<std::tuple<Ts...>> {
        static decoder<std::tuple<Ts...>> get()
        {
            return tuple_decoder(decoder_of<Ts>()...);
        }
    };

    template<typename A, typename B>
    struct decoder_for<std::pair<A, B>> {
        static decoder<std::pair<A, B>> get()
        {
            return tuple_decoder(decoder_of<A>(), decoder_of<B>()).map([](const std::tuple<A, B> &t) {
                return std::pair<A, B> { std::get<0>(t), std::get<1>(t) };
            });
        }
    };

    /*
     * Decodes a string and looks it up in the table.
     * An unknown name fails with the lookup error's description.
     */
    template<typename E>
    decoder<E> decode_enum(std::map<std::string, E> table)
    {
        return decoder_of<std::string>().emap_try([table=std::move(table)](const std::string &name) {
            const auto it = table.find(name);
            if (it == table.end())
                throw error(fmt::format("unknown {} value: {}", type_name<E>(), name));
            return it->second;
        });
    }
}

#endif // !DECODA_PRODUCT_HPP
