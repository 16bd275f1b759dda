/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_DECODER_HPP
#define DECODA_DECODER_HPP

#include <functional>
#include <memory>
#include <typeinfo>
#include <decoda/either.hpp>
#include <decoda/logger.hpp>
#include <decoda/result.hpp>

namespace decoda {
    template<typename T>
    struct decoder;

    template<typename T>
    struct accumulating_decoder;

    /*
     * The canonical decoder of a type is provided by a specialization of decoder_for
     * with a static get() method returning decoder<T>.
     * decoder_of<T>() builds it once and shares it afterwards.
     */
    template<typename T, typename Enable=void>
    struct decoder_for;

    template<typename T>
    const decoder<T> &decoder_of()
    {
        static const decoder<T> d = decoder_for<T>::get();
        return d;
    }

    // The name used in shape-mismatch failures; specializations provide readable names for known types
    template<typename T, typename Enable=void>
    struct type_name_for {
        static std::string get()
        {
            return typeid(T).name();
        }
    };

    template<typename T>
    std::string type_name()
    {
        return type_name_for<T>::get();
    }

    template<typename T>
    struct decoder {
        using value_type = T;
        using decode_func = std::function<result<T>(const cursor &)>;
        using accumulating_func = std::function<accumulating_result<T>(const cursor &)>;

        /*
         * When no accumulating function is given, accumulating decoding wraps the fail-fast failure
         * into a one-element list, so the two modes cannot disagree.
         * A reattempt decoder receives failed cursors as well, otherwise decoding a failed cursor
         * produces the failed cursor diagnostic without calling the functions.
         * map, flat_map and prepare pass failed cursors on to the wrapped decoder,
         * the other combinators require a successful cursor.
         */
        explicit decoder(decode_func f, accumulating_func af={}, const bool reattempt=false):
            _impl { std::make_shared<const impl>(std::move(f), std::move(af), reattempt) }
        {
        }

        [[nodiscard]] result<T> decode(const cursor &c) const
        {
            if (auto df = _guard(c); df)
                return std::move(*df);
            return _impl->decode(c);
        }

        [[nodiscard]] accumulating_result<T> decode_accumulating(const cursor &c) const
        {
            if (auto df = _guard(c); df)
                return std::move(*df);
            if (_impl->decode_accumulating)
                return _impl->decode_accumulating(c);
            return accumulating_result<T>::from(_impl->decode(c));
        }

        [[nodiscard]] result<T> decode_json(const json::value &v) const
        {
            return decode(cursor::from(v));
        }

        [[nodiscard]] accumulating_result<T> decode_json_accumulating(const json::value &v) const
        {
            return decode_accumulating(cursor::from(v));
        }

        // the cursors keep the moved document alive
        [[nodiscard]] result<T> decode_json(json::value &&v) const
        {
            return decode(cursor::from(std::move(v)));
        }

        [[nodiscard]] accumulating_result<T> decode_json_accumulating(json::value &&v) const
        {
            return decode_accumulating(cursor::from(std::move(v)));
        }

        [[nodiscard]] bool reattempt() const noexcept
        {
            return _impl->reattempt;
        }

        [[nodiscard]] accumulating_decoder<T> accumulating() const
        {
            return accumulating_decoder<T> { *this };
        }

        template<typename F>
        auto map(F f) const -> decoder<std::decay_t<std::invoke_result_t<F, const T &>>>
        {
            using U = std::decay_t<std::invoke_result_t<F, const T &>>;
            return decoder<U> {
                [self=*this, f](const cursor &c) { return self.decode(c).map(f); },
                [self=*this, f](const cursor &c) { return self.decode_accumulating(c).map(f); },
                true
            };
        }

        // decodes with the decoder chosen by f at the same cursor position
        template<typename F>
        auto flat_map(F f) const -> std::invoke_result_t<F, const T &>
        {
            using res_decoder = std::invoke_result_t<F, const T &>;
            using U = typename res_decoder::value_type;
            return res_decoder {
                [self=*this, f](const cursor &c) -> result<U> {
                    auto r = self.decode(c);
                    if (!r)
                        return r.failure();
                    return f(r.value()).decode(c);
                },
                [self=*this, f](const cursor &c) -> accumulating_result<U> {
                    return self.decode_accumulating(c).and_then([&](const T &v) {
                        return f(v).decode_accumulating(c);
                    });
                },
                true
            };
        }

        // in accumulating mode only the first failure is passed to f
        template<typename F>
        decoder handle_error_with(F f) const
        {
            return decoder {
                [self=*this, f](const cursor &c) -> result<T> {
                    auto r = self.decode(c);
                    if (r)
                        return r;
                    return f(r.failure()).decode(c);
                },
                [self=*this, f](const cursor &c) -> accumulating_result<T> {
                    auto r = self.decode_accumulating(c);
                    if (r)
                        return r;
                    return f(r.failures().front()).decode_accumulating(c);
                }
            };
        }

        [[nodiscard]] decoder with_error_message(const std::string &msg) const
        {
            return decoder {
                [self=*this, msg](const cursor &c) -> result<T> {
                    auto r = self.decode(c);
                    if (r)
                        return r;
                    return r.failure().with_message(msg);
                },
                [self=*this, msg](const cursor &c) -> accumulating_result<T> {
                    return self.decode_accumulating(c).map_failures([&](const decoding_failure &df) {
                        return df.with_message(msg);
                    });
                }
            };
        }

        template<typename P>
        decoder validate(P pred, const std::string &msg) const
        {
            return decoder {
                [self=*this, pred, msg](const cursor &c) -> result<T> {
                    if (!pred(c))
                        return decoding_failure { msg, c.history() };
                    return self.decode(c);
                },
                [self=*this, pred, msg](const cursor &c) -> accumulating_result<T> {
                    if (!pred(c))
                        return decoding_failure { msg, c.history() };
                    return self.decode_accumulating(c);
                }
            };
        }

        // both decoders run at the same position
        template<typename U>
        decoder<std::pair<T, U>> and_(const decoder<U> &o) const
        {
            return decoder<std::pair<T, U>> {
                [self=*this, o](const cursor &c) {
                    const auto a = self.decode(c);
                    return a.product(o.decode(c));
                },
                [self=*this, o](const cursor &c) {
                    const auto a = self.decode_accumulating(c);
                    return a.product(o.decode_accumulating(c));
                }
            };
        }

        // o runs only when this decoder fails and its failure is the one reported
        [[nodiscard]] decoder or_(const decoder &o) const
        {
            return decoder {
                [self=*this, o](const cursor &c) -> result<T> {
                    auto r = self.decode(c);
                    if (r)
                        return r;
                    return o.decode(c);
                },
                [self=*this, o](const cursor &c) -> accumulating_result<T> {
                    auto r = self.decode_accumulating(c);
                    if (r)
                        return r;
                    return o.decode_accumulating(c);
                }
            };
        }

        template<typename U>
        auto split(const decoder<U> &o) const
        {
            return [self=*this, o](const either<cursor, cursor> &c) -> result<either<T, U>> {
                if (const auto *l = std::get_if<0>(&c)) {
                    return self.decode(l->value).map([](const T &v) {
                        return either<T, U> { std::in_place_index<0>, left<T> { v } };
                    });
                }
                return o.decode(std::get<1>(c).value).map([](const U &v) {
                    return either<T, U> { std::in_place_index<1>, right<U> { v } };
                });
            };
        }

        template<typename U>
        auto product(const decoder<U> &o) const
        {
            return [self=*this, o](const cursor &a, const cursor &b) -> result<std::pair<T, U>> {
                const auto ra = self.decode(a);
                return ra.product(o.decode(b));
            };
        }

        template<typename F>
        decoder prepare(F f) const
        {
            return decoder {
                [self=*this, f](const cursor &c) { return self.decode(f(c)); },
                [self=*this, f](const cursor &c) { return self.decode_accumulating(f(c)); },
                true
            };
        }

        // f returns either an error message or the new value
        template<typename F>
        auto emap(F f) const
        {
            using either_type = std::invoke_result_t<F, const T &>;
            using U = std::decay_t<decltype(std::get<1>(std::declval<either_type>()).value)>;
            static_assert(std::is_same_v<either_type, either<std::string, U>>, "emap expects a function returning either<std::string, U>");
            const auto apply = [f](const T &v, const cursor &c) -> result<U> {
                auto e = f(v);
                if (auto *msg = std::get_if<0>(&e))
                    return decoding_failure { std::move(msg->value), c.history() };
                return std::move(std::get<1>(e).value);
            };
            return decoder<U> {
                [self=*this, apply](const cursor &c) -> result<U> {
                    return self.decode(c).flat_map([&](const T &v) { return apply(v, c); });
                },
                [self=*this, apply](const cursor &c) -> accumulating_result<U> {
                    return self.decode_accumulating(c).and_then([&](const T &v) {
                        return accumulating_result<U>::from(apply(v, c));
                    });
                }
            };
        }

        // f may throw: a std::exception becomes a failure carrying its description
        template<typename F>
        auto emap_try(F f) const -> decoder<std::decay_t<std::invoke_result_t<F, const T &>>>
        {
            using U = std::decay_t<std::invoke_result_t<F, const T &>>;
            const auto apply = [f](const T &v, const cursor &c) -> result<U> {
                try {
                    return f(v);
                } catch (const std::exception &ex) {
                    logger::trace("emap_try: conversion failed at {}: {}", history_path(c.history()), ex.what());
                    return decoding_failure::from_exception(ex, c.history());
                }
            };
            return decoder<U> {
                [self=*this, apply](const cursor &c) -> result<U> {
                    return self.decode(c).flat_map([&](const T &v) { return apply(v, c); });
                },
                [self=*this, apply](const cursor &c) -> accumulating_result<U> {
                    return self.decode_accumulating(c).and_then([&](const T &v) {
                        return accumulating_result<U>::from(apply(v, c));
                    });
                }
            };
        }
    private:
        struct impl {
            decode_func decode;
            accumulating_func decode_accumulating;
            bool reattempt;

            impl(decode_func f, accumulating_func af, const bool r):
                decode { std::move(f) }, decode_accumulating { std::move(af) }, reattempt { r }
            {
            }
        };

        std::shared_ptr<const impl> _impl;

        std::optional<decoding_failure> _guard(const cursor &c) const
        {
            if (c.depth() > c.limits().max_depth) [[unlikely]]
                return decoding_failure { std::string { decoding_failure::max_depth_message }, c.history() };
            if (!c.succeeded() && !_impl->reattempt)
                return decoding_failure { std::string { decoding_failure::failed_cursor_message }, c.history() };
            return {};
        }
    };

    // Exposes only the accumulating protocol of a decoder
    template<typename T>
    struct accumulating_decoder {
        using value_type = T;

        explicit accumulating_decoder(decoder<T> dec): _dec { std::move(dec) }
        {
        }

        [[nodiscard]] accumulating_result<T> decode(const cursor &c) const
        {
            return _dec.decode_accumulating(c);
        }

        [[nodiscard]] accumulating_result<T> decode_json(const json::value &v) const
        {
            return _dec.decode_json_accumulating(v);
        }

        [[nodiscard]] accumulating_result<T> decode_json(json::value &&v) const
        {
            return _dec.decode_json_accumulating(std::move(v));
        }

        template<typename F>
        auto map(F f) const
        {
            return _dec.map(std::move(f)).accumulating();
        }

        template<typename U>
        accumulating_decoder<std::pair<T, U>> and_(const accumulating_decoder<U> &o) const
        {
            return _dec.and_(o.underlying()).accumulating();
        }

        [[nodiscard]] const decoder<T> &underlying() const noexcept
        {
            return _dec;
        }
    private:
        decoder<T> _dec;
    };

    template<typename T>
    decoder<std::decay_t<T>> const_value(T &&v)
    {
        using U = std::decay_t<T>;
        return decoder<U> {
            [v=U { std::forward<T>(v) }](const cursor &) -> result<U> { return v; }
        };
    }

    template<typename T, typename F>
    decoder<T> instance(F f)
    {
        return decoder<T> { std::move(f) };
    }

    // f may throw: a std::exception becomes a failure carrying its description at the cursor's history
    template<typename T, typename F>
    decoder<T> instance_try(F f)
    {
        return decoder<T> {
            [f](const cursor &c) -> result<T> {
                try {
                    return f(c);
                } catch (const std::exception &ex) {
                    return decoding_failure::from_exception(ex, c.history());
                }
            }
        };
    }

    // f receives the cursor even when the navigation that produced it has failed
    template<typename T, typename F>
    decoder<T> with_reattempt(F f)
    {
        return decoder<T> { std::move(f), {}, true };
    }

    template<typename T>
    decoder<T> failed(decoding_failure df)
    {
        return decoder<T> {
            [df](const cursor &) -> result<T> { return df; },
            [df](const cursor &) -> accumulating_result<T> { return df; }
        };
    }

    template<typename T>
    decoder<T> failed_with_message(std::string msg)
    {
        return failed<T>(decoding_failure { std::move(msg) });
    }

    // Resolves the canonical decoder at decode time, which allows recursive types to refer to themselves
    template<typename T>
    decoder<T> deferred()
    {
        return decoder<T> {
            [](const cursor &c) { return decoder_of<T>().decode(c); },
            [](const cursor &c) { return decoder_of<T>().decode_accumulating(c); },
            true
        };
    }

    template<typename T>
    decoder<std::decay_t<T>> pure(T &&v)
    {
        return const_value(std::forward<T>(v));
    }

    template<typename T>
    decoder<T> raise_error(decoding_failure df)
    {
        return failed<T>(std::move(df));
    }

    template<typename T>
    decoder<T> combine_k(const decoder<T> &x, const decoder<T> &y)
    {
        return x.or_(y);
    }

    template<typename T>
    result<T> decode_as(const cursor &c)
    {
        return decoder_of<T>().decode(c);
    }

    template<typename T>
    result<T> decode_field(const cursor &c, const std::string_view name)
    {
        return decoder_of<T>().decode(c.down_field(name));
    }

    // a decoded cursor borrows v, use the rvalue overload for temporaries
    template<typename T>
    result<T> decode(const json::value &v)
    {
        return decoder_of<T>().decode_json(v);
    }

    template<typename T>
    result<T> decode(json::value &&v)
    {
        return decoder_of<T>().decode_json(std::move(v));
    }

    template<typename T>
    accumulating_result<T> decode_accumulating(const json::value &v)
    {
        return decoder_of<T>().decode_json_accumulating(v);
    }

    template<typename T>
    accumulating_result<T> decode_accumulating(json::value &&v)
    {
        return decoder_of<T>().decode_json_accumulating(std::move(v));
    }

    // collects every failure and throws them as a decoding_error
    template<typename T>
    T decode_or_throw(const json::value &v)
    {
        auto res = decode_accumulating<T>(v);
        if (!res) {
            logger::debug("decoding of {} failed: {}", type_name<T>(), failure_summary(res.failures()));
            throw decoding_error { res.failures() };
        }
        return std::move(res).value();
    }
}

#endif // !DECODA_DECODER_HPP
