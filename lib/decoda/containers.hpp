/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_CONTAINERS_HPP
#define DECODA_CONTAINERS_HPP

#include <deque>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>
#include <decoda/primitives.hpp>

namespace decoda {
    // A non-empty sequence: the head is always present
    template<typename T, template<typename...> typename C>
    struct one_and {
        T head;
        C<T> tail {};

        [[nodiscard]] size_t size() const noexcept
        {
            return tail.size() + 1;
        }

        bool operator==(const one_and &) const =default;
    };

    template<typename T>
    using non_empty_vector = one_and<T, std::vector>;

    template<typename T>
    using non_empty_list = one_and<T, std::list>;

    template<typename T, typename A>
    struct type_name_for<std::vector<T, A>> {
        static std::string get() { return fmt::format("Vector[{}]", type_name<T>()); }
    };

    template<typename T, typename A>
    struct type_name_for<std::list<T, A>> {
        static std::string get() { return fmt::format("List[{}]", type_name<T>()); }
    };

    template<typename T, typename A>
    struct type_name_for<std::deque<T, A>> {
        static std::string get() { return fmt::format("Deque[{}]", type_name<T>()); }
    };

    template<typename T, typename C, typename A>
    struct type_name_for<std::set<T, C, A>> {
        static std::string get() { return fmt::format("Set[{}]", type_name<T>()); }
    };

    template<typename K, typename V, typename C, typename A>
    struct type_name_for<std::map<K, V, C, A>> {
        static std::string get() { return fmt::format("Map[{}, {}]", type_name<K>(), type_name<V>()); }
    };

    template<typename K, typename V, typename H, typename E, typename A>
    struct type_name_for<std::unordered_map<K, V, H, E, A>> {
        static std::string get() { return fmt::format("Map[{}, {}]", type_name<K>(), type_name<V>()); }
    };

    template<typename T>
    struct type_name_for<std::optional<T>> {
        static std::string get() { return fmt::format("Option[{}]", type_name<T>()); }
    };

    template<typename T>
    struct type_name_for<non_empty_vector<T>> {
        static std::string get() { return fmt::format("NonEmptyVector[{}]", type_name<T>()); }
    };

    template<typename T>
    struct type_name_for<non_empty_list<T>> {
        static std::string get() { return fmt::format("NonEmptyList[{}]", type_name<T>()); }
    };

    template<typename L, typename R>
    struct type_name_for<either<L, R>> {
        static std::string get() { return fmt::format("Either[{}, {}]", type_name<L>(), type_name<R>()); }
    };

    template<typename E, typename A>
    struct type_name_for<validated<E, A>> {
        static std::string get() { return fmt::format("Validated[{}, {}]", type_name<E>(), type_name<A>()); }
    };

    /*
     * Decodes a JSON array element by element moving the cursor to the right.
     * An empty array yields an empty container.
     * Accumulating mode visits every element and reports the failures in positional order.
     */
    template<typename C>
    decoder<C> sequence_decoder(const decoder<typename C::value_type> &elem)
    {
        using T = typename C::value_type;
        const auto fail_msg = fmt::format("expected array of {}", type_name<T>());
        return decoder<C> {
            [elem, fail_msg](const cursor &c) -> result<C> {
                C res {};
                auto cur = c.down_array();
                if (!cur.succeeded()) {
                    if (c.focus().is_array())
                        return res;
                    return decoding_failure { fail_msg, c.history() };
                }
                for (; cur.succeeded(); cur = cur.right()) {
                    auto r = elem.decode(cur);
                    if (!r)
                        return r.failure();
                    res.emplace_back(std::move(r).value());
                }
                return res;
            },
            [elem, fail_msg](const cursor &c) -> accumulating_result<C> {
                C res {};
                auto cur = c.down_array();
                if (!cur.succeeded()) {
                    if (c.focus().is_array())
                        return res;
                    return decoding_failure { fail_msg, c.history() };
                }
                failure_list fl {};
                for (; cur.succeeded(); cur = cur.right()) {
                    auto r = elem.decode_accumulating(cur);
                    if (!r)
                        fl.insert(fl.end(), r.failures().begin(), r.failures().end());
                    else if (fl.empty())
                        res.emplace_back(std::move(r).value());
                }
                if (!fl.empty())
                    return fl;
                return res;
            }
        };
    }

    /*
     * Decodes every field value of an object with vd and its name with kd.
     * Values are decoded fail-fast in both modes.
     * Once a failure is known, accumulating mode keeps collecting failures but no longer adds entries.
     */
    template<typename M>
    decoder<M> map_decoder(const key_decoder<typename M::key_type> &kd, const decoder<typename M::mapped_type> &vd)
    {
        static constexpr std::string_view not_object_msg { "expected object" };
        const auto key_msg = type_name<M>();
        return decoder<M> {
            [kd, vd, key_msg](const cursor &c) -> result<M> {
                const auto names = c.fields();
                if (!names)
                    return decoding_failure { std::string { not_object_msg }, c.history() };
                M res {};
                for (const auto &name: *names) {
                    const auto at = c.down_field(name);
                    auto v = vd.decode(at);
                    if (!v)
                        return v.failure();
                    auto k = kd.decode(name);
                    if (!k)
                        return decoding_failure { key_msg, at.history() };
                    res.insert_or_assign(std::move(*k), std::move(v).value());
                }
                return res;
            },
            [kd, vd, key_msg](const cursor &c) -> accumulating_result<M> {
                const auto names = c.fields();
                if (!names)
                    return decoding_failure { std::string { not_object_msg }, c.history() };
                M res {};
                failure_list fl {};
                for (const auto &name: *names) {
                    const auto at = c.down_field(name);
                    auto v = vd.decode(at);
                    auto k = kd.decode(name);
                    if (!v)
                        fl.emplace_back(v.failure());
                    else if (!k)
                        fl.emplace_back(key_msg, at.history());
                    else if (fl.empty())
                        res.insert_or_assign(std::move(*k), std::move(v).value());
                }
                if (!fl.empty())
                    return fl;
                return res;
            }
        };
    }

    // Duplicates collapse, all failure messages are replaced with the set's type name
    template<typename S>
    decoder<S> set_decoder(const decoder<typename S::value_type> &elem)
    {
        using T = typename S::value_type;
        return sequence_decoder<std::vector<T>>(elem)
            .map([](const std::vector<T> &items) { return S(items.begin(), items.end()); })
            .with_error_message(type_name<S>());
    }

    /*
     * Null and absent fields decode to an empty optional.
     * A failed navigation is an error only when a step met a value of the wrong shape.
     * A decoding failure with an empty history also yields an empty optional.
     */
    template<typename T>
    decoder<std::optional<T>> optional_decoder(const decoder<T> &d)
    {
        static constexpr std::string_view wrong_shape_msg { "expected Option" };
        using opt_t = std::optional<T>;
        return decoder<opt_t> {
            [d](const cursor &c) -> result<opt_t> {
                if (!c.succeeded()) {
                    if (c.failed_on_incorrect_focus())
                        return decoding_failure { std::string { wrong_shape_msg }, c.history() };
                    return opt_t {};
                }
                if (c.focus().is_null())
                    return opt_t {};
                auto r = d.decode(c);
                if (r)
                    return opt_t { std::move(r).value() };
                if (r.failure().history().empty())
                    return opt_t {};
                return r.failure();
            },
            [d](const cursor &c) -> accumulating_result<opt_t> {
                if (!c.succeeded()) {
                    if (c.failed_on_incorrect_focus())
                        return decoding_failure { std::string { wrong_shape_msg }, c.history() };
                    return opt_t {};
                }
                if (c.focus().is_null())
                    return opt_t {};
                auto r = d.decode_accumulating(c);
                if (r)
                    return opt_t { std::move(r).value() };
                if (r.failures().front().history().empty())
                    return opt_t {};
                return r.failures();
            },
            true
        };
    }

    // The head is the first array element, the tail is the rest of the array decoded as a sequence
    template<typename T, template<typename...> typename C>
    decoder<one_and<T, C>> one_and_decoder(const decoder<T> &elem)
    {
        using res_t = one_and<T, C>;
        const auto tail = sequence_decoder<C<T>>(elem);
        return decoder<res_t> {
            [elem, tail](const cursor &c) -> result<res_t> {
                const auto head_c = c.down_array();
                auto h = elem.decode(head_c);
                if (!h)
                    return h.failure();
                auto t = tail.decode(head_c.delete_focus());
                if (!t)
                    return t.failure();
                return res_t { std::move(h).value(), std::move(t).value() };
            },
            [elem, tail](const cursor &c) -> accumulating_result<res_t> {
                const auto head_c = c.down_array();
                const auto h = elem.decode_accumulating(head_c);
                const auto t = tail.decode_accumulating(head_c.delete_focus());
                return h.map2(t, [](const T &hv, const C<T> &tv) { return res_t { hv, tv }; });
            }
        };
    }

    /*
     * Chooses the branch by field presence: exactly one of the two fields must be present.
     * The message of any failure is the name of the disjunction.
     */
    template<typename A, typename B>
    decoder<either<A, B>> decode_xor(const std::string &left_name, const std::string &right_name,
        const decoder<A> &da=decoder_of<A>(), const decoder<B> &db=decoder_of<B>())
    {
        const auto msg = fmt::format("Xor[{}, {}]", type_name<A>(), type_name<B>());
        return instance<either<A, B>>([=](const cursor &c) -> result<either<A, B>> {
            const auto l = c.down_field(left_name);
            const auto r = c.down_field(right_name);
            if (l.succeeded() && !r.succeeded()) {
                return da.decode(l).map([](const A &v) {
                    return either<A, B> { std::in_place_index<0>, left<A> { v } };
                });
            }
            if (!l.succeeded() && r.succeeded()) {
                return db.decode(r).map([](const B &v) {
                    return either<A, B> { std::in_place_index<1>, right<B> { v } };
                });
            }
            return decoding_failure { msg, c.history() };
        });
    }

    template<typename A, typename B>
    decoder<either<A, B>> decode_either(const std::string &left_name, const std::string &right_name,
        const decoder<A> &da=decoder_of<A>(), const decoder<B> &db=decoder_of<B>())
    {
        return decode_xor<A, B>(left_name, right_name, da, db).with_error_message(type_name<either<A, B>>());
    }

    template<typename E, typename A>
    decoder<validated<E, A>> decode_validated(const std::string &failure_name, const std::string &success_name,
        const decoder<E> &de=decoder_of<E>(), const decoder<A> &da=decoder_of<A>())
    {
        return decode_xor<E, A>(failure_name, success_name, de, da)
            .map([](const either<E, A> &v) -> validated<E, A> {
                if (const auto *l = std::get_if<0>(&v))
                    return validated<E, A> { std::in_place_index<0>, invalid<E> { l->value } };
                return validated<E, A> { std::in_place_index<1>, valid<A> { std::get<1>(v).value } };
            })
            .with_error_message(type_name<validated<E, A>>());
    }

    template<typename T, typename A>
    struct decoder_for<std::vector<T, A>> {
        static decoder<std::vector<T, A>> get()
        {
            return sequence_decoder<std::vector<T, A>>(decoder_of<T>());
        }
    };

    template<typename T, typename A>
    struct decoder_for<std::list<T, A>> {
        static decoder<std::list<T, A>> get()
        {
            return sequence_decoder<std::list<T, A>>(decoder_of<T>());
        }
    };

    template<typename T, typename A>
    struct decoder_for<std::deque<T, A>> {
        static decoder<std::deque<T, A>> get()
        {
            return sequence_decoder<std::deque<T, A>>(decoder_of<T>());
        }
    };

    template<typename T, typename C, typename A>
    struct decoder_for<std::set<T, C, A>> {
        static decoder<std::set<T, C, A>> get()
        {
            return set_decoder<std::set<T, C, A>>(decoder_of<T>());
        }
    };

    template<typename K, typename V, typename C, typename A>
    struct decoder_for<std::map<K, V, C, A>> {
        static decoder<std::map<K, V, C, A>> get()
        {
            return map_decoder<std::map<K, V, C, A>>(key_decoder_of<K>(), decoder_of<V>());
        }
    };

    template<typename K, typename V, typename H, typename E, typename A>
    struct decoder_for<std::unordered_map<K, V, H, E, A>> {
        static decoder<std::unordered_map<K, V, H, E, A>> get()
        {
            return map_decoder<std::unordered_map<K, V, H, E, A>>(key_decoder_of<K>(), decoder_of<V>());
        }
    };

    template<typename T>
    struct decoder_for<std::optional<T>> {
        static decoder<std::optional<T>> get()
        {
            return optional_decoder(decoder_of<T>());
        }
    };

    template<typename T, template<typename...> typename C>
    struct decoder_for<one_and<T, C>> {
        static decoder<one_and<T, C>> get()
        {
            return one_and_decoder<T, C>(decoder_of<T>());
        }
    };
}

namespace fmt {
    template<typename T, template<typename...> typename C>
    struct formatter<decoda::one_and<T, C>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "one_and({}, {})", v.head, v.tail);
        }
    };
}

#endif // !DECODA_CONTAINERS_HPP
