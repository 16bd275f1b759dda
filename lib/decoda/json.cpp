/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <variant>
#include <vector>
#include <boost/json/basic_parser_impl.hpp>
#include <decoda/json.hpp>
#include <decoda/logger.hpp>

namespace decoda::json {
    namespace {
        struct numeral {
            std::string text;
            double value;
        };

        // Allocates from the upstream resource and remembers the numeral text of the leaves living in its buffers
        struct numeral_resource: memory_resource {
            explicit numeral_resource(storage_ptr upstream): _upstream { std::move(upstream) }
            {
            }

            void record(const json::value *v, numeral n)
            {
                std::scoped_lock lk { _mutex };
                _numerals.insert_or_assign(static_cast<const void *>(v), std::move(n));
            }

            void record_root(numeral n)
            {
                std::scoped_lock lk { _mutex };
                _root = std::move(n);
            }

            [[nodiscard]] bool empty() const
            {
                std::scoped_lock lk { _mutex };
                return _numerals.empty();
            }

            [[nodiscard]] std::optional<std::string> find(const json::value &v, const bool root) const
            {
                std::scoped_lock lk { _mutex };
                if (const auto it = _numerals.find(static_cast<const void *>(&v)); it != _numerals.end() && it->second.value == v.get_double())
                    return it->second.text;
                if (root && _root && _root->value == v.get_double())
                    return _root->text;
                return {};
            }
        protected:
            void *do_allocate(const std::size_t n, const std::size_t align) override
            {
                return _upstream->allocate(n, align);
            }

            void do_deallocate(void *p, const std::size_t n, const std::size_t align) override
            {
                {
                    std::scoped_lock lk { _mutex };
                    if (!_numerals.empty()) {
                        const auto *begin = static_cast<const char *>(p);
                        _numerals.erase(_numerals.lower_bound(begin), _numerals.lower_bound(begin + n));
                    }
                }
                _upstream->deallocate(p, n, align);
            }

            [[nodiscard]] bool do_is_equal(const memory_resource &o) const noexcept override
            {
                return this == &o;
            }
        private:
            storage_ptr _upstream;
            mutable std::mutex _mutex {};
            std::map<const void *, numeral> _numerals {};
            std::optional<numeral> _root {};
        };

        // Builds the document like boost::json::parser does and collects the position and text of double numerals
        struct numeral_handler {
            static constexpr std::size_t max_object_size = object::max_size();
            static constexpr std::size_t max_array_size = array::max_size();
            static constexpr std::size_t max_key_size = string::max_size();
            static constexpr std::size_t max_string_size = string::max_size();

            using path_step = std::variant<size_t, std::string>;
            using path = std::vector<path_step>;

            struct level {
                bool array;
                size_t size = 0;
                std::string key {};
            };

            struct located_numeral {
                path pos;
                numeral num;
            };

            value_stack st {};
            storage_ptr sp;
            std::vector<level> levels {};
            std::string number_buf {};
            std::string key_buf {};
            std::vector<located_numeral> numerals {};

            explicit numeral_handler(storage_ptr sp_): sp { std::move(sp_) }
            {
            }

            bool on_document_begin(error_code &)
            {
                st.reset(sp);
                return true;
            }

            bool on_document_end(error_code &)
            {
                return true;
            }

            bool on_object_begin(error_code &)
            {
                levels.push_back(level { false });
                return true;
            }

            bool on_object_end(const std::size_t n, error_code &)
            {
                levels.pop_back();
                st.push_object(n);
                _value_done();
                return true;
            }

            bool on_array_begin(error_code &)
            {
                levels.push_back(level { true });
                return true;
            }

            bool on_array_end(const std::size_t n, error_code &)
            {
                levels.pop_back();
                st.push_array(n);
                _value_done();
                return true;
            }

            bool on_key_part(const string_view s, std::size_t, error_code &)
            {
                key_buf.append(s.data(), s.size());
                st.push_chars(s);
                return true;
            }

            bool on_key(const string_view s, std::size_t, error_code &)
            {
                key_buf.append(s.data(), s.size());
                levels.back().key = std::move(key_buf);
                key_buf.clear();
                st.push_key(s);
                return true;
            }

            bool on_string_part(const string_view s, std::size_t, error_code &)
            {
                st.push_chars(s);
                return true;
            }

            bool on_string(const string_view s, std::size_t, error_code &)
            {
                st.push_string(s);
                _value_done();
                return true;
            }

            bool on_number_part(const string_view s, error_code &)
            {
                number_buf.append(s.data(), s.size());
                return true;
            }

            bool on_int64(const int64_t i, string_view, error_code &)
            {
                number_buf.clear();
                st.push_int64(i);
                _value_done();
                return true;
            }

            bool on_uint64(const uint64_t u, string_view, error_code &)
            {
                number_buf.clear();
                st.push_uint64(u);
                _value_done();
                return true;
            }

            bool on_double(const double d, const string_view s, error_code &)
            {
                number_buf.append(s.data(), s.size());
                numerals.push_back(located_numeral { _path(), numeral { std::move(number_buf), d } });
                number_buf.clear();
                st.push_double(d);
                _value_done();
                return true;
            }

            bool on_bool(const bool b, error_code &)
            {
                st.push_bool(b);
                _value_done();
                return true;
            }

            bool on_null(error_code &)
            {
                st.push_null();
                _value_done();
                return true;
            }

            bool on_comment_part(string_view, error_code &)
            {
                return true;
            }

            bool on_comment(string_view, error_code &)
            {
                return true;
            }
        private:
            void _value_done()
            {
                if (!levels.empty())
                    ++levels.back().size;
            }

            [[nodiscard]] path _path() const
            {
                path p {};
                p.reserve(levels.size());
                for (const auto &l: levels) {
                    if (l.array)
                        p.emplace_back(l.size);
                    else
                        p.emplace_back(l.key);
                }
                return p;
            }
        };

        const json::value *resolve(const json::value &root, const numeral_handler::path &p)
        {
            const auto *v = &root;
            for (const auto &step: p) {
                if (const auto *idx = std::get_if<size_t>(&step)) {
                    if (!v->is_array() || *idx >= v->get_array().size())
                        return nullptr;
                    v = &v->get_array()[*idx];
                } else {
                    if (!v->is_object())
                        return nullptr;
                    const auto it = v->get_object().find(std::get<std::string>(step));
                    if (it == v->get_object().end())
                        return nullptr;
                    v = &it->value();
                }
            }
            return v;
        }

        numeral_resource *numeral_resource_of(const json::value &v)
        {
            return dynamic_cast<numeral_resource *>(v.storage().get());
        }
    }

    json::value parse(const std::string_view text, json::storage_ptr sp)
    {
        auto doc_sp = make_shared_resource<numeral_resource>(std::move(sp));
        auto &res = static_cast<numeral_resource &>(*doc_sp.get());
        basic_parser<numeral_handler> p { parse_options {}, doc_sp };
        boost::json::error_code ec {};
        const auto n = p.write_some(false, text.data(), text.size(), ec);
        if (!ec && n < text.size())
            ec = boost::json::error::extra_data;
        if (ec)
            throw error(fmt::format("invalid JSON text: {}", ec.message()));
        auto &h = p.handler();
        auto doc = h.st.release();
        for (auto &[pos, num]: h.numerals) {
            if (pos.empty()) {
                res.record_root(std::move(num));
                continue;
            }
            // of duplicate keys only the last value stays in the document
            if (const auto *v = resolve(doc, pos); v && v->is_double() && v->get_double() == num.value)
                res.record(v, std::move(num));
        }
        return doc;
    }

    json::value load(const std::string &path, json::storage_ptr sp)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error(fmt::format("unable to open {} for reading!", path));
        std::ostringstream ss {};
        ss << is.rdbuf();
        logger::trace("loaded {} bytes of JSON from {}", ss.view().size(), path);
        return parse(ss.view(), std::move(sp));
    }

    std::optional<std::string> numeral_text(const json::value &v, const bool root)
    {
        if (!v.is_double())
            return {};
        if (const auto *res = numeral_resource_of(v); res)
            return res->find(v, root);
        return {};
    }

    void carry_numerals(const json::value &src, const json::value &dst)
    {
        const auto *src_res = numeral_resource_of(src);
        auto *dst_res = numeral_resource_of(dst);
        if (!src_res || !dst_res || src_res->empty())
            return;
        std::vector<std::pair<const json::value *, const json::value *>> todo { { &src, &dst } };
        while (!todo.empty()) {
            const auto [s, d] = todo.back();
            todo.pop_back();
            switch (s->kind()) {
                case kind::double_:
                    if (auto text = src_res->find(*s, false); text && d->is_double())
                        dst_res->record(d, numeral { std::move(*text), d->get_double() });
                    break;
                case kind::array: {
                    const auto &sa = s->get_array();
                    const auto &da = d->get_array();
                    for (size_t i = 0; i < sa.size() && i < da.size(); ++i)
                        todo.emplace_back(&sa[i], &da[i]);
                    break;
                }
                case kind::object: {
                    const auto &da = d->get_object();
                    for (const auto &kv: s->get_object()) {
                        if (const auto it = da.find(kv.key()); it != da.end())
                            todo.emplace_back(&kv.value(), &it->value());
                    }
                    break;
                }
                default:
                    break;
            }
        }
    }
}
