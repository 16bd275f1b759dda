/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <variant>
#include <decoda/cursor.hpp>

namespace decoda {
    struct cursor::frame {
        const json::value *focus;
        // keeps the focus alive when it is a value synthesized by delete_focus
        std::shared_ptr<const json::value> owned {};
        std::shared_ptr<const frame> parent {};
        bool array_element = false;
        size_t index = 0;
        std::string key {};
        size_t depth = 0;
    };

    struct history::node {
        history_op op;
        mutable std::shared_ptr<const node> prev {};
        size_t size = 1;

        // unlinks the chain iteratively, histories of long arrays would exhaust the stack otherwise
        ~node()
        {
            auto p = std::move(prev);
            while (p && p.use_count() == 1) {
                auto next = std::move(p->prev);
                p = std::move(next);
            }
        }
    };

    history::history(std::shared_ptr<const node> last): _last { std::move(last) }
    {
    }

    history::history(const std::initializer_list<history_op> ops)
    {
        for (const auto &op: ops)
            *this = push(op);
    }

    size_t history::size() const noexcept
    {
        return _last ? _last->size : 0;
    }

    const history_op &history::back() const
    {
        if (!_last)
            throw error("back() requested from an empty history!");
        return _last->op;
    }

    std::vector<history_op> history::ops() const
    {
        std::vector<history_op> res {};
        res.reserve(size());
        for (const auto *n = _last.get(); n; n = n->prev.get())
            res.emplace_back(n->op);
        std::reverse(res.begin(), res.end());
        return res;
    }

    history history::push(history_op op) const
    {
        return history(std::make_shared<const node>(node { std::move(op), _last, size() + 1 }));
    }

    bool history::failed_on_incorrect_focus() const noexcept
    {
        for (const auto *n = _last.get(); n && !n->op.succeeded; n = n->prev.get()) {
            if (n->op.incorrect_focus)
                return true;
        }
        return false;
    }

    bool history::operator==(const history &o) const
    {
        if (size() != o.size())
            return false;
        const auto *a = _last.get();
        const auto *b = o._last.get();
        // shared tails are equal without looking at their steps
        for (; a != b; a = a->prev.get(), b = b->prev.get()) {
            if (a->op != b->op)
                return false;
        }
        return true;
    }

    std::string history_path(const history &h)
    {
        using segment = std::variant<std::string, size_t>;
        std::vector<segment> segs {};
        for (const auto &op: h.ops()) {
            switch (op.op) {
                case cursor_op::down_field:
                    segs.emplace_back(op.field);
                    break;
                case cursor_op::down_array:
                    segs.emplace_back(size_t { 0 });
                    break;
                case cursor_op::down_n:
                    segs.emplace_back(op.index);
                    break;
                case cursor_op::move_right:
                    if (!segs.empty() && std::holds_alternative<size_t>(segs.back()))
                        ++std::get<size_t>(segs.back());
                    break;
                case cursor_op::delete_focus:
                    if (op.succeeded && !segs.empty())
                        segs.pop_back();
                    break;
                default:
                    throw error(fmt::format("unsupported cursor_op: {}", static_cast<int>(op.op)));
            }
        }
        std::string path {};
        for (const auto &s: segs) {
            if (std::holds_alternative<size_t>(s))
                path += fmt::format("[{}]", std::get<size_t>(s));
            else
                path += fmt::format(".{}", std::get<std::string>(s));
        }
        return path;
    }

    cursor::cursor(std::shared_ptr<const frame> fr, std::shared_ptr<const decode_limits> limits):
        _frame { std::move(fr) }, _limits { std::move(limits) }
    {
    }

    cursor cursor::from(const json::value &root, const decode_limits &limits)
    {
        return { std::make_shared<const frame>(frame { &root }), std::make_shared<const decode_limits>(limits) };
    }

    cursor cursor::from(json::value &&root, const decode_limits &limits)
    {
        auto owned = std::make_shared<const json::value>(std::move(root));
        const auto *focus = owned.get();
        return { std::make_shared<const frame>(frame { focus, std::move(owned) }), std::make_shared<const decode_limits>(limits) };
    }

    const json::value &cursor::focus() const noexcept
    {
        return *_frame->focus;
    }

    size_t cursor::depth() const noexcept
    {
        return _frame->depth;
    }

    std::optional<std::string> cursor::numeral_text() const
    {
        return json::numeral_text(focus(), !_frame->parent);
    }

    cursor cursor::_step(history_op &&op, std::shared_ptr<const frame> fr) const
    {
        cursor res { std::move(fr), _limits };
        res._history = _history.push(std::move(op));
        return res;
    }

    cursor cursor::_fail(history_op &&op) const
    {
        cursor res { *this };
        op.succeeded = false;
        res._succeeded = false;
        res._history = _history.push(std::move(op));
        return res;
    }

    cursor cursor::down_field(const std::string_view name) const
    {
        if (!_succeeded)
            return *this;
        history_op op { cursor_op::down_field, true, false, std::string { name } };
        if (!focus().is_object()) {
            op.incorrect_focus = true;
            return _fail(std::move(op));
        }
        const auto &obj = focus().get_object();
        const auto it = obj.find(name);
        if (it == obj.end())
            return _fail(std::move(op));
        return _step(std::move(op), std::make_shared<const frame>(frame { &it->value(), nullptr, _frame, false, 0, std::string { name }, _frame->depth + 1 }));
    }

    cursor cursor::down_array() const
    {
        if (!_succeeded)
            return *this;
        history_op op { cursor_op::down_array };
        if (!focus().is_array()) {
            op.incorrect_focus = true;
            return _fail(std::move(op));
        }
        const auto &arr = focus().get_array();
        if (arr.empty())
            return _fail(std::move(op));
        return _step(std::move(op), std::make_shared<const frame>(frame { &arr[0], nullptr, _frame, true, 0, {}, _frame->depth + 1 }));
    }

    cursor cursor::down_n(const size_t n) const
    {
        if (!_succeeded)
            return *this;
        history_op op { cursor_op::down_n };
        op.index = n;
        if (!focus().is_array()) {
            op.incorrect_focus = true;
            return _fail(std::move(op));
        }
        const auto &arr = focus().get_array();
        if (n >= arr.size())
            return _fail(std::move(op));
        return _step(std::move(op), std::make_shared<const frame>(frame { &arr[n], nullptr, _frame, true, n, {}, _frame->depth + 1 }));
    }

    cursor cursor::right() const
    {
        if (!_succeeded)
            return *this;
        history_op op { cursor_op::move_right };
        if (!_frame->array_element)
            return _fail(std::move(op));
        const auto &arr = _frame->parent->focus->get_array();
        const auto next = _frame->index + 1;
        if (next >= arr.size())
            return _fail(std::move(op));
        return _step(std::move(op), std::make_shared<const frame>(frame { &arr[next], nullptr, _frame->parent, true, next, {}, _frame->depth }));
    }

    cursor cursor::delete_focus() const
    {
        if (!_succeeded)
            return *this;
        history_op op { cursor_op::delete_focus };
        const auto &parent = _frame->parent;
        if (!parent)
            return _fail(std::move(op));
        std::shared_ptr<const json::value> owned {};
        if (_frame->array_element) {
            const auto &arr = parent->focus->get_array();
            json::array rest(arr.storage());
            rest.reserve(arr.size() - 1);
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i != _frame->index)
                    rest.emplace_back(arr[i]);
            }
            owned = std::make_shared<const json::value>(std::move(rest));
            const auto &copy = owned->get_array();
            for (size_t i = 0, j = 0; i < arr.size(); ++i) {
                if (i != _frame->index)
                    json::carry_numerals(arr[i], copy[j++]);
            }
        } else {
            json::object rest(parent->focus->get_object(), parent->focus->storage());
            rest.erase(_frame->key);
            owned = std::make_shared<const json::value>(std::move(rest));
            json::carry_numerals(*parent->focus, *owned);
        }
        const auto *new_focus = owned.get();
        return _step(std::move(op), std::make_shared<const frame>(frame { new_focus, std::move(owned), parent->parent,
            parent->array_element, parent->index, parent->key, parent->depth }));
    }

    std::optional<std::vector<std::string>> cursor::fields() const
    {
        if (!_succeeded || !focus().is_object())
            return {};
        std::vector<std::string> names {};
        const auto &obj = focus().get_object();
        names.reserve(obj.size());
        for (const auto &kv: obj)
            names.emplace_back(kv.key());
        return names;
    }
}
