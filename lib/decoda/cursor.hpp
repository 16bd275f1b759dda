/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_CURSOR_HPP
#define DECODA_CURSOR_HPP

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <decoda/config.hpp>
#include <decoda/json.hpp>

namespace decoda {
    enum class cursor_op: uint8_t {
        down_field, down_array, down_n, move_right, delete_focus
    };

    struct history_op {
        cursor_op op;
        bool succeeded = true;
        // the step could not be taken because the focus had a different shape,
        // e.g. down_field on an array, as opposed to a missing field or element
        bool incorrect_focus = false;
        std::string field {};
        size_t index = 0;

        bool operator==(const history_op &) const =default;
    };

    /*
     * The navigation steps from the root to a position.
     * Histories are persistent lists shared between cursors and the failures produced at them,
     * so copying one does not depend on its length. ops() materializes the steps root first.
     */
    struct history {
        history() =default;
        history(std::initializer_list<history_op> ops);

        [[nodiscard]] bool empty() const noexcept
        {
            return !_last;
        }

        [[nodiscard]] size_t size() const noexcept;
        [[nodiscard]] const history_op &back() const;
        [[nodiscard]] std::vector<history_op> ops() const;
        [[nodiscard]] history push(history_op op) const;
        // true if any of the most recent unsuccessful steps failed due to an incorrect focus
        [[nodiscard]] bool failed_on_incorrect_focus() const noexcept;

        bool operator==(const history &o) const;
    private:
        struct node;
        std::shared_ptr<const node> _last {};

        explicit history(std::shared_ptr<const node> last);
    };

    extern std::string history_path(const history &h);

    /*
     * An immutable position inside a JSON tree together with the navigation steps taken to reach it.
     * Navigation never throws: an unsuccessful step produces a failed cursor that remembers the step.
     * A failed cursor keeps the focus of the position where the step was attempted,
     * and all navigation operations on a failed cursor return it unchanged.
     * A cursor created from a borrowed value must not outlive that value.
     */
    struct cursor {
        static cursor from(const json::value &root, const decode_limits &limits=decode_limits::get());
        static cursor from(json::value &&root, const decode_limits &limits=decode_limits::get());

        [[nodiscard]] const json::value &focus() const noexcept;

        [[nodiscard]] bool succeeded() const noexcept
        {
            return _succeeded;
        }

        [[nodiscard]] size_t depth() const noexcept;
        // the source text of the focus when it is a numeral stored as a double by json::parse
        [[nodiscard]] std::optional<std::string> numeral_text() const;

        [[nodiscard]] const decode_limits &limits() const noexcept
        {
            return *_limits;
        }

        [[nodiscard]] const decoda::history &history() const noexcept
        {
            return _history;
        }

        [[nodiscard]] bool history_empty() const noexcept
        {
            return _history.empty();
        }

        [[nodiscard]] bool failed_on_incorrect_focus() const noexcept
        {
            return _history.failed_on_incorrect_focus();
        }

        [[nodiscard]] cursor down_field(std::string_view name) const;
        [[nodiscard]] cursor down_array() const;
        [[nodiscard]] cursor down_n(size_t n) const;
        [[nodiscard]] cursor right() const;
        // removes the focused array element and moves to the parent array
        [[nodiscard]] cursor delete_focus() const;
        [[nodiscard]] std::optional<std::vector<std::string>> fields() const;
    private:
        struct frame;

        std::shared_ptr<const frame> _frame;
        decoda::history _history {};
        std::shared_ptr<const decode_limits> _limits;
        bool _succeeded = true;

        cursor(std::shared_ptr<const frame> fr, std::shared_ptr<const decode_limits> limits);
        cursor _step(history_op &&op, std::shared_ptr<const frame> fr) const;
        cursor _fail(history_op &&op) const;
    };
}

namespace fmt {
    template<>
    struct formatter<decoda::cursor_op>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::cursor_op &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using decoda::cursor_op;
            switch (v) {
                case cursor_op::down_field: return fmt::format_to(ctx.out(), "down_field");
                case cursor_op::down_array: return fmt::format_to(ctx.out(), "down_array");
                case cursor_op::down_n: return fmt::format_to(ctx.out(), "down_n");
                case cursor_op::move_right: return fmt::format_to(ctx.out(), "move_right");
                case cursor_op::delete_focus: return fmt::format_to(ctx.out(), "delete_focus");
                default: throw decoda::error(fmt::format("unsupported cursor_op: {}", static_cast<int>(v)));
            }
        }
    };

    template<>
    struct formatter<decoda::history_op>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::history_op &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "{}", v.op);
            switch (v.op) {
                case decoda::cursor_op::down_field:
                    out_it = fmt::format_to(out_it, "({})", v.field);
                    break;
                case decoda::cursor_op::down_n:
                    out_it = fmt::format_to(out_it, "({})", v.index);
                    break;
                default:
                    break;
            }
            if (!v.succeeded)
                out_it = fmt::format_to(out_it, v.incorrect_focus ? "!shape" : "!absent");
            return out_it;
        }
    };

    template<>
    struct formatter<decoda::history>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::history &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.ops());
        }
    };
}

#endif // !DECODA_CURSOR_HPP
