/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_FAILURE_HPP
#define DECODA_FAILURE_HPP

#include <decoda/cursor.hpp>

namespace decoda {
    struct decoding_failure {
        static constexpr std::string_view failed_cursor_message = "attempt to decode on a failed cursor";
        static constexpr std::string_view max_depth_message = "maximum nesting depth exceeded";

        explicit decoding_failure(std::string message, decoda::history history={}):
            _message { std::move(message) }, _history { std::move(history) }
        {
        }

        static decoding_failure from_exception(const std::exception &ex, decoda::history history)
        {
            return decoding_failure { ex.what(), std::move(history) };
        }

        [[nodiscard]] const std::string &message() const noexcept
        {
            return _message;
        }

        [[nodiscard]] const decoda::history &history() const noexcept
        {
            return _history;
        }

        [[nodiscard]] std::string path() const
        {
            return history_path(_history);
        }

        [[nodiscard]] decoding_failure with_message(std::string message) const
        {
            return decoding_failure { std::move(message), _history };
        }

        bool operator==(const decoding_failure &) const =default;
    private:
        std::string _message;
        decoda::history _history;
    };

    // never empty when it describes a failed decode
    using failure_list = std::vector<decoding_failure>;

    // the first failure and the number of the others
    extern std::string failure_summary(const failure_list &failures);

    struct decoding_error: error {
        explicit decoding_error(failure_list failures);

        [[nodiscard]] const failure_list &failures() const noexcept
        {
            return _failures;
        }
    private:
        failure_list _failures;
    };
}

namespace fmt {
    template<>
    struct formatter<decoda::decoding_failure>: formatter<int> {
        template<typename FormatContext>
        auto format(const decoda::decoding_failure &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (const auto path = v.path(); !path.empty())
                return fmt::format_to(ctx.out(), "{} at {}", v.message(), path);
            return fmt::format_to(ctx.out(), "{}", v.message());
        }
    };
}

#endif // !DECODA_FAILURE_HPP
