/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/failure.hpp>

namespace decoda {
    std::string failure_summary(const failure_list &failures)
    {
        if (failures.empty())
            return "no failures";
        if (failures.size() == 1)
            return fmt::format("{}", failures.front());
        return fmt::format("{} and {} more failure(s)", failures.front(), failures.size() - 1);
    }

    decoding_error::decoding_error(failure_list failures):
        error { fmt::format("decoding failed: {}", failure_summary(failures)) }, _failures { std::move(failures) }
    {
    }
}
