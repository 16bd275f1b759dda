/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_JSON_HPP
#define DECODA_JSON_HPP

#include <optional>
#include <string>
#include <string_view>
#include <boost/json.hpp>
#include <decoda/common/error.hpp>
#include <decoda/common/format.hpp>

namespace decoda::json {
    using namespace boost::json;

    /*
     * parse and load keep the source text of every numeral stored as a double: numerals with a fraction
     * or an exponent and integers beyond the 64-bit range. The text is held by the memory resource of the document
     * and is looked up by the address of the numeric leaf, so it stays available while the document is not copied.
     */
    extern json::value parse(std::string_view text, json::storage_ptr sp={});
    extern json::value load(const std::string &path, json::storage_ptr sp={});

    // root tells that v is the top-level value of its document, possibly moved or copied from the parsed one
    extern std::optional<std::string> numeral_text(const json::value &v, bool root=false);
    // dst must be a copy of src allocated from the same document
    extern void carry_numerals(const json::value &src, const json::value &dst);

    inline const char *kind_name(const json::kind k)
    {
        switch (k) {
            case json::kind::null: return "null";
            case json::kind::bool_: return "boolean";
            case json::kind::int64:
            case json::kind::uint64:
            case json::kind::double_: return "number";
            case json::kind::string: return "string";
            case json::kind::array: return "array";
            case json::kind::object: return "object";
            default: return "unknown";
        }
    }
}

namespace fmt {
    template<>
    struct formatter<boost::json::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const boost::json::value &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", boost::json::serialize(v));
        }
    };
}

#endif // !DECODA_JSON_HPP
