#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "chunkwire/core/value.hpp"
#include "chunkwire/core/config/codec.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace chunkwire {
namespace parser {
namespace value {

// ===============================================
// DOM ELEMENT → core::Value
// ===============================================
//
// Lossless structural copy of a simdjson element:
//   - object member order is preserved
//   - integers keep their exact value (int64, or
//     uint64 above INT64_MAX)
//   - nesting deeper than MAX_VALUE_DEPTH is
//     rejected
//
// On failure 'out' is unspecified.
//
// ===============================================

namespace detail {

[[nodiscard]]
inline bool parse_element(const simdjson::dom::element& el, core::Value& out, std::uint32_t depth) noexcept {
    using simdjson::dom::element_type;

    if (depth > core::config::codec::MAX_VALUE_DEPTH) {
        CW_DEBUG("[PARSER] Nesting deeper than " << core::config::codec::MAX_VALUE_DEPTH << " -> reject value.");
        return false;
    }

    switch (el.type()) {
        case element_type::NULL_VALUE:
            out = core::Value{};
            return true;

        case element_type::BOOL: {
            bool b{};
            if (el.get(b)) return false;
            out = core::Value{b};
            return true;
        }

        case element_type::INT64: {
            std::int64_t i{};
            if (el.get(i)) return false;
            out = core::Value{i};
            return true;
        }

        case element_type::UINT64: {
            std::uint64_t u{};
            if (el.get(u)) return false;
            out = core::Value{u};
            return true;
        }

        case element_type::DOUBLE: {
            double d{};
            if (el.get(d)) return false;
            out = core::Value{d};
            return true;
        }

        case element_type::STRING: {
            std::string_view sv;
            if (el.get(sv)) return false;
            out = core::Value{sv};
            return true;
        }

        case element_type::ARRAY: {
            simdjson::dom::array arr;
            if (el.get(arr)) return false;
            core::Value::Array items;
            items.reserve(arr.size());
            for (auto child : arr) {
                core::Value v;
                if (!parse_element(child, v, depth + 1)) {
                    return false;
                }
                items.push_back(std::move(v));
            }
            out = core::Value::array(std::move(items));
            return true;
        }

        case element_type::OBJECT: {
            simdjson::dom::object obj;
            if (el.get(obj)) return false;
            core::Value::Object members;
            members.reserve(obj.size());
            for (auto field : obj) {
                core::Value v;
                if (!parse_element(field.value, v, depth + 1)) {
                    return false;
                }
                members.emplace_back(std::string(field.key), std::move(v));
            }
            out = core::Value::object(std::move(members));
            return true;
        }
    }

    return false;
}

} // namespace detail

[[nodiscard]]
inline bool parse(const simdjson::dom::element& el, core::Value& out) noexcept {
    return detail::parse_element(el, out, 0);
}

} // namespace value
} // namespace parser
} // namespace chunkwire
