#include "chunkwire/core/canonical.hpp"
#include "chunkwire/core/config/codec.hpp"

#include <cmath>

#include "lcr/json.hpp"


namespace chunkwire::core::canonical {

namespace cfg = core::config::codec;

std::size_t encoded_size(const Value& v) noexcept {
    switch (v.kind()) {
        case Kind::Null:
            return 4;
        case Kind::Bool:
            return v.as_bool() ? 4 : 5;
        case Kind::Int:
            return lcr::json::digits(v.as_int());
        case Kind::UInt:
            return lcr::json::digits(v.as_uint());
        case Kind::Double: {
            double d = v.as_double();
            return std::isfinite(d) ? lcr::json::double_size(d) : 4;
        }
        case Kind::String:
            return lcr::json::quoted_size(v.as_string());
        case Kind::Array: {
            const auto& arr = v.as_array();
            std::size_t n = cfg::ARRAY_OVERHEAD;
            for (const auto& e : arr) {
                n += encoded_size(e);
            }
            if (!arr.empty()) {
                n += (arr.size() - 1) * cfg::SEPARATOR_OVERHEAD;
            }
            return n;
        }
        case Kind::Object: {
            const auto& obj = v.as_object();
            std::size_t n = cfg::OBJECT_OVERHEAD;
            for (const auto& [key, member] : obj) {
                n += lcr::json::quoted_size(key) + cfg::KEY_SEPARATOR + encoded_size(member);
            }
            if (!obj.empty()) {
                n += (obj.size() - 1) * cfg::SEPARATOR_OVERHEAD;
            }
            return n;
        }
    }
    return 0;
}

void encode(const Value& v, std::string& out) {
    switch (v.kind()) {
        case Kind::Null:
            out += "null";
            break;
        case Kind::Bool:
            out += (v.as_bool() ? "true" : "false");
            break;
        case Kind::Int:
            lcr::json::append(out, v.as_int());
            break;
        case Kind::UInt:
            lcr::json::append(out, v.as_uint());
            break;
        case Kind::Double: {
            double d = v.as_double();
            if (std::isfinite(d)) {
                lcr::json::append(out, d);
            }
            else {
                out += "null";
            }
            break;
        }
        case Kind::String:
            lcr::json::append_quoted(out, v.as_string());
            break;
        case Kind::Array: {
            out += '[';
            bool first = true;
            for (const auto& e : v.as_array()) {
                if (!first) out += ", ";
                encode(e, out);
                first = false;
            }
            out += ']';
            break;
        }
        case Kind::Object: {
            out += '{';
            bool first = true;
            for (const auto& [key, member] : v.as_object()) {
                if (!first) out += ", ";
                lcr::json::append_quoted(out, key);
                out += ": ";
                encode(member, out);
                first = false;
            }
            out += '}';
            break;
        }
    }
}

std::string encode(const Value& v) {
    std::string out;
    out.reserve(encoded_size(v));
    encode(v, out);
    return out;
}

bool is_array_value(const Value& v) noexcept {
    switch (v.kind()) {
        case Kind::Object:
            return false;
        case Kind::Double:
            return std::isfinite(v.as_double());
        case Kind::Array:
            for (const auto& e : v.as_array()) {
                if (!is_array_value(e)) {
                    return false;
                }
            }
            return true;
        default:
            return true;
    }
}

} // namespace chunkwire::core::canonical
