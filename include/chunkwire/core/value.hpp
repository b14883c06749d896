#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>


namespace chunkwire::core {

/*
===============================================================================
 core::Value
===============================================================================

Dynamic, JSON-shaped value: the canonical form every chunkwire field is
expressed in once array normalization has run.

  Null | Bool | Int | UInt | Double | String | Array | Object

Object members keep insertion order (a vector of key/value pairs, not a map):
field order is observable in every emitted chunk and must survive a
round-trip.

Integers are normalized on construction: any integral value representable as
int64 is stored as Int, UInt only holds values above INT64_MAX. This keeps
equality independent of the C++ type a value was built from.

Accessors (as_*) require the matching kind; calling one on the wrong kind
throws std::bad_variant_access.
===============================================================================
*/

enum class Kind : std::uint8_t {
    Null,
    Bool,
    Int,
    UInt,
    Double,
    String,
    Array,
    Object
};

constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
        case Kind::Null:   return "null";
        case Kind::Bool:   return "bool";
        case Kind::Int:    return "int";
        case Kind::UInt:   return "uint";
        case Kind::Double: return "double";
        case Kind::String: return "string";
        case Kind::Array:  return "array";
        case Kind::Object: return "object";
    }
    return "unknown";
}

class Value {
public:
    using Array  = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) noexcept : data_(b) {}

    template <std::integral T>
        requires (!std::same_as<T, bool> && !std::same_as<T, char>)
    Value(T v) noexcept {
        if constexpr (std::is_signed_v<T>) {
            data_ = static_cast<std::int64_t>(v);
        }
        else if (static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            data_ = static_cast<std::int64_t>(v);
        }
        else {
            data_ = static_cast<std::uint64_t>(v);
        }
    }

    template <std::floating_point T>
    Value(T v) noexcept : data_(static_cast<double>(v)) {}

    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(std::string s) noexcept : data_(std::move(s)) {}
    Value(Array a) noexcept : data_(std::move(a)) {}
    Value(Object o) noexcept : data_(std::move(o)) {}

    // Explicit builders, clearer than brace-initialization at call sites
    [[nodiscard]] static Value array(Array a = {}) { return Value(std::move(a)); }
    [[nodiscard]] static Value object(Object o = {}) { return Value(std::move(o)); }

    // ---------------------------------------------------------------------
    // Kind queries
    // ---------------------------------------------------------------------
    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }

    [[nodiscard]] bool is_null() const noexcept   { return kind() == Kind::Null; }
    [[nodiscard]] bool is_array() const noexcept  { return kind() == Kind::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == Kind::Object; }

    // Anything that is neither an Array nor an Object
    [[nodiscard]] bool is_scalar() const noexcept {
        return !is_array() && !is_object();
    }

    // ---------------------------------------------------------------------
    // Accessors
    // ---------------------------------------------------------------------
    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
    [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
    [[nodiscard]] std::uint64_t as_uint() const { return std::get<std::uint64_t>(data_); }
    [[nodiscard]] double as_double() const { return std::get<double>(data_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }

    [[nodiscard]] const Array& as_array() const { return std::get<Array>(data_); }
    [[nodiscard]] Array& as_array() { return std::get<Array>(data_); }

    [[nodiscard]] const Object& as_object() const { return std::get<Object>(data_); }
    [[nodiscard]] Object& as_object() { return std::get<Object>(data_); }

    // Top-level element count of an Array (0 for every other kind)
    [[nodiscard]] std::size_t size() const noexcept;

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    // Alternative order MUST follow Kind
    std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string, Array, Object> data_;
};

bool operator==(const Value& lhs, const Value& rhs);

inline bool operator!=(const Value& lhs, const Value& rhs) {
    return !(lhs == rhs);
}

// Linear lookup in an ordered member list (nullptr when absent)
[[nodiscard]] const Value* find(const Value::Object& members, std::string_view key) noexcept;
[[nodiscard]] Value* find(Value::Object& members, std::string_view key) noexcept;

// Canonical JSON text (see core/canonical.hpp)
std::ostream& operator<<(std::ostream& os, const Value& v);

} // namespace chunkwire::core
