#include "chunkwire/core/value.hpp"
#include "chunkwire/core/canonical.hpp"


namespace chunkwire::core {

std::size_t Value::size() const noexcept {
    if (const auto* a = std::get_if<Array>(&data_)) {
        return a->size();
    }
    return 0;
}

bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.data_ == rhs.data_;
}

const Value* find(const Value::Object& members, std::string_view key) noexcept {
    for (const auto& [k, v] : members) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

Value* find(Value::Object& members, std::string_view key) noexcept {
    for (auto& [k, v] : members) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    return os << canonical::encode(v);
}

} // namespace chunkwire::core
