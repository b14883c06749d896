#pragma once

#include <string_view>
#include <ostream>
#include <type_traits>
#include <cstdint>

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// counter - A simple monotonically increasing counter (Cumulative metric)
// ---------------------------------------------------------------------------
//
// No multithreading guarantees — owned by a single producer.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct counter {
public:
    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}
    // Counters are identities, not values
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    inline void copy_to(counter& dst) const noexcept {
        dst.value_ = value_;
    }

    // Accessor
    inline constexpr T load() const noexcept { return value_; }
    // Mutators
    inline constexpr void inc(T n = 1) noexcept { value_ += n; }
    inline constexpr void reset() noexcept { value_ = 0; }

    // "<name>: <value>" line for diagnostic dumps
    inline void dump(std::string_view name, std::ostream& os) const {
        os << "  " << name << ": " << value_ << "\n";
    }

private:
    T value_{0};
};
using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

} // namespace metrics
} // namespace lcr
