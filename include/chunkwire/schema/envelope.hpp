#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "chunkwire/core/value.hpp"


namespace chunkwire {
namespace schema {

// ===============================================
// FIELD GROUPS
// ===============================================
//
// Every update carries exactly two named groups of
// array fields. Emission and reassembly always
// visit them in this order: args, then data.
//
// ===============================================
enum class Group : std::uint8_t {
    Args = 0,
    Data = 1
};

inline constexpr std::array<Group, 2> GROUPS{ Group::Args, Group::Data };

constexpr std::string_view to_string(Group g) noexcept {
    switch (g) {
        case Group::Args: return "args";
        case Group::Data: return "data";
    }
    return "unknown";
}

// Ordered key → array mapping; keys are unique within one group
using Fields = core::Value::Object;

// -----------------------------------------------
// UPDATE
// -----------------------------------------------
struct Update {
    core::Value plot_type;
    Fields args;
    Fields data;

    [[nodiscard]]
    const Fields& group(Group g) const noexcept {
        return g == Group::Args ? args : data;
    }

    [[nodiscard]]
    Fields& group(Group g) noexcept {
        return g == Group::Args ? args : data;
    }

    bool operator==(const Update&) const = default;
};

// ===============================================
// ENVELOPE
// ===============================================
//
// Top-level message handed to the emitter:
//
//   { "type": .., "drafty_id": .., "command": ..,
//     "results": [ Update, ... ] }
//
// The three metadata values are copied verbatim
// into every chunk of an emission.
//
// ===============================================
struct Envelope {
    core::Value type;
    core::Value drafty_id;
    core::Value command;

    std::vector<Update> results;

    // Canonical JSON text of the whole envelope
    [[nodiscard]] std::string to_json() const;

    inline void dump(std::ostream& os) const {
        os << to_json();
    }

    bool operator==(const Envelope&) const = default;
};

// Appends {"plot_type": .., "args": {..}, "data": {..}} to 'out'
void append_json(const Update& update, std::string& out);

} // namespace schema
} // namespace chunkwire
