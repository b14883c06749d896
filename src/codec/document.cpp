#include "chunkwire/codec/document.hpp"

#include <string>
#include <utility>

#include "lcr/log/logger.hpp"


namespace chunkwire::codec {

namespace {

Status malformed(std::string message) {
    CW_DEBUG("[DOCUMENT] " << message << " -> reject envelope.");
    return Status::failure(Error::MalformedEnvelope, std::move(message));
}

// Moves member 'key' out of 'obj' into 'out' (null when absent)
[[nodiscard]]
bool take_scalar(core::Value::Object& obj, std::string_view key, core::Value& out) {
    core::Value* v = core::find(obj, key);
    if (v == nullptr) {
        out = core::Value{};
        return true;
    }
    if (!v->is_scalar()) {
        return false;
    }
    out = std::move(*v);
    return true;
}

Status take_group(core::Value::Object& update, std::size_t index, schema::Group group, schema::Fields& out) {
    const auto name = to_string(group);
    core::Value* v = core::find(update, name);
    if (v == nullptr) {
        out.clear();
        return {};
    }
    if (!v->is_object()) {
        return malformed("results[" + std::to_string(index) + "]." + std::string(name) + " is not a mapping");
    }

    auto& members = v->as_object();
    for (std::size_t i = 0; i < members.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (members[j].first == members[i].first) {
                return Status::failure(Error::MalformedEnvelope,
                                       FieldRef{index, group, members[i].first},
                                       "duplicate key in results[" + std::to_string(index) + "]." + std::string(name));
            }
        }
    }
    out = std::move(members);
    return {};
}

} // namespace

Status to_envelope(core::Value&& document, schema::Envelope& out) {
    if (!document.is_object()) {
        return malformed("envelope is not a mapping");
    }
    auto& root = document.as_object();

    schema::Envelope env;
    if (!take_scalar(root, "type", env.type)) {
        return malformed("'type' is not a scalar");
    }
    if (!take_scalar(root, "drafty_id", env.drafty_id)) {
        return malformed("'drafty_id' is not a scalar");
    }
    if (!take_scalar(root, "command", env.command)) {
        return malformed("'command' is not a scalar");
    }

    core::Value* results = core::find(root, "results");
    if (results != nullptr) {
        if (!results->is_array()) {
            return malformed("'results' is not a sequence");
        }

        auto& entries = results->as_array();
        env.results.reserve(entries.size());
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (!entries[i].is_object()) {
                return malformed("results[" + std::to_string(i) + "] is not a mapping");
            }
            auto& entry = entries[i].as_object();

            schema::Update update;
            if (!take_scalar(entry, "plot_type", update.plot_type)) {
                return malformed("results[" + std::to_string(i) + "].plot_type is not a scalar");
            }
            for (auto group : schema::GROUPS) {
                Status st = take_group(entry, i, group, update.group(group));
                if (!st) {
                    return st;
                }
            }
            env.results.push_back(std::move(update));
        }
    }

    out = std::move(env);
    return {};
}

Status to_envelope(const core::Value& document, schema::Envelope& out) {
    core::Value copy = document;
    return to_envelope(std::move(copy), out);
}

} // namespace chunkwire::codec
