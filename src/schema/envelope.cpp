#include "chunkwire/schema/envelope.hpp"
#include "chunkwire/core/canonical.hpp"

#include "lcr/json.hpp"


namespace chunkwire::schema {

namespace {

void append_fields(const Fields& fields, std::string& out) {
    out += '{';
    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) out += ", ";
        lcr::json::append_quoted(out, key);
        out += ": ";
        core::canonical::encode(value, out);
        first = false;
    }
    out += '}';
}

} // namespace

void append_json(const Update& update, std::string& out) {
    out += "{\"plot_type\": ";
    core::canonical::encode(update.plot_type, out);
    out += ", \"args\": ";
    append_fields(update.args, out);
    out += ", \"data\": ";
    append_fields(update.data, out);
    out += '}';
}

std::string Envelope::to_json() const {
    std::string j;
    j.reserve(256);

    j += "{\"type\": ";
    core::canonical::encode(type, j);
    j += ", \"drafty_id\": ";
    core::canonical::encode(drafty_id, j);
    j += ", \"command\": ";
    core::canonical::encode(command, j);

    j += ", \"results\": [";
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (i > 0) j += ", ";
        append_json(results[i], j);
    }
    j += "]}";

    return j;
}

} // namespace chunkwire::schema
