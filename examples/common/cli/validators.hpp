#pragma once

#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"
#include "chunkwire/core/config/codec.hpp"


namespace chunkwire::examples::cli {

// -------------------------------------------------------------
// Byte budget validator
// -------------------------------------------------------------
inline auto budget_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || value.front() < '0' || value.front() > '9') {
            return "Byte budget must be a valid integer";
        }
        try {
            std::size_t pos = 0;
            auto b = std::stoull(value, &pos);
            if (pos != value.size() || b < core::config::codec::MIN_CHUNK_BUDGET) {
                return "Byte budget must be at least 1";
            }
            return {};
        } catch (const std::logic_error&) {
            return "Byte budget must be a valid integer";
        }
    },
    "Byte budget validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl{};
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);

} // namespace chunkwire::examples::cli
