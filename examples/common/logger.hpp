#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace chunkwire::examples {

    // Unknown names fall back to info (the CLI validator rejects them first)
    inline void set_log_level(const std::string& log_level, bool color) {
        using namespace lcr::log;
        Level lvl = Level::Info;
        if (!parse_level(log_level, lvl)) {
            lvl = Level::Info;
        }
        Logger::instance().set_level(lvl);
        Logger::instance().enable_color(color);
    }

} // namespace chunkwire::examples
