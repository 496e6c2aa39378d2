#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace wirecheck::examples {

    // Unknown names fall back to info
    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Logger::instance().set_level(parse_level(log_level).value_or(Level::Info));
    }

} // namespace wirecheck::examples
