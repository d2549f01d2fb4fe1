#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace arbwire::examples {

    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Logger::instance().set_level(parse_level(log_level));
    }

    inline void enable_color() {
        lcr::log::Logger::instance().enable_color(true);
    }

} // namespace arbwire::examples
