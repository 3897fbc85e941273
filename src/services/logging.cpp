#include "syncgate/config.hpp"
#include <spdlog/spdlog.h>

namespace syncgate {

void init_logging(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to off; keep info instead of going silent
    if (level == spdlog::level::off && config.log_level != "off") {
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::set_pattern(config.log_pattern);
}

} // namespace syncgate
