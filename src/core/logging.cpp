#include "chatgate/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace chatgate::core {

void init_logging(const ObservabilityConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);

    // from_str maps unrecognized names to "off"; only honour "off" when asked for
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("Unknown log level '{}', using info", config.log_level);
        level = spdlog::level::info;
    }

    spdlog::set_level(level);
    if (!config.log_pattern.empty()) {
        spdlog::set_pattern(config.log_pattern);
    }
}

}  // namespace chatgate::core
