#pragma once

#include "config.hpp"

namespace chatgate::core {

// Apply observability settings to the default spdlog logger.
// Unknown level names fall back to "info".
void init_logging(const ObservabilityConfig& config);

}  // namespace chatgate::core
