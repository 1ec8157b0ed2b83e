#pragma once

#include "config.hpp"

namespace toolroute::core {

// Install the process-wide spdlog default logger.
// Safe to call more than once; the last call wins.
void init_logging(const ObservabilityConfig& config);

}  // namespace toolroute::core
