#pragma once
#include "config.hpp"

// Installs the process-wide spdlog default logger: colored stderr at
// cfg.level, plus a debug-level file sink when cfg.file is set.
void setup_logging(const LoggingConfig& cfg);
