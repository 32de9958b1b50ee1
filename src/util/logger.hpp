#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace mathviz::util {

// Install a colored console logger as the spdlog default. Tools that print
// results on stdout log to stderr instead.
void init_logger(const std::string& name = "mathviz", bool use_stderr = false);

void set_log_level(spdlog::level::level_enum level);

// Accepts "trace", "debug", "info", "warn", "error", "critical", "off".
// Unknown names fall back to info.
void set_log_level(const std::string& level);

} // namespace mathviz::util
