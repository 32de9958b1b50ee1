#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mathviz::util {

void init_logger(const std::string& name, bool use_stderr) {
    auto console = spdlog::get(name);
    if (!console) {
        console = use_stderr ? spdlog::stderr_color_mt(name) : spdlog::stdout_color_mt(name);
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

} // namespace mathviz::util
