// =============================================================================
// logging.cpp - spdlog set-up
// =============================================================================

#include "amm/logging.hpp"

#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace amm {

void init_logging(const LogConfig& config) {
    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        throw std::runtime_error("Unknown log level: " + config.level);
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("amm", console_sink);
    logger->set_level(level);
    logger->set_pattern(config.pattern);

    spdlog::set_default_logger(logger);
}

} // namespace amm
