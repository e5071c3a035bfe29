#ifndef AMM_LOGGING_HPP
#define AMM_LOGGING_HPP

#include <string>

namespace amm {

struct LogConfig {
    std::string level = "info";   // trace, debug, info, warn, error, critical, off
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

// Install a colour stdout logger named "amm" as the spdlog default logger
void init_logging(const LogConfig& config);

} // namespace amm

#endif // AMM_LOGGING_HPP
