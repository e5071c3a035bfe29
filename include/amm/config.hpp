// AMM - Configuration
// JSON-backed settings with builder helpers

#ifndef AMM_CONFIG_HPP
#define AMM_CONFIG_HPP

#include <string>
#include <string_view>

#include "exchange.hpp"
#include "logging.hpp"

namespace amm {

class Config {
public:
    LogConfig log;
    ExchangeConfig exchange;

    Config() = default;

    // Load from JSON file
    static Config from_file(std::string_view path);

    // Load from JSON string
    static Config from_json(std::string_view content);

    // Builder methods
    Config& set_log_level(std::string_view level) {
        log.level = std::string(level);
        return *this;
    }

    Config& set_min_initial_liquidity(const Amount& amount) {
        exchange.min_initial_liquidity = amount;
        return *this;
    }

    Config& set_share_metadata(std::string_view name, std::string_view symbol, uint8_t decimals = 18) {
        exchange.share_name = std::string(name);
        exchange.share_symbol = std::string(symbol);
        exchange.share_decimals = decimals;
        return *this;
    }
};

} // namespace amm

#endif // AMM_CONFIG_HPP
