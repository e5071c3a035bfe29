// AMM - Configuration Implementation

#include "amm/config.hpp"
#include "amm/json.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace amm {

using json = nlohmann::json;

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }

    try {
        if (root.contains("log")) {
            const json& log = root.at("log");
            if (log.contains("level")) config.log.level = log.at("level").get<std::string>();
            if (log.contains("pattern")) config.log.pattern = log.at("pattern").get<std::string>();
        }

        if (root.contains("exchange")) {
            const json& ex = root.at("exchange");
            if (ex.contains("min_initial_liquidity")) {
                config.exchange.min_initial_liquidity = parse_amount(ex.at("min_initial_liquidity"));
            }
            if (ex.contains("share_name")) config.exchange.share_name = ex.at("share_name").get<std::string>();
            if (ex.contains("share_symbol")) config.exchange.share_symbol = ex.at("share_symbol").get<std::string>();
            if (ex.contains("share_decimals")) {
                const json& decimals = ex.at("share_decimals");
                if (!decimals.is_number_integer() || decimals.get<int64_t>() < 0 ||
                    decimals.get<int64_t>() > 255) {
                    throw std::invalid_argument("share_decimals must be an integer from 0 to 255");
                }
                config.exchange.share_decimals = static_cast<uint8_t>(decimals.get<int64_t>());
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

} // namespace amm
