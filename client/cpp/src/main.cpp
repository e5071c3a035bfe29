// AMM C++ CLI Scenario Runner
//
// Builds an in-process chain with tokens and exchanges described by a JSON
// scenario, runs its operations in order and prints the event log and final
// pool state as JSON.

#include "amm/chain.hpp"
#include "amm/config.hpp"
#include "amm/exchange.hpp"
#include "amm/json.hpp"
#include "amm/logging.hpp"
#include "amm/registry.hpp"
#include "amm/token.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string scenario_path;
    bool verbose = false;
};

//------------------------------------------------------------------------------
// Scenario
//------------------------------------------------------------------------------

class Scenario {
public:
    Scenario(const amm::Config& config, const json& doc)
        : registry_(chain_, config.exchange)
    {
        load_accounts(doc.value("accounts", json::object()));
        load_tokens(doc.value("tokens", json::array()));
        for (const auto& symbol : doc.value("exchanges", json::array())) {
            registry_.create_exchange(token(symbol.get<std::string>()));
        }
    }

    // Runs every operation; a failure is recorded and the next one runs
    json run(const json& operations) {
        json results = json::array();
        for (const auto& op : operations) {
            const std::string name = op.at("op").get<std::string>();
            json result = {{"op", name}, {"block", chain_.block_number()}};
            try {
                result["result"] = execute(name, op);
                result["ok"] = true;
            } catch (const amm::ExchangeError& e) {
                spdlog::warn("{} failed: {} ({})", name, amm::error_name(e.code()), e.what());
                result["ok"] = false;
                result["error"] = amm::error_name(e.code());
                result["code"] = static_cast<int32_t>(e.code());
            }
            results.push_back(std::move(result));
        }
        return results;
    }

    json state() const {
        json pools = json::array();
        for (const auto& entry : tokens_) {
            amm::Exchange* exchange = registry_.get_exchange(entry.second->address());
            if (exchange == nullptr) continue;
            pools.push_back({
                {"token", entry.first},
                {"exchange", amm::addresses::to_hex(exchange->address())},
                {"eth_reserve", amm::format_amount(exchange->eth_reserve())},
                {"token_reserve", amm::format_amount(exchange->token_reserve())},
                {"total_supply", amm::format_amount(exchange->total_supply())}
            });
        }

        json balances = json::object();
        for (const auto& account : accounts_) {
            json holdings = {{"native", amm::format_amount(chain_.balance_of(account.second))}};
            for (const auto& entry : tokens_) {
                holdings[entry.first] = amm::format_amount(entry.second->balance_of(account.second));
            }
            balances[account.first] = std::move(holdings);
        }

        return {{"pools", std::move(pools)}, {"balances", std::move(balances)}};
    }

    json events() const { return amm::events_to_json(chain_.events()); }

private:
    amm::Chain chain_;
    amm::Registry registry_;
    std::map<std::string, amm::Address> accounts_;
    std::map<std::string, std::unique_ptr<amm::Token>> tokens_;

    void load_accounts(const json& accounts) {
        uint64_t next_id = 1;
        for (auto it = accounts.begin(); it != accounts.end(); ++it) {
            amm::Address addr = amm::addresses::from_id(next_id++);
            accounts_[it.key()] = addr;
            chain_.mint_native(addr, amm::parse_amount(it.value()));
        }
    }

    void load_tokens(const json& tokens) {
        for (const auto& spec : tokens) {
            const std::string symbol = spec.at("symbol").get<std::string>();
            const json decimals = spec.value("decimals", json(18));
            if (!decimals.is_number_integer() || decimals.get<int64_t>() < 0 ||
                decimals.get<int64_t>() > 255) {
                throw std::invalid_argument("token " + symbol + ": decimals must be an integer from 0 to 255");
            }
            auto token = std::make_unique<amm::Token>(
                chain_, spec.value("name", symbol), symbol,
                static_cast<uint8_t>(decimals.get<int64_t>()));
            const json mints = spec.value("mint", json::object());
            for (auto it = mints.begin(); it != mints.end(); ++it) {
                token->mint(account(it.key()), amm::parse_amount(it.value()));
            }
            tokens_[symbol] = std::move(token);
        }
    }

    amm::Address account(const std::string& name) const {
        auto it = accounts_.find(name);
        if (it != accounts_.end()) return it->second;
        return amm::parse_address(name);
    }

    amm::Token& token(const std::string& symbol) const {
        auto it = tokens_.find(symbol);
        if (it == tokens_.end()) {
            throw std::invalid_argument("Unknown token: " + symbol);
        }
        return *it->second;
    }

    amm::Exchange& exchange(const std::string& symbol) const {
        amm::Exchange* ex = registry_.get_exchange(token(symbol).address());
        if (ex == nullptr) {
            throw std::invalid_argument("No exchange for token: " + symbol);
        }
        return *ex;
    }

    static amm::Amount amount(const json& op, const char* key) {
        return op.contains(key) ? amm::parse_amount(op.at(key)) : amm::Amount(0);
    }

    uint64_t deadline(const json& op) const {
        return op.value("deadline", chain_.block_number() + 1);
    }

    json execute(const std::string& name, const json& op) {
        if (name == "advance_blocks") {
            chain_.advance_blocks(op.value("count", uint64_t{1}));
            return chain_.block_number();
        }

        const amm::Address sender = account(op.at("account").get<std::string>());

        if (name == "approve") {
            amm::Exchange& ex = exchange(op.at("exchange").get<std::string>());
            return token(op.at("exchange").get<std::string>()).approve(sender, ex.address(), amount(op, "amount"));
        }

        amm::Exchange& ex = exchange(op.at("exchange").get<std::string>());
        const bool has_recipient = op.contains("recipient");
        const amm::Address recipient = has_recipient ? account(op.at("recipient").get<std::string>()) : sender;
        const amm::Call call{sender, amount(op, "value")};

        if (name == "add_liquidity") {
            return amm::format_amount(ex.add_liquidity(call, amount(op, "min_liquidity"),
                                                       amount(op, "max_tokens"), deadline(op)));
        }
        if (name == "remove_liquidity") {
            auto out = ex.remove_liquidity(sender, amount(op, "amount"), amount(op, "min_eth"),
                                           amount(op, "min_tokens"), deadline(op));
            return {{"eth", amm::format_amount(out.first)}, {"tokens", amm::format_amount(out.second)}};
        }
        if (name == "eth_to_token_input") {
            return amm::format_amount(has_recipient
                ? ex.eth_to_token_transfer_input(call, amount(op, "min_tokens"), deadline(op), recipient)
                : ex.eth_to_token_swap_input(call, amount(op, "min_tokens"), deadline(op)));
        }
        if (name == "eth_to_token_output") {
            return amm::format_amount(has_recipient
                ? ex.eth_to_token_transfer_output(call, amount(op, "tokens_bought"), deadline(op), recipient)
                : ex.eth_to_token_swap_output(call, amount(op, "tokens_bought"), deadline(op)));
        }
        if (name == "default_swap") {
            return amm::format_amount(ex.default_swap(call));
        }
        if (name == "token_to_eth_input") {
            return amm::format_amount(has_recipient
                ? ex.token_to_eth_transfer_input(sender, amount(op, "tokens_sold"), amount(op, "min_eth"),
                                                 deadline(op), recipient)
                : ex.token_to_eth_swap_input(sender, amount(op, "tokens_sold"), amount(op, "min_eth"),
                                             deadline(op)));
        }
        if (name == "token_to_eth_output") {
            return amm::format_amount(has_recipient
                ? ex.token_to_eth_transfer_output(sender, amount(op, "eth_bought"), amount(op, "max_tokens"),
                                                  deadline(op), recipient)
                : ex.token_to_eth_swap_output(sender, amount(op, "eth_bought"), amount(op, "max_tokens"),
                                              deadline(op)));
        }
        if (name == "token_to_token_input") {
            const amm::Address to_token = token(op.at("to_token").get<std::string>()).address();
            return amm::format_amount(ex.token_to_token_transfer_input(
                sender, amount(op, "tokens_sold"), amount(op, "min_tokens_bought"),
                amount(op, "min_eth_bought"), deadline(op), recipient, to_token));
        }
        if (name == "token_to_token_output") {
            const amm::Address to_token = token(op.at("to_token").get<std::string>()).address();
            return amm::format_amount(ex.token_to_token_transfer_output(
                sender, amount(op, "tokens_bought"), amount(op, "max_tokens_sold"),
                amount(op, "max_eth_sold"), deadline(op), recipient, to_token));
        }

        throw std::invalid_argument("Unknown operation: " + name);
    }
};

//------------------------------------------------------------------------------
// Command Line
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "AMM C++ CLI Scenario Runner\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Configuration file (JSON)\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help message\n\n"
              << "Operations:\n"
              << "  approve, add_liquidity, remove_liquidity, default_swap\n"
              << "  eth_to_token_input, eth_to_token_output\n"
              << "  token_to_eth_input, token_to_eth_output\n"
              << "  token_to_token_input, token_to_token_output\n"
              << "  advance_blocks\n\n"
              << "Examples:\n"
              << "  " << prog << " scenario.json\n"
              << "  " << prog << " -c amm.json -v scenario.json\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-' && options.scenario_path.empty()) {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.scenario_path.empty()) {
        std::cerr << "No scenario specified. Use -h for help.\n";
        std::exit(1);
    }

    return options;
}

json load_scenario(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scenario file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return json::parse(buffer.str());
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        amm::Config config = options.config_path.empty()
            ? amm::Config{}
            : amm::Config::from_file(options.config_path);
        if (options.verbose) {
            config.set_log_level("debug");
        }
        amm::init_logging(config.log);

        json doc = load_scenario(options.scenario_path);
        Scenario scenario(config, doc);
        json results = scenario.run(doc.value("operations", json::array()));

        json output = {
            {"results", std::move(results)},
            {"events", scenario.events()},
            {"state", scenario.state()}
        };
        std::cout << output.dump(2) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
