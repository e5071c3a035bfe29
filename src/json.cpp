// =============================================================================
// json.cpp - JSON encoding of addresses, amounts and events
// =============================================================================

#include "amm/json.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace amm {

using json = nlohmann::json;

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Scalars
// =============================================================================

Address parse_address(const std::string& hex) {
    if (hex.size() != 42 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
        throw std::invalid_argument("Invalid address: " + hex);
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 + 2 * i]);
        int lo = hex_value(hex[3 + 2 * i]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid address: " + hex);
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

Amount parse_amount(const json& j) {
    if (j.is_number_unsigned()) {
        return Amount(j.get<uint64_t>());
    }
    if (j.is_number_integer()) {
        const int64_t value = j.get<int64_t>();
        if (value < 0) {
            throw std::invalid_argument("Invalid amount: " + j.dump());
        }
        return Amount(static_cast<uint64_t>(value));
    }
    if (!j.is_string()) {
        throw std::invalid_argument("Invalid amount: " + j.dump());
    }

    const std::string text = j.get<std::string>();
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid amount: " + text);
    }
    try {
        return Amount(text);
    } catch (const std::exception&) {
        throw std::invalid_argument("Amount out of range: " + text);
    }
}

std::string format_amount(const Amount& amount) {
    return amount.str();
}

// =============================================================================
// Events
// =============================================================================

void to_json(json& j, const TokenPurchase& e) {
    j = json{{"buyer", addresses::to_hex(e.buyer)},
             {"eth_sold", format_amount(e.eth_sold)},
             {"tokens_bought", format_amount(e.tokens_bought)}};
}

void to_json(json& j, const EthPurchase& e) {
    j = json{{"buyer", addresses::to_hex(e.buyer)},
             {"tokens_sold", format_amount(e.tokens_sold)},
             {"eth_bought", format_amount(e.eth_bought)}};
}

void to_json(json& j, const AddLiquidity& e) {
    j = json{{"provider", addresses::to_hex(e.provider)},
             {"eth_amount", format_amount(e.eth_amount)},
             {"token_amount", format_amount(e.token_amount)}};
}

void to_json(json& j, const RemoveLiquidity& e) {
    j = json{{"provider", addresses::to_hex(e.provider)},
             {"eth_amount", format_amount(e.eth_amount)},
             {"token_amount", format_amount(e.token_amount)}};
}

void to_json(json& j, const Transfer& e) {
    j = json{{"from", addresses::to_hex(e.from)},
             {"to", addresses::to_hex(e.to)},
             {"value", format_amount(e.value)}};
}

void to_json(json& j, const Approval& e) {
    j = json{{"owner", addresses::to_hex(e.owner)},
             {"spender", addresses::to_hex(e.spender)},
             {"value", format_amount(e.value)}};
}

void to_json(json& j, const NewExchange& e) {
    j = json{{"token", addresses::to_hex(e.token)},
             {"exchange", addresses::to_hex(e.exchange)}};
}

const char* event_name(const EventData& data) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TokenPurchase>) return "TokenPurchase";
        else if constexpr (std::is_same_v<T, EthPurchase>) return "EthPurchase";
        else if constexpr (std::is_same_v<T, AddLiquidity>) return "AddLiquidity";
        else if constexpr (std::is_same_v<T, RemoveLiquidity>) return "RemoveLiquidity";
        else if constexpr (std::is_same_v<T, Transfer>) return "Transfer";
        else if constexpr (std::is_same_v<T, Approval>) return "Approval";
        else return "NewExchange";
    }, data);
}

void to_json(json& j, const LogEntry& entry) {
    json args;
    std::visit([&args](const auto& e) { to_json(args, e); }, entry.data);

    j = json{{"block", entry.block},
             {"emitter", addresses::to_hex(entry.emitter)},
             {"event", event_name(entry.data)},
             {"args", std::move(args)}};
}

json events_to_json(const std::vector<LogEntry>& entries) {
    json out = json::array();
    for (const auto& entry : entries) {
        out.push_back(entry);
    }
    return out;
}

} // namespace amm
