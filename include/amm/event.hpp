#ifndef AMM_EVENT_HPP
#define AMM_EVENT_HPP

#include <cstdint>
#include <variant>

#include "types.hpp"

namespace amm {

// =============================================================================
// Exchange Events
// =============================================================================

struct TokenPurchase {
    Address buyer;
    Amount eth_sold;
    Amount tokens_bought;
};

struct EthPurchase {
    Address buyer;
    Amount tokens_sold;
    Amount eth_bought;
};

struct AddLiquidity {
    Address provider;
    Amount eth_amount;
    Amount token_amount;
};

struct RemoveLiquidity {
    Address provider;
    Amount eth_amount;
    Amount token_amount;
};

// =============================================================================
// Fungible Ledger Events (tokens and pool shares)
// =============================================================================

// Mint: from == 0, burn: to == 0
struct Transfer {
    Address from;
    Address to;
    Amount value;
};

struct Approval {
    Address owner;
    Address spender;
    Amount value;
};

// =============================================================================
// Registry Events
// =============================================================================

struct NewExchange {
    Address token;
    Address exchange;
};

using EventData = std::variant<TokenPurchase, EthPurchase, AddLiquidity, RemoveLiquidity,
                               Transfer, Approval, NewExchange>;

struct LogEntry {
    uint64_t block;
    Address emitter;
    EventData data;
};

// Callback interface for committed events
class EventListener {
public:
    virtual ~EventListener() = default;
    virtual void on_event(const LogEntry& entry) = 0;
};

} // namespace amm

#endif // AMM_EVENT_HPP
