// =============================================================================
// registry.cpp - Exchange creation and token <-> exchange index
// =============================================================================

#include "amm/registry.hpp"
#include "amm/chain.hpp"
#include "amm/event.hpp"
#include "amm/token.hpp"

#include <spdlog/spdlog.h>

namespace amm {

Registry::Registry(Chain& chain, ExchangeConfig config)
    : chain_(chain),
      config_(std::move(config)),
      address_(chain.new_address()) {}

// =============================================================================
// Exchange Creation
// =============================================================================

Exchange& Registry::create_exchange(IToken& token) {
    const Address token_addr = token.address();
    Exchange* created = nullptr;

    chain_.transact([&] {
        if (addresses::is_zero(token_addr)) {
            throw ExchangeError(ErrorCode::INVALID_EXCHANGE, "Registry: invalid token address");
        }
        if (token_to_exchange_.count(token_addr) != 0) {
            throw ExchangeError(ErrorCode::INVALID_EXCHANGE,
                                "Registry: exchange already exists for " + addresses::to_hex(token_addr));
        }

        exchanges_.push_back(std::make_unique<Exchange>(chain_, config_));
        created = exchanges_.back().get();
        chain_.record([this] { exchanges_.pop_back(); });

        created->setup(address_, token, this);

        const Address exchange_addr = created->address();
        const uint64_t token_id = token_count_ + 1;
        token_to_exchange_[token_addr] = created;
        exchange_to_token_[exchange_addr] = token_addr;
        id_to_token_[token_id] = token_addr;
        token_count_ = token_id;
        chain_.record([this, token_addr, exchange_addr, token_id] {
            token_to_exchange_.erase(token_addr);
            exchange_to_token_.erase(exchange_addr);
            id_to_token_.erase(token_id);
            token_count_ = token_id - 1;
        });

        chain_.emit(address_, NewExchange{token_addr, exchange_addr});
    });

    spdlog::info("registry {} created exchange {} for token {}",
                 addresses::to_hex(address_), addresses::to_hex(created->address()),
                 addresses::to_hex(token_addr));
    return *created;
}

// =============================================================================
// Queries
// =============================================================================

Exchange* Registry::get_exchange(const Address& token) const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    auto it = token_to_exchange_.find(token);
    return it != token_to_exchange_.end() ? it->second : nullptr;
}

std::optional<Address> Registry::get_token(const Address& exchange) const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    auto it = exchange_to_token_.find(exchange);
    if (it == exchange_to_token_.end()) return std::nullopt;
    return it->second;
}

std::optional<Address> Registry::get_token_with_id(uint64_t token_id) const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    auto it = id_to_token_.find(token_id);
    if (it == id_to_token_.end()) return std::nullopt;
    return it->second;
}

uint64_t Registry::token_count() const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return token_count_;
}

} // namespace amm
