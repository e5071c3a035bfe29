// =============================================================================
// exchange.cpp - Exchange setup, pool shares, price queries and settlement
// =============================================================================

#include "amm/exchange.hpp"
#include "amm/chain.hpp"
#include "amm/pricing.hpp"
#include "amm/registry.hpp"
#include "amm/token.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace amm {

// =============================================================================
// Constructor
// =============================================================================

Exchange::Exchange(Chain& chain, ExchangeConfig config)
    : chain_(chain),
      config_(std::move(config)),
      address_(chain.new_address()),
      shares_(chain, address_) {}

// =============================================================================
// Setup
// =============================================================================

void Exchange::setup(const Address& caller, IToken& token, IRegistry* registry) {
    chain_.transact([&] {
        if (token_ != nullptr) {
            throw ExchangeError(ErrorCode::ALREADY_CONFIGURED, "Exchange: already configured");
        }
        if (addresses::is_zero(token.address())) {
            throw ExchangeError(ErrorCode::INVALID_PARAMETERS, "Exchange: invalid token address");
        }

        token_ = &token;
        registry_ = registry;
        factory_ = caller;
        chain_.record([this] {
            token_ = nullptr;
            registry_ = nullptr;
            factory_ = Address{};
        });
    });

    spdlog::debug("exchange {} setup: token {} factory {}",
                  addresses::to_hex(address_), addresses::to_hex(token.address()),
                  addresses::to_hex(caller));
}

bool Exchange::is_configured() const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return token_ != nullptr;
}

Address Exchange::token_address() const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return token_ ? token_->address() : Address{};
}

Address Exchange::factory_address() const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return factory_;
}

Amount Exchange::eth_reserve() const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return eth_reserve_;
}

Amount Exchange::token_reserve() const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return token_reserve_;
}

// =============================================================================
// Pool Shares
// =============================================================================

Amount Exchange::total_supply() const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return shares_.total_supply();
}

Amount Exchange::balance_of(const Address& owner) const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return shares_.balance_of(owner);
}

Amount Exchange::allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return shares_.allowance(owner, spender);
}

bool Exchange::transfer(const Address& sender, const Address& to, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return shares_.transfer(sender, to, value);
}

bool Exchange::approve(const Address& owner, const Address& spender, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return shares_.approve(owner, spender, value);
}

bool Exchange::transfer_from(const Address& spender, const Address& from,
                             const Address& to, const Amount& value) {
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return shares_.transfer_from(spender, from, to, value);
}

// =============================================================================
// Price Queries
// =============================================================================

namespace {

void require_positive(const Amount& amount, const char* what) {
    if (amount == 0) {
        throw ExchangeError(ErrorCode::INVALID_PARAMETERS,
                            std::string("Exchange: ") + what + " must be greater than 0");
    }
}

} // anonymous namespace

Amount Exchange::get_eth_to_token_input_price(const Amount& eth_sold) const {
    require_positive(eth_sold, "eth_sold");
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return pricing::get_input_price(eth_sold, eth_reserve_, token_reserve_);
}

Amount Exchange::get_eth_to_token_output_price(const Amount& tokens_bought) const {
    require_positive(tokens_bought, "tokens_bought");
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return pricing::get_output_price(tokens_bought, eth_reserve_, token_reserve_);
}

Amount Exchange::get_token_to_eth_input_price(const Amount& tokens_sold) const {
    require_positive(tokens_sold, "tokens_sold");
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return pricing::get_input_price(tokens_sold, token_reserve_, eth_reserve_);
}

Amount Exchange::get_token_to_eth_output_price(const Amount& eth_bought) const {
    require_positive(eth_bought, "eth_bought");
    std::lock_guard<std::recursive_mutex> lock(chain_.mutex());
    return pricing::get_output_price(eth_bought, token_reserve_, eth_reserve_);
}

// =============================================================================
// Transaction Wrapper
// =============================================================================

void Exchange::execute(const char* op, const Call& call, const Address* recipient,
                       std::atomic<uint64_t>& counter, const std::function<void()>& body) {
    chain_.transact([&] {
        if (entered_) {
            throw ExchangeError(ErrorCode::REENTRANCY,
                                std::string("Exchange: reentrant call to ") + op);
        }
        entered_ = true;
        struct Unlock {
            bool& flag;
            ~Unlock() { flag = false; }
        } unlock{entered_};

        spdlog::debug("exchange {} {} from {} value {}",
                      addresses::to_hex(address_), op,
                      addresses::to_hex(call.sender), call.value.str());

        require_configured();
        if (call.sender == address_) {
            throw ExchangeError(ErrorCode::INVALID_PARAMETERS,
                                std::string("Exchange: ") + op + " called by the exchange itself");
        }
        if (recipient != nullptr) {
            require_recipient(*recipient);
        }

        try {
            chain_.transfer_native(call.sender, address_, call.value);
            body();
        } catch (const std::overflow_error& e) {
            throw ExchangeError(ErrorCode::ARITHMETIC_OVERFLOW,
                                std::string("Exchange: ") + op + ": " + e.what());
        } catch (const std::range_error& e) {
            throw ExchangeError(ErrorCode::ARITHMETIC_OVERFLOW,
                                std::string("Exchange: ") + op + ": " + e.what());
        }

        counter.fetch_add(1, std::memory_order_relaxed);
        chain_.record([&counter] { counter.fetch_sub(1, std::memory_order_relaxed); });
    });
}

// =============================================================================
// Internal Helpers
// =============================================================================

void Exchange::require_configured() const {
    if (token_ == nullptr) {
        throw ExchangeError(ErrorCode::NOT_CONFIGURED, "Exchange: not configured");
    }
}

void Exchange::require_recipient(const Address& recipient) const {
    if (addresses::is_zero(recipient) || recipient == address_) {
        throw ExchangeError(ErrorCode::INVALID_RECIPIENT,
                            "Exchange: invalid recipient " + addresses::to_hex(recipient));
    }
}

Exchange* Exchange::route(const Address& token_addr) const {
    if (registry_ == nullptr) {
        throw ExchangeError(ErrorCode::INVALID_EXCHANGE, "Exchange: no registry to route through");
    }
    return registry_->get_exchange(token_addr);
}

void Exchange::require_route(const Exchange* exchange) const {
    if (exchange == nullptr || exchange == this) {
        throw ExchangeError(ErrorCode::INVALID_EXCHANGE, "Exchange: invalid destination exchange");
    }
}

void Exchange::set_reserves(const Amount& eth_reserve, const Amount& token_reserve) {
    Amount eth_before = eth_reserve_;
    Amount token_before = token_reserve_;
    eth_reserve_ = eth_reserve;
    token_reserve_ = token_reserve;
    chain_.record([this, eth_before, token_before] {
        eth_reserve_ = eth_before;
        token_reserve_ = token_before;
    });
}

void Exchange::pay_eth(const Address& to, const Amount& amount) {
    chain_.transfer_native(address_, to, amount);
}

void Exchange::push_tokens(const Address& to, const Amount& amount) {
    if (!token_->transfer(address_, to, amount)) {
        throw ExchangeError(ErrorCode::ASSET_TRANSFER_FAILED, "Exchange: token transfer failed");
    }
}

void Exchange::pull_tokens(const Address& from, const Amount& amount) {
    if (!token_->transfer_from(address_, from, address_, amount)) {
        throw ExchangeError(ErrorCode::ASSET_TRANSFER_FAILED, "Exchange: token transfer_from failed");
    }
}

// =============================================================================
// Statistics
// =============================================================================

Exchange::Stats Exchange::get_stats() const {
    return Stats{
        total_swaps_.load(std::memory_order_relaxed),
        total_liquidity_ops_.load(std::memory_order_relaxed)
    };
}

} // namespace amm
