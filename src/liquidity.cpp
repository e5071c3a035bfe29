// =============================================================================
// liquidity.cpp - Pool share minting and burning
// =============================================================================

#include "amm/exchange.hpp"
#include "amm/chain.hpp"
#include "amm/event.hpp"

#include <spdlog/spdlog.h>

namespace amm {

namespace {

// Liquidity deadlines are exclusive: the current block must be strictly
// before the deadline (swaps accept deadline == block)
void require_liquidity_deadline(uint64_t deadline, uint64_t block) {
    if (deadline <= block) {
        throw ExchangeError(ErrorCode::EXPIRED, "Exchange: liquidity deadline has passed");
    }
}

} // anonymous namespace

// =============================================================================
// Add Liquidity
// =============================================================================

Amount Exchange::add_liquidity(const Call& call, const Amount& min_liquidity,
                               const Amount& max_tokens, uint64_t deadline) {
    Amount minted = 0;

    execute("add_liquidity", call, nullptr, total_liquidity_ops_, [&] {
        require_configured();
        if (max_tokens == 0 || call.value == 0) {
            throw ExchangeError(ErrorCode::INVALID_PARAMETERS, "Exchange: add_liquidity invalid parameters");
        }
        require_liquidity_deadline(deadline, chain_.block_number());

        const Amount total = shares_.total_supply();
        Amount token_amount = 0;

        if (total > 0) {
            if (min_liquidity == 0) {
                throw ExchangeError(ErrorCode::INVALID_PARAMETERS,
                                    "Exchange: add_liquidity min_liquidity must be greater than 0");
            }
            // Reserves exclude call.value: the deposit must not price itself
            token_amount = call.value * token_reserve_ / eth_reserve_ + 1;
            minted = call.value * total / eth_reserve_;
            if (token_amount > max_tokens || minted < min_liquidity) {
                throw ExchangeError(ErrorCode::SLIPPAGE_EXCEEDED,
                                    "Exchange: add_liquidity max_tokens or minted liquidity too low");
            }
        } else {
            if (call.value < config_.min_initial_liquidity) {
                throw ExchangeError(ErrorCode::INVALID_PARAMETERS,
                                    "Exchange: initial deposit below minimum");
            }
            // First provider sets the price
            token_amount = max_tokens;
            minted = call.value;
        }

        pull_tokens(call.sender, token_amount);
        set_reserves(eth_reserve_ + call.value, token_reserve_ + token_amount);
        chain_.emit(address_, AddLiquidity{call.sender, call.value, token_amount});
        shares_.mint(call.sender, minted);
    });

    spdlog::debug("exchange {} minted {} shares", addresses::to_hex(address_), minted.str());
    return minted;
}

// =============================================================================
// Remove Liquidity
// =============================================================================

std::pair<Amount, Amount> Exchange::remove_liquidity(const Address& sender, const Amount& amount,
                                                     const Amount& min_eth, const Amount& min_tokens,
                                                     uint64_t deadline) {
    Amount eth_amount = 0;
    Amount token_amount = 0;

    execute("remove_liquidity", Call{sender, 0}, nullptr, total_liquidity_ops_, [&] {
        require_configured();
        if (amount == 0 || min_eth == 0 || min_tokens == 0) {
            throw ExchangeError(ErrorCode::INVALID_PARAMETERS, "Exchange: remove_liquidity invalid parameters");
        }
        require_liquidity_deadline(deadline, chain_.block_number());

        const Amount total = shares_.total_supply();
        if (total == 0) {
            throw ExchangeError(ErrorCode::INSUFFICIENT_LIQUIDITY, "Exchange: pool is empty");
        }
        if (amount > shares_.balance_of(sender)) {
            throw ExchangeError(ErrorCode::INSUFFICIENT_LIQUIDITY,
                                "Exchange: remove_liquidity amount exceeds held shares");
        }

        eth_amount = amount * eth_reserve_ / total;
        token_amount = amount * token_reserve_ / total;
        if (eth_amount < min_eth || token_amount < min_tokens) {
            throw ExchangeError(ErrorCode::SLIPPAGE_EXCEEDED,
                                "Exchange: remove_liquidity min_eth or min_tokens not met");
        }

        if (!shares_.burn(sender, amount)) {
            throw ExchangeError(ErrorCode::INSUFFICIENT_LIQUIDITY, "Exchange: share burn failed");
        }
        set_reserves(eth_reserve_ - eth_amount, token_reserve_ - token_amount);
        pay_eth(sender, eth_amount);
        push_tokens(sender, token_amount);
        chain_.emit(address_, RemoveLiquidity{sender, eth_amount, token_amount});
    });

    return {eth_amount, token_amount};
}

} // namespace amm
