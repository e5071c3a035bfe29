// =============================================================================
// swap.cpp - Swap orchestration: native/token, token/native, token/token
// =============================================================================

#include "amm/exchange.hpp"
#include "amm/chain.hpp"
#include "amm/event.hpp"
#include "amm/pricing.hpp"

#include <spdlog/spdlog.h>

namespace amm {

namespace {

// Swap deadlines are inclusive: deadline == block is still valid
void require_swap_deadline(uint64_t deadline, uint64_t block) {
    if (deadline < block) {
        throw ExchangeError(ErrorCode::EXPIRED, "Exchange: swap deadline has passed");
    }
}

[[noreturn]] void invalid_parameters(const char* op) {
    throw ExchangeError(ErrorCode::INVALID_PARAMETERS,
                        std::string("Exchange: ") + op + " invalid parameters");
}

[[noreturn]] void slippage(const char* op) {
    throw ExchangeError(ErrorCode::SLIPPAGE_EXCEEDED,
                        std::string("Exchange: ") + op + " bound not met");
}

} // anonymous namespace

// =============================================================================
// Swap Bodies
// =============================================================================

Amount Exchange::eth_to_token_input(const Amount& eth_sold, const Amount& min_tokens, uint64_t deadline,
                                    const Address& buyer, const Address& recipient) {
    require_configured();
    if (eth_sold == 0 || min_tokens == 0) invalid_parameters("eth_to_token_input");
    require_swap_deadline(deadline, chain_.block_number());

    // eth_reserve_ does not yet include eth_sold
    Amount tokens_bought = pricing::get_input_price(eth_sold, eth_reserve_, token_reserve_);
    if (tokens_bought < min_tokens) slippage("eth_to_token_input");

    set_reserves(eth_reserve_ + eth_sold, token_reserve_ - tokens_bought);
    push_tokens(recipient, tokens_bought);
    chain_.emit(address_, TokenPurchase{buyer, eth_sold, tokens_bought});
    return tokens_bought;
}

Amount Exchange::eth_to_token_output(const Amount& tokens_bought, const Amount& max_eth, uint64_t deadline,
                                     const Address& buyer, const Address& recipient) {
    require_configured();
    if (tokens_bought == 0 || max_eth == 0) invalid_parameters("eth_to_token_output");
    require_swap_deadline(deadline, chain_.block_number());

    Amount eth_sold = pricing::get_output_price(tokens_bought, eth_reserve_, token_reserve_);
    if (eth_sold > max_eth) slippage("eth_to_token_output");

    set_reserves(eth_reserve_ + eth_sold, token_reserve_ - tokens_bought);
    Amount refund = max_eth - eth_sold;
    if (refund > 0) {
        pay_eth(buyer, refund);
    }
    push_tokens(recipient, tokens_bought);
    chain_.emit(address_, TokenPurchase{buyer, eth_sold, tokens_bought});
    return eth_sold;
}

Amount Exchange::token_to_eth_input(const Amount& tokens_sold, const Amount& min_eth, uint64_t deadline,
                                    const Address& buyer, const Address& recipient) {
    require_configured();
    if (tokens_sold == 0 || min_eth == 0) invalid_parameters("token_to_eth_input");
    require_swap_deadline(deadline, chain_.block_number());

    Amount eth_bought = pricing::get_input_price(tokens_sold, token_reserve_, eth_reserve_);
    if (eth_bought < min_eth) slippage("token_to_eth_input");

    set_reserves(eth_reserve_ - eth_bought, token_reserve_ + tokens_sold);
    pay_eth(recipient, eth_bought);
    pull_tokens(buyer, tokens_sold);
    chain_.emit(address_, EthPurchase{buyer, tokens_sold, eth_bought});
    return eth_bought;
}

Amount Exchange::token_to_eth_output(const Amount& eth_bought, const Amount& max_tokens, uint64_t deadline,
                                     const Address& buyer, const Address& recipient) {
    require_configured();
    if (eth_bought == 0) invalid_parameters("token_to_eth_output");
    require_swap_deadline(deadline, chain_.block_number());

    Amount tokens_sold = pricing::get_output_price(eth_bought, token_reserve_, eth_reserve_);
    if (tokens_sold > max_tokens) slippage("token_to_eth_output");

    set_reserves(eth_reserve_ - eth_bought, token_reserve_ + tokens_sold);
    pay_eth(recipient, eth_bought);
    pull_tokens(buyer, tokens_sold);
    chain_.emit(address_, EthPurchase{buyer, tokens_sold, eth_bought});
    return tokens_sold;
}

Amount Exchange::token_to_token_input(const Amount& tokens_sold, const Amount& min_tokens_bought,
                                      const Amount& min_eth_bought, uint64_t deadline,
                                      const Address& buyer, const Address& recipient, Exchange* exchange) {
    require_configured();
    if (tokens_sold == 0 || min_tokens_bought == 0 || min_eth_bought == 0) {
        invalid_parameters("token_to_token_input");
    }
    require_swap_deadline(deadline, chain_.block_number());
    require_route(exchange);

    Amount eth_bought = pricing::get_input_price(tokens_sold, token_reserve_, eth_reserve_);
    if (eth_bought < min_eth_bought) slippage("token_to_token_input");

    set_reserves(eth_reserve_ - eth_bought, token_reserve_ + tokens_sold);
    pull_tokens(buyer, tokens_sold);
    chain_.emit(address_, EthPurchase{buyer, tokens_sold, eth_bought});

    spdlog::debug("exchange {} routing {} eth to {}", addresses::to_hex(address_),
                  eth_bought.str(), addresses::to_hex(exchange->address()));

    // Second leg pays the final recipient directly
    return exchange->eth_to_token_transfer_input(Call{address_, eth_bought},
                                                 min_tokens_bought, deadline, recipient);
}

Amount Exchange::token_to_token_output(const Amount& tokens_bought, const Amount& max_tokens_sold,
                                       const Amount& max_eth_sold, uint64_t deadline,
                                       const Address& buyer, const Address& recipient, Exchange* exchange) {
    require_configured();
    if (tokens_bought == 0 || max_eth_sold == 0) invalid_parameters("token_to_token_output");
    require_swap_deadline(deadline, chain_.block_number());
    require_route(exchange);

    Amount eth_bought = exchange->get_eth_to_token_output_price(tokens_bought);
    Amount tokens_sold = pricing::get_output_price(eth_bought, token_reserve_, eth_reserve_);
    if (tokens_sold > max_tokens_sold || eth_bought > max_eth_sold) slippage("token_to_token_output");

    set_reserves(eth_reserve_ - eth_bought, token_reserve_ + tokens_sold);
    pull_tokens(buyer, tokens_sold);
    chain_.emit(address_, EthPurchase{buyer, tokens_sold, eth_bought});

    exchange->eth_to_token_transfer_output(Call{address_, eth_bought}, tokens_bought, deadline, recipient);
    return tokens_sold;
}

// =============================================================================
// Native -> Token
// =============================================================================

Amount Exchange::eth_to_token_swap_input(const Call& call, const Amount& min_tokens, uint64_t deadline) {
    Amount tokens_bought = 0;
    execute("eth_to_token_swap_input", call, nullptr, total_swaps_, [&] {
        tokens_bought = eth_to_token_input(call.value, min_tokens, deadline, call.sender, call.sender);
    });
    return tokens_bought;
}

Amount Exchange::eth_to_token_transfer_input(const Call& call, const Amount& min_tokens,
                                             uint64_t deadline, const Address& recipient) {
    Amount tokens_bought = 0;
    execute("eth_to_token_transfer_input", call, &recipient, total_swaps_, [&] {
        tokens_bought = eth_to_token_input(call.value, min_tokens, deadline, call.sender, recipient);
    });
    return tokens_bought;
}

Amount Exchange::eth_to_token_swap_output(const Call& call, const Amount& tokens_bought, uint64_t deadline) {
    Amount eth_sold = 0;
    execute("eth_to_token_swap_output", call, nullptr, total_swaps_, [&] {
        eth_sold = eth_to_token_output(tokens_bought, call.value, deadline, call.sender, call.sender);
    });
    return eth_sold;
}

Amount Exchange::eth_to_token_transfer_output(const Call& call, const Amount& tokens_bought,
                                              uint64_t deadline, const Address& recipient) {
    Amount eth_sold = 0;
    execute("eth_to_token_transfer_output", call, &recipient, total_swaps_, [&] {
        eth_sold = eth_to_token_output(tokens_bought, call.value, deadline, call.sender, recipient);
    });
    return eth_sold;
}

Amount Exchange::default_swap(const Call& call) {
    Amount tokens_bought = 0;
    execute("default_swap", call, nullptr, total_swaps_, [&] {
        tokens_bought = eth_to_token_input(call.value, 1, chain_.block_number(), call.sender, call.sender);
    });
    return tokens_bought;
}

// =============================================================================
// Token -> Native
// =============================================================================

Amount Exchange::token_to_eth_swap_input(const Address& sender, const Amount& tokens_sold,
                                         const Amount& min_eth, uint64_t deadline) {
    Amount eth_bought = 0;
    execute("token_to_eth_swap_input", Call{sender, 0}, nullptr, total_swaps_, [&] {
        eth_bought = token_to_eth_input(tokens_sold, min_eth, deadline, sender, sender);
    });
    return eth_bought;
}

Amount Exchange::token_to_eth_transfer_input(const Address& sender, const Amount& tokens_sold,
                                             const Amount& min_eth, uint64_t deadline,
                                             const Address& recipient) {
    Amount eth_bought = 0;
    execute("token_to_eth_transfer_input", Call{sender, 0}, &recipient, total_swaps_, [&] {
        eth_bought = token_to_eth_input(tokens_sold, min_eth, deadline, sender, recipient);
    });
    return eth_bought;
}

Amount Exchange::token_to_eth_swap_output(const Address& sender, const Amount& eth_bought,
                                          const Amount& max_tokens, uint64_t deadline) {
    Amount tokens_sold = 0;
    execute("token_to_eth_swap_output", Call{sender, 0}, nullptr, total_swaps_, [&] {
        tokens_sold = token_to_eth_output(eth_bought, max_tokens, deadline, sender, sender);
    });
    return tokens_sold;
}

Amount Exchange::token_to_eth_transfer_output(const Address& sender, const Amount& eth_bought,
                                              const Amount& max_tokens, uint64_t deadline,
                                              const Address& recipient) {
    Amount tokens_sold = 0;
    execute("token_to_eth_transfer_output", Call{sender, 0}, &recipient, total_swaps_, [&] {
        tokens_sold = token_to_eth_output(eth_bought, max_tokens, deadline, sender, recipient);
    });
    return tokens_sold;
}

// =============================================================================
// Token -> Token (registry routed)
// =============================================================================

Amount Exchange::token_to_token_swap_input(const Address& sender, const Amount& tokens_sold,
                                           const Amount& min_tokens_bought, const Amount& min_eth_bought,
                                           uint64_t deadline, const Address& token_addr) {
    Amount tokens_bought = 0;
    execute("token_to_token_swap_input", Call{sender, 0}, nullptr, total_swaps_, [&] {
        tokens_bought = token_to_token_input(tokens_sold, min_tokens_bought, min_eth_bought,
                                             deadline, sender, sender, route(token_addr));
    });
    return tokens_bought;
}

Amount Exchange::token_to_token_transfer_input(const Address& sender, const Amount& tokens_sold,
                                               const Amount& min_tokens_bought, const Amount& min_eth_bought,
                                               uint64_t deadline, const Address& recipient,
                                               const Address& token_addr) {
    Amount tokens_bought = 0;
    execute("token_to_token_transfer_input", Call{sender, 0}, &recipient, total_swaps_, [&] {
        tokens_bought = token_to_token_input(tokens_sold, min_tokens_bought, min_eth_bought,
                                             deadline, sender, recipient, route(token_addr));
    });
    return tokens_bought;
}

Amount Exchange::token_to_token_swap_output(const Address& sender, const Amount& tokens_bought,
                                            const Amount& max_tokens_sold, const Amount& max_eth_sold,
                                            uint64_t deadline, const Address& token_addr) {
    Amount tokens_sold = 0;
    execute("token_to_token_swap_output", Call{sender, 0}, nullptr, total_swaps_, [&] {
        tokens_sold = token_to_token_output(tokens_bought, max_tokens_sold, max_eth_sold,
                                            deadline, sender, sender, route(token_addr));
    });
    return tokens_sold;
}

Amount Exchange::token_to_token_transfer_output(const Address& sender, const Amount& tokens_bought,
                                                const Amount& max_tokens_sold, const Amount& max_eth_sold,
                                                uint64_t deadline, const Address& recipient,
                                                const Address& token_addr) {
    Amount tokens_sold = 0;
    execute("token_to_token_transfer_output", Call{sender, 0}, &recipient, total_swaps_, [&] {
        tokens_sold = token_to_token_output(tokens_bought, max_tokens_sold, max_eth_sold,
                                            deadline, sender, recipient, route(token_addr));
    });
    return tokens_sold;
}

// =============================================================================
// Token -> Token (explicit exchange)
// =============================================================================

Amount Exchange::token_to_exchange_swap_input(const Address& sender, const Amount& tokens_sold,
                                              const Amount& min_tokens_bought, const Amount& min_eth_bought,
                                              uint64_t deadline, Exchange* exchange) {
    Amount tokens_bought = 0;
    execute("token_to_exchange_swap_input", Call{sender, 0}, nullptr, total_swaps_, [&] {
        tokens_bought = token_to_token_input(tokens_sold, min_tokens_bought, min_eth_bought,
                                             deadline, sender, sender, exchange);
    });
    return tokens_bought;
}

Amount Exchange::token_to_exchange_transfer_input(const Address& sender, const Amount& tokens_sold,
                                                  const Amount& min_tokens_bought, const Amount& min_eth_bought,
                                                  uint64_t deadline, const Address& recipient,
                                                  Exchange* exchange) {
    Amount tokens_bought = 0;
    execute("token_to_exchange_transfer_input", Call{sender, 0}, &recipient, total_swaps_, [&] {
        tokens_bought = token_to_token_input(tokens_sold, min_tokens_bought, min_eth_bought,
                                             deadline, sender, recipient, exchange);
    });
    return tokens_bought;
}

Amount Exchange::token_to_exchange_swap_output(const Address& sender, const Amount& tokens_bought,
                                               const Amount& max_tokens_sold, const Amount& max_eth_sold,
                                               uint64_t deadline, Exchange* exchange) {
    Amount tokens_sold = 0;
    execute("token_to_exchange_swap_output", Call{sender, 0}, nullptr, total_swaps_, [&] {
        tokens_sold = token_to_token_output(tokens_bought, max_tokens_sold, max_eth_sold,
                                            deadline, sender, sender, exchange);
    });
    return tokens_sold;
}

Amount Exchange::token_to_exchange_transfer_output(const Address& sender, const Amount& tokens_bought,
                                                   const Amount& max_tokens_sold, const Amount& max_eth_sold,
                                                   uint64_t deadline, const Address& recipient,
                                                   Exchange* exchange) {
    Amount tokens_sold = 0;
    execute("token_to_exchange_transfer_output", Call{sender, 0}, &recipient, total_swaps_, [&] {
        tokens_sold = token_to_token_output(tokens_bought, max_tokens_sold, max_eth_sold,
                                            deadline, sender, recipient, exchange);
    });
    return tokens_sold;
}

} // namespace amm
