#ifndef AMM_EXCHANGE_HPP
#define AMM_EXCHANGE_HPP

#include <atomic>
#include <functional>
#include <string>
#include <utility>

#include "types.hpp"
#include "ledger.hpp"

namespace amm {

class Chain;
class IToken;
class IRegistry;

// =============================================================================
// Exchange Configuration
// =============================================================================

struct ExchangeConfig {
    Amount min_initial_liquidity{1000000000};  // dust threshold for the first deposit
    std::string share_name = "AMM Pool Share";
    std::string share_symbol = "AMM-LP";
    uint8_t share_decimals = 18;
};

// =============================================================================
// Exchange - native currency / token constant product pool
//
// Uninitialized until setup(); afterwards permanently active. Every mutating
// call is one chain transaction: it either settles completely or leaves no
// trace. Native currency attached to a call moves from Call::sender to the
// exchange on entry.
// =============================================================================

class Exchange {
public:
    explicit Exchange(Chain& chain, ExchangeConfig config = {});
    ~Exchange() = default;

    // Non-copyable
    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // =========================================================================
    // Setup
    // =========================================================================

    // Binds the paired token; caller becomes the permanent factory.
    // registry (optional) resolves token-to-token routes.
    void setup(const Address& caller, IToken& token, IRegistry* registry = nullptr);

    bool is_configured() const;
    Address address() const { return address_; }
    Address token_address() const;
    Address factory_address() const;

    Amount eth_reserve() const;
    Amount token_reserve() const;

    // =========================================================================
    // Liquidity
    // =========================================================================

    // Returns shares minted
    Amount add_liquidity(const Call& call, const Amount& min_liquidity,
                         const Amount& max_tokens, uint64_t deadline);

    // Returns (eth_amount, token_amount) paid out
    std::pair<Amount, Amount> remove_liquidity(const Address& sender, const Amount& amount,
                                               const Amount& min_eth, const Amount& min_tokens,
                                               uint64_t deadline);

    // =========================================================================
    // Pool Shares
    // =========================================================================

    const std::string& name() const { return config_.share_name; }
    const std::string& symbol() const { return config_.share_symbol; }
    uint8_t decimals() const { return config_.share_decimals; }

    Amount total_supply() const;
    Amount balance_of(const Address& owner) const;
    Amount allowance(const Address& owner, const Address& spender) const;

    bool transfer(const Address& sender, const Address& to, const Amount& value);
    bool approve(const Address& owner, const Address& spender, const Amount& value);
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, const Amount& value);

    // =========================================================================
    // Price Queries
    // =========================================================================

    Amount get_eth_to_token_input_price(const Amount& eth_sold) const;
    Amount get_eth_to_token_output_price(const Amount& tokens_bought) const;
    Amount get_token_to_eth_input_price(const Amount& tokens_sold) const;
    Amount get_token_to_eth_output_price(const Amount& eth_bought) const;

    // =========================================================================
    // Native -> Token
    // =========================================================================

    // Returns tokens bought
    Amount eth_to_token_swap_input(const Call& call, const Amount& min_tokens, uint64_t deadline);
    Amount eth_to_token_transfer_input(const Call& call, const Amount& min_tokens,
                                       uint64_t deadline, const Address& recipient);

    // Returns eth sold; the remainder of call.value is refunded
    Amount eth_to_token_swap_output(const Call& call, const Amount& tokens_bought, uint64_t deadline);
    Amount eth_to_token_transfer_output(const Call& call, const Amount& tokens_bought,
                                        uint64_t deadline, const Address& recipient);

    // Call without a selected operation: exact input, min 1 token, deadline now
    Amount default_swap(const Call& call);

    // =========================================================================
    // Token -> Native
    // =========================================================================

    // Returns eth bought
    Amount token_to_eth_swap_input(const Address& sender, const Amount& tokens_sold,
                                   const Amount& min_eth, uint64_t deadline);
    Amount token_to_eth_transfer_input(const Address& sender, const Amount& tokens_sold,
                                       const Amount& min_eth, uint64_t deadline,
                                       const Address& recipient);

    // Returns tokens sold
    Amount token_to_eth_swap_output(const Address& sender, const Amount& eth_bought,
                                    const Amount& max_tokens, uint64_t deadline);
    Amount token_to_eth_transfer_output(const Address& sender, const Amount& eth_bought,
                                        const Amount& max_tokens, uint64_t deadline,
                                        const Address& recipient);

    // =========================================================================
    // Token -> Token (routed through the registry's exchange for token_addr)
    // =========================================================================

    // Returns tokens bought
    Amount token_to_token_swap_input(const Address& sender, const Amount& tokens_sold,
                                     const Amount& min_tokens_bought, const Amount& min_eth_bought,
                                     uint64_t deadline, const Address& token_addr);
    Amount token_to_token_transfer_input(const Address& sender, const Amount& tokens_sold,
                                         const Amount& min_tokens_bought, const Amount& min_eth_bought,
                                         uint64_t deadline, const Address& recipient,
                                         const Address& token_addr);

    // Returns tokens sold
    Amount token_to_token_swap_output(const Address& sender, const Amount& tokens_bought,
                                      const Amount& max_tokens_sold, const Amount& max_eth_sold,
                                      uint64_t deadline, const Address& token_addr);
    Amount token_to_token_transfer_output(const Address& sender, const Amount& tokens_bought,
                                          const Amount& max_tokens_sold, const Amount& max_eth_sold,
                                          uint64_t deadline, const Address& recipient,
                                          const Address& token_addr);

    // =========================================================================
    // Token -> Token (explicit destination exchange, bypasses the registry)
    // =========================================================================

    Amount token_to_exchange_swap_input(const Address& sender, const Amount& tokens_sold,
                                        const Amount& min_tokens_bought, const Amount& min_eth_bought,
                                        uint64_t deadline, Exchange* exchange);
    Amount token_to_exchange_transfer_input(const Address& sender, const Amount& tokens_sold,
                                            const Amount& min_tokens_bought, const Amount& min_eth_bought,
                                            uint64_t deadline, const Address& recipient,
                                            Exchange* exchange);
    Amount token_to_exchange_swap_output(const Address& sender, const Amount& tokens_bought,
                                         const Amount& max_tokens_sold, const Amount& max_eth_sold,
                                         uint64_t deadline, Exchange* exchange);
    Amount token_to_exchange_transfer_output(const Address& sender, const Amount& tokens_bought,
                                             const Amount& max_tokens_sold, const Amount& max_eth_sold,
                                             uint64_t deadline, const Address& recipient,
                                             Exchange* exchange);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

private:
    Chain& chain_;
    ExchangeConfig config_;
    Address address_;

    // Set once by setup()
    IToken* token_{nullptr};
    IRegistry* registry_{nullptr};
    Address factory_{};

    FungibleLedger shares_;
    Amount eth_reserve_{0};
    Amount token_reserve_{0};

    // Reentrancy lock (true while an operation of this exchange is on the stack)
    bool entered_{false};

    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};

    // Runs body as one transaction: reentrancy lock, attached value, overflow
    // translation and rollback on failure. Setup, the caller and recipient
    // (when given) are checked before the attached value moves. The counter
    // bump is journaled with the rest of the operation.
    void execute(const char* op, const Call& call, const Address* recipient,
                 std::atomic<uint64_t>& counter, const std::function<void()>& body);

    void require_configured() const;
    void require_recipient(const Address& recipient) const;
    Exchange* route(const Address& token_addr) const;
    void require_route(const Exchange* exchange) const;

    // Journaled reserve update
    void set_reserves(const Amount& eth_reserve, const Amount& token_reserve);

    // Asset movements; failures throw ASSET_TRANSFER_FAILED
    void pay_eth(const Address& to, const Amount& amount);
    void push_tokens(const Address& to, const Amount& amount);
    void pull_tokens(const Address& from, const Amount& amount);

    // Shared swap bodies (run inside execute)
    Amount eth_to_token_input(const Amount& eth_sold, const Amount& min_tokens, uint64_t deadline,
                              const Address& buyer, const Address& recipient);
    Amount eth_to_token_output(const Amount& tokens_bought, const Amount& max_eth, uint64_t deadline,
                               const Address& buyer, const Address& recipient);
    Amount token_to_eth_input(const Amount& tokens_sold, const Amount& min_eth, uint64_t deadline,
                              const Address& buyer, const Address& recipient);
    Amount token_to_eth_output(const Amount& eth_bought, const Amount& max_tokens, uint64_t deadline,
                               const Address& buyer, const Address& recipient);
    Amount token_to_token_input(const Amount& tokens_sold, const Amount& min_tokens_bought,
                                const Amount& min_eth_bought, uint64_t deadline,
                                const Address& buyer, const Address& recipient, Exchange* exchange);
    Amount token_to_token_output(const Amount& tokens_bought, const Amount& max_tokens_sold,
                                 const Amount& max_eth_sold, uint64_t deadline,
                                 const Address& buyer, const Address& recipient, Exchange* exchange);
};

} // namespace amm

#endif // AMM_EXCHANGE_HPP
