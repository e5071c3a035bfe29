// AMM Tests - shared two-pool market

#ifndef AMM_TESTS_MARKET_FIXTURE_HPP
#define AMM_TESTS_MARKET_FIXTURE_HPP

#include <amm/chain.hpp>
#include <amm/exchange.hpp>
#include <amm/registry.hpp>
#include <amm/token.hpp>

namespace amm_test {

using namespace amm;

constexpr Address ALICE = addresses::from_id(1);
constexpr Address BOB = addresses::from_id(2);
constexpr Address CAROL = addresses::from_id(3);

// 10^18 base units
inline Amount ether(uint64_t n) {
    return Amount(n) * Amount(1000000000000000000ULL);
}

// Runs fn and returns the ExchangeError code it raised (OK if none)
template <typename Fn>
ErrorCode error_of(Fn&& fn) {
    try {
        fn();
    } catch (const ExchangeError& e) {
        return e.code();
    }
    return ErrorCode::OK;
}

// Token A pool: 10 native / 20 A. Token B pool: 10 native / 5 B.
// Alice and Bob start with 100 native, 100 A and 100 B, with both
// exchanges approved for their tokens.
struct Market {
    Chain chain;
    Registry registry{chain};
    Token token_a{chain, "Token A", "TKA"};
    Token token_b{chain, "Token B", "TKB"};
    Exchange& exchange_a;
    Exchange& exchange_b;

    Market()
        : exchange_a(registry.create_exchange(token_a)),
          exchange_b(registry.create_exchange(token_b)) {
        fund(ALICE);
        fund(BOB);
    }

    void fund(const Address& who) {
        chain.mint_native(who, ether(100));
        token_a.mint(who, ether(100));
        token_b.mint(who, ether(100));
        token_a.approve(who, exchange_a.address(), ether(1000));
        token_b.approve(who, exchange_b.address(), ether(1000));
    }

    void seed() {
        exchange_a.add_liquidity(Call{ALICE, ether(10)}, 0, ether(20), deadline());
        exchange_b.add_liquidity(Call{ALICE, ether(10)}, 0, ether(5), deadline());
    }

    uint64_t deadline() const { return chain.block_number() + 10; }
};

} // namespace amm_test

#endif // AMM_TESTS_MARKET_FIXTURE_HPP
