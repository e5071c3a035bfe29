// AMM - Token to Token Routing Tests

#include <catch2/catch_test_macros.hpp>

#include "market_fixture.hpp"

using namespace amm;
using namespace amm_test;

TEST_CASE("Token to token, exact input", "[routing]") {
    Market m;
    m.seed();
    const size_t before = m.chain.event_count();
    const Amount eth_bought("906610893880149131");
    const Amount tokens_bought("414480966530839898");

    SECTION("Leg one output feeds leg two") {
        Amount leg1 = m.exchange_a.get_token_to_eth_input_price(ether(2));
        Amount leg2 = m.exchange_b.get_eth_to_token_input_price(leg1);
        REQUIRE(leg1 == eth_bought);

        Amount bought = m.exchange_a.token_to_token_swap_input(BOB, ether(2), 1, 1, m.deadline(),
                                                               m.token_b.address());
        REQUIRE(bought == leg2);
        REQUIRE(bought == tokens_bought);

        REQUIRE(m.token_a.balance_of(BOB) == ether(98));
        REQUIRE(m.token_b.balance_of(BOB) == ether(100) + tokens_bought);
        REQUIRE(m.chain.balance_of(BOB) == ether(100));

        REQUIRE(m.exchange_a.eth_reserve() == ether(10) - eth_bought);
        REQUIRE(m.exchange_a.token_reserve() == ether(22));
        REQUIRE(m.exchange_b.eth_reserve() == ether(10) + eth_bought);
        REQUIRE(m.exchange_b.token_reserve() == ether(5) - tokens_bought);
        REQUIRE(m.chain.balance_of(m.exchange_a.address()) == ether(10) - eth_bought);
        REQUIRE(m.chain.balance_of(m.exchange_b.address()) == ether(10) + eth_bought);

        auto events = m.chain.events_since(before);
        REQUIRE(events.size() == 4);

        REQUIRE(events[1].emitter == m.exchange_a.address());
        const auto& sold = std::get<EthPurchase>(events[1].data);
        REQUIRE(sold.buyer == BOB);
        REQUIRE(sold.tokens_sold == ether(2));
        REQUIRE(sold.eth_bought == eth_bought);

        REQUIRE(events[3].emitter == m.exchange_b.address());
        const auto& bought_event = std::get<TokenPurchase>(events[3].data);
        REQUIRE(bought_event.buyer == m.exchange_a.address());
        REQUIRE(bought_event.eth_sold == eth_bought);
        REQUIRE(bought_event.tokens_bought == tokens_bought);
    }

    SECTION("Transfer variant pays the recipient") {
        m.exchange_a.token_to_token_transfer_input(BOB, ether(2), 1, 1, m.deadline(), CAROL,
                                                   m.token_b.address());
        REQUIRE(m.token_b.balance_of(CAROL) == tokens_bought);
        REQUIRE(m.token_b.balance_of(BOB) == ether(100));
    }

    SECTION("Second leg minimum rolls back the first leg") {
        REQUIRE(error_of([&] {
            m.exchange_a.token_to_token_swap_input(BOB, ether(2), tokens_bought + 1, 1, m.deadline(),
                                                   m.token_b.address());
        }) == ErrorCode::SLIPPAGE_EXCEEDED);

        REQUIRE(m.token_a.balance_of(BOB) == ether(100));
        REQUIRE(m.token_b.balance_of(BOB) == ether(100));
        REQUIRE(m.exchange_a.eth_reserve() == ether(10));
        REQUIRE(m.exchange_a.token_reserve() == ether(20));
        REQUIRE(m.exchange_b.eth_reserve() == ether(10));
        REQUIRE(m.exchange_b.token_reserve() == ether(5));
        REQUIRE(m.chain.balance_of(m.exchange_a.address()) == ether(10));
        REQUIRE(m.chain.event_count() == before);
    }

    SECTION("First leg minimum") {
        REQUIRE(error_of([&] {
            m.exchange_a.token_to_token_swap_input(BOB, ether(2), 1, eth_bought + 1, m.deadline(),
                                                   m.token_b.address());
        }) == ErrorCode::SLIPPAGE_EXCEEDED);
        REQUIRE(error_of([&] {
            m.exchange_a.token_to_token_swap_input(BOB, ether(2), 1, 0, m.deadline(),
                                                   m.token_b.address());
        }) == ErrorCode::INVALID_PARAMETERS);
    }

    SECTION("Second leg rejects its own address as recipient") {
        REQUIRE(error_of([&] {
            m.exchange_a.token_to_token_transfer_input(BOB, ether(2), 1, 1, m.deadline(),
                                                       m.exchange_b.address(), m.token_b.address());
        }) == ErrorCode::INVALID_RECIPIENT);
        REQUIRE(m.exchange_a.token_reserve() == ether(20));
    }
}

TEST_CASE("Token to token, exact output", "[routing]") {
    Market m;
    m.seed();
    const Amount eth_sold("2507522567703109328");
    const Amount tokens_sold("6713581171895875042");

    SECTION("Buys exactly the requested amount") {
        Amount sold = m.exchange_a.token_to_token_swap_output(BOB, ether(1), ether(10), ether(5),
                                                              m.deadline(), m.token_b.address());
        REQUIRE(sold == tokens_sold);
        REQUIRE(m.token_a.balance_of(BOB) == ether(100) - tokens_sold);
        REQUIRE(m.token_b.balance_of(BOB) == ether(101));
        REQUIRE(m.exchange_a.eth_reserve() == ether(10) - eth_sold);
        REQUIRE(m.exchange_a.token_reserve() == ether(20) + tokens_sold);
        REQUIRE(m.exchange_b.eth_reserve() == ether(10) + eth_sold);
        REQUIRE(m.exchange_b.token_reserve() == ether(4));
    }

    SECTION("Transfer variant") {
        m.exchange_a.token_to_token_transfer_output(BOB, ether(1), ether(10), ether(5), m.deadline(),
                                                    CAROL, m.token_b.address());
        REQUIRE(m.token_b.balance_of(CAROL) == ether(1));
    }

    SECTION("Bounds") {
        REQUIRE(error_of([&] {
            m.exchange_a.token_to_token_swap_output(BOB, ether(1), tokens_sold - 1, ether(5),
                                                    m.deadline(), m.token_b.address());
        }) == ErrorCode::SLIPPAGE_EXCEEDED);
        REQUIRE(error_of([&] {
            m.exchange_a.token_to_token_swap_output(BOB, ether(1), ether(10), eth_sold - 1,
                                                    m.deadline(), m.token_b.address());
        }) == ErrorCode::SLIPPAGE_EXCEEDED);
        REQUIRE(m.token_a.balance_of(BOB) == ether(100));
    }
}

TEST_CASE("Route resolution", "[routing]") {
    Market m;
    m.seed();

    SECTION("Token without an exchange") {
        Token token_c(m.chain, "Token C", "TKC");
        REQUIRE(error_of([&] {
            m.exchange_a.token_to_token_swap_input(BOB, ether(2), 1, 1, m.deadline(), token_c.address());
        }) == ErrorCode::INVALID_EXCHANGE);
    }

    SECTION("Routing back into the same exchange") {
        REQUIRE(error_of([&] {
            m.exchange_a.token_to_token_swap_input(BOB, ether(2), 1, 1, m.deadline(), m.token_a.address());
        }) == ErrorCode::INVALID_EXCHANGE);
    }

    SECTION("Explicit destination exchange") {
        Amount bought = m.exchange_a.token_to_exchange_swap_input(BOB, ether(2), 1, 1, m.deadline(),
                                                                  &m.exchange_b);
        REQUIRE(bought == Amount("414480966530839898"));

        Amount sold = m.exchange_a.token_to_exchange_transfer_output(BOB, ether(1), ether(50), ether(5),
                                                                     m.deadline(), CAROL, &m.exchange_b);
        REQUIRE(sold > 0);
        REQUIRE(m.token_b.balance_of(CAROL) == ether(1));

        REQUIRE(error_of([&] {
            m.exchange_a.token_to_exchange_swap_input(BOB, ether(2), 1, 1, m.deadline(), nullptr);
        }) == ErrorCode::INVALID_EXCHANGE);
    }

    SECTION("Exchange created outside a registry cannot route by token") {
        Token token_c(m.chain, "Token C", "TKC");
        Exchange solo(m.chain);
        solo.setup(ALICE, token_c);
        REQUIRE(error_of([&] {
            solo.token_to_token_swap_input(BOB, ether(1), 1, 1, m.deadline(), m.token_b.address());
        }) == ErrorCode::INVALID_EXCHANGE);
    }
}
