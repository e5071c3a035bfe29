// AMM - Chain Tests

#include <catch2/catch_test_macros.hpp>
#include <amm/chain.hpp>

#include <stdexcept>
#include <vector>

#include "market_fixture.hpp"

using namespace amm;
using amm_test::ALICE;
using amm_test::BOB;
using amm_test::error_of;

namespace {

struct Recorder : EventListener {
    std::vector<LogEntry> seen;
    void on_event(const LogEntry& entry) override { seen.push_back(entry); }
};

// Emits one follow-up event, in its own transaction, for the first event it sees
struct Echo : EventListener {
    Chain& chain;
    std::vector<Amount> seen;
    explicit Echo(Chain& c) : chain(c) {}
    void on_event(const LogEntry& entry) override {
        const Amount value = std::get<Approval>(entry.data).value;
        seen.push_back(value);
        if (seen.size() == 1) {
            chain.transact([&] { chain.emit(ALICE, Approval{ALICE, BOB, value + 1}); });
        }
    }
};

} // namespace

TEST_CASE("Logical clock and identities", "[chain]") {
    Chain chain;

    REQUIRE(chain.block_number() == 1);
    chain.advance_blocks();
    chain.advance_blocks(5);
    REQUIRE(chain.block_number() == 7);

    Address a = chain.new_address();
    Address b = chain.new_address();
    REQUIRE(a != b);
    REQUIRE_FALSE(addresses::is_zero(a));
    REQUIRE(a != ALICE);
}

TEST_CASE("Native transfers", "[chain]") {
    Chain chain;
    chain.mint_native(ALICE, 100);

    SECTION("Moves balance") {
        chain.transfer_native(ALICE, BOB, 40);
        REQUIRE(chain.balance_of(ALICE) == 60);
        REQUIRE(chain.balance_of(BOB) == 40);
    }

    SECTION("Insufficient balance") {
        REQUIRE(error_of([&] { chain.transfer_native(ALICE, BOB, 101); }) ==
                ErrorCode::ASSET_TRANSFER_FAILED);
        REQUIRE(chain.balance_of(ALICE) == 100);
    }

    SECTION("Rejecting recipient") {
        chain.set_rejects_native(BOB, true);
        REQUIRE(error_of([&] { chain.transfer_native(ALICE, BOB, 1); }) ==
                ErrorCode::ASSET_TRANSFER_FAILED);

        // Zero transfers are no-ops
        chain.transfer_native(ALICE, BOB, 0);

        chain.set_rejects_native(BOB, false);
        chain.transfer_native(ALICE, BOB, 1);
        REQUIRE(chain.balance_of(BOB) == 1);
    }

    SECTION("Self transfer does not create currency") {
        chain.transfer_native(ALICE, ALICE, 40);
        REQUIRE(chain.balance_of(ALICE) == 100);

        chain.transact([&] { chain.transfer_native(ALICE, ALICE, 100); });
        REQUIRE(chain.balance_of(ALICE) == 100);

        REQUIRE(error_of([&] { chain.transfer_native(ALICE, ALICE, 101); }) ==
                ErrorCode::ASSET_TRANSFER_FAILED);
        REQUIRE(chain.balance_of(ALICE) == 100);
    }
}

TEST_CASE("Transactions roll back on failure", "[chain]") {
    Chain chain;
    chain.mint_native(ALICE, 100);
    const size_t events_before = chain.event_count();

    SECTION("Failed transaction leaves no trace") {
        REQUIRE_THROWS_AS(chain.transact([&] {
            chain.transfer_native(ALICE, BOB, 30);
            chain.emit(ALICE, Transfer{ALICE, BOB, 30});
            throw std::runtime_error("boom");
        }), std::runtime_error);

        REQUIRE(chain.balance_of(ALICE) == 100);
        REQUIRE(chain.balance_of(BOB) == 0);
        REQUIRE(chain.event_count() == events_before);
        REQUIRE_FALSE(chain.in_transaction());
        REQUIRE(chain.get_stats().reverted == 1);
    }

    SECTION("Caught inner failure only undoes the inner part") {
        chain.transact([&] {
            chain.transfer_native(ALICE, BOB, 10);
            try {
                chain.transact([&] {
                    chain.transfer_native(ALICE, BOB, 20);
                    throw std::runtime_error("inner");
                });
            } catch (const std::runtime_error&) {
                REQUIRE(chain.balance_of(BOB) == 10);
            }
        });

        REQUIRE(chain.balance_of(ALICE) == 90);
        REQUIRE(chain.balance_of(BOB) == 10);
        REQUIRE(chain.get_stats().committed == 1);
    }
}

TEST_CASE("Listeners see committed events only", "[chain]") {
    Chain chain;
    Recorder recorder;
    chain.subscribe(&recorder);

    chain.transact([&] {
        chain.emit(ALICE, Approval{ALICE, BOB, 5});
        REQUIRE(recorder.seen.empty());
    });
    REQUIRE(recorder.seen.size() == 1);
    REQUIRE(recorder.seen[0].block == 1);
    REQUIRE(std::get<Approval>(recorder.seen[0].data).value == 5);

    REQUIRE_THROWS(chain.transact([&] {
        chain.emit(ALICE, Approval{ALICE, BOB, 6});
        throw std::runtime_error("revert");
    }));
    REQUIRE(recorder.seen.size() == 1);

    chain.unsubscribe(&recorder);
    chain.emit(ALICE, Approval{ALICE, BOB, 7});
    REQUIRE(recorder.seen.size() == 1);

    auto tail = chain.events_since(1);
    REQUIRE(tail.size() == 1);
    REQUIRE(std::get<Approval>(tail[0].data).value == 7);
    REQUIRE(chain.events_since(10).empty());
}

TEST_CASE("Events emitted by a listener are delivered once", "[chain]") {
    Chain chain;
    Echo echo(chain);
    chain.subscribe(&echo);

    chain.transact([&] { chain.emit(ALICE, Approval{ALICE, BOB, 1}); });

    REQUIRE(chain.event_count() == 2);
    REQUIRE(echo.seen.size() == 2);
    REQUIRE(echo.seen[0] == 1);
    REQUIRE(echo.seen[1] == 2);
    REQUIRE(chain.get_stats().committed == 2);
    REQUIRE_FALSE(chain.in_transaction());
}
