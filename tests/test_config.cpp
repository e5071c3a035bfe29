// AMM - Configuration, Logging and JSON Tests

#include <catch2/catch_test_macros.hpp>
#include <amm/config.hpp>
#include <amm/json.hpp>
#include <amm/logging.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "market_fixture.hpp"

using namespace amm;
using json = nlohmann::json;

TEST_CASE("Config defaults", "[config]") {
    Config config;

    REQUIRE(config.log.level == "info");
    REQUIRE(config.exchange.min_initial_liquidity == 1000000000);
    REQUIRE(config.exchange.share_name == "AMM Pool Share");
    REQUIRE(config.exchange.share_symbol == "AMM-LP");
    REQUIRE(config.exchange.share_decimals == 18);
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("Overrides and ignores unknown keys") {
        auto config = Config::from_json(R"({
            "log": {"level": "debug", "pattern": "%v"},
            "exchange": {
                "min_initial_liquidity": "115792089237316195423570985008687907853269984665640564039457584007913129639935",
                "share_name": "Pool",
                "share_symbol": "PL",
                "share_decimals": 6
            },
            "unused": true
        })");

        REQUIRE(config.log.level == "debug");
        REQUIRE(config.log.pattern == "%v");
        REQUIRE(config.exchange.min_initial_liquidity == std::numeric_limits<Amount>::max());
        REQUIRE(config.exchange.share_name == "Pool");
        REQUIRE(config.exchange.share_symbol == "PL");
        REQUIRE(config.exchange.share_decimals == 6);
    }

    SECTION("Partial documents keep defaults") {
        auto config = Config::from_json(R"({"exchange": {"min_initial_liquidity": 5}})");
        REQUIRE(config.exchange.min_initial_liquidity == 5);
        REQUIRE(config.log.level == "info");
        REQUIRE(config.exchange.share_symbol == "AMM-LP");
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(Config::from_json("{not json"), std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json("[]"), std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"log": {"level": 3}})"), std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"exchange": {"min_initial_liquidity": "1e9"}})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"exchange": {"min_initial_liquidity": -1}})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"exchange": {"share_decimals": 256}})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"exchange": {"share_decimals": -1}})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"exchange": {"share_decimals": 1.5}})"),
                          std::runtime_error);
    }

    SECTION("Decimals at the upper limit") {
        auto config = Config::from_json(R"({"exchange": {"share_decimals": 255}})");
        REQUIRE(config.exchange.share_decimals == 255);
    }
}

TEST_CASE("Config from file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "amm_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"log": {"level": "warn"}, "exchange": {"share_symbol": "F-LP"}})";
    }

    auto config = Config::from_file(path.string());
    REQUIRE(config.log.level == "warn");
    REQUIRE(config.exchange.share_symbol == "F-LP");
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(Config::from_file(path.string()), std::runtime_error);
}

TEST_CASE("Config builder", "[config]") {
    Config config;
    config.set_log_level("trace")
          .set_min_initial_liquidity(42)
          .set_share_metadata("Custom", "CST", 8);

    REQUIRE(config.log.level == "trace");
    REQUIRE(config.exchange.min_initial_liquidity == 42);
    REQUIRE(config.exchange.share_name == "Custom");
    REQUIRE(config.exchange.share_symbol == "CST");
    REQUIRE(config.exchange.share_decimals == 8);
}

TEST_CASE("Logging setup", "[config]") {
    LogConfig log;
    log.level = "debug";
    REQUIRE_NOTHROW(init_logging(log));

    log.level = "loud";
    REQUIRE_THROWS_AS(init_logging(log), std::runtime_error);
}

TEST_CASE("Address and amount encoding", "[json]") {
    SECTION("Addresses") {
        const Address addr = addresses::from_id(0xBEEF);
        REQUIRE(addresses::to_hex(addr) == "0x000000000000000000000000000000000000beef");
        REQUIRE(parse_address("0x000000000000000000000000000000000000BEEF") == addr);

        REQUIRE_THROWS_AS(parse_address("beef"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_address("0x00000000000000000000000000000000000000zz"),
                          std::invalid_argument);
    }

    SECTION("Amounts") {
        REQUIRE(parse_amount(json(42)) == 42);
        REQUIRE(parse_amount(json("1000000000000000000000")) == Amount("1000000000000000000000"));
        REQUIRE(format_amount(Amount("1000000000000000000000")) == "1000000000000000000000");

        REQUIRE_THROWS_AS(parse_amount(json("-1")), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_amount(json("")), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_amount(json(1.5)), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_amount(json(-3)), std::invalid_argument);
    }
}

TEST_CASE("Event log encoding", "[json]") {
    amm_test::Market m;
    m.seed();
    m.exchange_a.eth_to_token_swap_input(Call{amm_test::BOB, amm_test::ether(1)}, 1, m.deadline());

    auto entries = m.chain.events();
    json encoded = events_to_json(entries);
    REQUIRE(encoded.size() == entries.size());

    const json& last = encoded.back();
    REQUIRE(last["block"] == 1);
    REQUIRE(last["emitter"] == addresses::to_hex(m.exchange_a.address()));
    REQUIRE(last["event"] == "TokenPurchase");
    REQUIRE(last["args"]["buyer"] == addresses::to_hex(amm_test::BOB));
    REQUIRE(last["args"]["eth_sold"] == "1000000000000000000");
    REQUIRE(last["args"]["tokens_bought"] == "1813221787760298263");

    REQUIRE(encoded[0]["event"] == "NewExchange");
    REQUIRE(event_name(entries[0].data) == std::string("NewExchange"));
}
