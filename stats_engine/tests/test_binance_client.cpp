#include <catch2/catch_test_macros.hpp>
#include "../src/binance_client.hpp"
#include "../src/errors.hpp"

TEST_CASE("Exchange symbols", "[binance]") {
    REQUIRE(BinanceClient::to_exchange_symbol("BTC/USDT") == "BTCUSDT");
    REQUIRE(BinanceClient::to_exchange_symbol("ETH/USDT:USDT") == "ETHUSDT");
    REQUIRE(BinanceClient::to_exchange_symbol("SOLUSDT") == "SOLUSDT");
}

TEST_CASE("Kline parsing", "[binance]") {
    SECTION("String prices become doubles") {
        auto rows = nlohmann::json::parse(R"([
            [1704067200000, "42000.1", "42100.5", "41950.0", "42050.2", "12.5", 1704067259999],
            [1704067260000, "42050.2", "42060.0", "42000.0", "42010.0", "3.25", 1704067319999]
        ])");
        auto candles = BinanceClient::parse_klines("BTC/USDT", rows);

        REQUIRE(candles.size() == 2);
        REQUIRE(candles[0].asset_id == "BTC/USDT");
        REQUIRE(candles[0].timestamp_ms == 1704067200000LL);
        REQUIRE(candles[0].high == 42100.5);
        REQUIRE(candles[1].volume == 3.25);
    }

    SECTION("Error objects and malformed rows are fetch errors") {
        auto error = nlohmann::json::parse(R"({"code": -1121, "msg": "Invalid symbol."})");
        REQUIRE_THROWS_AS(BinanceClient::parse_klines("BTC/USDT", error), FetchError);

        auto short_row = nlohmann::json::parse(R"([[1704067200000, "1.0"]])");
        REQUIRE_THROWS_AS(BinanceClient::parse_klines("BTC/USDT", short_row), FetchError);
    }

    SECTION("Empty page is not an error") {
        REQUIRE(BinanceClient::parse_klines("BTC/USDT", nlohmann::json::array()).empty());
    }
}

TEST_CASE("Unreachable exchange", "[binance]") {
    BinanceClient client("http://127.0.0.1:1", "1m", 60000, 500, 1);
    client.set_retry_backoff(0, 0);
    REQUIRE_THROWS_AS(client.fetch_candles("BTC/USDT", 0, 60000), FetchError);
}
