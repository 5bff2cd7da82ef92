#pragma once

#include "interfaces.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// USD-M futures klines (/fapi/v1/klines)
class BinanceClient : public MarketSource {
public:
    BinanceClient(const std::string& base_url, const std::string& interval,
                  int64_t interval_ms, int timeout_ms = 10000, int max_retries = 3);

    void set_retry_backoff(int min_ms, int max_ms);

    std::vector<Candle> fetch_candles(const std::string& asset_id,
                                      int64_t start_ms, int64_t end_ms) override;

    // "BTC/USDT" or "BTC/USDT:USDT" -> "BTCUSDT"
    static std::string to_exchange_symbol(const std::string& asset_id);
    static std::vector<Candle> parse_klines(const std::string& asset_id,
                                            const nlohmann::json& rows);

    static constexpr int kPageLimit = 1000;

private:
    std::string base_url_;
    std::string interval_;
    int64_t interval_ms_;
    int timeout_ms_;
    int max_retries_;
    int backoff_min_ms_ = 500;
    int backoff_max_ms_ = 5000;

    nlohmann::json get_json(const std::string& url);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
