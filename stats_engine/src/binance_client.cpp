#include "binance_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <thread>
#include <chrono>

BinanceClient::BinanceClient(const std::string& base_url, const std::string& interval,
                             int64_t interval_ms, int timeout_ms, int max_retries)
    : base_url_(base_url)
    , interval_(interval)
    , interval_ms_(interval_ms)
    , timeout_ms_(timeout_ms)
    , max_retries_(max_retries) {}

void BinanceClient::set_retry_backoff(int min_ms, int max_ms) {
    backoff_min_ms_ = min_ms;
    backoff_max_ms_ = max_ms;
}

size_t BinanceClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string BinanceClient::to_exchange_symbol(const std::string& asset_id) {
    std::string symbol = asset_id.substr(0, asset_id.find(':'));
    std::string out;
    for (char c : symbol) {
        if (c != '/') out += c;
    }
    return out;
}

std::vector<Candle> BinanceClient::parse_klines(const std::string& asset_id,
                                                const nlohmann::json& rows) {
    if (!rows.is_array()) {
        throw FetchError("Unexpected klines payload for " + asset_id);
    }

    std::vector<Candle> candles;
    candles.reserve(rows.size());

    try {
        for (const auto& row : rows) {
            // [open_time, "open", "high", "low", "close", "volume", close_time, ...]
            Candle c;
            c.asset_id = asset_id;
            c.timestamp_ms = row.at(0).get<int64_t>();
            c.open = std::stod(row.at(1).get<std::string>());
            c.high = std::stod(row.at(2).get<std::string>());
            c.low = std::stod(row.at(3).get<std::string>());
            c.close = std::stod(row.at(4).get<std::string>());
            c.volume = std::stod(row.at(5).get<std::string>());
            candles.push_back(c);
        }
    } catch (const std::exception& e) {
        throw FetchError("Malformed kline for " + asset_id + ": " + e.what());
    }
    return candles;
}

nlohmann::json BinanceClient::get_json(const std::string& url) {
    for (int attempt = 0; attempt <= max_retries_; ++attempt) {
        if (attempt > 0) {
            int delay = util::random_jitter(backoff_min_ms_ * attempt, backoff_max_ms_);
            spdlog::debug("Retrying {} in {}ms (attempt {})", url, delay, attempt + 1);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }

        // One handle per request: the client is shared by the asset workers
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                                 curl_easy_cleanup);
        if (!curl) {
            throw FetchError("Failed to initialize CURL");
        }

        std::string response_string;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            spdlog::warn("Binance request failed: {}", curl_easy_strerror(res));
            continue;
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        if (status == 429 || status == 418 || status >= 500) {
            spdlog::warn("Binance returned HTTP {}, backing off", status);
            continue;
        }
        if (status != 200) {
            throw FetchError("Binance returned HTTP " + std::to_string(status) + ": " +
                             response_string.substr(0, 200));
        }

        try {
            return nlohmann::json::parse(response_string);
        } catch (const std::exception& e) {
            throw FetchError(std::string("Failed to parse Binance response: ") + e.what());
        }
    }

    throw FetchError("Binance request failed after " + std::to_string(max_retries_ + 1) +
                     " attempts: " + url);
}

std::vector<Candle> BinanceClient::fetch_candles(const std::string& asset_id,
                                                 int64_t start_ms, int64_t end_ms) {
    std::vector<Candle> out;
    const std::string symbol = to_exchange_symbol(asset_id);
    int64_t cursor = start_ms;

    while (cursor < end_ms) {
        // endTime is inclusive on the exchange side
        std::string url = base_url_ + "/fapi/v1/klines?symbol=" + symbol +
                          "&interval=" + interval_ +
                          "&startTime=" + std::to_string(cursor) +
                          "&endTime=" + std::to_string(end_ms - 1) +
                          "&limit=" + std::to_string(kPageLimit);

        auto page = parse_klines(asset_id, get_json(url));
        if (page.empty()) break;

        for (auto& c : page) {
            if (c.timestamp_ms >= cursor && c.timestamp_ms < end_ms) {
                out.push_back(std::move(c));
            }
        }

        int64_t next = page.back().timestamp_ms + interval_ms_;
        if (next <= cursor || static_cast<int>(page.size()) < kPageLimit) break;
        cursor = next;
    }

    spdlog::debug("Fetched {} {} candles for {}", out.size(), interval_, asset_id);
    return out;
}
