#include "delta_ingestor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

DeltaIngestor::DeltaIngestor(std::shared_ptr<MarketSource> source,
                             std::shared_ptr<RawStore> store,
                             int64_t interval_ms,
                             int64_t earliest_ms,
                             int batch_candles)
    : source_(source)
    , store_(store)
    , interval_ms_(interval_ms)
    , earliest_ms_(earliest_ms)
    , batch_candles_(batch_candles) {}

SyncResult DeltaIngestor::sync(const std::string& asset_id, int64_t now_ms) {
    SyncResult result;
    result.asset_id = asset_id;

    auto cursor = store_->get_cursor(asset_id);
    std::optional<int64_t> last_ingested;
    if (cursor) last_ingested = cursor->last_ingested_timestamp_ms;

    // The last stored candle is fetched again so a late correction lands
    const int64_t start = last_ingested ? *last_ingested : earliest_ms_;

    // Open times below this bound belong to closed candles
    const int64_t closed_end = util::floor_div(now_ms, interval_ms_) * interval_ms_;
    if (start >= closed_end) {
        spdlog::debug("{}: raw series up to date", asset_id);
        return result;
    }

    const int64_t chunk_span = static_cast<int64_t>(batch_candles_) * interval_ms_;
    int64_t chunk_start = start;

    while (chunk_start < closed_end) {
        int64_t chunk_end = std::min(chunk_start + chunk_span, closed_end);

        auto fetched = source_->fetch_candles(asset_id, chunk_start, chunk_end);

        std::vector<Candle> batch;
        batch.reserve(fetched.size());
        for (auto& c : fetched) {
            if (c.timestamp_ms < start) continue;                      // closed and stored
            if (c.timestamp_ms + interval_ms_ > now_ms) continue;      // still open
            if (c.timestamp_ms < chunk_start || c.timestamp_ms >= chunk_end) continue;
            c.asset_id = asset_id;
            batch.push_back(std::move(c));
        }

        std::sort(batch.begin(), batch.end(), [](const Candle& a, const Candle& b) {
            return a.timestamp_ms < b.timestamp_ms;
        });
        batch.erase(std::unique(batch.begin(), batch.end(), [](const Candle& a, const Candle& b) {
            return a.timestamp_ms == b.timestamp_ms;
        }), batch.end());

        if (!batch.empty()) {
            store_->upsert_candles(asset_id, batch);

            int64_t newest = batch.back().timestamp_ms;
            if (!last_ingested || newest > *last_ingested) {
                SyncCursor advanced;
                advanced.last_ingested_timestamp_ms = newest;
                store_->set_cursor(asset_id, advanced);
            }

            for (const auto& c : batch) {
                if (last_ingested && c.timestamp_ms <= *last_ingested) continue;
                if (result.candles_added == 0) result.range_start_ms = c.timestamp_ms;
                result.range_end_ms = c.timestamp_ms;
                result.candles_added++;
            }
            if (!last_ingested || newest > *last_ingested) last_ingested = newest;
        }

        chunk_start = chunk_end;
    }

    if (result.candles_added > 0) {
        spdlog::info("{}: ingested {} candles [{} .. {}]", asset_id, result.candles_added,
                     util::iso8601_from_ms(result.range_start_ms),
                     util::iso8601_from_ms(result.range_end_ms));
    } else {
        spdlog::debug("{}: no new candles", asset_id);
    }
    return result;
}
