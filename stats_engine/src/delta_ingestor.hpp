#pragma once

#include "interfaces.hpp"
#include <memory>
#include <string>

// Fetches the candles an asset is missing since its cursor and upserts them.
class DeltaIngestor {
public:
    DeltaIngestor(std::shared_ptr<MarketSource> source,
                  std::shared_ptr<RawStore> store,
                  int64_t interval_ms,
                  int64_t earliest_ms,
                  int batch_candles);

    // Throws FetchError (cursor keeps its last durable value) or PersistenceError.
    SyncResult sync(const std::string& asset_id, int64_t now_ms);

private:
    std::shared_ptr<MarketSource> source_;
    std::shared_ptr<RawStore> store_;
    int64_t interval_ms_;
    int64_t earliest_ms_;
    int batch_candles_;
};
