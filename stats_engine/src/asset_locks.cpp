#include "asset_locks.hpp"
#include <spdlog/spdlog.h>

AssetLocks::AssetLocks(std::shared_ptr<RunLockProvider> provider)
    : provider_(provider) {}

bool AssetLocks::try_acquire(const std::string& asset_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!held_.emplace(asset_id, nullptr).second) return false;
    }
    if (!provider_) return true;

    std::unique_ptr<RunLease> lease;
    try {
        lease = provider_->try_lock(asset_id);
    } catch (const std::exception&) {
        release(asset_id);
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!lease) {
        spdlog::debug("{}: run lock held by another process", asset_id);
        held_.erase(asset_id);
        return false;
    }
    held_[asset_id] = std::move(lease);
    return true;
}

void AssetLocks::release(const std::string& asset_id) {
    std::unique_ptr<RunLease> lease;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_.find(asset_id);
        if (it == held_.end()) return;
        lease = std::move(it->second);
        held_.erase(it);
    }
    // lease released here, outside the registry mutex
}

bool AssetLocks::is_locked(const std::string& asset_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(asset_id) > 0;
}

AssetLockGuard::AssetLockGuard(AssetLocks& locks, const std::string& asset_id)
    : locks_(locks), asset_id_(asset_id), owned_(locks.try_acquire(asset_id)) {}

AssetLockGuard::~AssetLockGuard() {
    if (owned_) locks_.release(asset_id_);
}
