#pragma once

#include "interfaces.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Per-asset run locks. The in-process registry is checked first; when a
// provider is set, its lease extends the exclusion to other processes.
// Acquisition never waits.
class AssetLocks {
public:
    explicit AssetLocks(std::shared_ptr<RunLockProvider> provider = nullptr);

    // Throws PersistenceError when the provider cannot be reached
    bool try_acquire(const std::string& asset_id);
    void release(const std::string& asset_id);
    bool is_locked(const std::string& asset_id) const;

private:
    std::shared_ptr<RunLockProvider> provider_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<RunLease>> held_;
};

class AssetLockGuard {
public:
    AssetLockGuard(AssetLocks& locks, const std::string& asset_id);
    ~AssetLockGuard();

    AssetLockGuard(const AssetLockGuard&) = delete;
    AssetLockGuard& operator=(const AssetLockGuard&) = delete;

    bool owns_lock() const { return owned_; }

private:
    AssetLocks& locks_;
    std::string asset_id_;
    bool owned_;
};
