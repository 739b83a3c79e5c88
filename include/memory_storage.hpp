#pragma once

#include "storage.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace asn2ip {

// Process-lifetime cache. Expiry is evaluated on get(); cleanup() is an
// optional sweep for callers that want memory back sooner.
class MemoryStorage : public Storage {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit MemoryStorage(std::chrono::seconds ttl, Clock clock = {});

    std::optional<CacheRecord> get(const std::string& asn) override;
    void set(CacheRecord record) override;

    // Drop every expired entry; returns how many were removed
    size_t cleanup();

    void clear();

    struct Stats {
        size_t hits;
        size_t misses;
        size_t expired;
        size_t entries;
    };
    Stats get_stats() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    std::unordered_map<std::string, CacheRecord> records_;
    mutable std::mutex mutex_;
    std::chrono::seconds ttl_;
    Clock clock_;

    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t expired_ = 0;

    bool is_expired(const CacheRecord& record, std::chrono::steady_clock::time_point now) const;
};

} // namespace asn2ip
