#include "memory_storage.hpp"
#include "logger.hpp"

namespace asn2ip {

MemoryStorage::MemoryStorage(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

// A record is still valid at exactly inserted_at + ttl
bool MemoryStorage::is_expired(const CacheRecord& record,
                               std::chrono::steady_clock::time_point now) const {
    return now - record.inserted_at > ttl_;
}

std::optional<CacheRecord> MemoryStorage::get(const std::string& asn) {
    log_debug("trying to fetch asn from cache", {{"asn", asn}});

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(asn);
    if (it == records_.end()) {
        misses_++;
        log_debug("cache missed for asn", {{"asn", asn}});
        return std::nullopt;
    }

    if (is_expired(it->second, clock_())) {
        misses_++;
        expired_++;
        log_info("ttl expired for asn", {{"asn", asn}});
        records_.erase(it);
        return std::nullopt;
    }

    hits_++;
    return it->second;
}

void MemoryStorage::set(CacheRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    record.inserted_at = clock_();
    std::string key = record.asn;
    records_[key] = std::move(record);
}

size_t MemoryStorage::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = clock_();
    size_t removed = 0;

    for (auto it = records_.begin(); it != records_.end(); ) {
        if (is_expired(it->second, now)) {
            it = records_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    expired_ += removed;
    return removed;
}

void MemoryStorage::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

MemoryStorage::Stats MemoryStorage::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{hits_, misses_, expired_, records_.size()};
}

} // namespace asn2ip
