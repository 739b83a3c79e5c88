#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>

namespace asn2ip {

class Statistics {
public:
    Statistics();

    // Fetch tracking (one call of Fetcher::fetch that reached the network)
    void record_fetch(std::chrono::milliseconds latency, size_t asn_count);
    void record_error(const std::string& error_type);

    // Whois protocol tracking
    void record_session();
    void record_query(size_t blocks_received);

    // Cache tracking
    void record_cache_hit();
    void record_cache_miss();

    struct Stats {
        uint64_t total_fetches;
        uint64_t total_asns_fetched;
        uint64_t total_errors;

        uint64_t sessions_opened;
        uint64_t queries_sent;
        uint64_t blocks_received;

        uint64_t cache_hits;
        uint64_t cache_misses;

        double avg_latency_ms;
        double min_latency_ms;
        double max_latency_ms;

        std::map<std::string, uint64_t> error_counts;
    };

    Stats get_stats() const;
    void reset();

    void print(std::ostream& out) const;

private:
    std::atomic<uint64_t> total_fetches_{0};
    std::atomic<uint64_t> total_asns_fetched_{0};
    std::atomic<uint64_t> total_errors_{0};

    std::atomic<uint64_t> sessions_opened_{0};
    std::atomic<uint64_t> queries_sent_{0};
    std::atomic<uint64_t> blocks_received_{0};

    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> cache_misses_{0};

    std::atomic<uint64_t> total_latency_ms_{0};
    std::atomic<uint64_t> min_latency_ms_{UINT64_MAX};
    std::atomic<uint64_t> max_latency_ms_{0};

    mutable std::mutex error_mutex_;
    std::map<std::string, uint64_t> error_counts_;
};

} // namespace asn2ip
