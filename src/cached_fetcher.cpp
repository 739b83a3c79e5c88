#include "cached_fetcher.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "stats.hpp"
#include <map>

namespace asn2ip {

bool parse_refresh_policy(const std::string& text, RefreshPolicy& out) {
    if (text == "overwrite") {
        out = RefreshPolicy::Overwrite;
        return true;
    }
    if (text == "merge") {
        out = RefreshPolicy::MergeVersions;
        return true;
    }
    return false;
}

const char* refresh_policy_name(RefreshPolicy policy) {
    return policy == RefreshPolicy::Overwrite ? "overwrite" : "merge";
}

CachedFetcher::CachedFetcher(std::shared_ptr<Fetcher> upstream,
                             std::shared_ptr<Storage> cache,
                             RefreshPolicy policy,
                             Statistics* stats)
    : upstream_(std::move(upstream)),
      cache_(std::move(cache)),
      policy_(policy),
      stats_(stats) {
}

FetchResult CachedFetcher::fetch(bool ipv4, bool ipv6, const std::vector<std::string>& asns) {
    FetchResult result;
    if (asns.empty()) {
        return result;
    }

    std::vector<std::string> uncached;
    // Incomplete records seen during lookup, for RefreshPolicy::MergeVersions
    std::map<std::string, CacheRecord> incomplete;

    for (const auto& asn : asns) {
        std::optional<CacheRecord> record;
        try {
            record = cache_->get(asn);
        } catch (const StorageError& e) {
            throw StorageError("failed to fetch asn " + asn + " from cache: " + e.what());
        }

        if (!record || (ipv4 && !record->fetched_ipv4) || (ipv6 && !record->fetched_ipv6)) {
            if (stats_) stats_->record_cache_miss();
            if (record) {
                log_debug("cached asn lacks requested version", {{"asn", asn}});
                incomplete[asn] = std::move(*record);
            }
            uncached.push_back(asn);
            continue;
        }

        if (stats_) stats_->record_cache_hit();
        ASNetworks& networks = result[asn];
        if (ipv4) networks.ipv4 = record->ipv4;
        if (ipv6) networks.ipv6 = record->ipv6;
    }

    if (uncached.empty()) {
        return result;
    }

    FetchResult fetched = upstream_->fetch(ipv4, ipv6, uncached);

    for (auto& [asn, networks] : fetched) {
        CacheRecord record;
        record.asn = asn;
        record.ipv4 = networks.ipv4;
        record.ipv6 = networks.ipv6;
        record.fetched_ipv4 = ipv4;
        record.fetched_ipv6 = ipv6;

        if (policy_ == RefreshPolicy::MergeVersions) {
            auto prev = incomplete.find(asn);
            if (prev != incomplete.end()) {
                if (!ipv4 && prev->second.fetched_ipv4) {
                    record.ipv4 = prev->second.ipv4;
                    record.fetched_ipv4 = true;
                }
                if (!ipv6 && prev->second.fetched_ipv6) {
                    record.ipv6 = prev->second.ipv6;
                    record.fetched_ipv6 = true;
                }
            }
        }

        try {
            cache_->set(std::move(record));
        } catch (const StorageError& e) {
            throw StorageError("failed to put " + asn + " on cache: " + e.what());
        }
        result[asn] = std::move(networks);
    }

    return result;
}

} // namespace asn2ip
