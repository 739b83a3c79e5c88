#pragma once

#include "fetcher.hpp"
#include "storage.hpp"
#include <memory>

namespace asn2ip {

class Statistics;

// How a refreshed record treats the version that was not requested this time
enum class RefreshPolicy {
    Overwrite,     // store only what this call fetched; the other version is forgotten
    MergeVersions  // carry over the other version from the record seen at lookup
};

bool parse_refresh_policy(const std::string& text, RefreshPolicy& out);
const char* refresh_policy_name(RefreshPolicy policy);

// Read-through cache in front of another Fetcher. Cached AS numbers that
// cover every requested version are served from storage; the rest go to the
// upstream fetcher in a single batch and are written back.
class CachedFetcher : public Fetcher {
public:
    CachedFetcher(std::shared_ptr<Fetcher> upstream,
                  std::shared_ptr<Storage> cache,
                  RefreshPolicy policy = RefreshPolicy::Overwrite,
                  Statistics* stats = nullptr);

    FetchResult fetch(bool ipv4, bool ipv6, const std::vector<std::string>& asns) override;

private:
    std::shared_ptr<Fetcher> upstream_;
    std::shared_ptr<Storage> cache_;
    RefreshPolicy policy_;
    Statistics* stats_;
};

} // namespace asn2ip
