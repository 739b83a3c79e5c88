#pragma once

#include "network_block.hpp"
#include "transport.hpp"
#include <string>
#include <vector>

namespace asn2ip {

class Statistics;

// Resolves AS numbers to the network blocks they announce.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Every requested AS number appears in the result, with an empty vector
    // for a version that was not requested. Failures throw asn2ip::Error.
    virtual FetchResult fetch(bool ipv4, bool ipv6, const std::vector<std::string>& asns) = 0;
};

// What a batch does when the server answers "D" for one of its AS numbers
enum class BatchPolicy {
    FailFast,     // abort the whole batch, discard everything fetched so far
    SkipNotFound  // leave that AS out of the result and keep going
};

bool parse_batch_policy(const std::string& text, BatchPolicy& out);
const char* batch_policy_name(BatchPolicy policy);

struct FetcherOptions {
    std::string host = "whois.radb.net";
    int port = 43;
    TransportOptions transport;
    BatchPolicy batch_policy = BatchPolicy::FailFast;
    Statistics* stats = nullptr;  // optional, not owned
};

// Plain fetcher: one fresh whois session per fetch() call, nothing cached.
class WhoisFetcher : public Fetcher {
public:
    explicit WhoisFetcher(FetcherOptions options,
                          TransportFactory factory = tcp_transport_factory());

    FetchResult fetch(bool ipv4, bool ipv6, const std::vector<std::string>& asns) override;

    const FetcherOptions& options() const { return options_; }

private:
    FetcherOptions options_;
    TransportFactory factory_;

    FetchResult run_batch(bool ipv4, bool ipv6, const std::vector<std::string>& asns);
};

} // namespace asn2ip
