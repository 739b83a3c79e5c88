#include "fetcher.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "stats.hpp"
#include "whois_session.hpp"
#include <chrono>

namespace asn2ip {

bool parse_batch_policy(const std::string& text, BatchPolicy& out) {
    if (text == "fail-fast") {
        out = BatchPolicy::FailFast;
        return true;
    }
    if (text == "skip-not-found") {
        out = BatchPolicy::SkipNotFound;
        return true;
    }
    return false;
}

const char* batch_policy_name(BatchPolicy policy) {
    return policy == BatchPolicy::FailFast ? "fail-fast" : "skip-not-found";
}

WhoisFetcher::WhoisFetcher(FetcherOptions options, TransportFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
}

FetchResult WhoisFetcher::fetch(bool ipv4, bool ipv6, const std::vector<std::string>& asns) {
    if (asns.empty()) {
        return {};
    }

    auto start = std::chrono::steady_clock::now();
    try {
        FetchResult result = run_batch(ipv4, ipv6, asns);
        if (options_.stats) {
            options_.stats->record_fetch(std::chrono::duration_cast<std::chrono::milliseconds>(
                                             std::chrono::steady_clock::now() - start),
                                         asns.size());
        }
        return result;
    } catch (const Error& e) {
        if (options_.stats) options_.stats->record_error(error_code_name(e.code()));
        throw;
    }
}

FetchResult WhoisFetcher::run_batch(bool ipv4, bool ipv6, const std::vector<std::string>& asns) {
    LogFields where = {{"host", options_.host}, {"port", std::to_string(options_.port)}};

    log_debug("connecting to whois host", where);
    QuerySession session(factory_(options_.host, options_.port, options_.transport), options_.stats);

    FetchResult result;
    for (const auto& asn : asns) {
        ASNetworks networks;
        try {
            if (ipv4) networks.ipv4 = session.query(asn, IPVersion::V4);
            if (ipv6) networks.ipv6 = session.query(asn, IPVersion::V6);
        } catch (const NotFoundError& e) {
            if (options_.batch_policy == BatchPolicy::FailFast) {
                throw;
            }
            log_info("skipping unknown as", {{"as", asn}, {"error", e.what()}});
            continue;
        }
        result[asn] = std::move(networks);
    }

    return result;
}

} // namespace asn2ip
