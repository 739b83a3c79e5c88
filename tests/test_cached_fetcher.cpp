#include "cached_fetcher.hpp"
#include "errors.hpp"
#include "memory_storage.hpp"
#include "stats.hpp"

#include "fakes.hpp"

#include <boost/test/unit_test.hpp>

using namespace asn2ip;
using namespace asn2ip::test;
using namespace std::chrono_literals;

namespace {

class BrokenStorage : public Storage {
public:
    bool fail_get = false;
    bool fail_set = false;

    std::optional<CacheRecord> get(const std::string&) override {
        if (fail_get) throw StorageError("backend unavailable");
        return std::nullopt;
    }
    void set(CacheRecord) override {
        if (fail_set) throw StorageError("backend read-only");
    }
};

struct CacheFixture {
    CacheFixture() {
        upstream = std::make_shared<CountingFetcher>();
        upstream->known["64500"].ipv4 = {v4("1.2.3.0/24")};
        upstream->known["64500"].ipv6 = {v6("2001:db8::/32")};
        upstream->known["64501"].ipv4 = {v4("5.6.0.0/16"), v4("5.7.0.0/16")};
        storage = std::make_shared<MemoryStorage>(3600s);
    }

    CachedFetcher make(RefreshPolicy policy = RefreshPolicy::Overwrite) {
        return CachedFetcher(upstream, storage, policy, &stats);
    }

    std::shared_ptr<CountingFetcher> upstream;
    std::shared_ptr<MemoryStorage> storage;
    Statistics stats;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(cached_fetcher, CacheFixture)

BOOST_AUTO_TEST_CASE(empty_input_touches_nothing) {
    auto fetcher = make();
    BOOST_TEST(fetcher.fetch(true, true, {}).empty());
    BOOST_TEST(upstream->calls.empty());
}

BOOST_AUTO_TEST_CASE(second_call_served_from_cache) {
    auto fetcher = make();

    FetchResult first = fetcher.fetch(true, true, {"64500"});
    FetchResult second = fetcher.fetch(true, true, {"64500"});

    BOOST_TEST(upstream->calls.size() == 1u);
    BOOST_REQUIRE(second["64500"].ipv4.size() == 1u);
    BOOST_TEST(second["64500"].ipv4[0].cidr == "1.2.3.0/24");
    BOOST_TEST(second["64500"].ipv6[0].cidr == "2001:db8::/32");
    BOOST_TEST(stats.get_stats().cache_hits == 1u);
    BOOST_TEST(stats.get_stats().cache_misses == 1u);
}

BOOST_AUTO_TEST_CASE(cached_subset_only_returns_requested_version) {
    auto fetcher = make();
    fetcher.fetch(true, true, {"64500"});

    FetchResult result = fetcher.fetch(false, true, {"64500"});
    BOOST_TEST(upstream->calls.size() == 1u);
    BOOST_TEST(result["64500"].ipv4.empty());
    BOOST_TEST(result["64500"].ipv6.size() == 1u);
}

BOOST_AUTO_TEST_CASE(only_uncached_asns_go_upstream_in_one_batch) {
    auto fetcher = make();
    fetcher.fetch(true, false, {"64500"});

    FetchResult result = fetcher.fetch(true, false, {"64500", "64501"});

    BOOST_REQUIRE(upstream->calls.size() == 2u);
    BOOST_REQUIRE(upstream->calls[1].asns.size() == 1u);
    BOOST_TEST(upstream->calls[1].asns[0] == "64501");
    BOOST_TEST(result.size() == 2u);
    BOOST_TEST(result["64501"].ipv4.size() == 2u);
}

BOOST_AUTO_TEST_CASE(missing_version_forces_refetch_of_all_requested) {
    auto fetcher = make();
    fetcher.fetch(true, false, {"64500"});

    fetcher.fetch(true, true, {"64500"});

    BOOST_REQUIRE(upstream->calls.size() == 2u);
    BOOST_TEST(upstream->calls[1].ipv4);
    BOOST_TEST(upstream->calls[1].ipv6);
}

BOOST_AUTO_TEST_CASE(overwrite_forgets_the_other_version) {
    auto fetcher = make(RefreshPolicy::Overwrite);
    fetcher.fetch(true, false, {"64500"});
    fetcher.fetch(false, true, {"64500"});

    auto record = storage->get("64500");
    BOOST_REQUIRE(record.has_value());
    BOOST_TEST(!record->fetched_ipv4);
    BOOST_TEST(record->fetched_ipv6);
    BOOST_TEST(record->ipv4.empty());

    // So asking for ipv4 again goes back upstream
    fetcher.fetch(true, false, {"64500"});
    BOOST_TEST(upstream->calls.size() == 3u);
}

BOOST_AUTO_TEST_CASE(merge_keeps_both_versions) {
    auto fetcher = make(RefreshPolicy::MergeVersions);
    fetcher.fetch(true, false, {"64500"});
    fetcher.fetch(false, true, {"64500"});

    auto record = storage->get("64500");
    BOOST_REQUIRE(record.has_value());
    BOOST_TEST(record->fetched_ipv4);
    BOOST_TEST(record->fetched_ipv6);
    BOOST_TEST(record->ipv4.size() == 1u);

    FetchResult both = fetcher.fetch(true, true, {"64500"});
    BOOST_TEST(upstream->calls.size() == 2u);
    BOOST_TEST(both["64500"].ipv4.size() == 1u);
    BOOST_TEST(both["64500"].ipv6.size() == 1u);
}

BOOST_AUTO_TEST_CASE(records_empty_versions_as_fetched) {
    auto fetcher = make();
    fetcher.fetch(true, true, {"64501"});

    auto record = storage->get("64501");
    BOOST_REQUIRE(record.has_value());
    BOOST_TEST(record->fetched_ipv6);
    BOOST_TEST(record->ipv6.empty());

    fetcher.fetch(true, true, {"64501"});
    BOOST_TEST(upstream->calls.size() == 1u);
}

BOOST_AUTO_TEST_CASE(upstream_error_propagates_and_caches_nothing) {
    auto fetcher = make();
    BOOST_CHECK_THROW(fetcher.fetch(true, true, {"64500", "9999"}), NotFoundError);
    BOOST_TEST(!storage->get("64500").has_value());

    upstream->fail = true;
    BOOST_CHECK_THROW(fetcher.fetch(true, true, {"64500"}), ConnectionError);
}

BOOST_AUTO_TEST_CASE(storage_failures_are_wrapped) {
    auto broken = std::make_shared<BrokenStorage>();
    CachedFetcher fetcher(upstream, broken);

    broken->fail_get = true;
    BOOST_CHECK_EXCEPTION(fetcher.fetch(true, true, {"64500"}), StorageError,
                          [](const StorageError& e) {
                              return std::string(e.what()).find("failed to fetch asn 64500 from cache") == 0;
                          });
    BOOST_TEST(upstream->calls.empty());

    broken->fail_get = false;
    broken->fail_set = true;
    BOOST_CHECK_EXCEPTION(fetcher.fetch(true, true, {"64500"}), StorageError,
                          [](const StorageError& e) {
                              return std::string(e.what()).find("failed to put 64500 on cache") == 0;
                          });
}

BOOST_AUTO_TEST_CASE(refresh_policy_names) {
    RefreshPolicy policy = RefreshPolicy::Overwrite;
    BOOST_TEST(parse_refresh_policy("merge", policy));
    BOOST_TEST((policy == RefreshPolicy::MergeVersions));
    BOOST_TEST(!parse_refresh_policy("append", policy));
    BOOST_TEST(std::string(refresh_policy_name(RefreshPolicy::Overwrite)) == "overwrite");
}

BOOST_AUTO_TEST_SUITE_END()
