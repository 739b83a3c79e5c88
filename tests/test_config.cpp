#include "config.hpp"

#include <boost/test/unit_test.hpp>

#include <initializer_list>
#include <map>
#include <string>
#include <vector>

using namespace asn2ip;
using namespace std::chrono_literals;

namespace {

// Owns a mutable argv for getopt
struct Args {
    Args(std::initializer_list<std::string> list) : strings(list) {
        for (auto& s : strings) ptrs.push_back(&s[0]);
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(strings.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> strings;
    std::vector<char*> ptrs;
};

CommandLine parse(Args args, Config& conf) {
    return parse_command_line(args.argc(), args.argv(), conf);
}

EnvLookup env_from(const std::map<std::string, std::string>& vars) {
    return [vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

BOOST_AUTO_TEST_SUITE(config)

BOOST_AUTO_TEST_CASE(parse_bool_accepts_go_spellings) {
    bool value = false;
    for (const char* yes : {"1", "t", "T", "TRUE", "true", "True"}) {
        value = false;
        BOOST_TEST(parse_bool(yes, value));
        BOOST_TEST(value);
    }
    for (const char* no : {"0", "f", "F", "FALSE", "false", "False"}) {
        value = true;
        BOOST_TEST(parse_bool(no, value));
        BOOST_TEST(!value);
    }
    BOOST_TEST(!parse_bool("yes", value));
    BOOST_TEST(!parse_bool("tRuE", value));
    BOOST_TEST(!parse_bool("", value));
}

BOOST_AUTO_TEST_CASE(parse_duration_units) {
    std::chrono::seconds d{0};
    BOOST_TEST(parse_duration("90", d));
    BOOST_TEST(d.count() == 90);
    BOOST_TEST(parse_duration("90s", d));
    BOOST_TEST(d.count() == 90);
    BOOST_TEST(parse_duration("15m", d));
    BOOST_TEST(d.count() == 900);
    BOOST_TEST(parse_duration("24h", d));
    BOOST_TEST(d.count() == 86400);
    BOOST_TEST(!parse_duration("h", d));
    BOOST_TEST(!parse_duration("-5s", d));
    BOOST_TEST(!parse_duration("1d", d));
}

BOOST_AUTO_TEST_CASE(parse_duration_rejects_overflowing_values) {
    std::chrono::seconds d{0};
    BOOST_TEST(parse_duration("876000h", d));
    BOOST_TEST((d == MAX_DURATION));
    BOOST_TEST(!parse_duration("876001h", d));
    BOOST_TEST(!parse_duration("3000000h", d));
    BOOST_TEST(!parse_duration("2147483647m", d));
    BOOST_TEST(!parse_duration("2147483647h", d));
    BOOST_TEST(!parse_duration("99999999999999999999", d));
}

BOOST_AUTO_TEST_CASE(storage_ttl_flag_rejects_overflow) {
    Config conf;
    BOOST_CHECK_THROW(parse({"asn2ip", "run", "--storage-ttl", "5000000h"}, conf), ConfigError);
    BOOST_CHECK_THROW(parse({"asn2ip", "--io-timeout", "2147483647h", "fetch"}, conf), ConfigError);
}

BOOST_AUTO_TEST_CASE(parse_port_range) {
    int port = 0;
    BOOST_TEST(parse_port("43", port));
    BOOST_TEST(port == 43);
    BOOST_TEST(!parse_port("0", port));
    BOOST_TEST(!parse_port("65536", port));
    BOOST_TEST(!parse_port("http", port));
}

BOOST_AUTO_TEST_CASE(defaults) {
    Config conf;
    BOOST_TEST(conf.whois_host == "whois.radb.net");
    BOOST_TEST(conf.whois_port == 43);
    BOOST_TEST(conf.listen_port == 8080);
    BOOST_TEST(conf.storage_ttl.count() == 86400);
    BOOST_TEST((conf.effective_log_level() == LogLevel::Info));
    BOOST_TEST((conf.batch_policy == BatchPolicy::FailFast));
    BOOST_TEST((conf.storage_refresh == RefreshPolicy::Overwrite));
}

BOOST_AUTO_TEST_CASE(environment_overrides) {
    Config conf;
    apply_environment(conf, env_from({
        {"DEBUG", "true"},
        {"LOG_FORMAT", "json"},
        {"LOG_LEVEL", "2"},
        {"WHOIS_HOST", "whois.example"},
        {"WHOIS_PORT", "4343"},
        {"LISTEN_ADDRESS", "127.0.0.1"},
        {"LISTEN_PORT", "9090"},
    }));

    BOOST_TEST(conf.debug);
    BOOST_TEST((conf.log_format == LogFormat::Json));
    BOOST_TEST(conf.log_level == 2);
    BOOST_TEST((conf.effective_log_level() == LogLevel::Debug));
    BOOST_TEST(conf.whois_host == "whois.example");
    BOOST_TEST(conf.whois_port == 4343);
    BOOST_TEST(conf.listen_address == "127.0.0.1");
    BOOST_TEST(conf.listen_port == 9090);
}

BOOST_AUTO_TEST_CASE(environment_rejects_bad_values) {
    Config conf;
    BOOST_CHECK_THROW(apply_environment(conf, env_from({{"WHOIS_PORT", "abc"}})), ConfigError);
    BOOST_CHECK_THROW(apply_environment(conf, env_from({{"DEBUG", "maybe"}})), ConfigError);
    BOOST_CHECK_THROW(apply_environment(conf, env_from({{"LOG_LEVEL", "7"}})), ConfigError);
}

BOOST_AUTO_TEST_CASE(fetch_command_with_flags) {
    Config conf;
    CommandLine cl = parse({"asn2ip", "--whois-host", "whois.example", "--io-timeout", "5s",
                            "get", "--ipv6=false", "--stats", "64500", "64501"}, conf);

    BOOST_TEST((cl.command == Command::Fetch));
    BOOST_REQUIRE(cl.args.size() == 2u);
    BOOST_TEST(cl.args[0] == "64500");
    BOOST_TEST(cl.args[1] == "64501");
    BOOST_TEST(conf.whois_host == "whois.example");
    BOOST_TEST(conf.io_timeout.count() == 5);
    BOOST_TEST(conf.fetch_ipv4);
    BOOST_TEST(!conf.fetch_ipv6);
    BOOST_TEST(conf.show_stats);

    FetcherOptions opts = conf.fetcher_options();
    BOOST_TEST(opts.host == "whois.example");
    BOOST_TEST(opts.transport.io_timeout.count() == 5000);
}

BOOST_AUTO_TEST_CASE(run_command_with_storage_flags) {
    Config conf;
    CommandLine cl = parse({"asn2ip", "-D", "d", "--port", "9000", "--storage-name", "memory",
                            "--storage-ttl", "1h", "--storage-refresh", "merge",
                            "--max-connections", "8"}, conf);

    BOOST_TEST((cl.command == Command::Run));
    BOOST_TEST(cl.args.empty());
    BOOST_TEST(conf.debug);
    BOOST_TEST(conf.listen_port == 9000);
    BOOST_TEST(conf.max_connections == 8);
    BOOST_TEST((conf.storage_refresh == RefreshPolicy::MergeVersions));

    StorageOptions storage = conf.storage_options();
    BOOST_TEST(storage.name == "memory");
    BOOST_TEST(storage.ttl.count() == 3600);
}

BOOST_AUTO_TEST_CASE(help_and_version) {
    Config conf;
    BOOST_TEST((parse({"asn2ip", "--help"}, conf).command == Command::Help));
    BOOST_TEST((parse({"asn2ip", "-V"}, conf).command == Command::Version));
    BOOST_TEST((parse({"asn2ip", "--version"}, conf).command == Command::Version));
    BOOST_TEST((parse({"asn2ip", "help"}, conf).command == Command::Help));
    BOOST_TEST(usage_text("asn2ip").find("fetch, get, g, f") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(command_line_errors) {
    Config conf;
    BOOST_CHECK_THROW(parse({"asn2ip"}, conf), ConfigError);
    BOOST_CHECK_THROW(parse({"asn2ip", "serve"}, conf), ConfigError);
    BOOST_CHECK_THROW(parse({"asn2ip", "--bogus", "fetch"}, conf), ConfigError);
    BOOST_CHECK_THROW(parse({"asn2ip", "--whois-port", "99999", "fetch"}, conf), ConfigError);
    BOOST_CHECK_THROW(parse({"asn2ip", "fetch", "--ipv4=maybe", "64500"}, conf), ConfigError);
    BOOST_CHECK_THROW(parse({"asn2ip", "run", "--storage-refresh", "append"}, conf), ConfigError);
    BOOST_CHECK_THROW(parse({"asn2ip", "--batch-policy", "partial", "fetch"}, conf), ConfigError);
}

BOOST_AUTO_TEST_SUITE_END()
