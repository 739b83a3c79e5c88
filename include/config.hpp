#pragma once

#include "cached_fetcher.hpp"
#include "fetcher.hpp"
#include "logger.hpp"
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace asn2ip {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct Config {
    // Global
    bool debug = false;
    LogFormat log_format = LogFormat::Plain;
    int log_level = 4;

    // Whois upstream
    std::string whois_host = "whois.radb.net";
    int whois_port = 43;
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds io_timeout{30};
    BatchPolicy batch_policy = BatchPolicy::FailFast;

    // Daemon
    std::string listen_address = "0.0.0.0";
    int listen_port = 8080;
    int max_connections = 64;

    // Storage
    std::string storage_name;
    std::chrono::seconds storage_ttl{86400};
    RefreshPolicy storage_refresh = RefreshPolicy::Overwrite;

    // Fetch command
    bool fetch_ipv4 = true;
    bool fetch_ipv6 = true;
    bool show_stats = false;

    LogLevel effective_log_level() const;
    FetcherOptions fetcher_options() const;
    StorageOptions storage_options() const;
};

enum class Command {
    None,
    Run,
    Fetch,
    Help,
    Version
};

struct CommandLine {
    Command command = Command::None;
    std::vector<std::string> args;  // positional arguments after the command
};

using EnvLookup = std::function<const char*(const char*)>;

// DEBUG, LOG_FORMAT, LOG_LEVEL, WHOIS_HOST, WHOIS_PORT, LISTEN_ADDRESS,
// LISTEN_PORT. Throws ConfigError on an unparsable value.
void apply_environment(Config& conf, const EnvLookup& lookup);

// asn2ip [global flags] <run|fetch> [command flags] [args...]
// Throws ConfigError on unknown flags, commands or bad values.
CommandLine parse_command_line(int argc, char* argv[], Config& conf);

std::string usage_text(const char* prog_name);

// 1 t T TRUE true True / 0 f F FALSE false False
bool parse_bool(const std::string& text, bool& out);

// Upper bound for any configured duration; deadlines built from it must
// still fit steady_clock's nanosecond representation.
constexpr std::chrono::seconds MAX_DURATION = std::chrono::hours(24 * 365 * 100);

// "90", "90s", "15m", "24h"; anything above MAX_DURATION is rejected
bool parse_duration(const std::string& text, std::chrono::seconds& out);

bool parse_port(const std::string& text, int& out);

} // namespace asn2ip
