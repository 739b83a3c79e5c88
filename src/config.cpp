#include "config.hpp"
#include <getopt.h>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace asn2ip {

// ─────────────────────────────────────────────────────────────────────────────
// Value parsers
// ─────────────────────────────────────────────────────────────────────────────
bool parse_bool(const std::string& text, bool& out) {
    if (text == "1" || text == "t" || text == "T" ||
        text == "TRUE" || text == "true" || text == "True") {
        out = true;
        return true;
    }
    if (text == "0" || text == "f" || text == "F" ||
        text == "FALSE" || text == "false" || text == "False") {
        out = false;
        return true;
    }
    return false;
}

static bool parse_int(const std::string& text, long min, long max, long& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    if (value < min || value > max) return false;
    out = value;
    return true;
}

bool parse_duration(const std::string& text, std::chrono::seconds& out) {
    if (text.empty()) return false;

    long multiplier = 1;
    std::string digits = text;
    switch (text.back()) {
        case 's': multiplier = 1;    digits.pop_back(); break;
        case 'm': multiplier = 60;   digits.pop_back(); break;
        case 'h': multiplier = 3600; digits.pop_back(); break;
        default: break;
    }

    long value = 0;
    if (!parse_int(digits, 0, std::numeric_limits<long>::max(), value)) {
        return false;
    }
    if (value > MAX_DURATION.count() / multiplier) {
        return false;
    }
    out = std::chrono::seconds(value * multiplier);
    return true;
}

bool parse_port(const std::string& text, int& out) {
    long value = 0;
    if (!parse_int(text, 1, 65535, value)) return false;
    out = static_cast<int>(value);
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Config
// ─────────────────────────────────────────────────────────────────────────────
LogLevel Config::effective_log_level() const {
    int level = log_level;
    if (debug && level < static_cast<int>(LogLevel::Debug)) {
        level = static_cast<int>(LogLevel::Debug);
    }
    return static_cast<LogLevel>(level);
}

FetcherOptions Config::fetcher_options() const {
    FetcherOptions opts;
    opts.host = whois_host;
    opts.port = whois_port;
    opts.transport.connect_timeout = connect_timeout;
    opts.transport.io_timeout = io_timeout;
    opts.batch_policy = batch_policy;
    return opts;
}

StorageOptions Config::storage_options() const {
    StorageOptions opts;
    opts.name = storage_name;
    opts.ttl = storage_ttl;
    return opts;
}

static void set_log_level(Config& conf, const std::string& value, const char* source) {
    long level = 0;
    if (!parse_int(value, 0, 6, level)) {
        throw ConfigError(std::string(source) + ": log level must be between 0 and 6, got '" + value + "'");
    }
    conf.log_level = static_cast<int>(level);
}

static void set_log_format(Config& conf, const std::string& value, const char* source) {
    if (!parse_log_format(value, conf.log_format)) {
        throw ConfigError(std::string(source) + ": unknown log-format '" + value + "'");
    }
}

static void set_port(int& dest, const std::string& value, const char* source) {
    if (!parse_port(value, dest)) {
        throw ConfigError(std::string(source) + ": invalid port '" + value + "'");
    }
}

static void set_bool(bool& dest, const std::string& value, const char* source) {
    if (!parse_bool(value, dest)) {
        throw ConfigError(std::string(source) + ": expected a boolean, got '" + value + "'");
    }
}

static void set_duration(std::chrono::seconds& dest, const std::string& value, const char* source) {
    if (!parse_duration(value, dest)) {
        throw ConfigError(std::string(source) + ": invalid duration '" + value + "'");
    }
}

void apply_environment(Config& conf, const EnvLookup& lookup) {
    if (const char* v = lookup("DEBUG"))          set_bool(conf.debug, v, "DEBUG");
    if (const char* v = lookup("LOG_FORMAT"))     set_log_format(conf, v, "LOG_FORMAT");
    if (const char* v = lookup("LOG_LEVEL"))      set_log_level(conf, v, "LOG_LEVEL");
    if (const char* v = lookup("WHOIS_HOST"))     conf.whois_host = v;
    if (const char* v = lookup("WHOIS_PORT"))     set_port(conf.whois_port, v, "WHOIS_PORT");
    if (const char* v = lookup("LISTEN_ADDRESS")) conf.listen_address = v;
    if (const char* v = lookup("LISTEN_PORT"))    set_port(conf.listen_port, v, "LISTEN_PORT");
}

// ─────────────────────────────────────────────────────────────────────────────
// Command line
// ─────────────────────────────────────────────────────────────────────────────
enum LongOnly {
    OPT_LOG_FORMAT = 1000,
    OPT_LOG_LEVEL,
    OPT_WHOIS_HOST,
    OPT_WHOIS_PORT,
    OPT_CONNECT_TIMEOUT,
    OPT_IO_TIMEOUT,
    OPT_BATCH_POLICY,
    OPT_LISTEN,
    OPT_PORT,
    OPT_MAX_CONN,
    OPT_STORAGE_NAME,
    OPT_STORAGE_TTL,
    OPT_STORAGE_REFRESH,
    OPT_IPV4,
    OPT_IPV6,
    OPT_STATS
};

static Command command_from_name(const std::string& name) {
    if (name == "run" || name == "daemon" || name == "r" || name == "d") return Command::Run;
    if (name == "fetch" || name == "get" || name == "g" || name == "f") return Command::Fetch;
    if (name == "help") return Command::Help;
    return Command::None;
}

static std::string flag_name(char* argv[], int index) {
    return (index > 0 && argv[index - 1]) ? argv[index - 1] : "?";
}

static bool parse_global_flags(int argc, char* argv[], Config& conf) {
    static struct option long_options[] = {
        {"debug",           no_argument,       0, 'D'},
        {"log-format",      required_argument, 0, OPT_LOG_FORMAT},
        {"log-level",       required_argument, 0, OPT_LOG_LEVEL},
        {"whois-host",      required_argument, 0, OPT_WHOIS_HOST},
        {"whois-port",      required_argument, 0, OPT_WHOIS_PORT},
        {"connect-timeout", required_argument, 0, OPT_CONNECT_TIMEOUT},
        {"io-timeout",      required_argument, 0, OPT_IO_TIMEOUT},
        {"batch-policy",    required_argument, 0, OPT_BATCH_POLICY},
        {"version",         no_argument,       0, 'V'},
        {"help",            no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // '+' stops at the command name; ':' reports missing arguments as ':'
    int opt;
    while ((opt = getopt_long(argc, argv, "+:DVh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'D': conf.debug = true; break;
            case OPT_LOG_FORMAT: set_log_format(conf, optarg, "--log-format"); break;
            case OPT_LOG_LEVEL: set_log_level(conf, optarg, "--log-level"); break;
            case OPT_WHOIS_HOST: conf.whois_host = optarg; break;
            case OPT_WHOIS_PORT: set_port(conf.whois_port, optarg, "--whois-port"); break;
            case OPT_CONNECT_TIMEOUT: set_duration(conf.connect_timeout, optarg, "--connect-timeout"); break;
            case OPT_IO_TIMEOUT: set_duration(conf.io_timeout, optarg, "--io-timeout"); break;
            case OPT_BATCH_POLICY:
                if (!parse_batch_policy(optarg, conf.batch_policy)) {
                    throw ConfigError(std::string("--batch-policy: unknown policy '") + optarg + "'");
                }
                break;
            case 'V': return false;
            case 'h': return false;
            case ':':
                throw ConfigError("missing value for " + flag_name(argv, optind));
            default:
                throw ConfigError("unknown flag " + flag_name(argv, optind));
        }
    }
    return true;
}

static void parse_run_flags(int argc, char* argv[], Config& conf, CommandLine& cl) {
    static struct option long_options[] = {
        {"listen",          required_argument, 0, OPT_LISTEN},
        {"port",            required_argument, 0, OPT_PORT},
        {"max-connections", required_argument, 0, OPT_MAX_CONN},
        {"storage-name",    required_argument, 0, OPT_STORAGE_NAME},
        {"storage-ttl",     required_argument, 0, OPT_STORAGE_TTL},
        {"storage-refresh", required_argument, 0, OPT_STORAGE_REFRESH},
        {"stats",           no_argument,       0, OPT_STATS},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, ":", long_options, nullptr)) != -1) {
        switch (opt) {
            case OPT_LISTEN: conf.listen_address = optarg; break;
            case OPT_PORT: set_port(conf.listen_port, optarg, "--port"); break;
            case OPT_MAX_CONN: {
                long value = 0;
                if (!parse_int(optarg, 1, 4096, value)) {
                    throw ConfigError(std::string("--max-connections: invalid value '") + optarg + "'");
                }
                conf.max_connections = static_cast<int>(value);
                break;
            }
            case OPT_STORAGE_NAME: conf.storage_name = optarg; break;
            case OPT_STORAGE_TTL: set_duration(conf.storage_ttl, optarg, "--storage-ttl"); break;
            case OPT_STORAGE_REFRESH:
                if (!parse_refresh_policy(optarg, conf.storage_refresh)) {
                    throw ConfigError(std::string("--storage-refresh: unknown policy '") + optarg + "'");
                }
                break;
            case OPT_STATS: conf.show_stats = true; break;
            case ':':
                throw ConfigError("missing value for " + flag_name(argv, optind));
            default:
                throw ConfigError("unknown flag for run: " + flag_name(argv, optind));
        }
    }
    for (int i = optind; i < argc; ++i) cl.args.push_back(argv[i]);
}

static void parse_fetch_flags(int argc, char* argv[], Config& conf, CommandLine& cl) {
    static struct option long_options[] = {
        {"ipv4",  optional_argument, 0, OPT_IPV4},
        {"ipv6",  optional_argument, 0, OPT_IPV6},
        {"stats", no_argument,       0, OPT_STATS},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, ":", long_options, nullptr)) != -1) {
        switch (opt) {
            case OPT_IPV4:
                conf.fetch_ipv4 = true;
                if (optarg) set_bool(conf.fetch_ipv4, optarg, "--ipv4");
                break;
            case OPT_IPV6:
                conf.fetch_ipv6 = true;
                if (optarg) set_bool(conf.fetch_ipv6, optarg, "--ipv6");
                break;
            case OPT_STATS: conf.show_stats = true; break;
            default:
                throw ConfigError("unknown flag for fetch: " + flag_name(argv, optind));
        }
    }
    for (int i = optind; i < argc; ++i) cl.args.push_back(argv[i]);
}

CommandLine parse_command_line(int argc, char* argv[], Config& conf) {
    CommandLine cl;

    optind = 0;  // full getopt reset, also between calls
    opterr = 0;
    if (!parse_global_flags(argc, argv, conf)) {
        // --help or --version; tell them apart by the flag that stopped us
        std::string flag = flag_name(argv, optind);
        cl.command = (flag == "--version" || flag == "-V") ? Command::Version : Command::Help;
        return cl;
    }

    if (optind >= argc) {
        throw ConfigError("no command given");
    }

    int cmd_index = optind;
    std::string name = argv[cmd_index];
    cl.command = command_from_name(name);

    // Command flags are parsed from a view that starts at the command name
    int sub_argc = argc - cmd_index;
    char** sub_argv = argv + cmd_index;
    optind = 0;

    switch (cl.command) {
        case Command::Run:
            parse_run_flags(sub_argc, sub_argv, conf, cl);
            break;
        case Command::Fetch:
            parse_fetch_flags(sub_argc, sub_argv, conf, cl);
            break;
        case Command::Help:
            break;
        default:
            throw ConfigError("unknown command '" + name + "'");
    }
    return cl;
}

std::string usage_text(const char* prog_name) {
    std::string p = prog_name ? prog_name : "asn2ip";
    return
        "asn2ip - map AS numbers to the IP networks they announce\n"
        "\n"
        "Usage: " + p + " [global options] <command> [command options] [args]\n"
        "\n"
        "COMMANDS\n"
        "  run, daemon, r, d         run the http daemon\n"
        "  fetch, get, g, f AS...    fetch AS number(s) and exit\n"
        "\n"
        "GLOBAL OPTIONS\n"
        "  -D, --debug               show debug messages               [DEBUG]\n"
        "  --log-format <fmt>        plain or json (default: plain)     [LOG_FORMAT]\n"
        "  --log-level <0-6>         log verbosity (default: 4)         [LOG_LEVEL]\n"
        "  --whois-host <host>       whois server (default: whois.radb.net) [WHOIS_HOST]\n"
        "  --whois-port <port>       whois port (default: 43)           [WHOIS_PORT]\n"
        "  --connect-timeout <dur>   connect deadline (default: 10s)\n"
        "  --io-timeout <dur>        per read/write deadline (default: 30s)\n"
        "  --batch-policy <policy>   fail-fast or skip-not-found (default: fail-fast)\n"
        "  -V, --version             print version and exit\n"
        "  -h, --help                show this help\n"
        "\n"
        "RUN OPTIONS\n"
        "  --listen <addr>           listen address (default: 0.0.0.0)  [LISTEN_ADDRESS]\n"
        "  --port <port>             listen port (default: 8080)        [LISTEN_PORT]\n"
        "  --max-connections <n>     concurrent http connections (default: 64)\n"
        "  --storage-name <name>     cache backend (default: memory)\n"
        "  --storage-ttl <dur>       cache ttl (default: 24h)\n"
        "  --storage-refresh <p>     overwrite or merge (default: overwrite)\n"
        "  --stats                   print statistics on shutdown\n"
        "\n"
        "FETCH OPTIONS\n"
        "  --ipv4[=bool]             fetch ipv4 networks (default: true)\n"
        "  --ipv6[=bool]             fetch ipv6 networks (default: true)\n"
        "  --stats                   print statistics after fetching\n";
}

} // namespace asn2ip
