#include "cached_fetcher.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "fetcher.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "render.hpp"
#include "stats.hpp"
#include "storage.hpp"
#include <iostream>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <string>
#include <vector>
#include <unistd.h>

#ifndef ASN2IP_VERSION
#define ASN2IP_VERSION "dev"
#endif

#define RESET   "\033[0m"
#define RED     "\033[31m"

using namespace asn2ip;

static HttpServer* g_server = nullptr;

static void handle_signal(int) {
    if (g_server) {
        g_server->stop();
    }
}

static void print_error(const std::string& message) {
    if (isatty(STDERR_FILENO)) {
        std::cerr << RED << "Error: " << RESET << message << "\n";
    } else {
        std::cerr << "Error: " << message << "\n";
    }
}

static std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

static int run_fetch(const Config& conf, const CommandLine& cl) {
    Statistics stats;
    FetcherOptions opts = conf.fetcher_options();
    opts.stats = &stats;

    WhoisFetcher fetcher(opts);
    int status = 0;

    try {
        FetchResult result = fetcher.fetch(conf.fetch_ipv4, conf.fetch_ipv6, cl.args);
        std::cout << render_listing(result);
        std::cout.flush();
    } catch (const Error& e) {
        log_error("failed to fetch ip addresses",
                  {{"asn", join(cl.args, ":")}, {"error", e.what()}});
        status = 10;
    }

    if (conf.show_stats) {
        stats.print(std::cerr);
    }
    return status;
}

static int run_daemon(const Config& conf) {
    Statistics stats;

    std::shared_ptr<Storage> storage;
    try {
        storage = create_storage(conf.storage_options());
    } catch (const StorageNotFoundError& e) {
        log_error("failed to initialize storage", {{"storage", e.name()}, {"error", e.what()}});
        return 1;
    } catch (const StorageError& e) {
        log_error("failed to initialize storage", {{"error", e.what()}});
        return 1;
    }

    FetcherOptions opts = conf.fetcher_options();
    opts.stats = &stats;
    auto upstream = std::make_shared<WhoisFetcher>(opts);
    auto fetcher = std::make_shared<CachedFetcher>(upstream, storage, conf.storage_refresh, &stats);

    HttpServerOptions server_opts;
    server_opts.listen_address = conf.listen_address;
    server_opts.port = conf.listen_port;
    server_opts.max_connections = conf.max_connections;

    HttpServer server(fetcher, server_opts);
    try {
        server.start();
    } catch (const ConnectionError& e) {
        log_error("failed to start http server", {{"error", e.what()}});
        return 1;
    }

    log_info("starting asn2ip", {
        {"version", ASN2IP_VERSION},
        {"whois", conf.whois_host + ":" + std::to_string(conf.whois_port)},
        {"storage", conf.storage_name.empty() ? "default" : conf.storage_name},
        {"ttl", std::to_string(conf.storage_ttl.count()) + "s"},
        {"refresh", refresh_policy_name(conf.storage_refresh)},
        {"batch_policy", batch_policy_name(conf.batch_policy)},
    });

    g_server = &server;
    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        server.serve();
    } catch (const ConnectionError& e) {
        log_error("http server failed", {{"error", e.what()}});
        g_server = nullptr;
        return 1;
    }
    g_server = nullptr;

    if (conf.show_stats) {
        stats.print(std::cerr);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Config conf;
    CommandLine cl;

    try {
        apply_environment(conf, [](const char* name) -> const char* { return std::getenv(name); });
        cl = parse_command_line(argc, argv, conf);
    } catch (const ConfigError& e) {
        print_error(e.what());
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }

    Logger::instance().set_level(conf.effective_log_level());
    Logger::instance().set_format(conf.log_format);

    switch (cl.command) {
        case Command::Version:
            std::cout << "asn2ip " << ASN2IP_VERSION << "\n";
            return 0;
        case Command::Help:
            std::cout << usage_text(argv[0]);
            return 0;
        case Command::Fetch:
            return run_fetch(conf, cl);
        case Command::Run:
            return run_daemon(conf);
        case Command::None:
        default:
            std::cerr << usage_text(argv[0]);
            return 1;
    }
}
