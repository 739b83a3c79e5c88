#pragma once

#include "fetcher.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace asn2ip {

struct HttpRequest {
    std::string method;
    std::string target;   // raw request target, e.g. "/64500:64501?ipv6=false"
    std::string path;     // decoded path
    std::string query;    // raw query string, without '?'
    std::string version;
    std::map<std::string, std::string> params;   // decoded query parameters
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string client;

    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int status_code = 200;
    std::string content_type = "text/plain; charset=utf-8";
    std::string body;
};

struct HttpServerOptions {
    std::string listen_address = "0.0.0.0";
    int port = 8080;
    int max_connections = 64;
    std::chrono::milliseconds read_timeout{10000};
    std::chrono::milliseconds write_timeout{10000};
    size_t max_header_size = 16384;
};

// Parses the request line and headers (everything before the blank line).
// Empty optional when the head is malformed.
std::optional<HttpRequest> parse_request(const std::string& head);

// Percent-decoding; '+' becomes a space when form is true.
std::optional<std::string> url_decode(const std::string& text, bool form = false);

const char* status_reason(int status_code);

// Status line, headers and (possibly compressed) body for the wire.
// Compression follows the request's Accept-Encoding.
std::string serialize_response(const HttpRequest& request, const HttpResponse& response);

class HttpServer {
public:
    HttpServer(std::shared_ptr<Fetcher> fetcher, HttpServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and listens; throws ConnectionError on failure
    void start();

    // Accept loop. Returns after stop() once running workers have finished.
    void serve();

    // Safe to call from a signal handler
    void stop() { stopping_.store(true); }

    // Bound port, valid after start(); differs from options.port when that was 0
    int port() const { return bound_port_; }

    // Routing without any socket I/O
    HttpResponse handle(const HttpRequest& request);

private:
    std::shared_ptr<Fetcher> fetcher_;
    HttpServerOptions options_;
    int listen_fd_ = -1;
    int bound_port_ = 0;
    std::atomic<bool> stopping_{false};

    void serve_connection(int fd, const std::string& client);
    HttpResponse handle_asn(const HttpRequest& request, const std::string& asn_path);
    bool read_head(int fd, std::string& head);
    bool write_all(int fd, const std::string& data);
};

} // namespace asn2ip
