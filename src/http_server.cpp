#include "http_server.hpp"
#include "compression.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "happy_eyeballs.hpp"
#include "logger.hpp"
#include "render.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <future>
#include <sstream>
#include <strings.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace asn2ip {

static const char* INDEX_HTML =
    "<!DOCTYPE html>\n"
    "<html>\n"
    "<head><title>asn2ip</title></head>\n"
    "<body>\n"
    "<h1>asn2ip</h1>\n"
    "<p>Look up the networks announced by one or more autonomous systems.</p>\n"
    "<pre>\n"
    "GET /&lt;asn&gt;[:&lt;asn&gt;...]\n"
    "\n"
    "  ipv4=true|false       include IPv4 networks (default true)\n"
    "  ipv6=true|false       include IPv6 networks (default true)\n"
    "  separator=&lt;text&gt;      joins networks in plain text output (default ' ')\n"
    "\n"
    "Send 'Accept: application/json' for JSON output.\n"
    "\n"
    "curl /15169\n"
    "curl '/15169:36040?ipv6=false&amp;separator=%0A'\n"
    "curl -H 'Accept: application/json' /15169\n"
    "</pre>\n"
    "</body>\n"
    "</html>\n";

static const char* TEXT_PLAIN = "text/plain; charset=utf-8";

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

std::optional<std::string> url_decode(const std::string& text, bool form) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%') {
            if (i + 2 >= text.size()) return std::nullopt;
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+' && form) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<HttpRequest> parse_request(const std::string& head) {
    HttpRequest req;

    size_t pos = head.find('\n');
    if (pos == std::string::npos) return std::nullopt;
    std::string request_line = head.substr(0, pos);
    if (!request_line.empty() && request_line.back() == '\r') request_line.pop_back();
    pos++;

    // METHOD SP target SP version
    size_t sp1 = request_line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return std::nullopt;
    size_t sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return std::nullopt;
    if (request_line.find(' ', sp2 + 1) != std::string::npos) return std::nullopt;

    req.method = request_line.substr(0, sp1);
    req.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    req.version = request_line.substr(sp2 + 1);
    if (req.version.compare(0, 5, "HTTP/") != 0) return std::nullopt;
    if (req.target.empty() || req.target[0] != '/') return std::nullopt;

    // Headers
    while (pos < head.size()) {
        size_t line_end = head.find('\n', pos);
        if (line_end == std::string::npos) line_end = head.size();
        std::string line = head.substr(pos, line_end - pos);
        pos = line_end + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return std::nullopt;
        std::string key = to_lower(line.substr(0, colon));
        // First occurrence wins
        req.headers.emplace(key, trim(line.substr(colon + 1)));
    }

    // Target: path and query
    std::string raw_path = req.target;
    size_t qmark = req.target.find('?');
    if (qmark != std::string::npos) {
        raw_path = req.target.substr(0, qmark);
        req.query = req.target.substr(qmark + 1);
    }
    auto path = url_decode(raw_path);
    if (!path) return std::nullopt;
    req.path = *path;

    size_t qpos = 0;
    while (qpos < req.query.size()) {
        size_t amp = req.query.find('&', qpos);
        if (amp == std::string::npos) amp = req.query.size();
        std::string pair = req.query.substr(qpos, amp - qpos);
        qpos = amp + 1;
        if (pair.empty()) continue;

        size_t eq = pair.find('=');
        auto key = url_decode(pair.substr(0, eq), true);
        auto value = url_decode(eq == std::string::npos ? "" : pair.substr(eq + 1), true);
        if (!key || !value) return std::nullopt;
        req.params.emplace(*key, *value);
    }

    return req;
}

const char* status_reason(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

std::string serialize_response(const HttpRequest& request, const HttpResponse& response) {
    ContentEncoding encoding = ContentEncoding::Identity;
    std::string payload = response.body;

    if (!response.body.empty()) {
        encoding = Compression::negotiate(request.header("accept-encoding"));
        if (encoding != ContentEncoding::Identity) {
            auto compressed = Compression::compress(response.body, encoding);
            if (compressed) {
                payload.assign(compressed->begin(), compressed->end());
            } else {
                log_warn("response compression failed",
                         {{"encoding", Compression::header_value(encoding)}});
                encoding = ContentEncoding::Identity;
            }
        }
    }

    std::ostringstream out;
    out << "HTTP/1.1 " << response.status_code << " " << status_reason(response.status_code) << "\r\n";
    out << "Content-Type: " << response.content_type << "\r\n";
    out << "Content-Length: " << payload.size() << "\r\n";
    if (encoding != ContentEncoding::Identity) {
        out << "Content-Encoding: " << Compression::header_value(encoding) << "\r\n";
    }
    out << "Vary: Accept-Encoding\r\n";
    if (response.status_code == 405) {
        out << "Allow: GET\r\n";
    }
    out << "Connection: close\r\n";
    out << "\r\n";
    out << payload;
    return out.str();
}

HttpServer::HttpServer(std::shared_ptr<Fetcher> fetcher, HttpServerOptions options)
    : fetcher_(std::move(fetcher)), options_(std::move(options)) {
}

HttpServer::~HttpServer() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
}

HttpResponse HttpServer::handle(const HttpRequest& request) {
    if (request.method != "GET") {
        return {405, TEXT_PLAIN, "method not allowed"};
    }
    if (request.path == "/") {
        return {200, "text/html; charset=utf-8", INDEX_HTML};
    }

    std::string asn_path = request.path.substr(1);
    if (asn_path.empty() || asn_path.find('/') != std::string::npos) {
        return {404, TEXT_PLAIN, "404 page not found"};
    }
    return handle_asn(request, asn_path);
}

HttpResponse HttpServer::handle_asn(const HttpRequest& request, const std::string& asn_path) {
    std::vector<std::string> asns;
    size_t pos = 0;
    while (true) {
        size_t colon = asn_path.find(':', pos);
        if (colon == std::string::npos) {
            asns.push_back(asn_path.substr(pos));
            break;
        }
        asns.push_back(asn_path.substr(pos, colon - pos));
        pos = colon + 1;
    }

    bool ipv4 = true;
    bool ipv6 = true;
    auto it = request.params.find("ipv4");
    if (it != request.params.end() && !parse_bool(it->second, ipv4)) {
        return {400, TEXT_PLAIN, "ipv4 query parameter must be a boolean"};
    }
    it = request.params.find("ipv6");
    if (it != request.params.end() && !parse_bool(it->second, ipv6)) {
        return {400, TEXT_PLAIN, "ipv6 query parameter must be a boolean"};
    }

    std::string separator = " ";
    it = request.params.find("separator");
    if (it != request.params.end()) {
        separator = it->second;
    }

    bool want_json = strcasecmp(request.header("accept").c_str(), "application/json") == 0;

    FetchResult result;
    try {
        result = fetcher_->fetch(ipv4, ipv6, asns);
    } catch (const Error& e) {
        log_error("failed to fetch ip addresses",
                  {{"asn", asn_path}, {"error", e.what()}, {"kind", error_code_name(e.code())}});
        return {500, TEXT_PLAIN, "failed to fetch ip addresses for AS " + asn_path};
    }

    if (want_json) {
        return {200, "application/json; charset=utf-8", render_json(result)};
    }
    return {200, TEXT_PLAIN, render_plain(result, separator)};
}

void HttpServer::start() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    const char* node = options_.listen_address.empty() ? nullptr : options_.listen_address.c_str();
    std::string service = std::to_string(options_.port);
    std::string where = options_.listen_address + ":" + service;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(node, service.c_str(), &hints, &res);
    if (rc != 0) {
        throw ConnectionError("failed to resolve listen address " + where + ": " + gai_strerror(rc));
    }

    int last_errno = 0;
    for (struct addrinfo* p = res; p != nullptr; p = p->ai_next) {
        int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }

        int yes = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        if (::bind(fd, p->ai_addr, p->ai_addrlen) < 0 || ::listen(fd, SOMAXCONN) < 0) {
            last_errno = errno;
            ::close(fd);
            continue;
        }

        listen_fd_ = fd;
        break;
    }
    freeaddrinfo(res);

    if (listen_fd_ < 0) {
        throw ConnectionError("failed to listen on " + where + ": " + std::strerror(last_errno));
    }

    // accept() after poll() must not block if the client went away meanwhile
    int flags = fcntl(listen_fd_, F_GETFL, 0);
    fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);

    AddressInfo bound{};
    bound.addrlen = sizeof(bound.addr);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound.addr), &bound.addrlen) == 0) {
        bound.family = bound.addr.ss_family;
        if (bound.family == AF_INET6) {
            bound_port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound.addr)->sin6_port);
        } else {
            bound_port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound.addr)->sin_port);
        }
        log_info("http server listening", {{"address", format_address(bound)}});
    } else {
        bound_port_ = options_.port;
        log_info("http server listening", {{"address", where}});
    }
}

void HttpServer::serve() {
    if (listen_fd_ < 0) {
        throw ConnectionError("http server is not listening");
    }

    std::vector<std::future<void>> workers;
    size_t max_workers = static_cast<size_t>(std::max(1, options_.max_connections));

    auto reap = [&workers]() {
        workers.erase(std::remove_if(workers.begin(), workers.end(), [](std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }), workers.end());
    };

    while (!stopping_.load()) {
        struct pollfd pfd{listen_fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 250);
        reap();
        if (rc < 0) {
            if (errno == EINTR) continue;
            log_error("poll on listening socket failed", {{"error", std::strerror(errno)}});
            break;
        }
        if (rc == 0) continue;

        AddressInfo peer{};
        peer.addrlen = sizeof(peer.addr);
        int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer.addr), &peer.addrlen);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && errno != ECONNABORTED) {
                log_warn("accept failed", {{"error", std::strerror(errno)}});
            }
            continue;
        }
        peer.family = peer.addr.ss_family;
        std::string client = format_address(peer);

        while (workers.size() >= max_workers) {
            workers.front().wait();
            reap();
        }

        workers.push_back(std::async(std::launch::async, [this, fd, client]() {
            serve_connection(fd, client);
        }));
    }

    log_info("http server shutting down", {{"pending", std::to_string(workers.size())}});
    for (auto& worker : workers) {
        worker.wait();
    }

    ::close(listen_fd_);
    listen_fd_ = -1;
}

bool HttpServer::read_head(int fd, std::string& head) {
    auto deadline = std::chrono::steady_clock::now() + options_.read_timeout;
    char buf[4096];

    while (head.find("\r\n\r\n") == std::string::npos) {
        if (head.size() > options_.max_header_size) {
            // Oversized head: hand back nothing so it is answered with 400
            head.clear();
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return false;

        struct pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) return false;

        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        head.append(buf, static_cast<size_t>(n));
    }

    head.resize(head.find("\r\n\r\n") + 4);
    return true;
}

bool HttpServer::write_all(int fd, const std::string& data) {
    auto deadline = std::chrono::steady_clock::now() + options_.write_timeout;
    size_t sent = 0;

    while (sent < data.size()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return false;

        struct pollfd pfd{fd, POLLOUT, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) return false;

        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void HttpServer::serve_connection(int fd, const std::string& client) {
    auto start = std::chrono::steady_clock::now();

    std::string head;
    if (!read_head(fd, head)) {
        log_debug("connection closed without a complete request", {{"client", client}});
        ::close(fd);
        return;
    }

    HttpRequest request;
    HttpResponse response;
    auto parsed = parse_request(head);
    if (!parsed) {
        request.method = "-";
        response = {400, TEXT_PLAIN, "bad request"};
    } else {
        request = std::move(*parsed);
        try {
            response = handle(request);
        } catch (const std::exception& e) {
            log_error("request handler failed", {{"path", request.path}, {"error", e.what()}});
            response = {500, TEXT_PLAIN, "internal server error"};
        }
    }
    request.client = client;

    std::string wire;
    try {
        wire = serialize_response(request, response);
    } catch (const std::exception& e) {
        log_error("failed to build response", {{"error", e.what()}});
        ::close(fd);
        return;
    }

    bool written = write_all(fd, wire);
    ::close(fd);

    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    std::string path = request.target.empty() ? "-" : request.target;

    log_info("processed http request", {
        {"method", request.method},
        {"path", path},
        {"status", std::to_string(response.status_code)},
        {"latency", std::to_string(latency.count() / 1000.0) + "ms"},
        {"client", client},
        {"size", std::to_string(response.body.size())},
    });
    if (!written) {
        log_debug("failed to write response", {{"client", client}});
    }
}

} // namespace asn2ip
