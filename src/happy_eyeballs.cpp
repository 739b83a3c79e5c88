#include "happy_eyeballs.hpp"
#include "logger.hpp"
#include <sys/types.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace asn2ip {

std::string format_address(const AddressInfo& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    int port = 0;
    if (addr.family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&addr.addr);
        inet_ntop(AF_INET6, &sin6->sin6_addr, host, sizeof(host));
        port = ntohs(sin6->sin6_port);
        return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    const auto* sin = reinterpret_cast<const sockaddr_in*>(&addr.addr);
    inet_ntop(AF_INET, &sin->sin_addr, host, sizeof(host));
    port = ntohs(sin->sin_port);
    return std::string(host) + ":" + std::to_string(port);
}

HappyEyeballs::HappyEyeballs(const std::string& host, int port)
    : host_(host), port_(port) {
}

bool HappyEyeballs::resolve_addresses() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    // Literal addresses are dialed as given, even on loopback-only hosts
    unsigned char probe[sizeof(struct in6_addr)];
    bool literal = inet_pton(AF_INET, host_.c_str(), probe) == 1 ||
                   inet_pton(AF_INET6, host_.c_str(), probe) == 1;
    hints.ai_flags = literal ? AI_NUMERICHOST : AI_ADDRCONFIG;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port_);

    int ret = getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &result);
    if (ret != 0) {
        last_error_ = "failed to resolve " + host_ + ": " + gai_strerror(ret);
        return false;
    }

    std::vector<AddressInfo> v6, v4;
    for (struct addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        AddressInfo addr{};
        addr.family = rp->ai_family;
        addr.socktype = rp->ai_socktype;
        addr.protocol = rp->ai_protocol;
        addr.addrlen = rp->ai_addrlen;
        std::memcpy(&addr.addr, rp->ai_addr, rp->ai_addrlen);

        if (rp->ai_family == AF_INET6) {
            v6.push_back(addr);
        } else if (rp->ai_family == AF_INET) {
            v4.push_back(addr);
        }
    }
    freeaddrinfo(result);

    // Interleave families, IPv6 first
    size_t n = std::max(v6.size(), v4.size());
    for (size_t i = 0; i < n; ++i) {
        if (i < v6.size()) candidates_.push_back(v6[i]);
        if (i < v4.size()) candidates_.push_back(v4[i]);
    }

    if (candidates_.empty()) {
        last_error_ = "no usable address for " + host_;
        return false;
    }
    return true;
}

int HappyEyeballs::start_attempt(const AddressInfo& addr) {
    int fd = socket(addr.family, addr.socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, addr.protocol);
    if (fd < 0) {
        last_error_ = std::string("socket: ") + std::strerror(errno);
        return -1;
    }

    int flag = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

    int ret = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr.addr), addr.addrlen);
    if (ret != 0 && errno != EINPROGRESS) {
        last_error_ = "connect " + format_address(addr) + ": " + std::strerror(errno);
        ::close(fd);
        return -1;
    }
    return fd;
}

int HappyEyeballs::connect(std::chrono::milliseconds timeout) {
    if (!resolve_addresses()) {
        return -1;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    // Parallel arrays: pending[i] was started for candidates_[owner[i]]
    std::vector<struct pollfd> pending;
    std::vector<size_t> owner;
    size_t next = 0;

    auto close_pending = [&](int keep_fd) {
        for (const auto& p : pending) {
            if (p.fd != keep_fd) ::close(p.fd);
        }
        pending.clear();
        owner.clear();
    };

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        if (next < candidates_.size()) {
            int fd = start_attempt(candidates_[next]);
            if (fd >= 0) {
                struct pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pending.push_back(pfd);
                owner.push_back(next);
            }
            next++;
        }

        if (pending.empty()) {
            if (next >= candidates_.size()) break;
            continue;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto wait = remaining;
        if (next < candidates_.size()) {
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(CONNECTION_ATTEMPT_DELAY));
        }

        int poll_ret = poll(pending.data(), pending.size(), static_cast<int>(wait.count()));
        if (poll_ret < 0 && errno != EINTR) {
            last_error_ = std::string("poll: ") + std::strerror(errno);
            break;
        }

        for (size_t i = 0; poll_ret > 0 && i < pending.size(); ) {
            if (pending[i].revents == 0) {
                ++i;
                continue;
            }
            int error = 0;
            socklen_t len = sizeof(error);
            getsockopt(pending[i].fd, SOL_SOCKET, SO_ERROR, &error, &len);

            const AddressInfo& addr = candidates_[owner[i]];
            if (error == 0) {
                int fd = pending[i].fd;
                connected_address_ = format_address(addr);
                close_pending(fd);
                return fd;
            }

            last_error_ = "connect " + format_address(addr) + ": " + std::strerror(error);
            log_debug("connection attempt failed", {{"address", format_address(addr)},
                                                     {"error", std::strerror(error)}});
            ::close(pending[i].fd);
            pending.erase(pending.begin() + i);
            owner.erase(owner.begin() + i);
        }
    }

    if (last_error_.empty() || std::chrono::steady_clock::now() >= deadline) {
        last_error_ = "timed out connecting to " + host_ + ":" + std::to_string(port_);
    }
    close_pending(-1);
    return -1;
}

} // namespace asn2ip
