#include "transport.hpp"
#include "errors.hpp"
#include "happy_eyeballs.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

// MSG_NOSIGNAL doesn't exist on some systems
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace asn2ip {

// Wait for `events` on fd until the deadline; false on expiry
static bool wait_for(int fd, short events, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret > 0) {
            return true;
        }
        if (ret == 0) {
            return false;
        }
        if (errno != EINTR) {
            throw ConnectionError(std::string("poll failed: ") + std::strerror(errno));
        }
    }
}

TcpTransport::TcpTransport(const std::string& host, int port, const TransportOptions& options)
    : socket_fd_(-1), options_(options) {
    HappyEyeballs he(host, port);
    socket_fd_ = he.connect(options_.connect_timeout);
    if (socket_fd_ < 0) {
        throw ConnectionError("failed to connect to " + host + ":" + std::to_string(port) +
                              ": " + he.last_error());
    }
    remote_ = he.connected_address();
}

TcpTransport::~TcpTransport() {
    close();
}

void TcpTransport::close() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

void TcpTransport::send_all(const std::string& data) {
    if (socket_fd_ < 0) {
        throw ConnectionError("write on closed connection to " + remote_);
    }

    auto deadline = std::chrono::steady_clock::now() + options_.io_timeout;
    size_t sent = 0;

    while (sent < data.size()) {
        ssize_t n = ::send(socket_fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_for(socket_fd_, POLLOUT, deadline)) {
                throw ConnectionError("timed out writing to " + remote_);
            }
            continue;
        }
        throw ConnectionError("failed to write to " + remote_ + ": " + std::strerror(errno));
    }
}

std::string TcpTransport::read_line() {
    if (socket_fd_ < 0) {
        throw ConnectionError("read on closed connection to " + remote_);
    }

    auto deadline = std::chrono::steady_clock::now() + options_.io_timeout;
    char buf[4096];

    while (true) {
        size_t newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            return line;
        }

        ssize_t n = ::recv(socket_fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            buffer_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            throw ConnectionError("connection closed by " + remote_ + " before end of line");
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!wait_for(socket_fd_, POLLIN, deadline)) {
                throw ConnectionError("timed out reading from " + remote_);
            }
            continue;
        }
        throw ConnectionError("failed to read from " + remote_ + ": " + std::strerror(errno));
    }
}

TransportFactory tcp_transport_factory() {
    return [](const std::string& host, int port, const TransportOptions& options) {
        return std::unique_ptr<LineTransport>(new TcpTransport(host, port, options));
    };
}

} // namespace asn2ip
