#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace asn2ip {

struct TransportOptions {
    std::chrono::milliseconds connect_timeout{10000};
    // Applies to each write and to each line read separately
    std::chrono::milliseconds io_timeout{30000};
};

// Newline-delimited, half-duplex byte stream. All failures (including
// deadline expiry) throw ConnectionError.
class LineTransport {
public:
    virtual ~LineTransport() = default;

    virtual void send_all(const std::string& data) = 0;

    // Next line without its '\n'. A peer that closes mid-line is an error,
    // never a short line.
    virtual std::string read_line() = 0;

    // Idempotent
    virtual void close() = 0;

    virtual std::string remote() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<LineTransport>(
    const std::string& host, int port, const TransportOptions& options)>;

class TcpTransport : public LineTransport {
public:
    // Dials immediately; throws ConnectionError if no address answers
    // within options.connect_timeout.
    TcpTransport(const std::string& host, int port, const TransportOptions& options);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    void send_all(const std::string& data) override;
    std::string read_line() override;
    void close() override;
    std::string remote() const override { return remote_; }

    int fd() const { return socket_fd_; }

private:
    int socket_fd_;
    std::string remote_;
    TransportOptions options_;
    std::string buffer_;
};

TransportFactory tcp_transport_factory();

} // namespace asn2ip
