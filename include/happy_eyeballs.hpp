#ifndef ASN2IP_HAPPY_EYEBALLS_HPP
#define ASN2IP_HAPPY_EYEBALLS_HPP

#include <string>
#include <vector>
#include <chrono>
#include <sys/socket.h>
#include <netinet/in.h>

namespace asn2ip {

struct AddressInfo {
    int family;
    int socktype;
    int protocol;
    sockaddr_storage addr;
    socklen_t addrlen;
};

std::string format_address(const AddressInfo& addr);

// RFC 8305 style dialer: resolve, interleave IPv6/IPv4, start a new attempt
// every CONNECTION_ATTEMPT_DELAY while earlier ones are still pending, and
// keep the first socket that completes. The socket is returned non-blocking.
class HappyEyeballs {
public:
    static constexpr auto CONNECTION_ATTEMPT_DELAY = std::chrono::milliseconds(250);

    HappyEyeballs(const std::string& host, int port);

    // Returns the connected fd, or -1 with last_error() describing why
    int connect(std::chrono::milliseconds timeout);

    const std::string& last_error() const { return last_error_; }
    const std::string& connected_address() const { return connected_address_; }

private:
    std::string host_;
    int port_;
    std::vector<AddressInfo> candidates_;
    std::string last_error_;
    std::string connected_address_;

    bool resolve_addresses();
    int start_attempt(const AddressInfo& addr);
};

} // namespace asn2ip

#endif // ASN2IP_HAPPY_EYEBALLS_HPP
