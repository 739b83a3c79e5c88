#pragma once

#include "network_block.hpp"
#include "transport.hpp"
#include <memory>
#include <string>
#include <vector>

namespace asn2ip {

class Statistics;

// One whois connection in multi-command mode. Queries run strictly one after
// another; the destructor always sends "exit" and closes the transport.
class QuerySession {
public:
    // Enables multi-command mode right away; throws ConnectionError if that
    // write fails (the transport is still shut down).
    explicit QuerySession(std::unique_ptr<LineTransport> transport, Statistics* stats = nullptr);
    ~QuerySession();

    QuerySession(const QuerySession&) = delete;
    QuerySession& operator=(const QuerySession&) = delete;

    // Issue one query and read its reply to the terminal marker.
    // Throws NotFoundError, ProtocolError or ConnectionError.
    std::vector<NetworkBlock> query(const std::string& asn, IPVersion version);

    const std::string& remote() const { return remote_; }

private:
    std::unique_ptr<LineTransport> transport_;
    Statistics* stats_;
    std::string remote_;

    void shutdown();
};

} // namespace asn2ip
