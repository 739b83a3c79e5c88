#include "whois_session.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "stats.hpp"
#include "whois_codec.hpp"

namespace asn2ip {

QuerySession::QuerySession(std::unique_ptr<LineTransport> transport, Statistics* stats)
    : transport_(std::move(transport)), stats_(stats) {
    remote_ = transport_->remote();
    if (stats_) stats_->record_session();

    log_debug("enabling multicommand mode", {{"remote", remote_}});
    try {
        transport_->send_all(whois::MULTI_COMMAND_MODE);
    } catch (const ConnectionError& e) {
        shutdown();
        throw ConnectionError(std::string("failed to enable multicommand mode: ") + e.what());
    }
}

QuerySession::~QuerySession() {
    shutdown();
}

void QuerySession::shutdown() {
    if (!transport_) {
        return;
    }

    log_debug("closing socket to whois host", {{"remote", remote_}});
    try {
        transport_->send_all(whois::EXIT_COMMAND);
    } catch (const ConnectionError& e) {
        // The close below must still happen
        log_debug("failed to send exit command", {{"remote", remote_}, {"error", e.what()}});
    }
    transport_->close();
    transport_.reset();
}

std::vector<NetworkBlock> QuerySession::query(const std::string& asn, IPVersion version) {
    std::string cmd = build_query(asn, version);

    log_debug("issuing fetch command", {{"remote", remote_},
                                        {"as", asn},
                                        {"version", std::to_string(static_cast<int>(version))}});
    try {
        transport_->send_all(cmd);
    } catch (const ConnectionError& e) {
        throw ConnectionError("failed to fetch ip addresses for " + asn + ": " + e.what());
    }

    ResponseParser parser(asn, version);
    while (!parser.finished()) {
        parser.feed(strip_line_ending(transport_->read_line()));
    }

    if (parser.state() == ResponseParser::State::Failed) {
        parser.raise();
    }

    auto blocks = parser.take_blocks();
    if (stats_) stats_->record_query(blocks.size());
    return blocks;
}

} // namespace asn2ip
