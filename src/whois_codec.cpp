#include "whois_codec.hpp"
#include <stdexcept>

namespace asn2ip {

std::string build_query(const std::string& asn, IPVersion version) {
    switch (version) {
        case IPVersion::V4:
            return "!gAS" + asn + "\n";
        case IPVersion::V6:
            return "!6AS" + asn + "\n";
    }
    throw std::invalid_argument("unknown ip protocol version " +
                                std::to_string(static_cast<int>(version)));
}

std::string strip_line_ending(const std::string& line) {
    size_t end = line.size();
    while (end > 0 && line[end - 1] == '\r') {
        end--;
    }
    return line.substr(0, end);
}

ResponseParser::ResponseParser(std::string asn, IPVersion version)
    : asn_(std::move(asn)),
      version_(version),
      state_(State::Start),
      error_code_(ErrorCode::ProtocolError) {
}

ResponseParser::State ResponseParser::fail(ErrorCode code, std::string message) {
    error_code_ = code;
    error_message_ = std::move(message);
    blocks_.clear();
    state_ = State::Failed;
    return state_;
}

ResponseParser::State ResponseParser::feed(const std::string& line) {
    if (finished()) {
        return state_;
    }

    // Terminal markers are honoured in every state
    if (line == whois::NOT_FOUND) {
        return fail(ErrorCode::NotFound, "as " + asn_ + " not found");
    }
    if (line == whois::COMPLETE) {
        state_ = State::Done;
        return state_;
    }

    if (state_ == State::Start) {
        if (line.empty()) {
            return fail(ErrorCode::ProtocolError, "empty response for as " + asn_);
        }
        if (line[0] != whois::HEADER_MARKER) {
            return fail(ErrorCode::ProtocolError, "received invalid response for as " + asn_);
        }
        state_ = State::Collecting;
        return state_;
    }

    // Collecting: tokens are separated by single spaces
    size_t pos = 0;
    while (true) {
        size_t space = line.find(' ', pos);
        std::string token = line.substr(pos, space == std::string::npos ? std::string::npos : space - pos);

        auto block = parse_network_block(token, version_);
        if (!block) {
            return fail(ErrorCode::ProtocolError,
                        "failed to parse network " + token + " for as " + asn_);
        }
        blocks_.push_back(std::move(*block));

        if (space == std::string::npos) break;
        pos = space + 1;
    }
    return state_;
}

void ResponseParser::raise() const {
    if (error_code_ == ErrorCode::NotFound) {
        throw NotFoundError(asn_);
    }
    throw ProtocolError(error_message_);
}

} // namespace asn2ip
