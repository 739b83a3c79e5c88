#pragma once

#include "errors.hpp"
#include "network_block.hpp"
#include <string>
#include <utility>
#include <vector>

namespace asn2ip {

// IRRd-style whois command set (whois.radb.net and friends)
namespace whois {
constexpr const char* MULTI_COMMAND_MODE = "!!\n";
constexpr const char* EXIT_COMMAND       = "exit\n";
constexpr char HEADER_MARKER    = 'A';
constexpr const char* NOT_FOUND = "D";
constexpr const char* COMPLETE  = "C";
} // namespace whois

// "!gAS<asn>\n" for IPv4, "!6AS<asn>\n" for IPv6.
// Throws std::invalid_argument for any other version value.
std::string build_query(const std::string& asn, IPVersion version);

// Remove trailing carriage returns left over from "\r\n" framing
std::string strip_line_ending(const std::string& line);

// Parses the reply to a single AS/version query, one line at a time.
//
//   Start --header 'A...'--> Collecting --"C"--> Done
//   Start|Collecting --"D"--> Failed (NotFound)
//   Start --"C"--> Done (no blocks)
//   Start --anything else--> Failed (ProtocolError)
//   Collecting --bad token--> Failed (ProtocolError)
class ResponseParser {
public:
    enum class State {
        Start,
        Collecting,
        Done,
        Failed
    };

    ResponseParser(std::string asn, IPVersion version);

    // Feed one line (without the newline). Lines fed after a terminal state
    // are ignored.
    State feed(const std::string& line);

    State state() const { return state_; }
    bool finished() const { return state_ == State::Done || state_ == State::Failed; }

    const std::vector<NetworkBlock>& blocks() const { return blocks_; }
    std::vector<NetworkBlock> take_blocks() { return std::move(blocks_); }

    // Only meaningful in State::Failed
    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

    // Throws the typed error matching the failure. Requires State::Failed.
    [[noreturn]] void raise() const;

private:
    std::string asn_;
    IPVersion version_;
    State state_;
    std::vector<NetworkBlock> blocks_;
    ErrorCode error_code_;
    std::string error_message_;

    State fail(ErrorCode code, std::string message);
};

} // namespace asn2ip
