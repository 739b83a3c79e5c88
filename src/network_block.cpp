#include "network_block.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstdint>
#include <cstring>

namespace asn2ip {

const char* ip_version_key(IPVersion version) {
    return version == IPVersion::V4 ? "ipv4" : "ipv6";
}

static bool parse_prefix_length(const std::string& text, int max_bits, int& out) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    if (value > max_bits) {
        return false;
    }
    out = value;
    return true;
}

// Zero every bit past the first prefix_len bits
static void mask_host_bits(uint8_t* addr, size_t addr_len, int prefix_len) {
    for (size_t i = 0; i < addr_len; ++i) {
        int bit_start = static_cast<int>(i) * 8;
        if (bit_start >= prefix_len) {
            addr[i] = 0;
        } else if (bit_start + 8 > prefix_len) {
            int keep = prefix_len - bit_start;
            addr[i] &= static_cast<uint8_t>(0xFF << (8 - keep));
        }
    }
}

std::optional<NetworkBlock> parse_network_block(const std::string& token, IPVersion version) {
    size_t slash = token.find('/');
    if (slash == std::string::npos || slash == 0 || token.find('/', slash + 1) != std::string::npos) {
        return std::nullopt;
    }

    std::string address = token.substr(0, slash);
    int family = (version == IPVersion::V4) ? AF_INET : AF_INET6;
    int max_bits = (version == IPVersion::V4) ? 32 : 128;

    int prefix_len = 0;
    if (!parse_prefix_length(token.substr(slash + 1), max_bits, prefix_len)) {
        return std::nullopt;
    }

    uint8_t buf[sizeof(in6_addr)];
    std::memset(buf, 0, sizeof(buf));
    if (inet_pton(family, address.c_str(), buf) != 1) {
        return std::nullopt;
    }

    size_t addr_len = (version == IPVersion::V4) ? sizeof(in_addr) : sizeof(in6_addr);
    mask_host_bits(buf, addr_len, prefix_len);

    char text[INET6_ADDRSTRLEN];
    if (inet_ntop(family, buf, text, sizeof(text)) == nullptr) {
        return std::nullopt;
    }

    NetworkBlock block;
    block.version = version;
    block.cidr = std::string(text) + "/" + std::to_string(prefix_len);
    return block;
}

std::vector<std::string> to_strings(const std::vector<NetworkBlock>& blocks) {
    std::vector<std::string> out;
    out.reserve(blocks.size());
    for (const auto& block : blocks) {
        out.push_back(block.cidr);
    }
    return out;
}

} // namespace asn2ip
