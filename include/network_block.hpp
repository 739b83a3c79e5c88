#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace asn2ip {

enum class IPVersion {
    V4 = 4,
    V6 = 6
};

const char* ip_version_key(IPVersion version); // "ipv4" / "ipv6"

// An announced prefix in canonical CIDR form (host bits cleared)
struct NetworkBlock {
    IPVersion version;
    std::string cidr;

    bool operator==(const NetworkBlock& other) const {
        return version == other.version && cidr == other.cidr;
    }
    bool operator!=(const NetworkBlock& other) const { return !(*this == other); }
};

// Parse "addr/len" for exactly one family. Returns nullopt for anything else,
// including a valid prefix of the other family.
std::optional<NetworkBlock> parse_network_block(const std::string& token, IPVersion version);

struct ASNetworks {
    std::vector<NetworkBlock> ipv4;
    std::vector<NetworkBlock> ipv6;

    std::vector<NetworkBlock>& blocks(IPVersion version) {
        return version == IPVersion::V4 ? ipv4 : ipv6;
    }
    const std::vector<NetworkBlock>& blocks(IPVersion version) const {
        return version == IPVersion::V4 ? ipv4 : ipv6;
    }
};

using FetchResult = std::map<std::string, ASNetworks>;

std::vector<std::string> to_strings(const std::vector<NetworkBlock>& blocks);

} // namespace asn2ip
