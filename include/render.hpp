#pragma once

#include "network_block.hpp"
#include <string>

namespace asn2ip {

// {"<asn>": {"ipv4": [...], "ipv6": [...]}, ...}
std::string render_json(const FetchResult& result);

// Every IPv4 block of every AS, then every IPv6 block, joined by separator
std::string render_plain(const FetchResult& result, const std::string& separator);

// Listing printed by the fetch command:
//   AS<asn>
//     <ipv4 blocks, comma separated>
//     <ipv6 blocks, comma separated>
std::string render_listing(const FetchResult& result);

} // namespace asn2ip
