#include "render.hpp"
#include <nlohmann/json.hpp>

namespace asn2ip {

using json = nlohmann::json;

static json block_array(const std::vector<NetworkBlock>& blocks) {
    json out = json::array();
    for (const auto& block : blocks) {
        out.push_back(block.cidr);
    }
    return out;
}

std::string render_json(const FetchResult& result) {
    json body = json::object();
    for (const auto& [asn, networks] : result) {
        body[asn] = {{"ipv4", block_array(networks.ipv4)}, {"ipv6", block_array(networks.ipv6)}};
    }
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string render_plain(const FetchResult& result, const std::string& separator) {
    std::string out;
    bool first = true;
    for (IPVersion version : {IPVersion::V4, IPVersion::V6}) {
        for (const auto& entry : result) {
            for (const auto& block : entry.second.blocks(version)) {
                if (!first) out += separator;
                out += block.cidr;
                first = false;
            }
        }
    }
    return out;
}

static std::string join(const std::vector<NetworkBlock>& blocks, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) out += separator;
        out += blocks[i].cidr;
    }
    return out;
}

std::string render_listing(const FetchResult& result) {
    std::string out;
    for (const auto& [asn, networks] : result) {
        out += "AS" + asn + "\n";
        out += "  " + join(networks.ipv4, ",") + "\n";
        out += "  " + join(networks.ipv6, ",") + "\n";
    }
    return out;
}

} // namespace asn2ip
