#pragma once

#include <vector>
#include <cstdint>
#include <string>
#include <optional>

namespace asn2ip {

enum class ContentEncoding {
    Identity,
    Gzip,
    Brotli
};

class Compression {
public:
    // Pick the encoding for a response from the request's Accept-Encoding.
    // Highest q-value wins; brotli beats gzip on a tie; "q=0" excludes.
    static ContentEncoding negotiate(const std::string& accept_encoding);

    // Value for the Content-Encoding header ("identity", "gzip", "br")
    static const char* header_value(ContentEncoding encoding);

    static std::optional<std::vector<uint8_t>> compress(
        const std::string& data,
        ContentEncoding encoding,
        int level = 6
    );

    static std::optional<std::string> decompress(
        const std::vector<uint8_t>& data,
        ContentEncoding encoding
    );

private:
    static std::optional<std::vector<uint8_t>> compress_gzip(const std::string& data, int level);
    static std::optional<std::vector<uint8_t>> compress_brotli(const std::string& data, int level);
    static std::optional<std::string> decompress_gzip(const std::vector<uint8_t>& data);
    static std::optional<std::string> decompress_brotli(const std::vector<uint8_t>& data);
};

} // namespace asn2ip
