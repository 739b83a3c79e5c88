#include "compression.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <zlib.h>
#include <brotli/decode.h>
#include <brotli/encode.h>

namespace asn2ip {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

ContentEncoding Compression::negotiate(const std::string& accept_encoding) {
    double q_gzip = -1.0;
    double q_br = -1.0;
    double q_any = -1.0;

    size_t pos = 0;
    while (pos <= accept_encoding.size()) {
        size_t comma = accept_encoding.find(',', pos);
        if (comma == std::string::npos) comma = accept_encoding.size();
        std::string item = accept_encoding.substr(pos, comma - pos);
        pos = comma + 1;

        size_t semi = item.find(';');
        std::string coding = trim(item.substr(0, semi));
        std::transform(coding.begin(), coding.end(), coding.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (coding.empty()) continue;

        double q = 1.0;
        if (semi != std::string::npos) {
            std::string param = trim(item.substr(semi + 1));
            if (param.size() > 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
                q = std::strtod(param.c_str() + 2, nullptr);
            }
        }

        if (coding == "gzip" || coding == "x-gzip") q_gzip = q;
        else if (coding == "br") q_br = q;
        else if (coding == "*") q_any = q;
    }

    if (q_gzip < 0) q_gzip = q_any;
    if (q_br < 0) q_br = q_any;

    if (q_br > 0 && q_br >= q_gzip) return ContentEncoding::Brotli;
    if (q_gzip > 0) return ContentEncoding::Gzip;
    return ContentEncoding::Identity;
}

const char* Compression::header_value(ContentEncoding encoding) {
    switch (encoding) {
        case ContentEncoding::Gzip:   return "gzip";
        case ContentEncoding::Brotli: return "br";
        case ContentEncoding::Identity:
        default:
            return "identity";
    }
}

std::optional<std::vector<uint8_t>> Compression::compress_gzip(const std::string& data, int level) {
    z_stream stream{};
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = data.size();

    // 15 + 16 selects the gzip wrapper
    if (deflateInit2(&stream, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    std::vector<uint8_t> output;
    output.reserve(deflateBound(&stream, data.size()));

    const size_t chunk_size = 16384;
    std::vector<uint8_t> temp(chunk_size);

    int ret;
    do {
        stream.next_out = temp.data();
        stream.avail_out = chunk_size;

        ret = deflate(&stream, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&stream);
            return std::nullopt;
        }

        size_t have = chunk_size - stream.avail_out;
        output.insert(output.end(), temp.begin(), temp.begin() + have);
    } while (ret != Z_STREAM_END);

    deflateEnd(&stream);
    return output;
}

std::optional<std::string> Compression::decompress_gzip(const std::vector<uint8_t>& data) {
    if (data.empty()) return std::string();

    z_stream stream{};
    stream.next_in = const_cast<uint8_t*>(data.data());
    stream.avail_in = data.size();

    if (inflateInit2(&stream, 15 + 16) != Z_OK) {
        return std::nullopt;
    }

    std::string output;
    const size_t chunk_size = 16384;
    std::vector<char> temp(chunk_size);

    int ret;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(temp.data());
        stream.avail_out = chunk_size;

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            return std::nullopt;
        }

        output.append(temp.data(), chunk_size - stream.avail_out);
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return output;
}

std::optional<std::vector<uint8_t>> Compression::compress_brotli(const std::string& data, int level) {
    size_t output_size = BrotliEncoderMaxCompressedSize(data.size());
    if (output_size == 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> output(output_size);

    BROTLI_BOOL result = BrotliEncoderCompress(
        level,
        BROTLI_DEFAULT_WINDOW,
        BROTLI_MODE_TEXT,
        data.size(), reinterpret_cast<const uint8_t*>(data.data()),
        &output_size, output.data()
    );

    if (result != BROTLI_TRUE) {
        return std::nullopt;
    }

    output.resize(output_size);
    return output;
}

std::optional<std::string> Compression::decompress_brotli(const std::vector<uint8_t>& data) {
    if (data.empty()) return std::string();

    BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (!state) {
        return std::nullopt;
    }

    std::string output;
    const uint8_t* next_in = data.data();
    size_t avail_in = data.size();
    uint8_t buf[16384];

    BrotliDecoderResult result;
    do {
        uint8_t* next_out = buf;
        size_t avail_out = sizeof(buf);
        result = BrotliDecoderDecompressStream(state, &avail_in, &next_in,
                                               &avail_out, &next_out, nullptr);
        output.append(reinterpret_cast<char*>(buf), sizeof(buf) - avail_out);
    } while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT);

    BrotliDecoderDestroyInstance(state);
    if (result != BROTLI_DECODER_RESULT_SUCCESS) {
        return std::nullopt;
    }
    return output;
}

std::optional<std::vector<uint8_t>> Compression::compress(
    const std::string& data,
    ContentEncoding encoding,
    int level) {

    switch (encoding) {
        case ContentEncoding::Gzip:
            return compress_gzip(data, std::min(level, 9));
        case ContentEncoding::Brotli:
            return compress_brotli(data, level);
        case ContentEncoding::Identity:
        default:
            return std::vector<uint8_t>(data.begin(), data.end());
    }
}

std::optional<std::string> Compression::decompress(
    const std::vector<uint8_t>& data,
    ContentEncoding encoding) {

    switch (encoding) {
        case ContentEncoding::Gzip:
            return decompress_gzip(data);
        case ContentEncoding::Brotli:
            return decompress_brotli(data);
        case ContentEncoding::Identity:
        default:
            return std::string(data.begin(), data.end());
    }
}

} // namespace asn2ip
