#include "stats.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>

namespace asn2ip {

// ──────────────────────────────────────────────────────────────────────────────
// ANSI color codes
// ──────────────────────────────────────────────────────────────────────────────
static const char* C_GREY   = "\033[90m";       // box outline
static const char* C_CYAN   = "\033[36m";       // connectors
static const char* C_GREEN  = "\033[92m";       // labels
static const char* C_PINK   = "\033[38;5;205m"; // values
static const char* C_RESET  = "\033[0m";

static const int BOX_WIDTH = 64;
static const size_t LABEL_COLS = 16;

// Display columns of a UTF-8 string; box-drawing chars are 3 bytes, 1 column
static int disp_w(const std::string& s) {
    int w = 0;
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = (unsigned char)s[i];
        if      (c < 0x80)             { w++;    i += 1; }
        else if ((c & 0xE0) == 0xC0)   { w++;    i += 2; }
        else if ((c & 0xF0) == 0xE0)   { w++;    i += 3; }
        else if ((c & 0xF8) == 0xF0)   { w += 2; i += 4; }
        else                           {          i += 1; }
    }
    return w;
}

// Pad `colored` to the box width using the width of `uncolored`, then close it
static void box_line(std::ostream& out, const std::string& uncolored, const std::string& colored) {
    int spaces = BOX_WIDTH - disp_w(uncolored) - 1;
    if (spaces < 0) spaces = 0;
    out << colored << std::string(spaces, ' ') << C_GREY << "║" << C_RESET << "\n";
}

static void section(std::ostream& out, const std::string& title) {
    out << C_GREY << "╔══════════════════════════════════════════════════════════════╗\n" << C_RESET;
    box_line(out, "║  " + title,
             std::string(C_GREY) + "║" + C_RESET + "  " + C_GREEN + title + C_RESET);
}

static void section_end(std::ostream& out) {
    out << C_GREY << "╚══════════════════════════════════════════════════════════════╝\n" << C_RESET;
}

// connector is "╟─" for inner rows, "╙─" for the last row of a section
static void stat_line(std::ostream& out, const std::string& connector,
                      const std::string& label, const std::string& value) {
    std::string pad(label.size() < LABEL_COLS ? LABEL_COLS - label.size() : 1, ' ');
    std::string unc = "║  " + connector + " " + label + pad + value;
    std::string col = std::string(C_GREY) + "║" + C_RESET + "  " +
                      C_CYAN + connector + C_RESET + " " +
                      C_GREEN + label + C_RESET + pad +
                      C_PINK + value + C_RESET;
    box_line(out, unc, col);
}

static std::string fmt2(double v, const std::string& suffix = "") {
    std::ostringstream o;
    o << std::fixed << std::setprecision(2) << v << suffix;
    return o.str();
}

// ──────────────────────────────────────────────────────────────────────────────
Statistics::Statistics() {}

void Statistics::record_fetch(std::chrono::milliseconds latency, size_t asn_count) {
    total_fetches_++;
    total_asns_fetched_ += asn_count;
    uint64_t lat_ms = latency.count();
    total_latency_ms_ += lat_ms;
    uint64_t cur_min = min_latency_ms_.load();
    while (lat_ms < cur_min && !min_latency_ms_.compare_exchange_weak(cur_min, lat_ms));
    uint64_t cur_max = max_latency_ms_.load();
    while (lat_ms > cur_max && !max_latency_ms_.compare_exchange_weak(cur_max, lat_ms));
}

void Statistics::record_error(const std::string& error_type) {
    total_errors_++;
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_counts_[error_type]++;
}

void Statistics::record_session() {
    sessions_opened_++;
}

void Statistics::record_query(size_t blocks_received) {
    queries_sent_++;
    blocks_received_ += blocks_received;
}

void Statistics::record_cache_hit() {
    cache_hits_++;
}

void Statistics::record_cache_miss() {
    cache_misses_++;
}

Statistics::Stats Statistics::get_stats() const {
    Stats s;
    s.total_fetches      = total_fetches_;
    s.total_asns_fetched = total_asns_fetched_;
    s.total_errors       = total_errors_;
    s.sessions_opened    = sessions_opened_;
    s.queries_sent       = queries_sent_;
    s.blocks_received    = blocks_received_;
    s.cache_hits         = cache_hits_;
    s.cache_misses       = cache_misses_;

    uint64_t fetches = total_fetches_.load();
    s.avg_latency_ms = fetches > 0 ? static_cast<double>(total_latency_ms_) / fetches : 0;
    uint64_t mn = min_latency_ms_.load();
    s.min_latency_ms = (mn == UINT64_MAX) ? 0 : mn;
    s.max_latency_ms = max_latency_ms_.load();

    std::lock_guard<std::mutex> lock(error_mutex_);
    s.error_counts = error_counts_;
    return s;
}

void Statistics::reset() {
    total_fetches_ = total_asns_fetched_ = total_errors_ = 0;
    sessions_opened_ = queries_sent_ = blocks_received_ = 0;
    cache_hits_ = cache_misses_ = 0;
    total_latency_ms_ = 0;
    min_latency_ms_ = UINT64_MAX;
    max_latency_ms_ = 0;
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_counts_.clear();
}

void Statistics::print(std::ostream& out) const {
    auto s = get_stats();

    out << "\n" << C_GREY
        << "╔══════════════════════════════════════════════════════════════╗\n"
        << "║                      ASN2IP STATISTICS                       ║\n"
        << "╚══════════════════════════════════════════════════════════════╝\n"
        << C_RESET;

    section(out, "FETCHES");
    stat_line(out, "╟─", "Fetches:", std::to_string(s.total_fetches));
    stat_line(out, "╟─", "AS numbers:", std::to_string(s.total_asns_fetched));
    stat_line(out, "╙─", "Errors:", std::to_string(s.total_errors));
    section_end(out);

    section(out, "WHOIS");
    stat_line(out, "╟─", "Sessions:", std::to_string(s.sessions_opened));
    stat_line(out, "╟─", "Queries:", std::to_string(s.queries_sent));
    stat_line(out, "╙─", "Networks:", std::to_string(s.blocks_received));
    section_end(out);

    section(out, "CACHE");
    stat_line(out, "╟─", "Hits:", std::to_string(s.cache_hits));
    stat_line(out, "╟─", "Misses:", std::to_string(s.cache_misses));
    {
        uint64_t lookups = s.cache_hits + s.cache_misses;
        std::string rate = lookups > 0 ? fmt2(100.0 * s.cache_hits / lookups, "%") : "0.00%";
        stat_line(out, "╙─", "Hit Rate:", rate);
    }
    section_end(out);

    section(out, "LATENCY");
    stat_line(out, "╟─", "Average:", fmt2(s.avg_latency_ms, " ms"));
    stat_line(out, "╟─", "Min:", fmt2(s.min_latency_ms, " ms"));
    stat_line(out, "╙─", "Max:", fmt2(s.max_latency_ms, " ms"));
    section_end(out);

    if (!s.error_counts.empty()) {
        section(out, "ERRORS");
        size_t i = 0;
        for (const auto& [kind, count] : s.error_counts) {
            bool last = ++i == s.error_counts.size();
            stat_line(out, last ? "╙─" : "╟─", kind + ":", std::to_string(count));
        }
        section_end(out);
    }
}

} // namespace asn2ip
