#include "logger.hpp"

#include <boost/test/unit_test.hpp>

#include <sstream>

using namespace asn2ip;

namespace {

// Points the logger at a private stream and puts it back afterwards
struct CaptureLog {
    CaptureLog() {
        Logger::instance().set_output(&out);
        Logger::instance().set_format(LogFormat::Plain);
        Logger::instance().set_level(LogLevel::Info);
    }
    ~CaptureLog() {
        Logger::instance().set_format(LogFormat::Plain);
        Logger::instance().set_level(LogLevel::Debug);
        Logger::instance().set_output(&discard);
    }
    std::ostringstream out;
    static std::ostringstream discard;
};

std::ostringstream CaptureLog::discard;

} // namespace

BOOST_FIXTURE_TEST_SUITE(logger, CaptureLog)

BOOST_AUTO_TEST_CASE(plain_line_with_fields) {
    log_info("processed http request", {{"status", "200"}, {"path", "/64500"}});
    std::string line = out.str();
    BOOST_TEST(line.find("[info] processed http request status=200 path=/64500\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(level_filters) {
    log_debug("hidden");
    BOOST_TEST(out.str().empty());

    Logger::instance().set_level(LogLevel::Debug);
    BOOST_TEST(Logger::instance().enabled(LogLevel::Debug));
    BOOST_TEST(!Logger::instance().enabled(LogLevel::Trace));
    log_debug("shown");
    BOOST_TEST(out.str().find("[debug] shown") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(json_format_escapes) {
    Logger::instance().set_format(LogFormat::Json);
    log_warn("bad \"reply\"", {{"asn", "64500"}});
    std::string line = out.str();
    BOOST_TEST(line.rfind("{\"time\":\"", 0) == 0);
    BOOST_TEST(line.find("\"level\":\"warning\"") != std::string::npos);
    BOOST_TEST(line.find("\"msg\":\"bad \\\"reply\\\"\"") != std::string::npos);
    BOOST_TEST(line.find("\"asn\":\"64500\"}") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(level_and_format_names) {
    BOOST_TEST(std::string(log_level_name(LogLevel::Error)) == "error");
    BOOST_TEST(std::string(log_level_name(LogLevel::Warn)) == "warning");

    LogFormat format = LogFormat::Plain;
    BOOST_TEST(parse_log_format("json", format));
    BOOST_TEST((format == LogFormat::Json));
    BOOST_TEST(!parse_log_format("xml", format));
}

BOOST_AUTO_TEST_SUITE_END()
