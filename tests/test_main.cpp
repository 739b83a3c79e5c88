#define BOOST_TEST_MODULE asn2ip_unit_test
#include <boost/test/unit_test.hpp>

#include "logger.hpp"

#include <sstream>

namespace {

// Keeps library logging out of the test report
struct QuietLogger {
    QuietLogger() {
        asn2ip::Logger::instance().set_output(&sink);
        asn2ip::Logger::instance().set_level(asn2ip::LogLevel::Debug);
    }
    ~QuietLogger() {
        asn2ip::Logger::instance().set_output(nullptr);
    }
    std::ostringstream sink;
};

} // namespace

BOOST_TEST_GLOBAL_FIXTURE(QuietLogger);
