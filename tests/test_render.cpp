#include "render.hpp"

#include "fakes.hpp"

#include <boost/test/unit_test.hpp>

using namespace asn2ip;
using namespace asn2ip::test;

namespace {

FetchResult sample() {
    FetchResult result;
    result["64500"].ipv4 = {v4("1.2.3.0/24"), v4("5.6.0.0/16")};
    result["64500"].ipv6 = {v6("2001:db8::/32")};
    result["64501"].ipv4 = {v4("9.9.9.0/24")};
    return result;
}

} // namespace

BOOST_AUTO_TEST_SUITE(render)

BOOST_AUTO_TEST_CASE(json_lists_both_versions_per_as) {
    BOOST_TEST(render_json(sample()) ==
               "{\"64500\":{\"ipv4\":[\"1.2.3.0/24\",\"5.6.0.0/16\"],\"ipv6\":[\"2001:db8::/32\"]},"
               "\"64501\":{\"ipv4\":[\"9.9.9.0/24\"],\"ipv6\":[]}}");
    BOOST_TEST(render_json(FetchResult{}) == "{}");
}

BOOST_AUTO_TEST_CASE(plain_puts_all_ipv4_before_ipv6) {
    BOOST_TEST(render_plain(sample(), " ") == "1.2.3.0/24 5.6.0.0/16 9.9.9.0/24 2001:db8::/32");
    BOOST_TEST(render_plain(sample(), "\n") == "1.2.3.0/24\n5.6.0.0/16\n9.9.9.0/24\n2001:db8::/32");
    BOOST_TEST(render_plain(FetchResult{}, " ") == "");
}

BOOST_AUTO_TEST_CASE(listing_per_as) {
    BOOST_TEST(render_listing(sample()) ==
               "AS64500\n"
               "  1.2.3.0/24,5.6.0.0/16\n"
               "  2001:db8::/32\n"
               "AS64501\n"
               "  9.9.9.0/24\n"
               "  \n");
}

BOOST_AUTO_TEST_CASE(json_escapes_keys) {
    FetchResult result;
    result["a\"b\\c\n"].ipv4 = {v4("1.2.3.0/24")};
    result[std::string("\x01", 1)];
    BOOST_TEST(render_json(result) ==
               "{\"\\u0001\":{\"ipv4\":[],\"ipv6\":[]},"
               "\"a\\\"b\\\\c\\n\":{\"ipv4\":[\"1.2.3.0/24\"],\"ipv6\":[]}}");
}

BOOST_AUTO_TEST_CASE(json_replaces_invalid_utf8) {
    FetchResult result;
    result["\xff"];
    BOOST_TEST(render_json(result) == "{\"\xef\xbf\xbd\":{\"ipv4\":[],\"ipv6\":[]}}");
}

BOOST_AUTO_TEST_SUITE_END()
