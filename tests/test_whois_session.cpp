#include "whois_session.hpp"
#include "errors.hpp"
#include "stats.hpp"

#include "fakes.hpp"

#include <boost/test/unit_test.hpp>

using namespace asn2ip;
using namespace asn2ip::test;

BOOST_AUTO_TEST_SUITE(whois_session)

BOOST_AUTO_TEST_CASE(enables_multi_command_mode_and_exits) {
    auto script = make_script({});
    {
        QuerySession session(std::make_unique<FakeTransport>(script));
        BOOST_TEST(script->sent == "!!\n");
        BOOST_TEST(session.remote() == "fake:43");
    }
    BOOST_TEST(script->sent == "!!\nexit\n");
    BOOST_TEST(script->close_count == 1);
}

BOOST_AUTO_TEST_CASE(queries_share_one_connection) {
    auto script = make_script({"A10\r", "1.2.3.0/24\r", "C\r", "A14", "2001:db8::/32", "C"});
    Statistics stats;
    {
        QuerySession session(std::make_unique<FakeTransport>(script), &stats);
        auto v4_blocks = session.query("64500", IPVersion::V4);
        auto v6_blocks = session.query("64500", IPVersion::V6);

        BOOST_REQUIRE(v4_blocks.size() == 1u);
        BOOST_TEST(v4_blocks[0].cidr == "1.2.3.0/24");
        BOOST_REQUIRE(v6_blocks.size() == 1u);
        BOOST_TEST(v6_blocks[0].cidr == "2001:db8::/32");
    }
    BOOST_TEST(script->sent == "!!\n!gAS64500\n!6AS64500\nexit\n");

    auto s = stats.get_stats();
    BOOST_TEST(s.sessions_opened == 1u);
    BOOST_TEST(s.queries_sent == 2u);
    BOOST_TEST(s.blocks_received == 2u);
}

BOOST_AUTO_TEST_CASE(not_found_still_closes) {
    auto script = make_script({"D"});
    {
        QuerySession session(std::make_unique<FakeTransport>(script));
        BOOST_CHECK_THROW(session.query("9999", IPVersion::V4), NotFoundError);
    }
    BOOST_TEST(script->close_count == 1);
    BOOST_TEST(script->sent == "!!\n!gAS9999\nexit\n");
}

BOOST_AUTO_TEST_CASE(peer_closing_mid_reply_is_connection_error) {
    auto script = make_script({"A10", "1.2.3.0/24"});
    QuerySession session(std::make_unique<FakeTransport>(script));
    BOOST_CHECK_THROW(session.query("64500", IPVersion::V4), ConnectionError);
}

BOOST_AUTO_TEST_CASE(failed_mode_switch_closes_transport) {
    auto script = make_script({});
    script->fail_send = true;

    BOOST_CHECK_EXCEPTION([&] { QuerySession session(std::make_unique<FakeTransport>(script)); }(),
                          ConnectionError,
                          [](const ConnectionError& e) {
                              return std::string(e.what()).find("failed to enable multicommand mode") == 0;
                          });
    BOOST_TEST(script->close_count == 1);
}

BOOST_AUTO_TEST_CASE(exit_failure_does_not_skip_close) {
    auto script = make_script({"C"});
    {
        QuerySession session(std::make_unique<FakeTransport>(script));
        session.query("64500", IPVersion::V4);
        script->fail_send = true;
    }
    BOOST_TEST(script->close_count == 1);
}

BOOST_AUTO_TEST_SUITE_END()
