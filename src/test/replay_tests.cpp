// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <teambalance/replay.h>
#include <test/test_teambalance.h>

#include <boost/test/unit_test.hpp>

#include <sstream>

using namespace teambalance;

namespace {

struct ReplayTestingSetup : public BasicTestingSetup {
    InMemoryAssetHolder holder;
    uint160 owner;
    uint160 memberA;
    uint160 memberB;
    std::unique_ptr<TeamLedger> ledger;

    ReplayTestingSetup()
        : owner(TestAddress(1))
        , memberA(uint160S("00000000000000000000000000000000000000a1"))
        , memberB(uint160S("00000000000000000000000000000000000000b2"))
    {
        LedgerError error;
        ledger = TeamLedger::Create({memberA, memberB}, {50, 50}, owner, TestAddress(0xfe), holder, error);
        BOOST_REQUIRE(ledger);
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(replay_tests, ReplayTestingSetup)

BOOST_AUTO_TEST_CASE(replay_rounding_script)
{
    ScriptReplayer replayer(*ledger, holder, 0);
    std::istringstream script(
        "# two rounds of 777\n"
        "deposit native 777\n"
        "withdraw native 0x00000000000000000000000000000000000000a1\n"
        "withdraw native 0x00000000000000000000000000000000000000b2\n"
        "\n"
        "deposit native 777\n"
        "entitlement native 0x00000000000000000000000000000000000000a1\n"
        "withdraw native 0x00000000000000000000000000000000000000a1   # second payout\n"
        "withdraw native 0x00000000000000000000000000000000000000b2\n"
        "withdraw native 0x00000000000000000000000000000000000000b2\n");
    std::ostringstream out;
    std::string error;

    BOOST_REQUIRE_MESSAGE(replayer.Replay(script, out, error), error);
    BOOST_CHECK_EQUAL(replayer.GetSuccessfulWithdrawals(), 4u);
    BOOST_CHECK_EQUAL(replayer.GetFailedWithdrawals(), 1u);

    BOOST_CHECK_EQUAL(holder.GetBalance(NATIVE_ASSET, memberA), 777);
    BOOST_CHECK_EQUAL(holder.GetBalance(NATIVE_ASSET, memberB), 777);

    const std::string text = out.str();
    BOOST_CHECK(text.find("deposit native 777 -> onhand 777\n") != std::string::npos);
    BOOST_CHECK(text.find("withdraw native 00000000000000000000000000000000000000a1 = 388 (event 1)\n") != std::string::npos);
    BOOST_CHECK(text.find("deposit native 777 -> onhand 778\n") != std::string::npos);
    BOOST_CHECK(text.find("entitlement native 00000000000000000000000000000000000000a1 = 389\n") != std::string::npos);
    BOOST_CHECK(text.find("failed: NoBalanceToWithdraw: No balance available to withdraw\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(replay_decimal_amounts)
{
    ScriptReplayer replayer(*ledger, holder);
    std::ostringstream out;
    std::string error;

    BOOST_REQUIRE(replayer.ExecuteLine("deposit 0x00000000000000000000000000000000000000aa 10.5", out, error));
    BOOST_REQUIRE(replayer.ExecuteLine("state 0x00000000000000000000000000000000000000aa", out, error));

    const std::string text = out.str();
    BOOST_CHECK(text.find("state 00000000000000000000000000000000000000aa total=0 onhand=10.5\n") != std::string::npos);
    BOOST_CHECK(text.find("00000000000000000000000000000000000000a1 share=50 withdrawn=0 entitlement=5.25\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(replay_rejects_malformed_lines)
{
    ScriptReplayer replayer(*ledger, holder);
    std::ostringstream out;
    std::string error;

    BOOST_CHECK(!replayer.ExecuteLine("steal native", out, error));
    BOOST_CHECK_EQUAL(error, "Unknown command 'steal'");

    BOOST_CHECK(!replayer.ExecuteLine("deposit native", out, error));
    BOOST_CHECK(!replayer.ExecuteLine("deposit gold 5", out, error));
    BOOST_CHECK(!replayer.ExecuteLine("deposit native -5", out, error));
    BOOST_CHECK(!replayer.ExecuteLine("withdraw native 0x1234", out, error));
    BOOST_CHECK(!replayer.ExecuteLine("state", out, error));

    // Comments and blank lines are no-ops
    BOOST_CHECK(replayer.ExecuteLine("   # nothing", out, error));
    BOOST_CHECK(replayer.ExecuteLine("", out, error));
    BOOST_CHECK(out.str().empty());

    std::istringstream script("deposit native 1\nwithdraw native\nstate native\n");
    BOOST_CHECK(!replayer.Replay(script, out, error));
    BOOST_CHECK_EQUAL(error, "line 2: withdraw takes 2 arguments");
}

BOOST_AUTO_TEST_CASE(replay_reports_refusals)
{
    ScriptReplayer replayer(*ledger, holder);
    std::ostringstream out;
    std::string error;

    BOOST_CHECK(replayer.ExecuteLine("withdraw native 0x00000000000000000000000000000000000000c3", out, error));
    BOOST_CHECK(out.str().find("failed: NoUserProportion") != std::string::npos);
    BOOST_CHECK_EQUAL(replayer.GetFailedWithdrawals(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
