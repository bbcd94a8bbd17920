// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <logging.h>
#include <test/test_teambalance.h>
#include <teambalance/ledger_common.h>
#include <uint256.h>
#include <util.h>
#include <utilmoneystr.h>
#include <utilstrencodings.h>

#include <boost/test/unit_test.hpp>

#include <sstream>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_ParseHex)
{
    std::vector<unsigned char> result = ParseHex("04678afdb0");
    std::vector<unsigned char> expected = {0x04, 0x67, 0x8a, 0xfd, 0xb0};
    BOOST_CHECK_EQUAL_COLLECTIONS(result.begin(), result.end(), expected.begin(), expected.end());

    // Spaces between bytes must be supported
    result = ParseHex("12 34 56 78");
    BOOST_CHECK(result.size() == 4 && result[0] == 0x12 && result[1] == 0x34 && result[2] == 0x56 && result[3] == 0x78);

    // Stop parsing at invalid value
    result = ParseHex("1234 invalid 1234");
    BOOST_CHECK(result.size() == 2 && result[0] == 0x12 && result[1] == 0x34);
}

BOOST_AUTO_TEST_CASE(util_HexStr)
{
    std::vector<unsigned char> data = {0x04, 0x67, 0x8a, 0xfd, 0xb0};
    BOOST_CHECK_EQUAL(HexStr(data.begin(), data.end()), "04678afdb0");
    BOOST_CHECK_EQUAL(HexStr(data.begin(), data.begin()), "");
}

BOOST_AUTO_TEST_CASE(util_ParseUInt64)
{
    uint64_t n;
    BOOST_CHECK(ParseUInt64("1234", &n) && n == 1234ULL);
    BOOST_CHECK(ParseUInt64("18446744073709551615", &n) && n == 18446744073709551615ULL);
    BOOST_CHECK(!ParseUInt64("18446744073709551616", nullptr));
    BOOST_CHECK(!ParseUInt64("", &n));
    BOOST_CHECK(!ParseUInt64(" 1", &n));
    BOOST_CHECK(!ParseUInt64("-1", &n));
    BOOST_CHECK(!ParseUInt64("1a", &n));
}

BOOST_AUTO_TEST_CASE(util_TrimString)
{
    BOOST_CHECK_EQUAL(TrimString("  abc \t\n"), "abc");
    BOOST_CHECK_EQUAL(TrimString("   "), "");
    BOOST_CHECK_EQUAL(ToLower("NaTiVe"), "native");
}

BOOST_AUTO_TEST_CASE(uint160_hex)
{
    const std::string hex = "00000000000000000000000000000000000000a1";
    uint160 addr = uint160S(hex);
    BOOST_CHECK_EQUAL(addr.GetHex(), hex);
    BOOST_CHECK_EQUAL(addr.ToString(), hex);
    BOOST_CHECK_EQUAL(*addr.begin(), 0xa1);
    BOOST_CHECK(uint160S("0x" + hex) == addr);
    BOOST_CHECK(!addr.IsNull());

    addr.SetNull();
    BOOST_CHECK(addr.IsNull());
    BOOST_CHECK(addr == uint160());
    BOOST_CHECK(uint160() < uint160S(hex));
}

BOOST_AUTO_TEST_CASE(uint160_ParseAddress)
{
    uint160 addr;
    BOOST_CHECK(ParseAddress("0x00000000000000000000000000000000000000a1", addr));
    BOOST_CHECK(addr == uint160S("a1"));
    BOOST_CHECK(ParseAddress("00000000000000000000000000000000000000A1", addr));
    BOOST_CHECK(addr == uint160S("a1"));

    BOOST_CHECK(!ParseAddress("", addr));
    BOOST_CHECK(!ParseAddress("0x", addr));
    BOOST_CHECK(!ParseAddress("0xa1", addr));
    BOOST_CHECK(!ParseAddress("0x00000000000000000000000000000000000000a1ff", addr));
    BOOST_CHECK(!ParseAddress("0x000000000000000000000000000000000000zza1", addr));
}

BOOST_AUTO_TEST_CASE(util_FormatUnits)
{
    BOOST_CHECK_EQUAL(FormatUnits(0), "0");
    BOOST_CHECK_EQUAL(FormatUnits(5 * COIN), "5");
    BOOST_CHECK_EQUAL(FormatUnits(CAmount("10123560000000000000")), "10.12356");
    BOOST_CHECK_EQUAL(FormatUnits(1), "0.000000000000000001");
    BOOST_CHECK_EQUAL(FormatUnits(777, 0), "777");
    BOOST_CHECK_EQUAL(FormatUnits(777, 2), "7.77");
    BOOST_CHECK_EQUAL(FormatUnits(700, 2), "7");
}

BOOST_AUTO_TEST_CASE(util_ParseUnits)
{
    CAmount ret = 0;
    BOOST_CHECK(ParseUnits("0", ret));
    BOOST_CHECK_EQUAL(ret, 0);
    BOOST_CHECK(ParseUnits("5", ret));
    BOOST_CHECK_EQUAL(ret, 5 * COIN);
    BOOST_CHECK(ParseUnits("10.12356", ret));
    BOOST_CHECK_EQUAL(ret, CAmount("10123560000000000000"));
    BOOST_CHECK(ParseUnits("0.000000000000000001", ret));
    BOOST_CHECK_EQUAL(ret, 1);
    BOOST_CHECK(ParseUnits(" 7.77 ", ret, 2));
    BOOST_CHECK_EQUAL(ret, 777);

    // Largest 256-bit value
    const std::string max = "115792089237316195423570985008687907853269984665640564039457584007913129639935";
    BOOST_CHECK(ParseUnits(max, ret, 0));
    BOOST_CHECK_EQUAL(ret.str(), max);
    BOOST_CHECK(!ParseUnits("115792089237316195423570985008687907853269984665640564039457584007913129639936", ret, 0));

    BOOST_CHECK(!ParseUnits("", ret));
    BOOST_CHECK(!ParseUnits("-1", ret));
    BOOST_CHECK(!ParseUnits("+1", ret));
    BOOST_CHECK(!ParseUnits(".5", ret));
    BOOST_CHECK(!ParseUnits("5.", ret));
    BOOST_CHECK(!ParseUnits("1.2.3", ret));
    BOOST_CHECK(!ParseUnits("0.0000000000000000001", ret));
    BOOST_CHECK(!ParseUnits("1.5", ret, 0));
    BOOST_CHECK(!ParseUnits("1e18", ret));
}

BOOST_AUTO_TEST_CASE(ledger_common_strings)
{
    using namespace teambalance;

    BOOST_CHECK_EQUAL(LedgerErrorName(LedgerError::EMPTY_TEAM), "EmptyTeam");
    BOOST_CHECK_EQUAL(LedgerErrorString(LedgerError::NOT_OWNER), "Caller is not the owner");

    WithdrawalAccounting mode;
    BOOST_CHECK(ParseWithdrawalAccounting("shared", mode));
    BOOST_CHECK_EQUAL(mode, WithdrawalAccounting::SHARED);
    BOOST_CHECK(ParseWithdrawalAccounting("perasset", mode));
    BOOST_CHECK_EQUAL(mode, WithdrawalAccounting::PER_ASSET);
    BOOST_CHECK(!ParseWithdrawalAccounting("both", mode));

    uint160 asset;
    BOOST_CHECK(ParseAsset("native", asset));
    BOOST_CHECK(asset == NATIVE_ASSET);
    BOOST_CHECK_EQUAL(AssetToString(asset), "native");
    BOOST_CHECK(ParseAsset("0x00000000000000000000000000000000000000aa", asset));
    BOOST_CHECK_EQUAL(AssetToString(asset), "00000000000000000000000000000000000000aa");
    BOOST_CHECK(!ParseAsset("gold", asset));
}

BOOST_AUTO_TEST_CASE(util_ReadConfigStream)
{
    std::istringstream stream(
        "a=1\n"
        "nob=1\n"
        "# comment\n"
        "c=x\n"
        "c=y\n");
    std::string error;
    gArgs.ForceSetArg("-a", "5");
    BOOST_REQUIRE(gArgs.ReadConfigStream(stream, error));

    BOOST_CHECK_EQUAL(gArgs.GetArg("-a", ""), "5");
    BOOST_CHECK(gArgs.IsArgSet("-b"));
    BOOST_CHECK(!gArgs.GetBoolArg("-b", true));
    BOOST_CHECK_EQUAL(gArgs.GetArg("-c", ""), "x");
    BOOST_CHECK_EQUAL(gArgs.GetArgs("-c").size(), 2u);
    BOOST_CHECK_EQUAL(gArgs.GetArg("-missing", (int64_t)7), 7);

    std::istringstream broken("[section\n");
    BOOST_CHECK(!gArgs.ReadConfigStream(broken, error));
    BOOST_CHECK(error.find("Error parsing configuration") == 0);
}

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    const char* argv[] = {"teambalance-replay", "-ignored", "--member=a:1", "-member=b:2", "-noprinttoconsole", "script", "-after"};
    gArgs.ParseParameters(7, argv);

    BOOST_CHECK(gArgs.IsArgSet("-ignored"));
    BOOST_CHECK_EQUAL(gArgs.GetArgs("-member").size(), 2u);
    BOOST_CHECK_EQUAL(gArgs.GetArg("-member", ""), "b:2");
    BOOST_CHECK(!gArgs.GetBoolArg("-printtoconsole", true));
    BOOST_CHECK(!gArgs.IsArgSet("-after"));
}

BOOST_AUTO_TEST_CASE(logging_categories)
{
    TBLog::LogFlags flag;
    BOOST_CHECK(GetLogCategory(flag, "ledger"));
    BOOST_CHECK_EQUAL(flag, TBLog::LEDGER);
    BOOST_CHECK(GetLogCategory(flag, ""));
    BOOST_CHECK_EQUAL(flag, TBLog::ALL);
    BOOST_CHECK(!GetLogCategory(flag, "net"));
    BOOST_CHECK_EQUAL(ListLogCategories(), "ledger, transfer, config");

    BOOST_CHECK(!LogAcceptCategory(TBLog::TRANSFER));
    BOOST_CHECK(g_logger->EnableCategory("transfer"));
    BOOST_CHECK(LogAcceptCategory(TBLog::TRANSFER));
    BOOST_CHECK(!LogAcceptCategory(TBLog::CONFIG));
    g_logger->DisableCategory(TBLog::ALL);
}

BOOST_AUTO_TEST_SUITE_END()
