// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <teambalance/asset_holder.h>
#include <teambalance/ledger_config.h>
#include <teambalance/replay.h>
#include <util.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

static std::string HelpMessage()
{
    std::string strUsage = "Usage:\n"
                           "  teambalance-replay [options] -script=<file>\n"
                           "  teambalance-replay [options] < script\n\n";
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-script=<file>", "Read commands from <file> instead of standard input");
    strUsage += HelpMessageOpt("-decimals=<n>", strprintf("Decimal places of script amounts (default: %u)", DEFAULT_ASSET_DECIMALS));
    strUsage += "\n";
    strUsage += teambalance::GetLedgerHelpMessage();
    return strUsage;
}

static int AppInit(int argc, char* argv[])
{
    gArgs.ParseParameters(argc, argv);

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return EXIT_SUCCESS;
    }

    std::string error;
    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", TEAMBALANCE_CONF_FILENAME), error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    if (!InitLogging(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    int64_t decimals = gArgs.GetArg("-decimals", (int64_t)DEFAULT_ASSET_DECIMALS);
    if (decimals < 0 || decimals > 77) {
        fprintf(stderr, "Error: Invalid -decimals=%lld\n", (long long)decimals);
        return EXIT_FAILURE;
    }

    teambalance::LedgerOptions options;
    if (!teambalance::InitLedgerOptions(options, error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    teambalance::InMemoryAssetHolder holder;
    teambalance::LedgerError ledgerError;
    std::unique_ptr<teambalance::TeamLedger> ledger = teambalance::CreateLedger(options, holder, ledgerError);
    if (!ledger) {
        fprintf(stderr, "Error: %s\n", teambalance::LedgerErrorString(ledgerError).c_str());
        return EXIT_FAILURE;
    }

    teambalance::ScriptReplayer replayer(*ledger, holder, static_cast<unsigned int>(decimals));
    bool ok;
    if (gArgs.IsArgSet("-script")) {
        std::string path = gArgs.GetArg("-script", "");
        std::ifstream script(path);
        if (!script.good()) {
            fprintf(stderr, "Error: Cannot open script %s\n", path.c_str());
            return EXIT_FAILURE;
        }
        ok = replayer.Replay(script, std::cout, error);
    } else {
        ok = replayer.Replay(std::cin, std::cout, error);
    }

    if (!ok) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try {
        return AppInit(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
    }
    return EXIT_FAILURE;
}
