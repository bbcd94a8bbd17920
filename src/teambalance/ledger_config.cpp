// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <teambalance/ledger_config.h>
#include <util.h>
#include <utilstrencodings.h>

namespace teambalance {

std::string GetLedgerHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Ledger options:");
    strUsage += HelpMessageOpt("-member=<address>:<share>", "Add a team member with its proportion of every inflow. Repeat once per member; proportions must sum to 100");
    strUsage += HelpMessageOpt("-owner=<address>", "Identity allowed to trigger withdrawals (default: first member)");
    strUsage += HelpMessageOpt("-ledgeraddress=<address>", "Account of the ledger at the asset holder (required)");
    strUsage += HelpMessageOpt("-withdrawalaccounting=<mode>", strprintf("Withdrawn counter used for entitlements: perasset or shared (default: %s)", DEFAULT_WITHDRAWAL_ACCOUNTING));
    strUsage += HelpMessageOpt("-maxhistory=<n>", strprintf("Number of withdrawal events kept in memory (default: %u)", DEFAULT_MAX_HISTORY));

    strUsage += HelpMessageGroup("Debugging/Logging options:");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", TEAMBALANCE_CONF_FILENAME));
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", strprintf("Write log output to <file> (default: %s)", DEFAULT_DEBUGLOGFILE));
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console");

    return strUsage;
}

bool ParseMemberArg(const std::string& value, TeamMember& member)
{
    std::string::size_type colon = value.rfind(':');
    if (colon == std::string::npos) {
        return false;
    }

    uint160 address;
    if (!ParseAddress(value.substr(0, colon), address)) {
        return false;
    }

    uint64_t proportion;
    if (!ParseUInt64(TrimString(value.substr(colon + 1)), &proportion) || proportion > TOTAL_PROPORTION) {
        return false;
    }

    member = TeamMember(address, static_cast<uint32_t>(proportion));
    return true;
}

bool InitLedgerOptions(LedgerOptions& options, std::string& error)
{
    options = LedgerOptions();

    for (const std::string& arg : gArgs.GetArgs("-member")) {
        TeamMember member;
        if (!ParseMemberArg(arg, member)) {
            error = strprintf("Invalid -member=%s, expected <address>:<share> with share 0-%u", arg, TOTAL_PROPORTION);
            return false;
        }
        options.members.push_back(member);
    }

    if (gArgs.IsArgSet("-owner")) {
        std::string owner = gArgs.GetArg("-owner", "");
        if (!ParseAddress(owner, options.owner)) {
            error = strprintf("Invalid -owner=%s", owner);
            return false;
        }
    } else if (!options.members.empty()) {
        options.owner = options.members.front().address;
    }

    std::string ledgerAddress = gArgs.GetArg("-ledgeraddress", "");
    if (ledgerAddress.empty()) {
        error = "-ledgeraddress must be set";
        return false;
    }
    if (!ParseAddress(ledgerAddress, options.ledgerAddress)) {
        error = strprintf("Invalid -ledgeraddress=%s", ledgerAddress);
        return false;
    }

    std::string accounting = gArgs.GetArg("-withdrawalaccounting", DEFAULT_WITHDRAWAL_ACCOUNTING);
    if (!ParseWithdrawalAccounting(accounting, options.settings.accounting)) {
        error = strprintf("Invalid -withdrawalaccounting=%s, expected perasset or shared", accounting);
        return false;
    }

    int64_t maxHistory = gArgs.GetArg("-maxhistory", DEFAULT_MAX_HISTORY);
    if (maxHistory < 1) {
        error = strprintf("Invalid -maxhistory=%d, must be at least 1", maxHistory);
        return false;
    }
    options.settings.maxHistory = static_cast<size_t>(maxHistory);

    LogPrint(TBLog::CONFIG, "Ledger: Configured %u members, owner=%s, ledger=%s, accounting=%s, maxhistory=%u\n",
             options.members.size(), options.owner.GetHex(), options.ledgerAddress.GetHex(),
             WithdrawalAccountingToString(options.settings.accounting), options.settings.maxHistory);

    return true;
}

std::unique_ptr<TeamLedger> CreateLedger(const LedgerOptions& options, AssetHolder& holder, LedgerError& error)
{
    return TeamLedger::Create(options.members, options.owner, options.ledgerAddress, holder, error, options.settings);
}

} // namespace teambalance
