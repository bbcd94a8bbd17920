// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <teambalance/replay.h>
#include <util.h>
#include <utilmoneystr.h>
#include <utilstrencodings.h>

#include <sstream>
#include <vector>

namespace teambalance {

ScriptReplayer::ScriptReplayer(TeamLedger& ledger, InMemoryAssetHolder& holder, unsigned int decimals)
    : ledger_(ledger)
    , holder_(holder)
    , decimals_(decimals)
    , successfulWithdrawals_(0)
    , failedWithdrawals_(0)
{
}

bool ScriptReplayer::ExecuteLine(const std::string& line, std::ostream& out, std::string& error)
{
    std::string text = line.substr(0, line.find('#'));

    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    if (words.empty()) {
        return true;
    }

    const std::string command = ToLower(words[0]);

    if (command == "deposit" || command == "entitlement" || command == "withdraw") {
        if (words.size() != 3) {
            error = strprintf("%s takes 2 arguments", command);
            return false;
        }
    } else if (command == "state") {
        if (words.size() != 2) {
            error = "state takes 1 argument";
            return false;
        }
    } else {
        error = strprintf("Unknown command '%s'", words[0]);
        return false;
    }

    uint160 asset;
    if (!ParseAsset(words[1], asset)) {
        error = strprintf("Invalid asset '%s'", words[1]);
        return false;
    }

    if (command == "deposit") {
        CAmount amount;
        if (!ParseUnits(words[2], amount, decimals_)) {
            error = strprintf("Invalid amount '%s'", words[2]);
            return false;
        }
        if (!holder_.Credit(asset, ledger_.GetLedgerAddress(), amount)) {
            error = "Deposit refused by asset holder";
            return false;
        }
        out << "deposit " << AssetToString(asset) << " " << FormatUnits(amount, decimals_)
            << " -> onhand " << FormatUnits(holder_.GetBalance(asset, ledger_.GetLedgerAddress()), decimals_) << "\n";
        return true;
    }

    if (command == "state") {
        out << "state " << AssetToString(asset)
            << " total=" << FormatUnits(ledger_.GetTotalBalance(asset), decimals_)
            << " onhand=" << FormatUnits(holder_.GetBalance(asset, ledger_.GetLedgerAddress()), decimals_) << "\n";
        for (const TeamMember& member : ledger_.GetTeam()) {
            out << "  " << member.address.GetHex()
                << " share=" << member.proportion
                << " withdrawn=" << FormatUnits(ledger_.GetWithdrawn(member.address, asset), decimals_)
                << " entitlement=" << FormatUnits(ledger_.GetEntitlement(asset, member.address), decimals_) << "\n";
        }
        return true;
    }

    uint160 member;
    if (!ParseAddress(words[2], member)) {
        error = strprintf("Invalid member address '%s'", words[2]);
        return false;
    }

    if (command == "entitlement") {
        out << "entitlement " << AssetToString(asset) << " " << member.GetHex()
            << " = " << FormatUnits(ledger_.GetEntitlement(asset, member), decimals_) << "\n";
        return true;
    }

    WithdrawResult result = ledger_.Withdraw(ledger_.GetOwner(), asset, member);
    out << "withdraw " << AssetToString(asset) << " " << member.GetHex();
    if (result.success) {
        ++successfulWithdrawals_;
        out << " = " << FormatUnits(result.amount, decimals_) << " (event " << result.event.sequence << ")\n";
    } else {
        ++failedWithdrawals_;
        out << " failed: " << LedgerErrorName(result.error) << ": " << result.message << "\n";
    }
    return true;
}

bool ScriptReplayer::Replay(std::istream& script, std::ostream& out, std::string& error)
{
    std::string line;
    unsigned int lineNumber = 0;
    while (std::getline(script, line)) {
        ++lineNumber;
        std::string lineError;
        if (!ExecuteLine(line, out, lineError)) {
            error = strprintf("line %u: %s", lineNumber, lineError);
            LogPrintf("ScriptReplayer: Aborted at %s\n", error);
            return false;
        }
    }

    LogPrint(TBLog::LEDGER, "ScriptReplayer: Replayed %u lines, %u withdrawals paid, %u refused\n",
             lineNumber, successfulWithdrawals_, failedWithdrawals_);
    return true;
}

} // namespace teambalance
