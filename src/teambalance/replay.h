// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TEAMBALANCE_REPLAY_H
#define TEAMBALANCE_REPLAY_H

/**
 * @file replay.h
 * @brief Replays a script of deposits and withdrawals against a ledger
 *
 * One command per line, '#' starts a comment:
 *
 *     deposit <asset|native> <amount>
 *     entitlement <asset|native> <member>
 *     withdraw <asset|native> <member>
 *     state <asset|native>
 *
 * Amounts are decimal strings in whole units of the configured decimals.
 */

#include <teambalance/asset_holder.h>
#include <teambalance/team_ledger.h>
#include <amount.h>

#include <istream>
#include <ostream>
#include <string>

namespace teambalance {

class ScriptReplayer {
public:
    /**
     * @param ledger Ledger to drive, withdrawals are issued as its owner
     * @param holder Holder the ledger reads; deposits credit the ledger account
     * @param decimals Decimal places of script amounts
     */
    ScriptReplayer(TeamLedger& ledger, InMemoryAssetHolder& holder, unsigned int decimals = DEFAULT_ASSET_DECIMALS);

    /**
     * @brief Execute a single script line
     * @param line Command text
     * @param out Receives one result line (more for "state")
     * @param error Set if the line is malformed
     * @return false if the line could not be executed
     *
     * A refused withdrawal is a result, not an error.
     */
    bool ExecuteLine(const std::string& line, std::ostream& out, std::string& error);

    /**
     * @brief Execute every line of a script
     * @return false at the first malformed line, with error naming the line
     */
    bool Replay(std::istream& script, std::ostream& out, std::string& error);

    /** Number of withdrawals that paid out */
    uint64_t GetSuccessfulWithdrawals() const { return successfulWithdrawals_; }

    /** Number of withdrawals that were refused */
    uint64_t GetFailedWithdrawals() const { return failedWithdrawals_; }

private:
    TeamLedger& ledger_;
    InMemoryAssetHolder& holder_;
    unsigned int decimals_;
    uint64_t successfulWithdrawals_;
    uint64_t failedWithdrawals_;
};

} // namespace teambalance

#endif // TEAMBALANCE_REPLAY_H
