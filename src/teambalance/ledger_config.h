// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TEAMBALANCE_LEDGER_CONFIG_H
#define TEAMBALANCE_LEDGER_CONFIG_H

/**
 * @file ledger_config.h
 * @brief Ledger configuration from command-line arguments and config file
 */

#include <teambalance/asset_holder.h>
#include <teambalance/ledger_common.h>
#include <teambalance/team_ledger.h>

#include <memory>
#include <string>
#include <vector>

namespace teambalance {

// Default values for ledger configuration
static const char* const DEFAULT_WITHDRAWAL_ACCOUNTING = "perasset";
static const int64_t DEFAULT_MAX_HISTORY = static_cast<int64_t>(DEFAULT_MAX_WITHDRAWAL_HISTORY);

/** Everything needed to create a TeamLedger */
struct LedgerOptions {
    /** Members in configuration order (duplicates kept) */
    std::vector<TeamMember> members;

    /** Creating identity, defaults to the first member */
    uint160 owner;

    /** Account of the ledger at the asset holder */
    uint160 ledgerAddress;

    LedgerSettings settings;
};

/**
 * Get ledger help message for command-line options
 * @return Help message string
 */
std::string GetLedgerHelpMessage();

/**
 * Parse a "-member" value of the form <address>:<proportion>
 * @return false if the address or proportion is malformed
 */
bool ParseMemberArg(const std::string& value, TeamMember& member);

/**
 * Build ledger options from gArgs
 * @param options Filled on success
 * @param error Set to the offending option on failure
 * @return true if every option was valid
 *
 * The team itself is validated by TeamLedger::Create, not here.
 */
bool InitLedgerOptions(LedgerOptions& options, std::string& error);

/**
 * Create a ledger from options
 * @return The ledger, or nullptr with error set
 */
std::unique_ptr<TeamLedger> CreateLedger(const LedgerOptions& options, AssetHolder& holder, LedgerError& error);

} // namespace teambalance

#endif // TEAMBALANCE_LEDGER_CONFIG_H
