// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TEAMBALANCE_LEDGER_COMMON_H
#define TEAMBALANCE_LEDGER_COMMON_H

/**
 * @file ledger_common.h
 * @brief Common definitions and types for the team balance ledger
 *
 * Shared constants, error codes and small value types used by the ledger,
 * the asset holder and the configuration layer.
 */

#include <uint256.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace teambalance {

/** Proportions of all team members must sum to exactly this value */
static constexpr uint32_t TOTAL_PROPORTION = 100;

/** Asset identifier of the native balance (the null identifier) */
static const uint160 NATIVE_ASSET;

/** Errors reported by ledger creation and withdrawal */
enum class LedgerError : uint8_t {
    NONE = 0,
    EMPTY_TEAM = 1,                 // No team members given
    LENGTH_MISMATCH = 2,            // Team and proportion lists differ in size
    INVALID_ADDRESS = 3,            // A member or the ledger account is the null identity
    BAD_PROPORTION = 4,             // Proportions do not sum to TOTAL_PROPORTION
    NOT_OWNER = 5,                  // Withdrawal requested by someone other than the owner
    NO_USER_PROPORTION = 6,         // Beneficiary has no share assigned
    NO_BALANCE_TO_WITHDRAW = 7,     // Entitlement is zero
    INSUFFICIENT_ENTITLEMENT = 8,   // Withdrawn counter exceeds the share of inflow
    TRANSFER_FAILED = 9,            // Asset holder refused the transfer
    REENTRANT_CALL = 10             // Withdraw called while another withdrawal is transferring
};

/**
 * How the withdrawn counter is keyed when computing entitlements.
 *
 * PER_ASSET subtracts what the beneficiary received of the same asset.
 * SHARED subtracts what the beneficiary received across all assets, which
 * lets a withdrawal of one asset reduce the entitlement of every other asset.
 */
enum class WithdrawalAccounting : uint8_t {
    PER_ASSET = 0,
    SHARED = 1
};

/** A team member and its proportion of every inflow */
struct TeamMember {
    uint160 address;
    uint32_t proportion;

    TeamMember() : proportion(0) {}
    TeamMember(const uint160& addr, uint32_t prop) : address(addr), proportion(prop) {}

    bool operator==(const TeamMember& other) const {
        return address == other.address && proportion == other.proportion;
    }
};

/**
 * Canonical message for an error code, e.g. "Total proportion must equal 100"
 */
std::string LedgerErrorString(LedgerError error);

/**
 * Short name of an error code for logging, e.g. "BadProportion"
 */
std::string LedgerErrorName(LedgerError error);

std::string WithdrawalAccountingToString(WithdrawalAccounting mode);

/**
 * Parse "perasset" or "shared" (case-insensitive)
 * @return false if the string names no mode
 */
bool ParseWithdrawalAccounting(const std::string& str, WithdrawalAccounting& mode);

/**
 * Format an asset identifier, "native" for NATIVE_ASSET
 */
std::string AssetToString(const uint160& asset);

/**
 * Parse "native" or a 40 digit hex address into an asset identifier
 */
bool ParseAsset(const std::string& str, uint160& asset);

/**
 * Stream output operators for enum types (needed for Boost.Test)
 */
inline std::ostream& operator<<(std::ostream& os, LedgerError error) {
    return os << LedgerErrorName(error);
}

inline std::ostream& operator<<(std::ostream& os, WithdrawalAccounting mode) {
    return os << WithdrawalAccountingToString(mode);
}

} // namespace teambalance

#endif // TEAMBALANCE_LEDGER_COMMON_H
