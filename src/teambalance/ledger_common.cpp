// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <teambalance/ledger_common.h>

#include <utilstrencodings.h>

namespace teambalance {

std::string LedgerErrorString(LedgerError error)
{
    switch (error) {
        case LedgerError::NONE: return "No error";
        case LedgerError::EMPTY_TEAM: return "Team length must be bigger than 0";
        case LedgerError::LENGTH_MISMATCH: return "Team and proportions length mismatch";
        case LedgerError::INVALID_ADDRESS: return "Address must not be zero";
        case LedgerError::BAD_PROPORTION: return "Total proportion must equal 100";
        case LedgerError::NOT_OWNER: return "Caller is not the owner";
        case LedgerError::NO_USER_PROPORTION: return "User has no proportion assigned";
        case LedgerError::NO_BALANCE_TO_WITHDRAW: return "No balance available to withdraw";
        case LedgerError::INSUFFICIENT_ENTITLEMENT: return "Withdrawn amount exceeds entitlement";
        case LedgerError::TRANSFER_FAILED: return "Asset transfer failed";
        case LedgerError::REENTRANT_CALL: return "Withdrawal already in progress";
    }
    return "Unknown error";
}

std::string LedgerErrorName(LedgerError error)
{
    switch (error) {
        case LedgerError::NONE: return "None";
        case LedgerError::EMPTY_TEAM: return "EmptyTeam";
        case LedgerError::LENGTH_MISMATCH: return "LengthMismatch";
        case LedgerError::INVALID_ADDRESS: return "InvalidAddress";
        case LedgerError::BAD_PROPORTION: return "BadProportion";
        case LedgerError::NOT_OWNER: return "NotOwner";
        case LedgerError::NO_USER_PROPORTION: return "NoUserProportion";
        case LedgerError::NO_BALANCE_TO_WITHDRAW: return "NoBalanceToWithdraw";
        case LedgerError::INSUFFICIENT_ENTITLEMENT: return "InsufficientEntitlement";
        case LedgerError::TRANSFER_FAILED: return "TransferFailed";
        case LedgerError::REENTRANT_CALL: return "ReentrantCall";
    }
    return "Unknown";
}

std::string WithdrawalAccountingToString(WithdrawalAccounting mode)
{
    switch (mode) {
        case WithdrawalAccounting::PER_ASSET: return "perasset";
        case WithdrawalAccounting::SHARED: return "shared";
    }
    return "unknown";
}

bool ParseWithdrawalAccounting(const std::string& str, WithdrawalAccounting& mode)
{
    std::string lower = ToLower(TrimString(str));
    if (lower == "perasset") {
        mode = WithdrawalAccounting::PER_ASSET;
        return true;
    }
    if (lower == "shared") {
        mode = WithdrawalAccounting::SHARED;
        return true;
    }
    return false;
}

std::string AssetToString(const uint160& asset)
{
    if (asset.IsNull()) {
        return "native";
    }
    return asset.GetHex();
}

bool ParseAsset(const std::string& str, uint160& asset)
{
    if (ToLower(TrimString(str)) == "native") {
        asset.SetNull();
        return true;
    }
    return ParseAddress(str, asset);
}

} // namespace teambalance
