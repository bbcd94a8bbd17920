// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file team_ledger.cpp
 * @brief Implementation of the team balance ledger
 */

#include <teambalance/team_ledger.h>
#include <util.h>

#include <set>
#include <stdexcept>

namespace teambalance {

namespace {

/** Value of a counter before a withdrawal, for rollback */
struct CounterSnapshot {
    bool existed;
    CAmount value;
};

template <typename Key>
CounterSnapshot TakeSnapshot(const std::map<Key, CAmount>& counters, const Key& key)
{
    CounterSnapshot snapshot;
    auto it = counters.find(key);
    snapshot.existed = it != counters.end();
    snapshot.value = snapshot.existed ? it->second : CAmount(0);
    return snapshot;
}

template <typename Key>
void RestoreSnapshot(std::map<Key, CAmount>& counters, const Key& key, const CounterSnapshot& snapshot)
{
    if (snapshot.existed) {
        counters[key] = snapshot.value;
    } else {
        counters.erase(key);
    }
}

/** Holds a flag set for the lifetime of the guard */
class FlagGuard {
public:
    explicit FlagGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~FlagGuard() { flag_ = false; }

    FlagGuard(const FlagGuard&) = delete;
    FlagGuard& operator=(const FlagGuard&) = delete;

private:
    bool& flag_;
};

} // anonymous namespace

// ============================================================================
// Creation
// ============================================================================

TeamLedger::TeamLedger(const uint160& owner,
                       const uint160& ledgerAddress,
                       AssetHolder& holder,
                       const std::map<uint160, uint32_t>& proportions,
                       const LedgerSettings& settings)
    : owner_(owner)
    , ledgerAddress_(ledgerAddress)
    , holder_(holder)
    , proportions_(proportions)
    , settings_(settings)
    , nextSequence_(1)
    , withdrawInProgress_(false)
{
}

LedgerError TeamLedger::ValidateTeam(
    const std::vector<uint160>& team,
    const std::vector<uint32_t>& proportions)
{
    if (team.empty()) {
        return LedgerError::EMPTY_TEAM;
    }
    if (team.size() != proportions.size()) {
        return LedgerError::LENGTH_MISMATCH;
    }

    uint64_t totalProportion = 0;
    for (size_t i = 0; i < team.size(); ++i) {
        if (team[i].IsNull()) {
            return LedgerError::INVALID_ADDRESS;
        }
        totalProportion += proportions[i];
    }

    // Summed over the raw input, duplicates included
    if (totalProportion != TOTAL_PROPORTION) {
        return LedgerError::BAD_PROPORTION;
    }
    return LedgerError::NONE;
}

std::unique_ptr<TeamLedger> TeamLedger::Create(
    const std::vector<uint160>& team,
    const std::vector<uint32_t>& proportions,
    const uint160& creator,
    const uint160& ledgerAddress,
    AssetHolder& holder,
    LedgerError& error,
    const LedgerSettings& settings)
{
    error = LedgerError::NONE;

    if (team.empty()) {
        error = LedgerError::EMPTY_TEAM;
    } else if (team.size() != proportions.size()) {
        error = LedgerError::LENGTH_MISMATCH;
    } else if (ledgerAddress.IsNull()) {
        error = LedgerError::INVALID_ADDRESS;
    } else {
        error = ValidateTeam(team, proportions);
    }

    if (error != LedgerError::NONE) {
        LogPrintf("TeamLedger: Rejected team of %u members - %s\n",
                  team.size(), LedgerErrorString(error));
        return nullptr;
    }

    // Last write wins for repeated identities
    std::map<uint160, uint32_t> table;
    std::set<uint160> seen;
    for (size_t i = 0; i < team.size(); ++i) {
        if (!seen.insert(team[i]).second) {
            LogPrintf("TeamLedger: Warning - member %s listed again, proportion %u replaces %u\n",
                      team[i].GetHex(), proportions[i], table.count(team[i]) ? table[team[i]] : 0);
        }
        if (proportions[i] == 0) {
            table.erase(team[i]);
        } else {
            table[team[i]] = proportions[i];
        }
    }

    std::unique_ptr<TeamLedger> ledger(new TeamLedger(creator, ledgerAddress, holder, table, settings));

    LogPrintf("TeamLedger: Created ledger %s owned by %s with %u members (%s accounting)\n",
              ledgerAddress.GetHex(), creator.GetHex(), table.size(),
              WithdrawalAccountingToString(settings.accounting));
    for (const auto& entry : table) {
        LogPrint(TBLog::LEDGER, "TeamLedger:   %s -> %u%%\n", entry.first.GetHex(), entry.second);
    }

    return ledger;
}

std::unique_ptr<TeamLedger> TeamLedger::Create(
    const std::vector<TeamMember>& members,
    const uint160& creator,
    const uint160& ledgerAddress,
    AssetHolder& holder,
    LedgerError& error,
    const LedgerSettings& settings)
{
    std::vector<uint160> team;
    std::vector<uint32_t> proportions;
    team.reserve(members.size());
    proportions.reserve(members.size());

    for (const auto& member : members) {
        team.push_back(member.address);
        proportions.push_back(member.proportion);
    }

    return Create(team, proportions, creator, ledgerAddress, holder, error, settings);
}

CAmount TeamLedger::CalculateShare(const CAmount& inflow, uint32_t proportion)
{
    return (inflow * proportion) / TOTAL_PROPORTION;
}

// ============================================================================
// Entitlement and Withdrawal
// ============================================================================

CAmount TeamLedger::GetTotalBalanceLocked(const uint160& asset) const
{
    auto it = totalBalance_.find(asset);
    if (it == totalBalance_.end()) {
        return 0;
    }
    return it->second;
}

CAmount TeamLedger::GetAccountedWithdrawnLocked(const uint160& beneficiary, const uint160& asset) const
{
    if (settings_.accounting == WithdrawalAccounting::SHARED) {
        auto it = withdrawn_.find(beneficiary);
        return it == withdrawn_.end() ? CAmount(0) : it->second;
    }

    auto it = withdrawnByAsset_.find(std::make_pair(beneficiary, asset));
    return it == withdrawnByAsset_.end() ? CAmount(0) : it->second;
}

LedgerError TeamLedger::ComputeEntitlementLocked(
    const uint160& asset,
    const uint160& beneficiary,
    uint32_t proportion,
    const CAmount& observedBalance,
    CAmount& available) const
{
    available = 0;

    CAmount balanceUntilNow = GetTotalBalanceLocked(asset) + observedBalance;
    CAmount entitled = CalculateShare(balanceUntilNow, proportion);
    CAmount alreadyWithdrawn = GetAccountedWithdrawnLocked(beneficiary, asset);

    if (alreadyWithdrawn > entitled) {
        LogPrint(TBLog::LEDGER, "TeamLedger: %s withdrew %s but is entitled to %s of %s\n",
                 beneficiary.GetHex(), alreadyWithdrawn.str(), entitled.str(), AssetToString(asset));
        return LedgerError::INSUFFICIENT_ENTITLEMENT;
    }

    available = entitled - alreadyWithdrawn;
    return LedgerError::NONE;
}

CAmount TeamLedger::GetEntitlement(const uint160& asset, const uint160& beneficiary) const
{
    LOCK(cs_ledger_);

    auto it = proportions_.find(beneficiary);
    if (it == proportions_.end()) {
        return 0;
    }

    CAmount observed = holder_.GetBalance(asset, ledgerAddress_);
    CAmount available;
    try {
        if (ComputeEntitlementLocked(asset, beneficiary, it->second, observed, available) != LedgerError::NONE) {
            return 0;
        }
    } catch (const std::overflow_error& e) {
        LogPrintf("TeamLedger: Entitlement of %s in %s overflows - %s\n",
                  beneficiary.GetHex(), AssetToString(asset), e.what());
        return 0;
    }
    return available;
}

WithdrawResult TeamLedger::Withdraw(const uint160& caller, const uint160& asset, const uint160& beneficiary)
{
    LOCK(cs_ledger_);

    if (caller != owner_) {
        LogPrint(TBLog::LEDGER, "TeamLedger: Withdrawal by %s refused, not the owner\n", caller.GetHex());
        return WithdrawResult::Failure(LedgerError::NOT_OWNER);
    }

    if (withdrawInProgress_) {
        LogPrintf("TeamLedger: Refused re-entrant withdrawal of %s for %s\n",
                  AssetToString(asset), beneficiary.GetHex());
        return WithdrawResult::Failure(LedgerError::REENTRANT_CALL);
    }

    auto it = proportions_.find(beneficiary);
    if (it == proportions_.end()) {
        LogPrint(TBLog::LEDGER, "TeamLedger: %s has no proportion\n", beneficiary.GetHex());
        return WithdrawResult::Failure(LedgerError::NO_USER_PROPORTION);
    }

    CAmount observed = holder_.GetBalance(asset, ledgerAddress_);
    CAmount available;
    LedgerError error = ComputeEntitlementLocked(asset, beneficiary, it->second, observed, available);
    if (error != LedgerError::NONE) {
        LogPrintf("TeamLedger: Withdrawal of %s for %s failed - %s\n",
                  AssetToString(asset), beneficiary.GetHex(), LedgerErrorString(error));
        return WithdrawResult::Failure(error);
    }

    if (available == 0) {
        LogPrint(TBLog::LEDGER, "TeamLedger: Nothing to withdraw of %s for %s\n",
                 AssetToString(asset), beneficiary.GetHex());
        return WithdrawResult::Failure(LedgerError::NO_BALANCE_TO_WITHDRAW);
    }

    const std::pair<uint160, uint160> assetKey = std::make_pair(beneficiary, asset);
    const CounterSnapshot prevTotal = TakeSnapshot(totalBalance_, asset);
    const CounterSnapshot prevWithdrawn = TakeSnapshot(withdrawn_, beneficiary);
    const CounterSnapshot prevByAsset = TakeSnapshot(withdrawnByAsset_, assetKey);

    // Computed up front so an overflow leaves the counters untouched
    const CAmount newTotal = prevTotal.value + available;
    const CAmount newWithdrawn = prevWithdrawn.value + available;
    const CAmount newByAsset = prevByAsset.value + available;

    // Commit before the transfer: code run by the holder sees the new state
    totalBalance_[asset] = newTotal;
    withdrawn_[beneficiary] = newWithdrawn;
    withdrawnByAsset_[assetKey] = newByAsset;

    // Nested withdrawals are refused until the transfer and callbacks finish
    FlagGuard inProgress(withdrawInProgress_);

    std::string transferError;
    bool transferred = false;
    try {
        transferred = holder_.Transfer(asset, ledgerAddress_, beneficiary, available, transferError);
    } catch (...) {
        RestoreSnapshot(totalBalance_, asset, prevTotal);
        RestoreSnapshot(withdrawn_, beneficiary, prevWithdrawn);
        RestoreSnapshot(withdrawnByAsset_, assetKey, prevByAsset);
        throw;
    }

    if (!transferred) {
        RestoreSnapshot(totalBalance_, asset, prevTotal);
        RestoreSnapshot(withdrawn_, beneficiary, prevWithdrawn);
        RestoreSnapshot(withdrawnByAsset_, assetKey, prevByAsset);
        LogPrintf("TeamLedger: Transfer of %s %s to %s failed, rolled back - %s\n",
                  available.str(), AssetToString(asset), beneficiary.GetHex(), transferError);
        return WithdrawResult::Failure(LedgerError::TRANSFER_FAILED, transferError);
    }

    WithdrawalEvent event(nextSequence_++, beneficiary, asset, available);
    RecordEventLocked(event);

    LogPrint(TBLog::LEDGER, "TeamLedger: Withdrawn %s %s to %s (event %u)\n",
             available.str(), AssetToString(asset), beneficiary.GetHex(), event.sequence);

    for (const auto& callback : callbacks_) {
        callback(event);
    }

    return WithdrawResult::Success(event);
}

// ============================================================================
// Accessors
// ============================================================================

uint32_t TeamLedger::GetProportion(const uint160& beneficiary) const
{
    auto it = proportions_.find(beneficiary);
    if (it == proportions_.end()) {
        return 0;
    }
    return it->second;
}

std::vector<TeamMember> TeamLedger::GetTeam() const
{
    std::vector<TeamMember> team;
    team.reserve(proportions_.size());
    for (const auto& entry : proportions_) {
        team.emplace_back(entry.first, entry.second);
    }
    return team;
}

CAmount TeamLedger::GetTotalBalance(const uint160& asset) const
{
    LOCK(cs_ledger_);
    return GetTotalBalanceLocked(asset);
}

CAmount TeamLedger::GetWithdrawn(const uint160& beneficiary) const
{
    LOCK(cs_ledger_);
    auto it = withdrawn_.find(beneficiary);
    if (it == withdrawn_.end()) {
        return 0;
    }
    return it->second;
}

CAmount TeamLedger::GetWithdrawn(const uint160& beneficiary, const uint160& asset) const
{
    LOCK(cs_ledger_);
    auto it = withdrawnByAsset_.find(std::make_pair(beneficiary, asset));
    if (it == withdrawnByAsset_.end()) {
        return 0;
    }
    return it->second;
}

// ============================================================================
// Events
// ============================================================================

void TeamLedger::RegisterWithdrawnCallback(WithdrawnCallback callback)
{
    LOCK(cs_ledger_);
    callbacks_.push_back(std::move(callback));
}

void TeamLedger::RecordEventLocked(const WithdrawalEvent& event)
{
    history_.push_back(event);
    while (history_.size() > settings_.maxHistory) {
        history_.pop_front();
    }
}

std::vector<WithdrawalEvent> TeamLedger::GetWithdrawalHistory() const
{
    LOCK(cs_ledger_);
    return std::vector<WithdrawalEvent>(history_.begin(), history_.end());
}

std::vector<WithdrawalEvent> TeamLedger::GetWithdrawalHistory(const uint160& beneficiary) const
{
    LOCK(cs_ledger_);
    std::vector<WithdrawalEvent> result;
    for (const auto& event : history_) {
        if (event.beneficiary == beneficiary) {
            result.push_back(event);
        }
    }
    return result;
}

// ============================================================================
// Verification
// ============================================================================

bool TeamLedger::VerifyPayoutInvariant(const uint160& asset, std::string& error) const
{
    LOCK(cs_ledger_);

    const CAmount recorded = GetTotalBalanceLocked(asset);
    const CAmount lifetimeInflow = recorded + holder_.GetBalance(asset, ledgerAddress_);

    CAmount paidOut = 0;
    for (const auto& entry : withdrawnByAsset_) {
        if (entry.first.second != asset) continue;

        paidOut += entry.second;

        CAmount share = CalculateShare(lifetimeInflow, GetProportion(entry.first.first));
        if (entry.second > share) {
            error = strprintf("%s received %s of %s, share of inflow is %s",
                              entry.first.first.GetHex(), entry.second.str(),
                              AssetToString(asset), share.str());
            return false;
        }
    }

    if (paidOut > recorded) {
        error = strprintf("Paid out %s of %s exceeds recorded inflow %s",
                          paidOut.str(), AssetToString(asset), recorded.str());
        return false;
    }

    return true;
}

} // namespace teambalance
