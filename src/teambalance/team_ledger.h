// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TEAMBALANCE_TEAM_LEDGER_H
#define TEAMBALANCE_TEAM_LEDGER_H

/**
 * @file team_ledger.h
 * @brief Proportional distribution of deposited assets to a fixed team
 *
 * Every team member owns an integer proportion of all value that ever flows
 * into the ledger account. Deposits are never announced to the ledger: the
 * lifetime inflow of an asset is reconstructed on demand as
 *
 *     lifetime inflow = TotalBalance[asset] + on-hand balance
 *
 * where TotalBalance[asset] is the part of the inflow that has already been
 * paid out. A member is owed
 *
 *     floor(lifetime inflow * proportion / 100) - Withdrawn
 *
 * so members can withdraw at any time, in any order, without ever being
 * paid twice for the same inflow.
 */

#include <teambalance/asset_holder.h>
#include <teambalance/ledger_common.h>
#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace teambalance {

/** Default number of withdrawal events kept in memory */
static constexpr size_t DEFAULT_MAX_WITHDRAWAL_HISTORY = 1000;

/**
 * @brief Record of a successful withdrawal
 */
struct WithdrawalEvent {
    /** Position in the ledger's withdrawal sequence, starting at 1 */
    uint64_t sequence;

    /** Member that received the funds */
    uint160 beneficiary;

    /** Asset that was paid out */
    uint160 asset;

    /** Amount paid out */
    CAmount amount;

    WithdrawalEvent() : sequence(0), amount(0) {}

    WithdrawalEvent(uint64_t seq, const uint160& to, const uint160& assetId, const CAmount& value)
        : sequence(seq)
        , beneficiary(to)
        , asset(assetId)
        , amount(value)
    {}
};

/**
 * @brief Result of a withdrawal
 */
struct WithdrawResult {
    /** Whether funds were paid out */
    bool success;

    /** Error code if failed */
    LedgerError error;

    /** Error message if failed */
    std::string message;

    /** Amount paid out */
    CAmount amount;

    /** Emitted event (valid on success) */
    WithdrawalEvent event;

    WithdrawResult() : success(false), error(LedgerError::NONE), amount(0) {}

    static WithdrawResult Success(const WithdrawalEvent& ev) {
        WithdrawResult result;
        result.success = true;
        result.amount = ev.amount;
        result.event = ev;
        return result;
    }

    static WithdrawResult Failure(LedgerError err, const std::string& detail = std::string()) {
        WithdrawResult result;
        result.success = false;
        result.error = err;
        result.message = LedgerErrorString(err);
        if (!detail.empty()) {
            result.message += ": " + detail;
        }
        return result;
    }
};

/**
 * @brief Settings fixed at ledger creation
 */
struct LedgerSettings {
    /** Which withdrawn counter the entitlement formula subtracts */
    WithdrawalAccounting accounting;

    /** Maximum withdrawal events kept by GetWithdrawalHistory */
    size_t maxHistory;

    LedgerSettings()
        : accounting(WithdrawalAccounting::PER_ASSET)
        , maxHistory(DEFAULT_MAX_WITHDRAWAL_HISTORY)
    {}
};

/**
 * @brief Team balance ledger
 *
 * Owns the proportion table, the per-asset TotalBalance counters and the
 * withdrawn counters of one team. The table is fixed at creation. Counters
 * only ever grow.
 *
 * Withdraw commits its counters before asking the asset holder to transfer,
 * so code run by the transfer observes the updated state. A withdrawal
 * started from inside that transfer or from a withdrawal callback is refused
 * with REENTRANT_CALL, and a
 * failed transfer restores the counters to their previous values.
 *
 * Thread-safe for concurrent access.
 */
class TeamLedger {
public:
    /** Callback type for withdrawal notifications */
    using WithdrawnCallback = std::function<void(const WithdrawalEvent&)>;

    /**
     * @brief Create a ledger for a team
     * @param team Member identities, in order
     * @param proportions Proportion of each member, same order as team
     * @param creator Identity recorded as owner
     * @param ledgerAddress Account of the ledger at the asset holder
     * @param holder Asset custody, must outlive the ledger
     * @param error Set to the reason when creation fails
     * @param settings Accounting mode and history size
     * @return The ledger, or nullptr on failure
     *
     * Checks, in order: empty team, length mismatch, null ledger account,
     * null member identity, proportion sum. A repeated identity overwrites
     * the earlier entry, while the sum is taken over the raw input.
     */
    static std::unique_ptr<TeamLedger> Create(
        const std::vector<uint160>& team,
        const std::vector<uint32_t>& proportions,
        const uint160& creator,
        const uint160& ledgerAddress,
        AssetHolder& holder,
        LedgerError& error,
        const LedgerSettings& settings = LedgerSettings()
    );

    /**
     * @brief Create a ledger from (identity, proportion) pairs
     */
    static std::unique_ptr<TeamLedger> Create(
        const std::vector<TeamMember>& members,
        const uint160& creator,
        const uint160& ledgerAddress,
        AssetHolder& holder,
        LedgerError& error,
        const LedgerSettings& settings = LedgerSettings()
    );

    /**
     * @brief Validate a team without creating a ledger
     * @return LedgerError::NONE if Create would accept it
     */
    static LedgerError ValidateTeam(
        const std::vector<uint160>& team,
        const std::vector<uint32_t>& proportions
    );

    /**
     * @brief Share of an inflow owed to a proportion
     * @return floor(inflow * proportion / TOTAL_PROPORTION)
     */
    static CAmount CalculateShare(const CAmount& inflow, uint32_t proportion);

    // =========================================================================
    // Entitlement and Withdrawal
    // =========================================================================

    /**
     * @brief Amount of asset the beneficiary could withdraw right now
     * @param asset Asset identifier
     * @param beneficiary Member identity
     * @return Entitlement, 0 for identities outside the team
     *
     * Never fails. The result is 0 when the withdrawn counter exceeds the
     * share of inflow (possible only with SHARED accounting), and when the
     * inflow is too large for inflow * proportion to fit in 256 bits.
     */
    CAmount GetEntitlement(const uint160& asset, const uint160& beneficiary) const;

    /**
     * @brief Pay the beneficiary its full entitlement of asset
     * @param caller Identity requesting the withdrawal, must be the owner
     * @param asset Asset identifier
     * @param beneficiary Member identity
     * @return WithdrawResult with the paid amount and event
     *
     * Failures leave every counter unchanged:
     * NOT_OWNER, REENTRANT_CALL, NO_USER_PROPORTION, INSUFFICIENT_ENTITLEMENT,
     * NO_BALANCE_TO_WITHDRAW and TRANSFER_FAILED. An inflow too large for
     * CalculateShare throws std::overflow_error before anything changes.
     */
    WithdrawResult Withdraw(const uint160& caller, const uint160& asset, const uint160& beneficiary);

    // =========================================================================
    // Accessors
    // =========================================================================

    const uint160& GetOwner() const { return owner_; }

    const uint160& GetLedgerAddress() const { return ledgerAddress_; }

    WithdrawalAccounting GetAccountingMode() const { return settings_.accounting; }

    /**
     * @brief Proportion of a member
     * @return Proportion, 0 if the identity has none
     */
    uint32_t GetProportion(const uint160& beneficiary) const;

    /**
     * @brief Members with a nonzero proportion, ordered by identity
     */
    std::vector<TeamMember> GetTeam() const;

    /**
     * @brief Part of the lifetime inflow of asset already paid out
     */
    CAmount GetTotalBalance(const uint160& asset) const;

    /**
     * @brief Amount the beneficiary received, summed across assets
     */
    CAmount GetWithdrawn(const uint160& beneficiary) const;

    /**
     * @brief Amount the beneficiary received of one asset
     */
    CAmount GetWithdrawn(const uint160& beneficiary, const uint160& asset) const;

    // =========================================================================
    // Events
    // =========================================================================

    /**
     * @brief Register a callback run after every successful withdrawal
     *
     * Callbacks run while the ledger lock is held. They may query the
     * ledger; a withdrawal started from a callback fails with REENTRANT_CALL.
     */
    void RegisterWithdrawnCallback(WithdrawnCallback callback);

    /**
     * @brief Recent withdrawal events, oldest first
     */
    std::vector<WithdrawalEvent> GetWithdrawalHistory() const;

    /**
     * @brief Recent withdrawal events of one beneficiary, oldest first
     */
    std::vector<WithdrawalEvent> GetWithdrawalHistory(const uint160& beneficiary) const;

    // =========================================================================
    // Verification
    // =========================================================================

    /**
     * @brief Check that nobody was paid more than its share of asset
     * @param asset Asset identifier
     * @param error Set to the violated condition
     * @return true if the payouts of asset are within bounds
     */
    bool VerifyPayoutInvariant(const uint160& asset, std::string& error) const;

private:
    TeamLedger(const uint160& owner,
               const uint160& ledgerAddress,
               AssetHolder& holder,
               const std::map<uint160, uint32_t>& proportions,
               const LedgerSettings& settings);

    /** Owner, the only identity allowed to withdraw */
    const uint160 owner_;

    /** Account of the ledger at the asset holder */
    const uint160 ledgerAddress_;

    /** External custody */
    AssetHolder& holder_;

    /** Member -> proportion (nonzero entries only) */
    const std::map<uint160, uint32_t> proportions_;

    const LedgerSettings settings_;

    /** Asset -> paid-out part of lifetime inflow */
    std::map<uint160, CAmount> totalBalance_;

    /** Member -> amount received across all assets */
    std::map<uint160, CAmount> withdrawn_;

    /** (member, asset) -> amount received */
    std::map<std::pair<uint160, uint160>, CAmount> withdrawnByAsset_;

    /** Recent withdrawal events */
    std::deque<WithdrawalEvent> history_;

    std::vector<WithdrawnCallback> callbacks_;

    /** Sequence number of the next withdrawal event */
    uint64_t nextSequence_;

    /** Set while a withdrawal runs its transfer and callbacks */
    bool withdrawInProgress_;

    /** Mutex for thread safety (recursive, see sync.h) */
    mutable CCriticalSection cs_ledger_;

    CAmount GetTotalBalanceLocked(const uint160& asset) const;

    /** Counter subtracted by the entitlement formula in the current mode */
    CAmount GetAccountedWithdrawnLocked(const uint160& beneficiary, const uint160& asset) const;

    /**
     * @brief Apply the entitlement formula
     * @param available Set to the entitlement on success, 0 otherwise
     * @return NONE, or INSUFFICIENT_ENTITLEMENT if the counter exceeds the share
     */
    LedgerError ComputeEntitlementLocked(
        const uint160& asset,
        const uint160& beneficiary,
        uint32_t proportion,
        const CAmount& observedBalance,
        CAmount& available) const;

    void RecordEventLocked(const WithdrawalEvent& event);
};

} // namespace teambalance

#endif // TEAMBALANCE_TEAM_LEDGER_H
