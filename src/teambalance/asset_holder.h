// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TEAMBALANCE_ASSET_HOLDER_H
#define TEAMBALANCE_ASSET_HOLDER_H

/**
 * @file asset_holder.h
 * @brief External custody of fungible assets
 *
 * The ledger never holds value itself. It asks an AssetHolder how much of
 * an asset its account currently holds and instructs it to move amounts
 * to beneficiaries. Anyone may credit the ledger account directly; such
 * deposits are picked up through GetBalance without notifying the ledger.
 */

#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>

namespace teambalance {

/**
 * Asset custody interface
 * Maps asset + account to an on-hand balance
 */
class AssetHolder {
public:
    virtual ~AssetHolder() {}

    /** Amount of asset currently held by account */
    virtual CAmount GetBalance(const uint160& asset, const uint160& account) const = 0;

    /**
     * Move amount of asset from one account to another.
     * May run recipient code synchronously before returning.
     * @return false with error set if nothing was moved
     */
    virtual bool Transfer(const uint160& asset, const uint160& from, const uint160& to,
                          const CAmount& amount, std::string& error) = 0;
};

/**
 * @brief Asset holder keeping every balance in memory
 *
 * Used by the replay tool and the tests. An optional hook runs after each
 * successful transfer, outside the holder's lock, the way a token contract
 * notifies a recipient. If the hook throws, the transfer is reverted and the
 * exception propagates to the caller of Transfer.
 *
 * Thread-safe for concurrent access.
 */
class InMemoryAssetHolder : public AssetHolder {
public:
    /** Callback run after funds moved */
    using TransferHook = std::function<void(const uint160& asset, const uint160& from,
                                            const uint160& to, const CAmount& amount)>;

    InMemoryAssetHolder();

    CAmount GetBalance(const uint160& asset, const uint160& account) const override;

    bool Transfer(const uint160& asset, const uint160& from, const uint160& to,
                  const CAmount& amount, std::string& error) override;

    /**
     * @brief Credit an account from outside the system (a deposit)
     * @return false if account is null
     */
    bool Credit(const uint160& asset, const uint160& account, const CAmount& amount);

    /** Total amount of asset ever credited */
    CAmount GetTotalCredited(const uint160& asset) const;

    /** Install or clear (empty function) the post-transfer hook */
    void SetTransferHook(TransferHook hook);

    /** Number of transfers that moved funds */
    uint64_t GetTransferCount() const;

private:
    /** (asset, account) -> balance */
    std::map<std::pair<uint160, uint160>, CAmount> balances_;

    /** asset -> total credited */
    std::map<uint160, CAmount> credited_;

    TransferHook transferHook_;

    uint64_t transferCount_;

    mutable CCriticalSection cs_holder_;
};

} // namespace teambalance

#endif // TEAMBALANCE_ASSET_HOLDER_H
