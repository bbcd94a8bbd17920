// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <teambalance/asset_holder.h>
#include <teambalance/ledger_common.h>
#include <utilmoneystr.h>
#include <util.h>

namespace teambalance {

InMemoryAssetHolder::InMemoryAssetHolder()
    : transferCount_(0)
{
}

CAmount InMemoryAssetHolder::GetBalance(const uint160& asset, const uint160& account) const
{
    LOCK(cs_holder_);
    auto it = balances_.find(std::make_pair(asset, account));
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

bool InMemoryAssetHolder::Transfer(const uint160& asset, const uint160& from, const uint160& to,
                                   const CAmount& amount, std::string& error)
{
    TransferHook hook;
    {
        LOCK(cs_holder_);

        if (to.IsNull()) {
            error = "Transfer to the zero address";
            return false;
        }
        if (amount == 0) {
            error = "Transfer amount must be positive";
            return false;
        }

        auto fromIt = balances_.find(std::make_pair(asset, from));
        if (fromIt == balances_.end() || fromIt->second < amount) {
            error = strprintf("Insufficient %s balance: have %s, need %s",
                              AssetToString(asset),
                              fromIt == balances_.end() ? std::string("0") : FormatUnits(fromIt->second),
                              FormatUnits(amount));
            LogPrint(TBLog::TRANSFER, "InMemoryAssetHolder: %s\n", error);
            return false;
        }

        fromIt->second -= amount;
        balances_[std::make_pair(asset, to)] += amount;
        ++transferCount_;
        hook = transferHook_;

        LogPrint(TBLog::TRANSFER, "InMemoryAssetHolder: Moved %s of %s from %s to %s\n",
                 FormatUnits(amount), AssetToString(asset), from.GetHex(), to.GetHex());
    }

    if (hook) {
        try {
            hook(asset, from, to, amount);
        } catch (...) {
            // A throwing recipient reverts the transfer
            LOCK(cs_holder_);
            CAmount& received = balances_[std::make_pair(asset, to)];
            if (received >= amount) {
                received -= amount;
                balances_[std::make_pair(asset, from)] += amount;
                --transferCount_;
                LogPrint(TBLog::TRANSFER, "InMemoryAssetHolder: Reverted %s of %s from %s to %s\n",
                         FormatUnits(amount), AssetToString(asset), from.GetHex(), to.GetHex());
            } else {
                LogPrintf("InMemoryAssetHolder: Cannot revert %s of %s to %s, recipient holds %s\n",
                          FormatUnits(amount), AssetToString(asset), to.GetHex(), FormatUnits(received));
            }
            throw;
        }
    }
    return true;
}

bool InMemoryAssetHolder::Credit(const uint160& asset, const uint160& account, const CAmount& amount)
{
    LOCK(cs_holder_);

    if (account.IsNull()) {
        LogPrintf("InMemoryAssetHolder: Refusing credit to the zero address\n");
        return false;
    }

    // Both sums are computed before either is stored, an overflow changes nothing
    CAmount& balance = balances_[std::make_pair(asset, account)];
    CAmount& credited = credited_[asset];
    const CAmount newBalance = balance + amount;
    const CAmount newCredited = credited + amount;
    balance = newBalance;
    credited = newCredited;

    LogPrint(TBLog::TRANSFER, "InMemoryAssetHolder: Credited %s of %s to %s\n",
             FormatUnits(amount), AssetToString(asset), account.GetHex());
    return true;
}

CAmount InMemoryAssetHolder::GetTotalCredited(const uint160& asset) const
{
    LOCK(cs_holder_);
    auto it = credited_.find(asset);
    if (it == credited_.end()) {
        return 0;
    }
    return it->second;
}

void InMemoryAssetHolder::SetTransferHook(TransferHook hook)
{
    LOCK(cs_holder_);
    transferHook_ = std::move(hook);
}

uint64_t InMemoryAssetHolder::GetTransferCount() const
{
    LOCK(cs_holder_);
    return transferCount_;
}

} // namespace teambalance
