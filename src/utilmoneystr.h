// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef TEAMBALANCE_UTILMONEYSTR_H
#define TEAMBALANCE_UTILMONEYSTR_H

#include <amount.h>

#include <string>

/**
 * Format an amount as a decimal string with the given number of decimals.
 * Trailing fractional zeros are dropped, e.g. "10.12356" or "5".
 */
std::string FormatUnits(const CAmount& amount, unsigned int decimals = DEFAULT_ASSET_DECIMALS);

/**
 * Parse a non-negative decimal string such as "10.12356" into the smallest
 * unit. Fails on a sign, more fractional digits than decimals, or overflow.
 */
bool ParseUnits(const std::string& str, CAmount& amountRet, unsigned int decimals = DEFAULT_ASSET_DECIMALS);

#endif // TEAMBALANCE_UTILMONEYSTR_H
