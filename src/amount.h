// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TEAMBALANCE_AMOUNT_H
#define TEAMBALANCE_AMOUNT_H

#include <boost/multiprecision/cpp_int.hpp>

/**
 * Amount of an asset in its smallest unit.
 *
 * Unsigned 256-bit with checked arithmetic: an overflow throws
 * std::overflow_error and a subtraction below zero throws std::range_error.
 */
typedef boost::multiprecision::checked_uint256_t CAmount;

/** Decimal places of the assets handled by the ledger tools */
static constexpr unsigned int DEFAULT_ASSET_DECIMALS = 18;

/** One whole unit of an asset with DEFAULT_ASSET_DECIMALS decimals */
extern const CAmount COIN;

#endif // TEAMBALANCE_AMOUNT_H
