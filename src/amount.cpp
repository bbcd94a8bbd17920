// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <amount.h>

const CAmount COIN = CAmount(1000000000000000000ULL);
