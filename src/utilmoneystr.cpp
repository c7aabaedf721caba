// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilmoneystr.h"

static const size_t COIN_DECIMALS = 18;

std::string FormatMoney(const CAmount& n)
{
    const CAmount quotient = n / COIN;
    const CAmount remainder = n % COIN;

    std::string strFraction = remainder.str();
    strFraction.insert(0, COIN_DECIMALS - strFraction.size(), '0');

    // Right-trim excess zeros, keep two decimals
    size_t nTrim = 0;
    for (size_t i = strFraction.size() - 1; i >= 2 && strFraction[i] == '0'; --i) {
        ++nTrim;
    }
    strFraction.erase(strFraction.size() - nTrim);

    return quotient.str() + "." + strFraction;
}
