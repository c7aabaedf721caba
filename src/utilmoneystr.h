// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money formatting utilities.
 */
#ifndef SOLAR_UTILMONEYSTR_H
#define SOLAR_UTILMONEYSTR_H

#include "amount.h"

#include <string>

/** Render a wei amount as a coin string with at least two decimals ("1.30") */
std::string FormatMoney(const CAmount& n);

#endif // SOLAR_UTILMONEYSTR_H
