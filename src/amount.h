// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_AMOUNT_H
#define SOLAR_AMOUNT_H

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>

/**
 * Amount in the smallest currency denomination (wei).
 *
 * 256-bit unsigned, fixed width. Arithmetic that can exceed 256 bits must be
 * carried out in CWideAmount and range checked before narrowing back.
 */
typedef boost::multiprecision::uint256_t CAmount;

/** Double-width intermediate for products of two amounts */
typedef boost::multiprecision::uint512_t CWideAmount;

static const CAmount COIN = CAmount(1000000000000000000ULL);
static const CAmount MAX_AMOUNT = std::numeric_limits<CAmount>::max();

inline bool MoneyRange(const CWideAmount& nValue) { return nValue <= CWideAmount(MAX_AMOUNT); }

#endif // SOLAR_AMOUNT_H
