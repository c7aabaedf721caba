// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_MATH_H
#define SOLAR_SOLAR_MATH_H

#include "amount.h"

#include <stdint.h>

/**
 * Fixed-point helpers for the reward-per-unit accumulator.
 *
 * Reward-per-unit values are scaled by PRECISION (10^18). Both directions
 * truncate toward zero; the lost remainder ("dust") stays in the ledger
 * and is only recoverable in aggregate through the residual sweep.
 *
 * Products are formed in CWideAmount (512 bit) so that D × PRECISION never
 * wraps, then range checked before narrowing back to CAmount.
 */
namespace solar_math {

static const CAmount PRECISION = CAmount(1000000000000000000ULL);

/**
 * CalculateRewardPerUnitIncrease - increase = (nAmount × PRECISION) / nUnits
 *
 * @param nAmount   Deposited revenue (wei)
 * @param nUnits    Units in circulation, must be > 0
 * @param nIncrease [out] Scaled reward-per-unit increase (may be 0)
 * @return false when nUnits == 0 or the result does not fit a CAmount
 */
bool CalculateRewardPerUnitIncrease(const CAmount& nAmount, uint64_t nUnits, CAmount& nIncrease);

/**
 * CalculateEarned - earned = (nBalance × nDelta) / PRECISION
 *
 * Never larger than the revenue deposited while the balance was held, so
 * it always fits a CAmount when nDelta comes from the accumulator.
 */
CAmount CalculateEarned(uint64_t nBalance, const CAmount& nDelta);

/** nUnits × nPrice, false on overflow */
bool CalculateCost(uint64_t nUnits, const CAmount& nPrice, CAmount& nCost);

/** nUnits × nRewardPerUnit, the exact scaled amount allocated by one deposit */
bool CalculateScaledAllocation(uint64_t nUnits, const CAmount& nIncrease, CAmount& nScaled);

/** a + b, false on overflow */
bool CheckedAdd(const CAmount& a, const CAmount& b, CAmount& nSum);

} // namespace solar_math

#endif // SOLAR_SOLAR_MATH_H
