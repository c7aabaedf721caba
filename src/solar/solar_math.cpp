// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_math.h"

#include "logging.h"

namespace solar_math {

bool CalculateRewardPerUnitIncrease(const CAmount& nAmount, uint64_t nUnits, CAmount& nIncrease)
{
    if (nUnits == 0) {
        return false;
    }

    CWideAmount increase = CWideAmount(nAmount) * CWideAmount(PRECISION) / nUnits;

    if (!MoneyRange(increase)) {
        LogPrintf("ERROR: CalculateRewardPerUnitIncrease: overflow amount=%s units=%u\n",
                  nAmount.str(), nUnits);
        return false;
    }

    nIncrease = static_cast<CAmount>(increase);
    return true;
}

CAmount CalculateEarned(uint64_t nBalance, const CAmount& nDelta)
{
    if (nBalance == 0 || nDelta == 0) {
        return 0;
    }

    CWideAmount earned = CWideAmount(nBalance) * CWideAmount(nDelta) / CWideAmount(PRECISION);

    // Bounded by deposited revenue, see header
    return static_cast<CAmount>(earned);
}

bool CalculateCost(uint64_t nUnits, const CAmount& nPrice, CAmount& nCost)
{
    CWideAmount cost = CWideAmount(nUnits) * CWideAmount(nPrice);
    if (!MoneyRange(cost)) {
        return false;
    }
    nCost = static_cast<CAmount>(cost);
    return true;
}

bool CalculateScaledAllocation(uint64_t nUnits, const CAmount& nIncrease, CAmount& nScaled)
{
    return CalculateCost(nUnits, nIncrease, nScaled);
}

bool CheckedAdd(const CAmount& a, const CAmount& b, CAmount& nSum)
{
    if (a > MAX_AMOUNT - b) {
        return false;
    }
    nSum = a + b;
    return true;
}

} // namespace solar_math
