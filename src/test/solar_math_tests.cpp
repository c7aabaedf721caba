// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for the fixed-point helpers of the reward accumulator
//
// Tests verify:
// - increase = (D × PRECISION) / N with truncation
// - earned = (B × Δ) / PRECISION with truncation
// - no wraparound for amounts close to 2^256
//

#include "test/test_solar.h"

#include "amount.h"
#include "solar/solar_math.h"

#include <boost/test/unit_test.hpp>

using namespace solar_math;

BOOST_FIXTURE_TEST_SUITE(solar_math_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(test_reward_per_unit_increase)
{
    CAmount nIncrease;

    // 1 coin over 100 units: 0.01 coin per unit, exactly
    BOOST_CHECK(CalculateRewardPerUnitIncrease(COIN, 100, nIncrease));
    BOOST_CHECK_EQUAL(nIncrease, PRECISION * COIN / 100);

    // 10 wei over 3 units truncates
    BOOST_CHECK(CalculateRewardPerUnitIncrease(10, 3, nIncrease));
    BOOST_CHECK_EQUAL(nIncrease, CAmount("3333333333333333333"));

    // Division by zero is refused
    BOOST_CHECK(!CalculateRewardPerUnitIncrease(COIN, 0, nIncrease));
}

BOOST_AUTO_TEST_CASE(test_reward_per_unit_increase_can_round_to_zero)
{
    // 1 wei over more than 10^18 units rounds to 0
    CAmount nIncrease = 1;
    BOOST_CHECK(CalculateRewardPerUnitIncrease(1, 2000000000000000000ULL, nIncrease));
    BOOST_CHECK_EQUAL(nIncrease, 0);
}

BOOST_AUTO_TEST_CASE(test_reward_per_unit_increase_wide_intermediate)
{
    // D × PRECISION exceeds 256 bits, but the quotient fits
    const CAmount nAmount = MAX_AMOUNT / 2;
    CAmount nIncrease;
    BOOST_CHECK(!CalculateRewardPerUnitIncrease(nAmount, 1, nIncrease));

    const uint64_t nUnits = 1000000000000000000ULL;
    BOOST_CHECK(CalculateRewardPerUnitIncrease(nAmount, nUnits, nIncrease));
    BOOST_CHECK_EQUAL(nIncrease, nAmount);
}

BOOST_AUTO_TEST_CASE(test_calculate_earned)
{
    BOOST_CHECK_EQUAL(CalculateEarned(0, PRECISION), 0);
    BOOST_CHECK_EQUAL(CalculateEarned(30, 0), 0);

    // 30 units × 0.01 coin per unit
    BOOST_CHECK_EQUAL(CalculateEarned(30, PRECISION * COIN / 100), COIN * 3 / 10);

    // 3 units × floor(10e18/3): 9.999..., truncated to 9
    BOOST_CHECK_EQUAL(CalculateEarned(3, CAmount("3333333333333333333")), 9);
}

BOOST_AUTO_TEST_CASE(test_proportionality)
{
    const CAmount nDeposit = 7 * COIN + 12345;
    const uint64_t nMinted = 1000;
    CAmount nIncrease;
    BOOST_REQUIRE(CalculateRewardPerUnitIncrease(nDeposit, nMinted, nIncrease));

    CAmount nSum = 0;
    const uint64_t vBalances[] = {1, 249, 250, 500};
    for (uint64_t nBalance : vBalances) {
        const CAmount nEarned = CalculateEarned(nBalance, nIncrease);
        // Within one wei of the exact share
        const CAmount nExact = nDeposit * nBalance / nMinted;
        BOOST_CHECK(nEarned <= nExact);
        BOOST_CHECK(nExact - nEarned <= 1);
        nSum += nEarned;
    }
    BOOST_CHECK(nSum <= nDeposit);
    BOOST_CHECK(nDeposit - nSum <= 4);
}

BOOST_AUTO_TEST_CASE(test_cost_and_checked_add)
{
    CAmount nCost;
    BOOST_CHECK(CalculateCost(30, COIN / 100, nCost));
    BOOST_CHECK_EQUAL(nCost, COIN * 3 / 10);

    BOOST_CHECK(!CalculateCost(2, MAX_AMOUNT, nCost));
    BOOST_CHECK(CalculateCost(1, MAX_AMOUNT, nCost));
    BOOST_CHECK_EQUAL(nCost, MAX_AMOUNT);

    CAmount nSum;
    BOOST_CHECK(CheckedAdd(COIN, COIN, nSum));
    BOOST_CHECK_EQUAL(nSum, 2 * COIN);
    BOOST_CHECK(CheckedAdd(MAX_AMOUNT - 1, 1, nSum));
    BOOST_CHECK(!CheckedAdd(MAX_AMOUNT, 1, nSum));
}

BOOST_AUTO_TEST_SUITE_END()
