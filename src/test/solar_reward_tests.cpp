// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for the reward-per-unit accumulator (CRewardEngine)
//
// Tests verify:
// - deposits touch no holder and reject degenerate amounts
// - settlement through the unit ledger keeps pre-transfer rewards
// - claimable preview is pure and matches settlement
// - liability bound: sum of holder earnings never exceeds allocation
//

#include "test/test_solar.h"

#include "solar/solar_errors.h"
#include "solar/solar_math.h"
#include "solar/solar_registry.h"
#include "solar/solar_reward.h"
#include "solar/solar_units.h"

#include <boost/test/unit_test.hpp>

namespace {

struct RewardTestingSetup : public BasicTestingSetup {
    CProjectRegistry registry;
    CRewardEngine rewards;
    CUnitLedger units;
    const CAccountID creator;
    const CAccountID alice;
    const CAccountID bob;
    uint64_t nProjectId;

    RewardTestingSetup()
        : rewards(registry), units(&rewards),
          creator(TestAccount(0xc0)), alice(TestAccount(0xa1)), bob(TestAccount(0xb0))
    {
        nProjectId = registry.AddProject(creator, "Solar Park", 100, COIN / 100, 1, TEST_MOCK_TIME);
    }

    void Mint(const CAccountID& to, uint64_t nAmount)
    {
        registry.LookupMutable(nProjectId)->nMinted += nAmount;
        units.Mint(to, nProjectId, nAmount);
    }

    void Deposit(const CAmount& nAmount)
    {
        CValidationState state;
        CAmount nIncrease, nScaled;
        SolarProject& project = *registry.LookupMutable(nProjectId);
        BOOST_REQUIRE_MESSAGE(rewards.CheckDeposit(project, nAmount, 0, nIncrease, nScaled, state), state.ToString());
        rewards.ApplyDeposit(project, nAmount, 0, nIncrease, nScaled);
    }

    CAmount Claimable(const CAccountID& holder) const
    {
        return rewards.GetClaimable(nProjectId, holder, units.BalanceOf(holder, nProjectId));
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(solar_reward_tests, RewardTestingSetup)

BOOST_AUTO_TEST_CASE(test_deposit_rules)
{
    SolarProject& project = *registry.LookupMutable(nProjectId);
    CAmount nIncrease, nScaled;

    CValidationState s1;
    BOOST_CHECK(!rewards.CheckDeposit(project, COIN, 0, nIncrease, nScaled, s1));
    BOOST_CHECK(s1.GetError() == LedgerError::NO_TOKENS_MINTED);

    Mint(alice, 10);

    CValidationState s2;
    BOOST_CHECK(!rewards.CheckDeposit(project, 0, 0, nIncrease, nScaled, s2));
    BOOST_CHECK(s2.GetError() == LedgerError::NO_FUNDS_DEPOSITED);

    project.fActive = false;
    CValidationState s3;
    BOOST_CHECK(!rewards.CheckDeposit(project, COIN, 0, nIncrease, nScaled, s3));
    BOOST_CHECK(s3.GetError() == LedgerError::PROJECT_NOT_ACTIVE);
    project.fActive = true;

    CValidationState s4;
    BOOST_CHECK(rewards.CheckDeposit(project, COIN, 5, nIncrease, nScaled, s4));
    BOOST_CHECK_EQUAL(nIncrease, solar_math::PRECISION * COIN / 10);
    BOOST_CHECK_EQUAL(nScaled, solar_math::PRECISION * COIN);
}

BOOST_AUTO_TEST_CASE(test_deposit_too_small)
{
    SolarProject& project = *registry.LookupMutable(nProjectId);
    project.nTotalSupply = 3000000000000000000ULL;
    Mint(alice, 2000000000000000000ULL);

    CAmount nIncrease, nScaled;
    CValidationState state;
    BOOST_CHECK(!rewards.CheckDeposit(project, 1, 0, nIncrease, nScaled, state));
    BOOST_CHECK(state.GetError() == LedgerError::REWARD_INCREASE_TOO_SMALL);
    BOOST_CHECK(state.GetKind() == ErrorKind::ECONOMIC_DEGENERATE);
}

BOOST_AUTO_TEST_CASE(test_deposit_is_lazy)
{
    Mint(alice, 30);
    Mint(bob, 70);

    Deposit(COIN);

    // Nothing stored for holders yet, everything is in the accumulator
    BOOST_CHECK(rewards.GetHolderReward(nProjectId, alice).nPending == 0);
    BOOST_CHECK_EQUAL(registry.Lookup(nProjectId)->nTotalRevenue, COIN);
    BOOST_CHECK_EQUAL(Claimable(alice), COIN * 3 / 10);
    BOOST_CHECK_EQUAL(Claimable(bob), COIN * 7 / 10);

    // Preview is pure
    BOOST_CHECK_EQUAL(Claimable(alice), COIN * 3 / 10);
    BOOST_CHECK(rewards.GetHolderReward(nProjectId, alice).nPending == 0);
}

BOOST_AUTO_TEST_CASE(test_transfer_preserves_rewards)
{
    Mint(alice, 100);
    Deposit(COIN);
    BOOST_CHECK_EQUAL(Claimable(alice), COIN);

    CValidationState state;
    BOOST_REQUIRE(units.Transfer(alice, bob, nProjectId, 60, state));

    // Earned before the transfer stays with alice
    BOOST_CHECK_EQUAL(Claimable(alice), COIN);
    BOOST_CHECK_EQUAL(Claimable(bob), 0);
    BOOST_CHECK_EQUAL(rewards.GetHolderReward(nProjectId, alice).nPending, COIN);

    // Next deposit splits 40/60
    Deposit(COIN);
    BOOST_CHECK_EQUAL(Claimable(alice), COIN + COIN * 4 / 10);
    BOOST_CHECK_EQUAL(Claimable(bob), COIN * 6 / 10);
}

BOOST_AUTO_TEST_CASE(test_self_transfer_no_double_count)
{
    Mint(alice, 10);
    Deposit(COIN);
    const CAmount nBefore = Claimable(alice);

    CValidationState state;
    BOOST_REQUIRE(units.Transfer(alice, alice, nProjectId, 10, state));
    BOOST_CHECK_EQUAL(Claimable(alice), nBefore);
    BOOST_CHECK_EQUAL(units.BalanceOf(alice, nProjectId), 10U);
}

BOOST_AUTO_TEST_CASE(test_mint_after_deposit_earns_nothing_retroactively)
{
    Mint(alice, 50);
    Deposit(COIN);

    // bob joins after the deposit
    Mint(bob, 50);
    BOOST_CHECK_EQUAL(Claimable(bob), 0);
    BOOST_CHECK_EQUAL(Claimable(alice), COIN);

    Deposit(COIN);
    BOOST_CHECK_EQUAL(Claimable(bob), COIN / 2);
    BOOST_CHECK_EQUAL(Claimable(alice), COIN + COIN / 2);
}

BOOST_AUTO_TEST_CASE(test_take_pending)
{
    Mint(alice, 30);
    Mint(bob, 70);
    Deposit(COIN);

    const CAmount nTaken = rewards.TakePending(nProjectId, alice, units.BalanceOf(alice, nProjectId));
    BOOST_CHECK_EQUAL(nTaken, COIN * 3 / 10);
    BOOST_CHECK_EQUAL(Claimable(alice), 0);
    BOOST_CHECK_EQUAL(rewards.GetTotalClaimed(nProjectId, alice), COIN * 3 / 10);
    BOOST_CHECK_EQUAL(rewards.GetTotalRewardsClaimed(), COIN * 3 / 10);

    // Second take yields nothing
    BOOST_CHECK_EQUAL(rewards.TakePending(nProjectId, alice, units.BalanceOf(alice, nProjectId)), 0);

    // Liability is what bob is still owed
    BOOST_CHECK_EQUAL(rewards.GetRewardLiability(), COIN * 7 / 10);
}

BOOST_AUTO_TEST_CASE(test_dust_and_liability_bound)
{
    SolarProject& project = *registry.LookupMutable(nProjectId);
    project.nTotalSupply = 3;
    Mint(alice, 1);
    Mint(bob, 2);

    // 10 wei over 3 units: 3 + 6 = 9 payable, 1 wei dust
    Deposit(10);
    BOOST_CHECK_EQUAL(Claimable(alice), 3);
    BOOST_CHECK_EQUAL(Claimable(bob), 6);
    BOOST_CHECK_EQUAL(rewards.GetRewardLiability(), 9);

    for (int i = 0; i < 7; ++i) {
        Deposit(10 + i);
    }
    const CAmount nTotal = Claimable(alice) + Claimable(bob);
    BOOST_CHECK(nTotal <= rewards.GetRewardLiability());
    BOOST_CHECK(rewards.GetRewardLiability() <= 10 + 10 * 7 + 21);
}

BOOST_AUTO_TEST_SUITE_END()
