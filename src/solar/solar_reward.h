// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_REWARD_H
#define SOLAR_SOLAR_REWARD_H

#include "amount.h"
#include "solar/solar_account.h"
#include "solar/solar_project.h"
#include "solar/solar_units.h"

#include <map>
#include <stdint.h>

class CProjectRegistry;
class CValidationState;

namespace solar_reward {

// ============================================================================
// Settlement (pure)
// ============================================================================

/**
 * Earned since the holder's checkpoint
 *
 * FORMULA:
 *   earned = balance × (rewardPerUnitStored − checkpoint) / PRECISION
 *
 * @param project Project carrying the accumulator
 * @param reward  Holder's accrual record
 * @param nBalance Holder's balance since the checkpoint
 * @return Earned amount (wei), truncated
 */
CAmount CalculatePendingDelta(const SolarProject& project, const SolarHolderReward& reward, uint64_t nBalance);

/**
 * Settle one holder in place: pending += earned, checkpoint = accumulator.
 *
 * Idempotent: a second call with the same balance adds nothing.
 */
void SettleHolder(const SolarProject& project, SolarHolderReward& reward, uint64_t nBalance);

/** Preview of SettleHolder: pending + earned, no mutation */
CAmount GetClaimable(const SolarProject& project, const SolarHolderReward& reward, uint64_t nBalance);

} // namespace solar_reward

/**
 * CRewardEngine - reward-per-unit accumulator for all projects
 *
 * The per-project accumulator (nRewardPerUnitStored) lives in the project
 * record; the engine keeps the per-holder checkpoints and pending amounts.
 *
 * Deposits are O(1): no holder is touched. A holder is reconciled lazily
 * whenever its balance is about to change (BalanceWillChange, wired into
 * CUnitLedger) and at claim time.
 *
 * Outstanding reward liability is kept O(1):
 *   liability = floor(nScaledRewardAllocated / PRECISION) − nTotalRewardsClaimed
 * where nScaledRewardAllocated = Σ minted_k × increase_k over all deposits.
 * Σ of every holder's truncated earnings never exceeds it.
 */
class CRewardEngine : public CBalanceObserver
{
public:
    typedef std::pair<uint64_t, CAccountID> RewardKey;
    typedef std::map<RewardKey, SolarHolderReward> RewardMap;

private:
    CProjectRegistry& registry;
    RewardMap mapRewards;

    CAmount nScaledRewardAllocated;
    CAmount nTotalRewardsClaimed;

public:
    explicit CRewardEngine(CProjectRegistry& registryIn);

    /** CBalanceObserver: settle with the balance as of before the change */
    void BalanceWillChange(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalanceBefore) override;

    void Settle(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalance);

    /** Pure read: what a settlement followed by a claim would pay now */
    CAmount GetClaimable(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalance) const;

    /**
     * CheckDeposit - validate a revenue deposit against a project
     *
     * RULES (in order):
     * 1. nAmount > 0                    (NoFundsDeposited)
     * 2. project active                 (ProjectNotActive)
     * 3. minted > 0                     (NoTokensMinted)
     * 4. increase = amount×P/minted > 0 (RewardIncreaseTooSmall)
     * 5. no counter overflows           (AmountOverflow)
     *
     * @param nIncrease [out] Reward-per-unit increase to apply
     * @param nScaled   [out] minted × increase, added to the scaled allocation
     */
    bool CheckDeposit(const SolarProject& project, const CAmount& nAmount, uint64_t nEnergyDelta,
                      CAmount& nIncrease, CAmount& nScaled, CValidationState& state) const;

    /** Apply a checked deposit. No holder settlement happens here. */
    void ApplyDeposit(SolarProject& project, const CAmount& nAmount, uint64_t nEnergyDelta,
                      const CAmount& nIncrease, const CAmount& nScaled);

    /**
     * TakePending - settle, then move pending into claimed
     *
     * @return amount taken (0 if nothing was pending)
     */
    CAmount TakePending(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalance);

    SolarHolderReward GetHolderReward(uint64_t nProjectId, const CAccountID& holder) const;
    CAmount GetTotalClaimed(uint64_t nProjectId, const CAccountID& holder) const;

    /** Undo support */
    void RestoreHolderReward(uint64_t nProjectId, const CAccountID& holder, const SolarHolderReward& reward);
    void RestoreTotals(const CAmount& nScaledAllocated, const CAmount& nClaimed);

    CAmount GetScaledRewardAllocated() const { return nScaledRewardAllocated; }
    CAmount GetTotalRewardsClaimed() const { return nTotalRewardsClaimed; }

    /** Rewards owed to holders, claimable or not yet settled */
    CAmount GetRewardLiability() const;

    const RewardMap& GetRewards() const { return mapRewards; }
    void Load(const RewardMap& rewards, const CAmount& nScaledAllocated, const CAmount& nClaimed);
};

#endif // SOLAR_SOLAR_REWARD_H
