// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_reward.h"

#include "logging.h"
#include "solar/solar_errors.h"
#include "solar/solar_math.h"
#include "solar/solar_registry.h"
#include "utilmoneystr.h"

#include <limits>

namespace solar_reward {

CAmount CalculatePendingDelta(const SolarProject& project, const SolarHolderReward& reward, uint64_t nBalance)
{
    if (nBalance == 0 || project.nRewardPerUnitStored <= reward.nRewardPerUnitPaid) {
        return 0;
    }
    return solar_math::CalculateEarned(nBalance, project.nRewardPerUnitStored - reward.nRewardPerUnitPaid);
}

void SettleHolder(const SolarProject& project, SolarHolderReward& reward, uint64_t nBalance)
{
    reward.nPending += CalculatePendingDelta(project, reward, nBalance);
    reward.nRewardPerUnitPaid = project.nRewardPerUnitStored;
}

CAmount GetClaimable(const SolarProject& project, const SolarHolderReward& reward, uint64_t nBalance)
{
    return reward.nPending + CalculatePendingDelta(project, reward, nBalance);
}

} // namespace solar_reward

CRewardEngine::CRewardEngine(CProjectRegistry& registryIn)
    : registry(registryIn),
      nScaledRewardAllocated(0),
      nTotalRewardsClaimed(0)
{
}

void CRewardEngine::BalanceWillChange(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalanceBefore)
{
    Settle(nProjectId, holder, nBalanceBefore);
}

void CRewardEngine::Settle(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalance)
{
    const SolarProject* pproject = registry.Lookup(nProjectId);
    if (!pproject) {
        LogPrint(BCLog::REWARD, "%s: project=%u not found, nothing to settle\n", __func__, nProjectId);
        return;
    }

    const RewardKey key = std::make_pair(nProjectId, holder);
    auto it = mapRewards.find(key);
    SolarHolderReward reward = (it != mapRewards.end()) ? it->second : SolarHolderReward();

    const CAmount nEarned = solar_reward::CalculatePendingDelta(*pproject, reward, nBalance);
    solar_reward::SettleHolder(*pproject, reward, nBalance);

    // A holder that never saw a deposit keeps no record
    if (reward.IsNull()) {
        if (it != mapRewards.end()) mapRewards.erase(it);
    } else {
        mapRewards[key] = reward;
    }

    if (nEarned > 0) {
        LogPrint(BCLog::REWARD, "%s: project=%u holder=%s balance=%u earned=%s pending=%s\n",
                 __func__, nProjectId, holder.ToString(), nBalance, FormatMoney(nEarned), FormatMoney(reward.nPending));
    }
}

CAmount CRewardEngine::GetClaimable(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalance) const
{
    const SolarProject* pproject = registry.Lookup(nProjectId);
    if (!pproject) {
        return 0;
    }
    return solar_reward::GetClaimable(*pproject, GetHolderReward(nProjectId, holder), nBalance);
}

bool CRewardEngine::CheckDeposit(const SolarProject& project, const CAmount& nAmount, uint64_t nEnergyDelta,
                                 CAmount& nIncrease, CAmount& nScaled, CValidationState& state) const
{
    nIncrease = 0;
    nScaled = 0;

    if (nAmount == 0) {
        return state.Invalid(LedgerError::NO_FUNDS_DEPOSITED, "bad-deposit-empty");
    }
    if (!project.fActive) {
        return state.Invalid(LedgerError::PROJECT_NOT_ACTIVE, "bad-deposit-inactive", strprintf("project=%u", project.nId));
    }
    if (project.nMinted == 0) {
        return state.Invalid(LedgerError::NO_TOKENS_MINTED, "bad-deposit-no-units", strprintf("project=%u", project.nId));
    }

    if (!solar_math::CalculateRewardPerUnitIncrease(nAmount, project.nMinted, nIncrease)) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-deposit-overflow", "reward per unit increase");
    }
    if (nIncrease == 0) {
        // A zero increase would strand the whole deposit
        return state.Invalid(LedgerError::REWARD_INCREASE_TOO_SMALL, "bad-deposit-too-small",
                             strprintf("amount=%s minted=%u", nAmount.str(), project.nMinted));
    }

    CAmount nSum;
    if (!solar_math::CheckedAdd(project.nRewardPerUnitStored, nIncrease, nSum) ||
        !solar_math::CheckedAdd(project.nTotalRevenue, nAmount, nSum)) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-deposit-overflow", "project accumulator");
    }

    if (!solar_math::CalculateScaledAllocation(project.nMinted, nIncrease, nScaled) ||
        !solar_math::CheckedAdd(nScaledRewardAllocated, nScaled, nSum)) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-deposit-overflow", "scaled allocation");
    }

    if (project.nTotalEnergyKwh > std::numeric_limits<uint64_t>::max() - nEnergyDelta) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-deposit-overflow", "energy counter");
    }
    return true;
}

void CRewardEngine::ApplyDeposit(SolarProject& project, const CAmount& nAmount, uint64_t nEnergyDelta,
                                 const CAmount& nIncrease, const CAmount& nScaled)
{
    project.nRewardPerUnitStored += nIncrease;
    project.nTotalRevenue += nAmount;
    project.nTotalEnergyKwh += nEnergyDelta;
    nScaledRewardAllocated += nScaled;

    LogPrint(BCLog::REWARD, "%s: project=%u amount=%s minted=%u increase=%s rewardPerUnit=%s\n",
             __func__, project.nId, FormatMoney(nAmount), project.nMinted,
             nIncrease.str(), project.nRewardPerUnitStored.str());
}

CAmount CRewardEngine::TakePending(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalance)
{
    Settle(nProjectId, holder, nBalance);

    auto it = mapRewards.find(std::make_pair(nProjectId, holder));
    if (it == mapRewards.end() || it->second.nPending == 0) {
        return 0;
    }

    SolarHolderReward& reward = it->second;
    const CAmount nAmount = reward.nPending;
    reward.nPending = 0;
    reward.nClaimed += nAmount;
    nTotalRewardsClaimed += nAmount;

    LogPrint(BCLog::REWARD, "%s: project=%u holder=%s amount=%s claimed=%s\n",
             __func__, nProjectId, holder.ToString(), FormatMoney(nAmount), FormatMoney(reward.nClaimed));
    return nAmount;
}

SolarHolderReward CRewardEngine::GetHolderReward(uint64_t nProjectId, const CAccountID& holder) const
{
    auto it = mapRewards.find(std::make_pair(nProjectId, holder));
    if (it == mapRewards.end()) {
        return SolarHolderReward();
    }
    return it->second;
}

CAmount CRewardEngine::GetTotalClaimed(uint64_t nProjectId, const CAccountID& holder) const
{
    return GetHolderReward(nProjectId, holder).nClaimed;
}

void CRewardEngine::RestoreHolderReward(uint64_t nProjectId, const CAccountID& holder, const SolarHolderReward& reward)
{
    const RewardKey key = std::make_pair(nProjectId, holder);
    if (reward.IsNull()) {
        mapRewards.erase(key);
    } else {
        mapRewards[key] = reward;
    }
}

void CRewardEngine::RestoreTotals(const CAmount& nScaledAllocated, const CAmount& nClaimed)
{
    nScaledRewardAllocated = nScaledAllocated;
    nTotalRewardsClaimed = nClaimed;
}

CAmount CRewardEngine::GetRewardLiability() const
{
    const CAmount nAllocated = nScaledRewardAllocated / solar_math::PRECISION;
    if (nAllocated < nTotalRewardsClaimed) {
        LogPrintf("ERROR: %s: claimed %s exceeds allocated %s\n",
                  __func__, FormatMoney(nTotalRewardsClaimed), FormatMoney(nAllocated));
        return 0;
    }
    return nAllocated - nTotalRewardsClaimed;
}

void CRewardEngine::Load(const RewardMap& rewards, const CAmount& nScaledAllocated, const CAmount& nClaimed)
{
    mapRewards = rewards;
    nScaledRewardAllocated = nScaledAllocated;
    nTotalRewardsClaimed = nClaimed;
}
