// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_LEDGER_H
#define SOLAR_SOLAR_LEDGER_H

#include "amount.h"
#include "serialize.h"
#include "solar/solar_account.h"
#include "solar/solar_params.h"
#include "solar/solar_project.h"
#include "solar/solar_registry.h"
#include "solar/solar_reward.h"
#include "solar/solar_signals.h"
#include "solar/solar_units.h"
#include "sync.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

class CValidationState;

/**
 * CValueTransfer - outbound currency movement
 *
 * Implemented by the host. SendValue returns false when the recipient
 * rejects the transfer; the ledger then rolls the whole operation back.
 * A std::exception is treated as a rejection. Any other exception is
 * propagated to the caller after the rollback.
 * An implementation may call back into the ledger: queries succeed,
 * mutating calls fail with ReentrantCall.
 */
class CValueTransfer
{
public:
    virtual ~CValueTransfer() {}
    virtual bool SendValue(const CAccountID& to, const CAmount& nAmount) = 0;
};

/** One page of a paginated listing. fHasMore = offset + vItems.size() < nTotal */
template <typename T>
struct CPage
{
    std::vector<T> vItems;
    uint64_t nTotal;
    bool fHasMore;

    CPage() : nTotal(0), fHasMore(false) {}
};

/** Holder view of one project */
struct SolarPortfolioEntry
{
    uint64_t nProjectId;
    std::string strName;
    uint64_t nBalance;
    CAmount nClaimable;
    CAmount nClaimed;

    SolarPortfolioEntry() : nProjectId(0), nBalance(0), nClaimable(0), nClaimed(0) {}
};

/**
 * SolarLedgerGlobals - ledger-wide counters
 *
 * INVARIANT: nHeldBalance >= nTotalSalesBalance + rewardLiability
 */
struct SolarLedgerGlobals
{
    uint64_t nNextProjectId;
    CAmount nHeldBalance;
    CAmount nTotalSalesBalance;
    CAmount nScaledRewardAllocated;
    CAmount nTotalRewardsClaimed;
    bool fPaused;

    SolarLedgerGlobals() { SetNull(); }

    void SetNull()
    {
        nNextProjectId = 1;
        nHeldBalance = 0;
        nTotalSalesBalance = 0;
        nScaledRewardAllocated = 0;
        nTotalRewardsClaimed = 0;
        fPaused = false;
    }

    SERIALIZE_METHODS(SolarLedgerGlobals, obj)
    {
        READWRITE(obj.nNextProjectId, obj.nHeldBalance, obj.nTotalSalesBalance);
        READWRITE(obj.nScaledRewardAllocated, obj.nTotalRewardsClaimed, obj.fPaused);
    }
};

/** Complete ledger state, as persisted by CSolarLedgerDB */
struct SolarLedgerSnapshot
{
    CProjectRegistry::ProjectMap projects;
    CProjectRegistry::UserIndex userProjects;
    CUnitLedger::BalanceMap balances;
    CUnitLedger::ApprovalSet approvals;
    CRewardEngine::RewardMap rewards;
    SolarLedgerGlobals globals;
};

/**
 * CLedgerUndo - state captured before an operation that sends value
 *
 * Only entries the operation may touch are captured; the first capture of
 * an entry wins.
 */
struct CLedgerUndo
{
    std::map<uint64_t, SolarProject> projects;
    std::map<CUnitLedger::BalanceKey, uint64_t> balances;
    std::map<CRewardEngine::RewardKey, SolarHolderReward> rewards;
    CAmount nHeldBalance;
    CAmount nTotalSalesBalance;
    CAmount nScaledRewardAllocated;
    CAmount nTotalRewardsClaimed;

    CLedgerUndo() : nHeldBalance(0), nTotalSalesBalance(0), nScaledRewardAllocated(0), nTotalRewardsClaimed(0) {}
};

/** Holds the non-reentrancy flag for the scope of one mutating operation */
class CReentrancyGuard
{
private:
    bool& fEntered;
    bool fAcquired;

public:
    explicit CReentrancyGuard(bool& fEnteredIn) : fEntered(fEnteredIn), fAcquired(!fEnteredIn)
    {
        if (fAcquired) fEntered = true;
    }
    ~CReentrancyGuard()
    {
        if (fAcquired) fEntered = false;
    }

    CReentrancyGuard(const CReentrancyGuard&) = delete;
    CReentrancyGuard& operator=(const CReentrancyGuard&) = delete;

    bool Acquired() const { return fAcquired; }
};

/**
 * CSolarLedger - revenue ledger for energy investment projects
 *
 * Owns the project registry, the unit ledger and the reward engine, and is
 * the only entry point for external callers.
 *
 * RÈGLES:
 * - Every public method takes cs_solar: operations are serialized and
 *   queries never observe a half-applied mutation.
 * - Every mutating method holds the re-entrancy flag for its whole
 *   duration; a nested mutating call fails with ReentrantCall.
 * - All validation happens before the first mutation. Effects are applied
 *   before any outbound transfer; when the transfer fails, the effects
 *   are undone from a CLedgerUndo and the call fails with TransferFailed.
 * - Pause blocks purchases and unit transfers only. Claims, deposits and
 *   withdrawals stay available.
 */
class CSolarLedger
{
private:
    mutable RecursiveMutex cs_solar;

    const CAccountID admin;
    const CLedgerParams params;
    CValueTransfer& valueTransfer;

    CProjectRegistry registry GUARDED_BY(cs_solar);
    CRewardEngine rewards GUARDED_BY(cs_solar);
    CUnitLedger units GUARDED_BY(cs_solar);

    CAmount nHeldBalance GUARDED_BY(cs_solar);
    CAmount nTotalSalesBalance GUARDED_BY(cs_solar);
    bool fPaused GUARDED_BY(cs_solar);
    bool fEntered GUARDED_BY(cs_solar);

    CLedgerSignals signals;

    // Undo helpers
    void UndoCaptureGlobals(CLedgerUndo& undo) const;
    void UndoCaptureProject(CLedgerUndo& undo, uint64_t nProjectId) const;
    void UndoCaptureHolder(CLedgerUndo& undo, uint64_t nProjectId, const CAccountID& holder) const;
    void ApplyUndo(const CLedgerUndo& undo);

    /** SendValue with rollback on failure */
    bool SendValueOrUndo(const CAccountID& to, const CAmount& nAmount, const CLedgerUndo& undo, CValidationState& state);

    bool CheckProjectExists(uint64_t nProjectId, CValidationState& state) const;
    bool CheckCreatorOrAdmin(const SolarProject& project, const CAccountID& caller, CValidationState& state) const;
    bool CheckNotPaused(CValidationState& state) const;
    bool CheckAdmin(const CAccountID& caller, CValidationState& state) const;

    bool CreateProjectInternal(const CAccountID& creator, const std::string& strName, uint64_t nTotalSupply,
                               const CAmount& nPrice, uint64_t nMinPurchase, uint64_t& nProjectId, CValidationState& state);

    CAmount GetRescuableDustInternal() const;

public:
    CSolarLedger(const CAccountID& adminIn, const CLedgerParams& paramsIn, CValueTransfer& valueTransferIn);

    CSolarLedger(const CSolarLedger&) = delete;
    CSolarLedger& operator=(const CSolarLedger&) = delete;

    CLedgerSignals& Signals() { return signals; }
    const CAccountID& GetAdmin() const { return admin; }
    const CLedgerParams& GetParams() const { return params; }

    // ------------------------------------------------------------------------
    // Project lifecycle
    // ------------------------------------------------------------------------

    bool CreateProject(const CAccountID& caller, const std::string& strName, uint64_t nTotalSupply,
                       const CAmount& nPrice, uint64_t nMinPurchase, uint64_t& nProjectId, CValidationState& state);

    /** Administrator creates a project on behalf of creator */
    bool CreateProjectFor(const CAccountID& caller, const CAccountID& creator, const std::string& strName,
                          uint64_t nTotalSupply, const CAmount& nPrice, uint64_t nMinPurchase,
                          uint64_t& nProjectId, CValidationState& state);

    bool TransferProjectOwnership(const CAccountID& caller, uint64_t nProjectId, const CAccountID& newCreator, CValidationState& state);
    bool SetProjectStatus(const CAccountID& caller, uint64_t nProjectId, bool fActive, CValidationState& state);

    /** Administrator only, before the first unit is minted */
    bool SetProjectPrice(const CAccountID& caller, uint64_t nProjectId, const CAmount& nNewPrice, CValidationState& state);

    // ------------------------------------------------------------------------
    // Units
    // ------------------------------------------------------------------------

    /**
     * Purchase - buy nAmount units paying nValuePaid
     *
     * RULES (in order):
     * 1. not paused, project exists and is active
     * 2. nAmount > 0 and nAmount >= minPurchase
     * 3. minted + nAmount <= totalSupply
     * 4. nValuePaid >= nAmount × price
     *
     * The cost goes to the project's sales balance, the excess is refunded.
     */
    bool Purchase(const CAccountID& caller, uint64_t nProjectId, uint64_t nAmount, const CAmount& nValuePaid, CValidationState& state);

    bool SafeTransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to,
                          uint64_t nProjectId, uint64_t nAmount, CValidationState& state);
    bool SafeBatchTransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to,
                               const std::vector<uint64_t>& vProjectIds, const std::vector<uint64_t>& vAmounts,
                               CValidationState& state);
    bool SetApprovalForAll(const CAccountID& caller, const CAccountID& op, bool fApproved, CValidationState& state);

    // ------------------------------------------------------------------------
    // Revenue and rewards
    // ------------------------------------------------------------------------

    /** Creator or administrator deposits nValue of revenue for the current holders */
    bool DepositRevenue(const CAccountID& caller, uint64_t nProjectId, uint64_t nEnergyDelta,
                        const CAmount& nValue, CValidationState& state);

    bool UpdateEnergy(const CAccountID& caller, uint64_t nProjectId, uint64_t nEnergyDelta, CValidationState& state);

    /** Overwrite the energy counter; the previous value and reason are logged and signalled */
    bool SetEnergy(const CAccountID& caller, uint64_t nProjectId, uint64_t nNewValue,
                   const std::string& strReason, CValidationState& state);

    bool Claim(const CAccountID& caller, uint64_t nProjectId, CAmount& nClaimed, CValidationState& state);

    /** Claims every listed project and pays the total in one transfer */
    bool ClaimMultiple(const CAccountID& caller, const std::vector<uint64_t>& vProjectIds, CAmount& nClaimed, CValidationState& state);

    // ------------------------------------------------------------------------
    // Treasury
    // ------------------------------------------------------------------------

    bool WithdrawSales(const CAccountID& caller, uint64_t nProjectId, const CAccountID& recipient,
                       const CAmount& nAmount, CValidationState& state);

    /** Sweep value attributed neither to sales nor to holder rewards */
    bool RescueDust(const CAccountID& caller, const CAccountID& recipient, CAmount& nRescued, CValidationState& state);

    /** Unsolicited plain transfer into the ledger */
    bool ReceiveValue(const CAccountID& from, const CAmount& nAmount, CValidationState& state);

    bool Pause(const CAccountID& caller, CValidationState& state);
    bool Unpause(const CAccountID& caller, CValidationState& state);

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    bool GetProject(uint64_t nProjectId, SolarProject& project) const;
    uint64_t GetProjectCount() const;
    CAmount GetClaimableAmount(uint64_t nProjectId, const CAccountID& holder) const;
    CAmount GetTotalClaimed(uint64_t nProjectId, const CAccountID& holder) const;
    uint64_t BalanceOf(const CAccountID& owner, uint64_t nProjectId) const;
    bool BalanceOfBatch(const std::vector<CAccountID>& vOwners, const std::vector<uint64_t>& vProjectIds,
                        std::vector<uint64_t>& vBalances, CValidationState& state) const;
    bool IsApprovedForAll(const CAccountID& owner, const CAccountID& op) const;

    std::vector<uint64_t> GetUserProjects(const CAccountID& creator) const;
    bool GetUserProjectsPaginated(const CAccountID& creator, uint64_t nOffset, uint64_t nLimit,
                                  CPage<uint64_t>& page, CValidationState& state) const;
    bool GetProjectsPaginated(uint64_t nOffset, uint64_t nLimit, CPage<SolarProject>& page, CValidationState& state) const;
    bool GetPortfolio(const CAccountID& holder, uint64_t nOffset, uint64_t nLimit,
                      CPage<SolarPortfolioEntry>& page, CValidationState& state) const;

    CAmount GetHeldBalance() const;
    CAmount GetTotalSalesBalance() const;
    CAmount GetRewardLiability() const;
    CAmount GetRescuableDust() const;
    bool IsPaused() const;

    /** Conservation checks over the whole ledger, logs every violation */
    bool CheckInvariants() const;

    // ------------------------------------------------------------------------
    // Snapshot
    // ------------------------------------------------------------------------

    SolarLedgerSnapshot GetSnapshot() const;

    /** Replace the whole state; rejected (state unchanged) when inconsistent */
    bool LoadSnapshot(const SolarLedgerSnapshot& snapshot);
};

#endif // SOLAR_SOLAR_LEDGER_H
