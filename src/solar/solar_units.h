// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_UNITS_H
#define SOLAR_SOLAR_UNITS_H

#include "solar/solar_account.h"

#include <map>
#include <set>
#include <stdint.h>
#include <utility>
#include <vector>

class CValidationState;

/**
 * CBalanceObserver - settlement hook of the unit ledger
 *
 * Called for every holder whose balance is about to change, with the balance
 * as of before the change. Called twice for a self-transfer.
 */
class CBalanceObserver
{
public:
    virtual ~CBalanceObserver() {}
    virtual void BalanceWillChange(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalanceBefore) = 0;
};

/**
 * CUnitLedger - multi-class unit balances (holder × project → count)
 *
 * RÈGLE: the settlement hook runs inside the balance primitives, before
 * any balance is written. Callers never settle on their own.
 *
 * Check* methods validate without side effects; the matching mutators
 * assume a successful check and cannot fail.
 */
class CUnitLedger
{
public:
    typedef std::pair<uint64_t, CAccountID> BalanceKey;
    typedef std::map<BalanceKey, uint64_t> BalanceMap;
    typedef std::set<std::pair<CAccountID, CAccountID>> ApprovalSet;

private:
    BalanceMap mapBalances;
    ApprovalSet setApprovals; // (owner, operator)
    CBalanceObserver* m_observer;

    void Notify(uint64_t nProjectId, const CAccountID& holder);

public:
    explicit CUnitLedger(CBalanceObserver* observer = nullptr) : m_observer(observer) {}

    uint64_t BalanceOf(const CAccountID& owner, uint64_t nProjectId) const;

    /** Sum of all balances of a project (O(holders), used by invariant checks) */
    uint64_t TotalBalance(uint64_t nProjectId) const;

    bool CheckMint(const CAccountID& to, uint64_t nProjectId, uint64_t nAmount, CValidationState& state) const;
    void Mint(const CAccountID& to, uint64_t nProjectId, uint64_t nAmount);

    /**
     * CheckTransferBatch - validate a (batch) transfer
     *
     * Repeated project ids are accumulated, so the sender must hold the
     * total of all entries for a project. Empty batches are valid.
     */
    bool CheckTransferBatch(const CAccountID& from, const CAccountID& to,
                            const std::vector<uint64_t>& vProjectIds,
                            const std::vector<uint64_t>& vAmounts,
                            CValidationState& state) const;
    void TransferBatch(const CAccountID& from, const CAccountID& to,
                       const std::vector<uint64_t>& vProjectIds,
                       const std::vector<uint64_t>& vAmounts);

    bool Transfer(const CAccountID& from, const CAccountID& to, uint64_t nProjectId, uint64_t nAmount, CValidationState& state);

    void SetApprovalForAll(const CAccountID& owner, const CAccountID& op, bool fApproved);
    bool IsApprovedForAll(const CAccountID& owner, const CAccountID& op) const;

    /** Project ids in which owner holds a non-zero balance, ascending */
    std::vector<uint64_t> GetHeldProjects(const CAccountID& owner) const;

    /** Undo support: put back a balance captured before a failed operation */
    void RestoreBalance(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalance);

    const BalanceMap& GetBalances() const { return mapBalances; }
    const ApprovalSet& GetApprovals() const { return setApprovals; }
    void Load(const BalanceMap& balances, const ApprovalSet& approvals);
};

#endif // SOLAR_SOLAR_UNITS_H
