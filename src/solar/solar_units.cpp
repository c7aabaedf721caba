// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_units.h"

#include "logging.h"
#include "solar/solar_errors.h"

#include <limits>

void CUnitLedger::Notify(uint64_t nProjectId, const CAccountID& holder)
{
    if (m_observer) {
        m_observer->BalanceWillChange(nProjectId, holder, BalanceOf(holder, nProjectId));
    }
}

uint64_t CUnitLedger::BalanceOf(const CAccountID& owner, uint64_t nProjectId) const
{
    auto it = mapBalances.find(std::make_pair(nProjectId, owner));
    if (it == mapBalances.end()) {
        return 0;
    }
    return it->second;
}

uint64_t CUnitLedger::TotalBalance(uint64_t nProjectId) const
{
    uint64_t nTotal = 0;
    auto it = mapBalances.lower_bound(std::make_pair(nProjectId, CAccountID()));
    for (; it != mapBalances.end() && it->first.first == nProjectId; ++it) {
        nTotal += it->second;
    }
    return nTotal;
}

bool CUnitLedger::CheckMint(const CAccountID& to, uint64_t nProjectId, uint64_t nAmount, CValidationState& state) const
{
    if (to.IsNull()) {
        return state.Invalid(LedgerError::INVALID_RECIPIENT, "bad-mint-recipient");
    }
    if (BalanceOf(to, nProjectId) > std::numeric_limits<uint64_t>::max() - nAmount) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-mint-overflow");
    }
    return true;
}

void CUnitLedger::Mint(const CAccountID& to, uint64_t nProjectId, uint64_t nAmount)
{
    // Mint is a transfer without sender: only the receiver settles
    Notify(nProjectId, to);

    mapBalances[std::make_pair(nProjectId, to)] += nAmount;

    LogPrint(BCLog::UNITS, "%s: project=%u to=%s amount=%u balance=%u\n",
             __func__, nProjectId, to.ToString(), nAmount, BalanceOf(to, nProjectId));
}

bool CUnitLedger::CheckTransferBatch(const CAccountID& from, const CAccountID& to,
                                     const std::vector<uint64_t>& vProjectIds,
                                     const std::vector<uint64_t>& vAmounts,
                                     CValidationState& state) const
{
    if (vProjectIds.size() != vAmounts.size()) {
        return state.Invalid(LedgerError::ARRAY_LENGTH_MISMATCH, "bad-transfer-length",
                             strprintf("ids=%u amounts=%u", vProjectIds.size(), vAmounts.size()));
    }
    if (to.IsNull()) {
        return state.Invalid(LedgerError::INVALID_RECIPIENT, "bad-transfer-recipient");
    }

    std::map<uint64_t, uint64_t> mapRequired;
    for (size_t i = 0; i < vProjectIds.size(); ++i) {
        uint64_t& nRequired = mapRequired[vProjectIds[i]];
        if (nRequired > std::numeric_limits<uint64_t>::max() - vAmounts[i]) {
            return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-transfer-overflow");
        }
        nRequired += vAmounts[i];
    }

    for (const auto& required : mapRequired) {
        const uint64_t nBalance = BalanceOf(from, required.first);
        if (nBalance < required.second) {
            return state.Invalid(LedgerError::INSUFFICIENT_BALANCE, "bad-transfer-balance",
                                 strprintf("project=%u balance=%u required=%u", required.first, nBalance, required.second));
        }
    }
    return true;
}

void CUnitLedger::TransferBatch(const CAccountID& from, const CAccountID& to,
                                const std::vector<uint64_t>& vProjectIds,
                                const std::vector<uint64_t>& vAmounts)
{
    for (size_t i = 0; i < vProjectIds.size(); ++i) {
        const uint64_t nProjectId = vProjectIds[i];
        const uint64_t nAmount = vAmounts[i];

        // Rewards accrued so far stay with whoever held the units until now
        Notify(nProjectId, from);
        Notify(nProjectId, to);

        if (from == to || nAmount == 0) {
            continue;
        }

        uint64_t& nFrom = mapBalances[std::make_pair(nProjectId, from)];
        nFrom -= nAmount;
        if (nFrom == 0) {
            mapBalances.erase(std::make_pair(nProjectId, from));
        }
        mapBalances[std::make_pair(nProjectId, to)] += nAmount;

        LogPrint(BCLog::UNITS, "%s: project=%u from=%s to=%s amount=%u\n",
                 __func__, nProjectId, from.ToString(), to.ToString(), nAmount);
    }
}

bool CUnitLedger::Transfer(const CAccountID& from, const CAccountID& to, uint64_t nProjectId, uint64_t nAmount, CValidationState& state)
{
    const std::vector<uint64_t> vProjectIds(1, nProjectId);
    const std::vector<uint64_t> vAmounts(1, nAmount);
    if (!CheckTransferBatch(from, to, vProjectIds, vAmounts, state)) {
        return false;
    }
    TransferBatch(from, to, vProjectIds, vAmounts);
    return true;
}

void CUnitLedger::SetApprovalForAll(const CAccountID& owner, const CAccountID& op, bool fApproved)
{
    if (fApproved) {
        setApprovals.insert(std::make_pair(owner, op));
    } else {
        setApprovals.erase(std::make_pair(owner, op));
    }
}

bool CUnitLedger::IsApprovedForAll(const CAccountID& owner, const CAccountID& op) const
{
    return setApprovals.count(std::make_pair(owner, op)) > 0;
}

std::vector<uint64_t> CUnitLedger::GetHeldProjects(const CAccountID& owner) const
{
    std::vector<uint64_t> vProjects;
    for (const auto& entry : mapBalances) {
        if (entry.first.second == owner && entry.second > 0) {
            vProjects.push_back(entry.first.first);
        }
    }
    return vProjects;
}

void CUnitLedger::RestoreBalance(uint64_t nProjectId, const CAccountID& holder, uint64_t nBalance)
{
    if (nBalance == 0) {
        mapBalances.erase(std::make_pair(nProjectId, holder));
    } else {
        mapBalances[std::make_pair(nProjectId, holder)] = nBalance;
    }
}

void CUnitLedger::Load(const BalanceMap& balances, const ApprovalSet& approvals)
{
    mapBalances = balances;
    setApprovals = approvals;
}
