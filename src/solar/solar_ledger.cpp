// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_ledger.h"

#include "logging.h"
#include "solar/solar_errors.h"
#include "solar/solar_math.h"
#include "utilmoneystr.h"
#include "utiltime.h"

#include <algorithm>
#include <iterator>
#include <limits>
#include <set>

namespace {

template <typename T>
void FillPage(const std::vector<T>& vAll, uint64_t nOffset, uint64_t nLimit, CPage<T>& page)
{
    page.vItems.clear();
    page.nTotal = vAll.size();
    if (nOffset >= vAll.size()) {
        page.fHasMore = false;
        return;
    }
    const uint64_t nEnd = std::min<uint64_t>(vAll.size(), nOffset + nLimit);
    page.vItems.assign(vAll.begin() + nOffset, vAll.begin() + nEnd);
    page.fHasMore = nOffset + page.vItems.size() < page.nTotal;
}

bool CheckPageLimit(uint64_t nLimit, uint32_t nMax, CValidationState& state)
{
    if (nLimit > nMax) {
        return state.Invalid(LedgerError::INVALID_AMOUNT, "bad-page-limit", strprintf("limit=%u max=%u", nLimit, nMax));
    }
    return true;
}

bool RejectReentrant(const char* pszFunc, CValidationState& state)
{
    LogPrint(BCLog::LEDGER, "%s: rejected nested call\n", pszFunc);
    return state.Invalid(LedgerError::REENTRANT_CALL, "bad-reentrant-call", pszFunc);
}

} // namespace

CSolarLedger::CSolarLedger(const CAccountID& adminIn, const CLedgerParams& paramsIn, CValueTransfer& valueTransferIn)
    : admin(adminIn),
      params(paramsIn),
      valueTransfer(valueTransferIn),
      rewards(registry),
      units(&rewards),
      nHeldBalance(0),
      nTotalSalesBalance(0),
      fPaused(false),
      fEntered(false)
{
    LogPrint(BCLog::LEDGER, "%s: admin=%s maxClaimBatch=%u allowPriceUpdate=%d\n",
             __func__, admin.ToString(), params.nMaxClaimBatch, params.fAllowPriceUpdate);
}

// ============================================================================
// Undo
// ============================================================================

void CSolarLedger::UndoCaptureGlobals(CLedgerUndo& undo) const
{
    undo.nHeldBalance = nHeldBalance;
    undo.nTotalSalesBalance = nTotalSalesBalance;
    undo.nScaledRewardAllocated = rewards.GetScaledRewardAllocated();
    undo.nTotalRewardsClaimed = rewards.GetTotalRewardsClaimed();
}

void CSolarLedger::UndoCaptureProject(CLedgerUndo& undo, uint64_t nProjectId) const
{
    if (undo.projects.count(nProjectId)) return;
    const SolarProject* pproject = registry.Lookup(nProjectId);
    if (pproject) {
        undo.projects.emplace(nProjectId, *pproject);
    }
}

void CSolarLedger::UndoCaptureHolder(CLedgerUndo& undo, uint64_t nProjectId, const CAccountID& holder) const
{
    const CUnitLedger::BalanceKey key = std::make_pair(nProjectId, holder);
    if (!undo.balances.count(key)) {
        undo.balances.emplace(key, units.BalanceOf(holder, nProjectId));
    }
    if (!undo.rewards.count(key)) {
        undo.rewards.emplace(key, rewards.GetHolderReward(nProjectId, holder));
    }
}

void CSolarLedger::ApplyUndo(const CLedgerUndo& undo)
{
    for (const auto& entry : undo.projects) {
        registry.RestoreProject(entry.second);
    }
    for (const auto& entry : undo.balances) {
        units.RestoreBalance(entry.first.first, entry.first.second, entry.second);
    }
    for (const auto& entry : undo.rewards) {
        rewards.RestoreHolderReward(entry.first.first, entry.first.second, entry.second);
    }
    nHeldBalance = undo.nHeldBalance;
    nTotalSalesBalance = undo.nTotalSalesBalance;
    rewards.RestoreTotals(undo.nScaledRewardAllocated, undo.nTotalRewardsClaimed);

    LogPrint(BCLog::LEDGER, "%s: restored %u projects, %u balances, %u reward records\n",
             __func__, undo.projects.size(), undo.balances.size(), undo.rewards.size());
}

bool CSolarLedger::SendValueOrUndo(const CAccountID& to, const CAmount& nAmount, const CLedgerUndo& undo, CValidationState& state)
{
    bool fSent = false;
    std::string strError = "recipient rejected transfer";
    try {
        fSent = valueTransfer.SendValue(to, nAmount);
    } catch (const std::exception& e) {
        strError = e.what();
    } catch (...) {
        // Unknown host error: restore the ledger, then let the caller see it
        ApplyUndo(undo);
        LogPrintf("%s: transfer of %s to %s aborted by unknown exception, ledger restored\n",
                  __func__, FormatMoney(nAmount), to.ToString());
        throw;
    }

    if (!fSent) {
        ApplyUndo(undo);
        LogPrint(BCLog::LEDGER, "%s: transfer of %s to %s failed: %s\n",
                 __func__, FormatMoney(nAmount), to.ToString(), strError);
        return state.Invalid(LedgerError::TRANSFER_FAILED, "bad-value-transfer",
                             strprintf("to=%s amount=%s: %s", to.ToString(), nAmount.str(), strError));
    }
    return true;
}

// ============================================================================
// Checks
// ============================================================================

bool CSolarLedger::CheckProjectExists(uint64_t nProjectId, CValidationState& state) const
{
    if (!registry.Exists(nProjectId)) {
        return state.Invalid(LedgerError::PROJECT_NOT_FOUND, "bad-project-id", strprintf("project=%u", nProjectId));
    }
    return true;
}

bool CSolarLedger::CheckCreatorOrAdmin(const SolarProject& project, const CAccountID& caller, CValidationState& state) const
{
    if (caller != project.creator && caller != admin) {
        return state.Invalid(LedgerError::UNAUTHORIZED, "bad-caller-not-creator-or-admin",
                             strprintf("project=%u caller=%s", project.nId, caller.ToString()));
    }
    return true;
}

bool CSolarLedger::CheckNotPaused(CValidationState& state) const
{
    if (fPaused) {
        return state.Invalid(LedgerError::CONTRACT_PAUSED, "bad-ledger-paused");
    }
    return true;
}

bool CSolarLedger::CheckAdmin(const CAccountID& caller, CValidationState& state) const
{
    if (caller != admin) {
        return state.Invalid(LedgerError::UNAUTHORIZED, "bad-caller-not-admin", strprintf("caller=%s", caller.ToString()));
    }
    return true;
}

// ============================================================================
// Project lifecycle
// ============================================================================

bool CSolarLedger::CreateProjectInternal(const CAccountID& creator, const std::string& strName, uint64_t nTotalSupply,
                                         const CAmount& nPrice, uint64_t nMinPurchase, uint64_t& nProjectId, CValidationState& state)
{
    if (!registry.CheckNewProject(creator, nTotalSupply, nPrice, nMinPurchase, state)) {
        LogPrint(BCLog::LEDGER, "%s: rejected: %s\n", __func__, state.ToString());
        return false;
    }

    nProjectId = registry.AddProject(creator, strName, nTotalSupply, nPrice, nMinPurchase, GetTime());

    signals.ProjectCreated(nProjectId, creator, strName, nTotalSupply, nPrice);
    return true;
}

bool CSolarLedger::CreateProject(const CAccountID& caller, const std::string& strName, uint64_t nTotalSupply,
                                 const CAmount& nPrice, uint64_t nMinPurchase, uint64_t& nProjectId, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }
    return CreateProjectInternal(caller, strName, nTotalSupply, nPrice, nMinPurchase, nProjectId, state);
}

bool CSolarLedger::CreateProjectFor(const CAccountID& caller, const CAccountID& creator, const std::string& strName,
                                    uint64_t nTotalSupply, const CAmount& nPrice, uint64_t nMinPurchase,
                                    uint64_t& nProjectId, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }
    if (!CheckAdmin(caller, state)) {
        return false;
    }
    return CreateProjectInternal(creator, strName, nTotalSupply, nPrice, nMinPurchase, nProjectId, state);
}

bool CSolarLedger::TransferProjectOwnership(const CAccountID& caller, uint64_t nProjectId, const CAccountID& newCreator, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    const SolarProject* pproject = registry.Lookup(nProjectId);
    const CAccountID oldCreator = pproject ? pproject->creator : CAccountID();

    if (!registry.TransferOwnership(nProjectId, caller, newCreator, state)) {
        LogPrint(BCLog::LEDGER, "%s: rejected: %s\n", __func__, state.ToString());
        return false;
    }

    signals.OwnershipTransferred(nProjectId, oldCreator, newCreator);
    return true;
}

bool CSolarLedger::SetProjectStatus(const CAccountID& caller, uint64_t nProjectId, bool fActive, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!registry.SetActive(nProjectId, caller, fActive, state)) {
        LogPrint(BCLog::LEDGER, "%s: rejected: %s\n", __func__, state.ToString());
        return false;
    }

    signals.StatusChanged(nProjectId, fActive);
    return true;
}

bool CSolarLedger::SetProjectPrice(const CAccountID& caller, uint64_t nProjectId, const CAmount& nNewPrice, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckAdmin(caller, state) || !CheckProjectExists(nProjectId, state)) {
        return false;
    }
    if (nNewPrice == 0) {
        return state.Invalid(LedgerError::INVALID_PRICE, "bad-project-price");
    }

    SolarProject& project = *registry.LookupMutable(nProjectId);
    if (!params.fAllowPriceUpdate || project.nMinted > 0) {
        return state.Invalid(LedgerError::PRICE_LOCKED, "bad-project-price-locked",
                             strprintf("project=%u minted=%u", nProjectId, project.nMinted));
    }

    const CAmount nOldPrice = project.nPrice;
    project.nPrice = nNewPrice;

    LogPrint(BCLog::LEDGER, "%s: project=%u price %s -> %s\n",
             __func__, nProjectId, FormatMoney(nOldPrice), FormatMoney(nNewPrice));
    signals.PriceUpdated(nProjectId, nOldPrice, nNewPrice);
    return true;
}

// ============================================================================
// Units
// ============================================================================

bool CSolarLedger::Purchase(const CAccountID& caller, uint64_t nProjectId, uint64_t nAmount, const CAmount& nValuePaid, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckNotPaused(state) || !CheckProjectExists(nProjectId, state)) {
        return false;
    }

    const SolarProject& project = *registry.Lookup(nProjectId);
    if (!project.fActive) {
        return state.Invalid(LedgerError::PROJECT_NOT_ACTIVE, "bad-purchase-inactive", strprintf("project=%u", nProjectId));
    }
    if (nAmount == 0) {
        return state.Invalid(LedgerError::INVALID_AMOUNT, "bad-purchase-amount");
    }
    if (nAmount < project.nMinPurchase) {
        return state.Invalid(LedgerError::BELOW_MIN_PURCHASE, "bad-purchase-below-min",
                             strprintf("amount=%u minPurchase=%u", nAmount, project.nMinPurchase));
    }
    if (nAmount > project.GetAvailableSupply()) {
        return state.Invalid(LedgerError::EXCEEDS_SUPPLY, "bad-purchase-supply",
                             strprintf("amount=%u available=%u", nAmount, project.GetAvailableSupply()));
    }

    CAmount nCost;
    if (!solar_math::CalculateCost(nAmount, project.nPrice, nCost)) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-purchase-overflow", "cost");
    }
    if (nValuePaid < nCost) {
        return state.Invalid(LedgerError::INSUFFICIENT_PAYMENT, "bad-purchase-payment",
                             strprintf("paid=%s cost=%s", nValuePaid.str(), nCost.str()));
    }

    CAmount nNewHeld, nNewSales, nNewTotalSales;
    if (!solar_math::CheckedAdd(nHeldBalance, nValuePaid, nNewHeld) ||
        !solar_math::CheckedAdd(project.nSalesBalance, nCost, nNewSales) ||
        !solar_math::CheckedAdd(nTotalSalesBalance, nCost, nNewTotalSales)) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-purchase-overflow", "balances");
    }
    if (!units.CheckMint(caller, nProjectId, nAmount, state)) {
        return false;
    }

    CLedgerUndo undo;
    UndoCaptureGlobals(undo);
    UndoCaptureProject(undo, nProjectId);
    UndoCaptureHolder(undo, nProjectId, caller);

    // Effects
    SolarProject& mutableProject = *registry.LookupMutable(nProjectId);
    nHeldBalance = nNewHeld;
    mutableProject.nSalesBalance = nNewSales;
    nTotalSalesBalance = nNewTotalSales;
    mutableProject.nMinted += nAmount;
    units.Mint(caller, nProjectId, nAmount);

    // Interactions
    const CAmount nRefund = nValuePaid - nCost;
    if (nRefund > 0) {
        nHeldBalance -= nRefund;
        if (!SendValueOrUndo(caller, nRefund, undo, state)) {
            return false;
        }
    }

    LogPrint(BCLog::LEDGER, "%s: project=%u buyer=%s amount=%u cost=%s refund=%s minted=%u/%u\n",
             __func__, nProjectId, caller.ToString(), nAmount, FormatMoney(nCost), FormatMoney(nRefund),
             mutableProject.nMinted, mutableProject.nTotalSupply);
    signals.UnitsPurchased(nProjectId, caller, nAmount, nCost);
    return true;
}

bool CSolarLedger::SafeTransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to,
                                    uint64_t nProjectId, uint64_t nAmount, CValidationState& state)
{
    return SafeBatchTransferFrom(caller, from, to, std::vector<uint64_t>(1, nProjectId), std::vector<uint64_t>(1, nAmount), state);
}

bool CSolarLedger::SafeBatchTransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to,
                                         const std::vector<uint64_t>& vProjectIds, const std::vector<uint64_t>& vAmounts,
                                         CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckNotPaused(state)) {
        return false;
    }
    if (caller != from && !units.IsApprovedForAll(from, caller)) {
        return state.Invalid(LedgerError::UNAUTHORIZED, "bad-transfer-caller",
                             strprintf("caller=%s from=%s", caller.ToString(), from.ToString()));
    }
    if (to.IsNull()) {
        return state.Invalid(LedgerError::INVALID_RECIPIENT, "bad-transfer-recipient");
    }
    if (vProjectIds.size() != vAmounts.size()) {
        return state.Invalid(LedgerError::ARRAY_LENGTH_MISMATCH, "bad-transfer-length",
                             strprintf("ids=%u amounts=%u", vProjectIds.size(), vAmounts.size()));
    }
    for (const uint64_t nProjectId : vProjectIds) {
        if (!CheckProjectExists(nProjectId, state)) {
            return false;
        }
    }
    if (!units.CheckTransferBatch(from, to, vProjectIds, vAmounts, state)) {
        LogPrint(BCLog::LEDGER, "%s: rejected: %s\n", __func__, state.ToString());
        return false;
    }

    units.TransferBatch(from, to, vProjectIds, vAmounts);

    signals.UnitsTransferred(caller, from, to, vProjectIds, vAmounts);
    return true;
}

bool CSolarLedger::SetApprovalForAll(const CAccountID& caller, const CAccountID& op, bool fApproved, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (op == caller) {
        return state.Invalid(LedgerError::INVALID_OPERATOR, "bad-approval-self");
    }
    if (op.IsNull()) {
        return state.Invalid(LedgerError::INVALID_OPERATOR, "bad-approval-operator");
    }

    units.SetApprovalForAll(caller, op, fApproved);

    LogPrint(BCLog::LEDGER, "%s: owner=%s operator=%s approved=%d\n", __func__, caller.ToString(), op.ToString(), fApproved);
    signals.ApprovalForAll(caller, op, fApproved);
    return true;
}

// ============================================================================
// Revenue and rewards
// ============================================================================

bool CSolarLedger::DepositRevenue(const CAccountID& caller, uint64_t nProjectId, uint64_t nEnergyDelta,
                                  const CAmount& nValue, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckProjectExists(nProjectId, state)) {
        return false;
    }
    SolarProject& project = *registry.LookupMutable(nProjectId);
    if (!CheckCreatorOrAdmin(project, caller, state)) {
        return false;
    }

    CAmount nIncrease, nScaled;
    if (!rewards.CheckDeposit(project, nValue, nEnergyDelta, nIncrease, nScaled, state)) {
        LogPrint(BCLog::LEDGER, "%s: rejected: %s\n", __func__, state.ToString());
        return false;
    }
    CAmount nNewHeld;
    if (!solar_math::CheckedAdd(nHeldBalance, nValue, nNewHeld)) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-deposit-overflow", "held balance");
    }

    nHeldBalance = nNewHeld;
    rewards.ApplyDeposit(project, nValue, nEnergyDelta, nIncrease, nScaled);

    LogPrint(BCLog::LEDGER, "%s: project=%u caller=%s amount=%s energy=+%u\n",
             __func__, nProjectId, caller.ToString(), FormatMoney(nValue), nEnergyDelta);
    signals.RevenueDeposited(nProjectId, nValue, nEnergyDelta, project.nRewardPerUnitStored);
    return true;
}

bool CSolarLedger::UpdateEnergy(const CAccountID& caller, uint64_t nProjectId, uint64_t nEnergyDelta, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckProjectExists(nProjectId, state)) {
        return false;
    }
    SolarProject& project = *registry.LookupMutable(nProjectId);
    if (!CheckCreatorOrAdmin(project, caller, state)) {
        return false;
    }
    if (!project.fActive) {
        return state.Invalid(LedgerError::PROJECT_NOT_ACTIVE, "bad-energy-inactive", strprintf("project=%u", nProjectId));
    }
    if (project.nTotalEnergyKwh > std::numeric_limits<uint64_t>::max() - nEnergyDelta) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-energy-overflow");
    }

    project.nTotalEnergyKwh += nEnergyDelta;

    LogPrint(BCLog::LEDGER, "%s: project=%u energy=+%u total=%u\n", __func__, nProjectId, nEnergyDelta, project.nTotalEnergyKwh);
    signals.EnergyUpdated(nProjectId, nEnergyDelta, project.nTotalEnergyKwh);
    return true;
}

bool CSolarLedger::SetEnergy(const CAccountID& caller, uint64_t nProjectId, uint64_t nNewValue,
                             const std::string& strReason, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckProjectExists(nProjectId, state)) {
        return false;
    }
    SolarProject& project = *registry.LookupMutable(nProjectId);
    if (!CheckCreatorOrAdmin(project, caller, state)) {
        return false;
    }
    if (!project.fActive) {
        return state.Invalid(LedgerError::PROJECT_NOT_ACTIVE, "bad-energy-inactive", strprintf("project=%u", nProjectId));
    }

    const uint64_t nOldValue = project.nTotalEnergyKwh;
    project.nTotalEnergyKwh = nNewValue;

    LogPrintf("%s: project=%u energy corrected %u -> %u by %s (%s)\n",
              __func__, nProjectId, nOldValue, nNewValue, caller.ToString(), strReason);
    signals.EnergyCorrected(nProjectId, nOldValue, nNewValue, strReason);
    return true;
}

bool CSolarLedger::Claim(const CAccountID& caller, uint64_t nProjectId, CAmount& nClaimed, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }
    nClaimed = 0;

    if (!CheckProjectExists(nProjectId, state)) {
        return false;
    }

    const uint64_t nBalance = units.BalanceOf(caller, nProjectId);
    if (rewards.GetClaimable(nProjectId, caller, nBalance) == 0) {
        return state.Invalid(LedgerError::NOTHING_TO_CLAIM, "bad-claim-nothing", strprintf("project=%u", nProjectId));
    }

    CLedgerUndo undo;
    UndoCaptureGlobals(undo);
    UndoCaptureHolder(undo, nProjectId, caller);

    // Effects: pending is zeroed before the transfer
    const CAmount nAmount = rewards.TakePending(nProjectId, caller, nBalance);
    nHeldBalance -= nAmount;

    // Interactions
    if (!SendValueOrUndo(caller, nAmount, undo, state)) {
        return false;
    }

    nClaimed = nAmount;
    LogPrint(BCLog::LEDGER, "%s: project=%u holder=%s amount=%s\n", __func__, nProjectId, caller.ToString(), FormatMoney(nAmount));
    signals.RewardsClaimed(nProjectId, caller, nAmount);
    return true;
}

bool CSolarLedger::ClaimMultiple(const CAccountID& caller, const std::vector<uint64_t>& vProjectIds, CAmount& nClaimed, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }
    nClaimed = 0;

    if (vProjectIds.size() > params.nMaxClaimBatch) {
        return state.Invalid(LedgerError::BATCH_SIZE_TOO_LARGE, "bad-claim-batch-size",
                             strprintf("size=%u max=%u", vProjectIds.size(), params.nMaxClaimBatch));
    }
    for (const uint64_t nProjectId : vProjectIds) {
        if (!CheckProjectExists(nProjectId, state)) {
            return false;
        }
    }

    CLedgerUndo undo;
    UndoCaptureGlobals(undo);
    for (const uint64_t nProjectId : vProjectIds) {
        UndoCaptureHolder(undo, nProjectId, caller);
    }

    // Effects: repeated ids take nothing the second time
    std::vector<std::pair<uint64_t, CAmount>> vTaken;
    CAmount nTotal = 0;
    for (const uint64_t nProjectId : vProjectIds) {
        const CAmount nAmount = rewards.TakePending(nProjectId, caller, units.BalanceOf(caller, nProjectId));
        if (nAmount == 0) continue;
        vTaken.emplace_back(nProjectId, nAmount);
        nTotal += nAmount;
    }

    if (nTotal == 0) {
        ApplyUndo(undo);
        return state.Invalid(LedgerError::NOTHING_TO_CLAIM, "bad-claim-nothing", strprintf("projects=%u", vProjectIds.size()));
    }
    nHeldBalance -= nTotal;

    // Interactions: one transfer for the whole batch
    if (!SendValueOrUndo(caller, nTotal, undo, state)) {
        return false;
    }

    nClaimed = nTotal;
    LogPrint(BCLog::LEDGER, "%s: holder=%s projects=%u paid=%u total=%s\n",
             __func__, caller.ToString(), vProjectIds.size(), vTaken.size(), FormatMoney(nTotal));
    for (const auto& taken : vTaken) {
        signals.RewardsClaimed(taken.first, caller, taken.second);
    }
    return true;
}

// ============================================================================
// Treasury
// ============================================================================

bool CSolarLedger::WithdrawSales(const CAccountID& caller, uint64_t nProjectId, const CAccountID& recipient,
                                 const CAmount& nAmount, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckProjectExists(nProjectId, state)) {
        return false;
    }
    SolarProject& project = *registry.LookupMutable(nProjectId);
    if (caller != project.creator) {
        return state.Invalid(LedgerError::UNAUTHORIZED, "bad-withdraw-caller",
                             strprintf("project=%u caller=%s", nProjectId, caller.ToString()));
    }
    if (recipient.IsNull()) {
        return state.Invalid(LedgerError::INVALID_RECIPIENT, "bad-withdraw-recipient");
    }
    if (nAmount == 0) {
        return state.Invalid(LedgerError::INVALID_AMOUNT, "bad-withdraw-amount");
    }
    if (nAmount > project.nSalesBalance) {
        return state.Invalid(LedgerError::INSUFFICIENT_SALES_BALANCE, "bad-withdraw-balance",
                             strprintf("amount=%s sales=%s", nAmount.str(), project.nSalesBalance.str()));
    }

    CLedgerUndo undo;
    UndoCaptureGlobals(undo);
    UndoCaptureProject(undo, nProjectId);

    project.nSalesBalance -= nAmount;
    nTotalSalesBalance -= nAmount;
    nHeldBalance -= nAmount;

    if (!SendValueOrUndo(recipient, nAmount, undo, state)) {
        return false;
    }

    LogPrint(BCLog::LEDGER, "%s: project=%u recipient=%s amount=%s remaining=%s\n",
             __func__, nProjectId, recipient.ToString(), FormatMoney(nAmount), FormatMoney(project.nSalesBalance));
    signals.SalesWithdrawn(nProjectId, recipient, nAmount);
    return true;
}

CAmount CSolarLedger::GetRescuableDustInternal() const
{
    const CAmount nAttributed = nTotalSalesBalance + rewards.GetRewardLiability();
    if (nHeldBalance <= nAttributed) {
        return 0;
    }
    return nHeldBalance - nAttributed;
}

bool CSolarLedger::RescueDust(const CAccountID& caller, const CAccountID& recipient, CAmount& nRescued, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }
    nRescued = 0;

    if (!CheckAdmin(caller, state)) {
        return false;
    }
    if (recipient.IsNull()) {
        return state.Invalid(LedgerError::INVALID_RECIPIENT, "bad-rescue-recipient");
    }

    const CAmount nDust = GetRescuableDustInternal();
    if (nDust == 0) {
        return state.Invalid(LedgerError::NO_DUST_TO_RESCUE, "bad-rescue-nothing",
                             strprintf("held=%s sales=%s liability=%s", nHeldBalance.str(), nTotalSalesBalance.str(),
                                       rewards.GetRewardLiability().str()));
    }

    CLedgerUndo undo;
    UndoCaptureGlobals(undo);

    nHeldBalance -= nDust;

    if (!SendValueOrUndo(recipient, nDust, undo, state)) {
        return false;
    }

    nRescued = nDust;
    LogPrintf("%s: swept %s to %s\n", __func__, FormatMoney(nDust), recipient.ToString());
    signals.DustRescued(recipient, nDust);
    return true;
}

bool CSolarLedger::ReceiveValue(const CAccountID& from, const CAmount& nAmount, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    CAmount nNewHeld;
    if (!solar_math::CheckedAdd(nHeldBalance, nAmount, nNewHeld)) {
        return state.Invalid(LedgerError::AMOUNT_OVERFLOW, "bad-receive-overflow");
    }
    nHeldBalance = nNewHeld;

    LogPrint(BCLog::LEDGER, "%s: from=%s amount=%s held=%s\n", __func__, from.ToString(), FormatMoney(nAmount), FormatMoney(nHeldBalance));
    signals.ValueReceived(from, nAmount);
    return true;
}

bool CSolarLedger::Pause(const CAccountID& caller, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckAdmin(caller, state) || !CheckNotPaused(state)) {
        return false;
    }
    fPaused = true;

    LogPrintf("%s: ledger paused by %s\n", __func__, caller.ToString());
    signals.Paused(caller);
    return true;
}

bool CSolarLedger::Unpause(const CAccountID& caller, CValidationState& state)
{
    LOCK(cs_solar);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return RejectReentrant(__func__, state);
    }

    if (!CheckAdmin(caller, state)) {
        return false;
    }
    if (!fPaused) {
        return state.Invalid(LedgerError::CONTRACT_NOT_PAUSED, "bad-ledger-not-paused");
    }
    fPaused = false;

    LogPrintf("%s: ledger unpaused by %s\n", __func__, caller.ToString());
    signals.Unpaused(caller);
    return true;
}

// ============================================================================
// Queries
// ============================================================================

bool CSolarLedger::GetProject(uint64_t nProjectId, SolarProject& project) const
{
    LOCK(cs_solar);
    return registry.GetProject(nProjectId, project);
}

uint64_t CSolarLedger::GetProjectCount() const
{
    LOCK(cs_solar);
    return registry.GetProjectCount();
}

CAmount CSolarLedger::GetClaimableAmount(uint64_t nProjectId, const CAccountID& holder) const
{
    LOCK(cs_solar);
    return rewards.GetClaimable(nProjectId, holder, units.BalanceOf(holder, nProjectId));
}

CAmount CSolarLedger::GetTotalClaimed(uint64_t nProjectId, const CAccountID& holder) const
{
    LOCK(cs_solar);
    return rewards.GetTotalClaimed(nProjectId, holder);
}

uint64_t CSolarLedger::BalanceOf(const CAccountID& owner, uint64_t nProjectId) const
{
    LOCK(cs_solar);
    return units.BalanceOf(owner, nProjectId);
}

bool CSolarLedger::BalanceOfBatch(const std::vector<CAccountID>& vOwners, const std::vector<uint64_t>& vProjectIds,
                                  std::vector<uint64_t>& vBalances, CValidationState& state) const
{
    LOCK(cs_solar);

    if (vOwners.size() != vProjectIds.size()) {
        return state.Invalid(LedgerError::ARRAY_LENGTH_MISMATCH, "bad-balance-batch-length",
                             strprintf("owners=%u ids=%u", vOwners.size(), vProjectIds.size()));
    }

    vBalances.clear();
    vBalances.reserve(vOwners.size());
    for (size_t i = 0; i < vOwners.size(); ++i) {
        vBalances.push_back(units.BalanceOf(vOwners[i], vProjectIds[i]));
    }
    return true;
}

bool CSolarLedger::IsApprovedForAll(const CAccountID& owner, const CAccountID& op) const
{
    LOCK(cs_solar);
    return units.IsApprovedForAll(owner, op);
}

std::vector<uint64_t> CSolarLedger::GetUserProjects(const CAccountID& creator) const
{
    LOCK(cs_solar);
    return registry.GetUserProjects(creator);
}

bool CSolarLedger::GetUserProjectsPaginated(const CAccountID& creator, uint64_t nOffset, uint64_t nLimit,
                                            CPage<uint64_t>& page, CValidationState& state) const
{
    LOCK(cs_solar);
    if (!CheckPageLimit(nLimit, params.nMaxUserProjectsPage, state)) {
        return false;
    }
    FillPage(registry.GetUserProjects(creator), nOffset, nLimit, page);
    return true;
}

bool CSolarLedger::GetProjectsPaginated(uint64_t nOffset, uint64_t nLimit, CPage<SolarProject>& page, CValidationState& state) const
{
    LOCK(cs_solar);
    if (!CheckPageLimit(nLimit, params.nMaxProjectsPage, state)) {
        return false;
    }

    page.vItems.clear();
    page.nTotal = registry.GetProjectCount();
    if (nOffset < page.nTotal) {
        // Ids are dense from 1, ordered by the map
        auto it = registry.GetProjects().begin();
        std::advance(it, nOffset);
        for (; it != registry.GetProjects().end() && page.vItems.size() < nLimit; ++it) {
            page.vItems.push_back(it->second);
        }
    }
    page.fHasMore = nOffset < page.nTotal && nOffset + page.vItems.size() < page.nTotal;
    return true;
}

bool CSolarLedger::GetPortfolio(const CAccountID& holder, uint64_t nOffset, uint64_t nLimit,
                                CPage<SolarPortfolioEntry>& page, CValidationState& state) const
{
    LOCK(cs_solar);
    if (!CheckPageLimit(nLimit, params.nMaxPortfolioPage, state)) {
        return false;
    }

    std::set<uint64_t> setCandidates;
    for (const uint64_t nProjectId : units.GetHeldProjects(holder)) {
        setCandidates.insert(nProjectId);
    }
    for (const auto& entry : rewards.GetRewards()) {
        if (entry.first.second == holder && entry.second.nPending > 0) {
            setCandidates.insert(entry.first.first);
        }
    }

    std::vector<SolarPortfolioEntry> vEntries;
    for (const uint64_t nProjectId : setCandidates) {
        const SolarProject* pproject = registry.Lookup(nProjectId);
        if (!pproject) continue;

        SolarPortfolioEntry entry;
        entry.nProjectId = nProjectId;
        entry.strName = pproject->strName;
        entry.nBalance = units.BalanceOf(holder, nProjectId);
        entry.nClaimable = rewards.GetClaimable(nProjectId, holder, entry.nBalance);
        entry.nClaimed = rewards.GetTotalClaimed(nProjectId, holder);
        if (entry.nBalance == 0 && entry.nClaimable == 0) continue;
        vEntries.push_back(entry);
    }

    FillPage(vEntries, nOffset, nLimit, page);
    return true;
}

CAmount CSolarLedger::GetHeldBalance() const
{
    LOCK(cs_solar);
    return nHeldBalance;
}

CAmount CSolarLedger::GetTotalSalesBalance() const
{
    LOCK(cs_solar);
    return nTotalSalesBalance;
}

CAmount CSolarLedger::GetRewardLiability() const
{
    LOCK(cs_solar);
    return rewards.GetRewardLiability();
}

CAmount CSolarLedger::GetRescuableDust() const
{
    LOCK(cs_solar);
    return GetRescuableDustInternal();
}

bool CSolarLedger::IsPaused() const
{
    LOCK(cs_solar);
    return fPaused;
}

bool CSolarLedger::CheckInvariants() const
{
    LOCK(cs_solar);

    bool fOk = true;
    CAmount nSales = 0;
    for (const auto& entry : registry.GetProjects()) {
        const SolarProject& project = entry.second;
        const uint64_t nUnits = units.TotalBalance(project.nId);
        if (nUnits != project.nMinted) {
            fOk = error("%s: project=%u balances sum to %u, minted=%u", __func__, project.nId, nUnits, project.nMinted);
        }
        if (project.nMinted > project.nTotalSupply) {
            fOk = error("%s: project=%u minted=%u exceeds supply=%u", __func__, project.nId, project.nMinted, project.nTotalSupply);
        }
        if (project.nMinPurchase == 0 || project.nMinPurchase > project.nTotalSupply) {
            fOk = error("%s: project=%u minPurchase=%u out of range", __func__, project.nId, project.nMinPurchase);
        }
        nSales += project.nSalesBalance;
    }

    if (nSales != nTotalSalesBalance) {
        fOk = error("%s: sales accumulator %s != sum of project sales %s", __func__, nTotalSalesBalance.str(), nSales.str());
    }

    const CAmount nAllocated = rewards.GetScaledRewardAllocated() / solar_math::PRECISION;
    if (nAllocated < rewards.GetTotalRewardsClaimed()) {
        fOk = error("%s: claimed %s exceeds allocated %s", __func__, rewards.GetTotalRewardsClaimed().str(), nAllocated.str());
    }

    CWideAmount nAttributed = CWideAmount(nTotalSalesBalance) + CWideAmount(rewards.GetRewardLiability());
    if (CWideAmount(nHeldBalance) < nAttributed) {
        fOk = error("%s: held %s below sales %s + liability %s", __func__,
                    nHeldBalance.str(), nTotalSalesBalance.str(), rewards.GetRewardLiability().str());
    }

    for (const auto& entry : units.GetBalances()) {
        if (!registry.Exists(entry.first.first)) {
            fOk = error("%s: balance for unknown project=%u", __func__, entry.first.first);
        }
    }

    // A checkpoint ahead of the accumulator would underflow the pending delta
    for (const auto& entry : rewards.GetRewards()) {
        const SolarProject* pproject = registry.Lookup(entry.first.first);
        if (!pproject) {
            fOk = error("%s: reward record for unknown project=%u holder=%s", __func__,
                        entry.first.first, entry.first.second.ToString());
            continue;
        }
        if (entry.second.nRewardPerUnitPaid > pproject->nRewardPerUnitStored) {
            fOk = error("%s: project=%u holder=%s checkpoint %s ahead of accumulator %s", __func__,
                        entry.first.first, entry.first.second.ToString(),
                        entry.second.nRewardPerUnitPaid.str(), pproject->nRewardPerUnitStored.str());
        }
    }
    return fOk;
}

// ============================================================================
// Snapshot
// ============================================================================

SolarLedgerSnapshot CSolarLedger::GetSnapshot() const
{
    LOCK(cs_solar);

    SolarLedgerSnapshot snapshot;
    snapshot.projects = registry.GetProjects();
    snapshot.userProjects = registry.GetUserIndex();
    snapshot.balances = units.GetBalances();
    snapshot.approvals = units.GetApprovals();
    snapshot.rewards = rewards.GetRewards();
    snapshot.globals.nNextProjectId = registry.GetNextProjectId();
    snapshot.globals.nHeldBalance = nHeldBalance;
    snapshot.globals.nTotalSalesBalance = nTotalSalesBalance;
    snapshot.globals.nScaledRewardAllocated = rewards.GetScaledRewardAllocated();
    snapshot.globals.nTotalRewardsClaimed = rewards.GetTotalRewardsClaimed();
    snapshot.globals.fPaused = fPaused;
    return snapshot;
}

bool CSolarLedger::LoadSnapshot(const SolarLedgerSnapshot& snapshot)
{
    LOCK(cs_solar);
    if (fEntered) {
        return error("%s: cannot load a snapshot during a ledger operation", __func__);
    }

    const SolarLedgerSnapshot previous = GetSnapshot();

    if (!registry.Load(snapshot.projects, snapshot.userProjects, snapshot.globals.nNextProjectId)) {
        return error("%s: inconsistent project registry", __func__);
    }
    units.Load(snapshot.balances, snapshot.approvals);
    rewards.Load(snapshot.rewards, snapshot.globals.nScaledRewardAllocated, snapshot.globals.nTotalRewardsClaimed);
    nHeldBalance = snapshot.globals.nHeldBalance;
    nTotalSalesBalance = snapshot.globals.nTotalSalesBalance;
    fPaused = snapshot.globals.fPaused;

    if (!CheckInvariants()) {
        // Put the previous state back, it passed the same checks
        if (!registry.Load(previous.projects, previous.userProjects, previous.globals.nNextProjectId)) {
            return error("%s: failed to restore previous registry", __func__);
        }
        units.Load(previous.balances, previous.approvals);
        rewards.Load(previous.rewards, previous.globals.nScaledRewardAllocated, previous.globals.nTotalRewardsClaimed);
        nHeldBalance = previous.globals.nHeldBalance;
        nTotalSalesBalance = previous.globals.nTotalSalesBalance;
        fPaused = previous.globals.fPaused;
        return error("%s: snapshot violates ledger invariants", __func__);
    }

    LogPrint(BCLog::LEDGER, "%s: loaded %u projects, %u balances, %u reward records\n",
             __func__, snapshot.projects.size(), snapshot.balances.size(), snapshot.rewards.size());
    return true;
}
