// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_registry.h"

#include "logging.h"
#include "solar/solar_errors.h"
#include "utilmoneystr.h"

std::string SolarProject::ToString() const
{
    return strprintf("SolarProject(id=%u, creator=%s, name=%s, supply=%u, minted=%u, minPurchase=%u, price=%s, "
                     "active=%d, energy=%u, revenue=%s, rewardPerUnit=%s, sales=%s)",
                     nId, creator.ToString(), strName, nTotalSupply, nMinted, nMinPurchase, FormatMoney(nPrice),
                     fActive, nTotalEnergyKwh, FormatMoney(nTotalRevenue), nRewardPerUnitStored.str(),
                     FormatMoney(nSalesBalance));
}

void CProjectRegistry::IndexAppend(const CAccountID& creator, uint64_t nProjectId)
{
    std::vector<uint64_t>& vProjects = mapUserProjects[creator];
    mapUserProjectPos[nProjectId] = vProjects.size();
    vProjects.push_back(nProjectId);
}

void CProjectRegistry::IndexRemove(const CAccountID& creator, uint64_t nProjectId)
{
    std::vector<uint64_t>& vProjects = mapUserProjects[creator];
    const size_t nPos = mapUserProjectPos[nProjectId];
    const uint64_t nLast = vProjects.back();

    // Swap with last, then pop
    vProjects[nPos] = nLast;
    mapUserProjectPos[nLast] = nPos;
    vProjects.pop_back();
    mapUserProjectPos.erase(nProjectId);

    if (vProjects.empty()) {
        mapUserProjects.erase(creator);
    }
}

bool CProjectRegistry::CheckNewProject(const CAccountID& creator, uint64_t nTotalSupply, const CAmount& nPrice,
                                       uint64_t nMinPurchase, CValidationState& state) const
{
    if (creator.IsNull()) {
        return state.Invalid(LedgerError::INVALID_CREATOR, "bad-project-creator");
    }
    if (nTotalSupply == 0) {
        return state.Invalid(LedgerError::INVALID_SUPPLY, "bad-project-supply");
    }
    if (nPrice == 0) {
        return state.Invalid(LedgerError::INVALID_PRICE, "bad-project-price");
    }
    if (nMinPurchase == 0 || nMinPurchase > nTotalSupply) {
        return state.Invalid(LedgerError::INVALID_MIN_PURCHASE, "bad-project-min-purchase",
                             strprintf("minPurchase=%u supply=%u", nMinPurchase, nTotalSupply));
    }
    return true;
}

uint64_t CProjectRegistry::AddProject(const CAccountID& creator, const std::string& strName, uint64_t nTotalSupply,
                                      const CAmount& nPrice, uint64_t nMinPurchase, int64_t nCreatedAt)
{
    const uint64_t nProjectId = nNextProjectId++;

    SolarProject& project = mapProjects[nProjectId];
    project.SetNull();
    project.nId = nProjectId;
    project.creator = creator;
    project.strName = strName;
    project.nTotalSupply = nTotalSupply;
    project.nMinPurchase = nMinPurchase;
    project.nPrice = nPrice;
    project.fActive = true;
    project.nCreatedAt = nCreatedAt;

    IndexAppend(creator, nProjectId);

    LogPrint(BCLog::REGISTRY, "%s: %s\n", __func__, project.ToString());
    return nProjectId;
}

const SolarProject* CProjectRegistry::Lookup(uint64_t nProjectId) const
{
    auto it = mapProjects.find(nProjectId);
    if (it == mapProjects.end()) {
        return nullptr;
    }
    return &it->second;
}

SolarProject* CProjectRegistry::LookupMutable(uint64_t nProjectId)
{
    auto it = mapProjects.find(nProjectId);
    if (it == mapProjects.end()) {
        return nullptr;
    }
    return &it->second;
}

bool CProjectRegistry::GetProject(uint64_t nProjectId, SolarProject& project) const
{
    const SolarProject* pproject = Lookup(nProjectId);
    if (!pproject) {
        return false;
    }
    project = *pproject;
    return true;
}

bool CProjectRegistry::IsCreator(uint64_t nProjectId, const CAccountID& caller) const
{
    const SolarProject* pproject = Lookup(nProjectId);
    return pproject && pproject->creator == caller;
}

bool CProjectRegistry::TransferOwnership(uint64_t nProjectId, const CAccountID& caller, const CAccountID& newCreator, CValidationState& state)
{
    SolarProject* pproject = LookupMutable(nProjectId);
    if (!pproject) {
        return state.Invalid(LedgerError::PROJECT_NOT_FOUND, "bad-project-id", strprintf("project=%u", nProjectId));
    }
    if (pproject->creator != caller) {
        return state.Invalid(LedgerError::UNAUTHORIZED, "bad-project-owner",
                             strprintf("caller=%s creator=%s", caller.ToString(), pproject->creator.ToString()));
    }
    if (newCreator.IsNull()) {
        return state.Invalid(LedgerError::INVALID_CREATOR, "bad-project-new-creator");
    }

    const CAccountID oldCreator = pproject->creator;
    IndexRemove(oldCreator, nProjectId);
    pproject->creator = newCreator;
    IndexAppend(newCreator, nProjectId);

    LogPrint(BCLog::REGISTRY, "%s: project=%u %s -> %s\n",
             __func__, nProjectId, oldCreator.ToString(), newCreator.ToString());
    return true;
}

bool CProjectRegistry::SetActive(uint64_t nProjectId, const CAccountID& caller, bool fActive, CValidationState& state)
{
    SolarProject* pproject = LookupMutable(nProjectId);
    if (!pproject) {
        return state.Invalid(LedgerError::PROJECT_NOT_FOUND, "bad-project-id", strprintf("project=%u", nProjectId));
    }
    if (pproject->creator != caller) {
        return state.Invalid(LedgerError::UNAUTHORIZED, "bad-project-owner",
                             strprintf("caller=%s creator=%s", caller.ToString(), pproject->creator.ToString()));
    }

    pproject->fActive = fActive;

    LogPrint(BCLog::REGISTRY, "%s: project=%u active=%d\n", __func__, nProjectId, fActive);
    return true;
}

const std::vector<uint64_t>& CProjectRegistry::GetUserProjects(const CAccountID& creator) const
{
    static const std::vector<uint64_t> vEmpty;
    auto it = mapUserProjects.find(creator);
    if (it == mapUserProjects.end()) {
        return vEmpty;
    }
    return it->second;
}

void CProjectRegistry::RestoreProject(const SolarProject& project)
{
    // Creator changes are never rolled back through this path, the index stays valid
    mapProjects[project.nId] = project;
}

bool CProjectRegistry::Load(const ProjectMap& projects, const UserIndex& userIndex, uint64_t nNextId)
{
    std::map<uint64_t, size_t> mapPos;
    size_t nIndexed = 0;
    for (const auto& entry : userIndex) {
        for (size_t i = 0; i < entry.second.size(); ++i) {
            const uint64_t nProjectId = entry.second[i];
            auto it = projects.find(nProjectId);
            if (it == projects.end() || it->second.creator != entry.first || mapPos.count(nProjectId)) {
                return error("%s: user index entry project=%u creator=%s is inconsistent",
                             __func__, nProjectId, entry.first.ToString());
            }
            mapPos[nProjectId] = i;
            ++nIndexed;
        }
    }
    if (nIndexed != projects.size()) {
        return error("%s: user index lists %u projects, registry holds %u", __func__, nIndexed, projects.size());
    }
    if (!projects.empty() && projects.rbegin()->first >= nNextId) {
        return error("%s: next id %u not above highest project %u", __func__, nNextId, projects.rbegin()->first);
    }

    mapProjects = projects;
    mapUserProjects = userIndex;
    mapUserProjectPos = mapPos;
    nNextProjectId = nNextId;
    return true;
}
