// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_REGISTRY_H
#define SOLAR_SOLAR_REGISTRY_H

#include "amount.h"
#include "solar/solar_account.h"
#include "solar/solar_project.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

class CValidationState;

/**
 * CProjectRegistry - lifecycle of investment projects
 *
 * Ids are assigned from 1 upward and never reused; projects are never
 * deleted. A project exists iff Lookup() finds it.
 *
 * Per-creator index: ordered list of the ids a creator currently owns.
 * Removal swaps the last entry into the hole, so the relative order of the
 * remaining ids is not preserved.
 */
class CProjectRegistry
{
public:
    typedef std::map<uint64_t, SolarProject> ProjectMap;
    typedef std::map<CAccountID, std::vector<uint64_t>> UserIndex;

private:
    ProjectMap mapProjects;
    UserIndex mapUserProjects;
    std::map<uint64_t, size_t> mapUserProjectPos; // project id -> position in its creator's list
    uint64_t nNextProjectId;

    void IndexAppend(const CAccountID& creator, uint64_t nProjectId);
    void IndexRemove(const CAccountID& creator, uint64_t nProjectId);

public:
    CProjectRegistry() : nNextProjectId(1) {}

    /**
     * CheckNewProject - creation preconditions
     *
     * RULES:
     * 1. creator != null           (InvalidCreator)
     * 2. nTotalSupply > 0          (InvalidSupply)
     * 3. nPrice > 0                (InvalidPrice)
     * 4. 1 <= nMinPurchase <= nTotalSupply (InvalidMinPurchase)
     */
    bool CheckNewProject(const CAccountID& creator, uint64_t nTotalSupply, const CAmount& nPrice,
                         uint64_t nMinPurchase, CValidationState& state) const;

    /** Assign the next id, active, all counters zero, appended to the creator's index */
    uint64_t AddProject(const CAccountID& creator, const std::string& strName, uint64_t nTotalSupply,
                        const CAmount& nPrice, uint64_t nMinPurchase, int64_t nCreatedAt);

    const SolarProject* Lookup(uint64_t nProjectId) const;
    SolarProject* LookupMutable(uint64_t nProjectId);
    bool GetProject(uint64_t nProjectId, SolarProject& project) const;
    bool Exists(uint64_t nProjectId) const { return Lookup(nProjectId) != nullptr; }

    /** Only the current creator; newCreator must not be null */
    bool TransferOwnership(uint64_t nProjectId, const CAccountID& caller, const CAccountID& newCreator, CValidationState& state);

    /** Only the current creator */
    bool SetActive(uint64_t nProjectId, const CAccountID& caller, bool fActive, CValidationState& state);

    bool IsCreator(uint64_t nProjectId, const CAccountID& caller) const;

    const std::vector<uint64_t>& GetUserProjects(const CAccountID& creator) const;

    uint64_t GetProjectCount() const { return mapProjects.size(); }
    uint64_t GetNextProjectId() const { return nNextProjectId; }
    const ProjectMap& GetProjects() const { return mapProjects; }
    const UserIndex& GetUserIndex() const { return mapUserProjects; }

    /** Undo support: put back a project record captured before a failed operation */
    void RestoreProject(const SolarProject& project);

    /**
     * Load - replace the whole registry (snapshot restore)
     *
     * The user index must list every project exactly once, under its creator.
     * @return false if the index is inconsistent with the projects
     */
    bool Load(const ProjectMap& projects, const UserIndex& userIndex, uint64_t nNextId);
};

#endif // SOLAR_SOLAR_REGISTRY_H
