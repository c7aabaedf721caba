// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_PROJECT_H
#define SOLAR_SOLAR_PROJECT_H

#include "amount.h"
#include "serialize.h"
#include "solar/solar_account.h"

#include <stdint.h>
#include <string>

/**
 * SolarProject - one investment offering
 *
 * INVARIANTS:
 * - 1 <= nMinPurchase <= nTotalSupply
 * - nMinted <= nTotalSupply, and nMinted equals the sum of all unit balances
 * - nRewardPerUnitStored, nTotalRevenue never decrease
 * - nTotalEnergyKwh only decreases through an explicit energy correction
 *
 * Existence is decided by the registry (a project exists iff the registry
 * holds a record for its id), never by inspecting field values.
 */
struct SolarProject
{
    uint64_t nId;
    CAccountID creator;
    std::string strName;

    // Supply
    uint64_t nTotalSupply;
    uint64_t nMinted;
    uint64_t nMinPurchase;
    CAmount nPrice;              // wei per unit

    bool fActive;
    int64_t nCreatedAt;

    // Informational counters
    uint64_t nTotalEnergyKwh;
    CAmount nTotalRevenue;

    // Accrual
    CAmount nRewardPerUnitStored; // scaled by solar_math::PRECISION

    // Owed to the creator from unit sales
    CAmount nSalesBalance;

    SolarProject()
    {
        SetNull();
    }

    void SetNull()
    {
        nId = 0;
        creator.SetNull();
        strName.clear();
        nTotalSupply = 0;
        nMinted = 0;
        nMinPurchase = 0;
        nPrice = 0;
        fActive = false;
        nCreatedAt = 0;
        nTotalEnergyKwh = 0;
        nTotalRevenue = 0;
        nRewardPerUnitStored = 0;
        nSalesBalance = 0;
    }

    uint64_t GetAvailableSupply() const { return nTotalSupply - nMinted; }

    std::string ToString() const;

    SERIALIZE_METHODS(SolarProject, obj)
    {
        READWRITE(obj.nId, obj.creator, obj.strName);
        READWRITE(obj.nTotalSupply, obj.nMinted, obj.nMinPurchase, obj.nPrice);
        READWRITE(obj.fActive, obj.nCreatedAt);
        READWRITE(obj.nTotalEnergyKwh, obj.nTotalRevenue);
        READWRITE(obj.nRewardPerUnitStored, obj.nSalesBalance);
    }
};

/**
 * SolarHolderReward - accrual state of one (project, holder) pair
 *
 * nRewardPerUnitPaid is the checkpoint: the project accumulator value seen
 * at the holder's last settlement. nPending only grows until claimed.
 */
struct SolarHolderReward
{
    CAmount nRewardPerUnitPaid;
    CAmount nPending;
    CAmount nClaimed;

    SolarHolderReward() : nRewardPerUnitPaid(0), nPending(0), nClaimed(0) {}

    bool IsNull() const
    {
        return nRewardPerUnitPaid == 0 && nPending == 0 && nClaimed == 0;
    }

    SERIALIZE_METHODS(SolarHolderReward, obj)
    {
        READWRITE(obj.nRewardPerUnitPaid, obj.nPending, obj.nClaimed);
    }
};

#endif // SOLAR_SOLAR_PROJECT_H
