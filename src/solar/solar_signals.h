// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_SIGNALS_H
#define SOLAR_SOLAR_SIGNALS_H

#include "amount.h"
#include "solar/solar_account.h"

#include <stdint.h>
#include <string>
#include <vector>

#include <boost/signals2/signal.hpp>

/**
 * CLedgerSignals - notifications emitted by CSolarLedger
 *
 * Fired after the operation's effects are committed, while cs_solar is still
 * held. Slots may query the ledger; a mutating call from a slot fails with
 * ReentrantCall.
 */
struct CLedgerSignals
{
    boost::signals2::signal<void(uint64_t nProjectId, const CAccountID& creator, const std::string& strName,
                                 uint64_t nTotalSupply, const CAmount& nPrice)> ProjectCreated;
    boost::signals2::signal<void(uint64_t nProjectId, const CAccountID& oldCreator, const CAccountID& newCreator)> OwnershipTransferred;
    boost::signals2::signal<void(uint64_t nProjectId, bool fActive)> StatusChanged;
    boost::signals2::signal<void(uint64_t nProjectId, const CAmount& nOldPrice, const CAmount& nNewPrice)> PriceUpdated;

    boost::signals2::signal<void(uint64_t nProjectId, const CAccountID& buyer, uint64_t nAmount, const CAmount& nCost)> UnitsPurchased;
    boost::signals2::signal<void(const CAccountID& op, const CAccountID& from, const CAccountID& to,
                                 const std::vector<uint64_t>& vProjectIds, const std::vector<uint64_t>& vAmounts)> UnitsTransferred;
    boost::signals2::signal<void(const CAccountID& owner, const CAccountID& op, bool fApproved)> ApprovalForAll;

    boost::signals2::signal<void(uint64_t nProjectId, const CAmount& nAmount, uint64_t nEnergyDelta,
                                 const CAmount& nRewardPerUnit)> RevenueDeposited;
    boost::signals2::signal<void(uint64_t nProjectId, uint64_t nEnergyDelta, uint64_t nTotalEnergyKwh)> EnergyUpdated;
    boost::signals2::signal<void(uint64_t nProjectId, uint64_t nOldValue, uint64_t nNewValue, const std::string& strReason)> EnergyCorrected;

    boost::signals2::signal<void(uint64_t nProjectId, const CAccountID& holder, const CAmount& nAmount)> RewardsClaimed;
    boost::signals2::signal<void(uint64_t nProjectId, const CAccountID& recipient, const CAmount& nAmount)> SalesWithdrawn;
    boost::signals2::signal<void(const CAccountID& recipient, const CAmount& nAmount)> DustRescued;
    boost::signals2::signal<void(const CAccountID& from, const CAmount& nAmount)> ValueReceived;

    boost::signals2::signal<void(const CAccountID& admin)> Paused;
    boost::signals2::signal<void(const CAccountID& admin)> Unpaused;
};

#endif // SOLAR_SOLAR_SIGNALS_H
