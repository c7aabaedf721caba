// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_LEDGERDB_H
#define SOLAR_SOLAR_LEDGERDB_H

#include "dbwrapper.h"
#include "solar/solar_ledger.h"

#include <stdint.h>

/**
 * CSolarLedgerDB - LevelDB persistence layer for the solar ledger
 *
 * Database keys:
 * - 'P' + projectId              -> SolarProject
 * - 'B' + (projectId, holder)    -> uint64_t balance (non-zero only)
 * - 'R' + (projectId, holder)    -> SolarHolderReward
 * - 'U' + creator                -> std::vector<uint64_t> project ids
 * - 'A' + (owner, operator)      -> bool
 * - 'G'                          -> SolarLedgerGlobals
 *
 * A snapshot is written atomically: every stored key is erased and the new
 * state written in one batch.
 */
class CSolarLedgerDB : public CDBWrapper
{
public:
    CSolarLedgerDB(const boost::filesystem::path& path, size_t nCacheSize, bool fWipe = false);

    bool WriteSnapshot(const SolarLedgerSnapshot& snapshot);

    /**
     * ReadSnapshot - load every stored record
     *
     * @return false if the globals record is missing or a record is corrupt
     */
    bool ReadSnapshot(SolarLedgerSnapshot& snapshot);

    bool HaveSnapshot() const;

    /** ledger.GetSnapshot() -> WriteSnapshot */
    bool FlushLedger(const CSolarLedger& ledger);

    /** ReadSnapshot -> ledger.LoadSnapshot */
    bool LoadLedger(CSolarLedger& ledger);
};

#endif // SOLAR_SOLAR_LEDGERDB_H
