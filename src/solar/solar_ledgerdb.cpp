// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_ledgerdb.h"

#include "logging.h"

#include <memory>

static const char DB_PROJECT = 'P';
static const char DB_BALANCE = 'B';
static const char DB_REWARD = 'R';
static const char DB_USER_PROJECTS = 'U';
static const char DB_APPROVAL = 'A';
static const char DB_GLOBALS = 'G';

CSolarLedgerDB::CSolarLedgerDB(const boost::filesystem::path& path, size_t nCacheSize, bool fWipe) :
    CDBWrapper(path, nCacheSize, fWipe)
{
}

bool CSolarLedgerDB::WriteSnapshot(const SolarLedgerSnapshot& snapshot)
{
    CDBBatch batch;

    // Drop everything stored so far, removed entries must not survive
    size_t nErased = 0;
    {
        std::unique_ptr<CDBIterator> pcursor(NewIterator());
        for (pcursor->SeekToFirst(); pcursor->Valid(); pcursor->Next()) {
            EraseRaw(batch, pcursor->GetKeyBytes());
            ++nErased;
        }
    }

    for (const auto& entry : snapshot.projects) {
        batch.Write(std::make_pair(DB_PROJECT, entry.first), entry.second);
    }
    for (const auto& entry : snapshot.balances) {
        if (entry.second == 0) continue;
        batch.Write(std::make_pair(DB_BALANCE, entry.first), entry.second);
    }
    for (const auto& entry : snapshot.rewards) {
        batch.Write(std::make_pair(DB_REWARD, entry.first), entry.second);
    }
    for (const auto& entry : snapshot.userProjects) {
        batch.Write(std::make_pair(DB_USER_PROJECTS, entry.first), entry.second);
    }
    for (const auto& approval : snapshot.approvals) {
        batch.Write(std::make_pair(DB_APPROVAL, approval), true);
    }
    batch.Write(DB_GLOBALS, snapshot.globals);

    LogPrint(BCLog::DB, "%s: erased %u keys, writing %u projects %u balances %u rewards (%u bytes)\n",
             __func__, nErased, snapshot.projects.size(), snapshot.balances.size(), snapshot.rewards.size(),
             batch.SizeEstimate());

    return WriteBatch(batch, true);
}

bool CSolarLedgerDB::HaveSnapshot() const
{
    return Exists(DB_GLOBALS);
}

template <typename K, typename V, typename Func>
static bool ReadPrefix(CDBWrapper& db, char chPrefix, Func func)
{
    std::unique_ptr<CDBIterator> pcursor(db.NewIterator());
    pcursor->Seek(chPrefix);

    while (pcursor->Valid()) {
        std::pair<char, K> key;
        if (!pcursor->GetKey(key) || key.first != chPrefix) {
            break;
        }
        V value;
        if (!pcursor->GetValue(value)) {
            return error("ReadPrefix: corrupt record under prefix '%c'", chPrefix);
        }
        func(key.second, value);
        pcursor->Next();
    }
    return true;
}

bool CSolarLedgerDB::ReadSnapshot(SolarLedgerSnapshot& snapshot)
{
    snapshot = SolarLedgerSnapshot();

    if (!Read(DB_GLOBALS, snapshot.globals)) {
        return error("%s: no ledger globals in %s", __func__, GetName());
    }

    bool fOk = ReadPrefix<uint64_t, SolarProject>(*this, DB_PROJECT,
        [&](const uint64_t& nProjectId, const SolarProject& project) { snapshot.projects[nProjectId] = project; });
    fOk = fOk && ReadPrefix<CUnitLedger::BalanceKey, uint64_t>(*this, DB_BALANCE,
        [&](const CUnitLedger::BalanceKey& key, const uint64_t& nBalance) { snapshot.balances[key] = nBalance; });
    fOk = fOk && ReadPrefix<CRewardEngine::RewardKey, SolarHolderReward>(*this, DB_REWARD,
        [&](const CRewardEngine::RewardKey& key, const SolarHolderReward& reward) { snapshot.rewards[key] = reward; });
    fOk = fOk && ReadPrefix<CAccountID, std::vector<uint64_t>>(*this, DB_USER_PROJECTS,
        [&](const CAccountID& creator, const std::vector<uint64_t>& vProjects) { snapshot.userProjects[creator] = vProjects; });
    fOk = fOk && ReadPrefix<std::pair<CAccountID, CAccountID>, bool>(*this, DB_APPROVAL,
        [&](const std::pair<CAccountID, CAccountID>& approval, const bool& fApproved) {
            if (fApproved) snapshot.approvals.insert(approval);
        });
    if (!fOk) {
        return false;
    }

    LogPrint(BCLog::DB, "%s: read %u projects %u balances %u rewards\n",
             __func__, snapshot.projects.size(), snapshot.balances.size(), snapshot.rewards.size());
    return true;
}

bool CSolarLedgerDB::FlushLedger(const CSolarLedger& ledger)
{
    return WriteSnapshot(ledger.GetSnapshot());
}

bool CSolarLedgerDB::LoadLedger(CSolarLedger& ledger)
{
    SolarLedgerSnapshot snapshot;
    if (!ReadSnapshot(snapshot)) {
        return false;
    }
    return ledger.LoadSnapshot(snapshot);
}
