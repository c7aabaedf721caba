// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_solar.h"

#include "solar/solar_ledgerdb.h"

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

namespace {

/** Ledger fixture with a scratch database directory */
struct LedgerDBTestingSetup : public LedgerTestingSetup {
    boost::filesystem::path pathDB;

    LedgerDBTestingSetup()
        : pathDB(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("solar_ledgerdb_%%%%-%%%%"))
    {
    }

    ~LedgerDBTestingSetup()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(pathDB, ec);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(solar_ledgerdb_tests, LedgerDBTestingSetup)

BOOST_AUTO_TEST_CASE(test_empty_database)
{
    CSolarLedgerDB db(pathDB, 1 << 20, true);
    BOOST_CHECK(!db.HaveSnapshot());
    BOOST_CHECK(db.IsEmpty());

    SolarLedgerSnapshot snapshot;
    BOOST_CHECK(!db.ReadSnapshot(snapshot));
    BOOST_CHECK(!db.LoadLedger(ledger));
}

BOOST_AUTO_TEST_CASE(test_flush_and_reload)
{
    const uint64_t nA = CreateTestProject(100, COIN / 100, 1);
    const uint64_t nB = CreateTestProject(3, 1000, 1);
    Buy(alice, nA, 30);
    Buy(bob, nA, 70);
    Buy(carol, nB, 3);
    Deposit(nA, COIN, 1500);
    Deposit(nB, 10);

    CValidationState state;
    CAmount nClaimed;
    BOOST_REQUIRE(ledger.Claim(bob, nA, nClaimed, state));
    BOOST_REQUIRE(ledger.SetApprovalForAll(alice, carol, true, state));
    BOOST_REQUIRE(ledger.SafeTransferFrom(carol, alice, carol, nA, 10, state));

    {
        CSolarLedgerDB db(pathDB, 1 << 20, true);
        BOOST_REQUIRE(db.FlushLedger(ledger));
        BOOST_CHECK(db.HaveSnapshot());
    }

    // Reopen from disk into a fresh ledger
    CSolarLedgerDB db(pathDB, 1 << 20);
    CTestValueTransfer otherTransfer;
    CSolarLedger reloaded(admin, CLedgerParams::Default(), otherTransfer);
    BOOST_REQUIRE(db.LoadLedger(reloaded));

    BOOST_CHECK_EQUAL(reloaded.GetProjectCount(), 2U);
    BOOST_CHECK_EQUAL(reloaded.BalanceOf(alice, nA), 20U);
    BOOST_CHECK_EQUAL(reloaded.BalanceOf(carol, nA), 10U);
    BOOST_CHECK_EQUAL(reloaded.BalanceOf(carol, nB), 3U);
    BOOST_CHECK_EQUAL(reloaded.GetClaimableAmount(nA, alice), COIN * 3 / 10);
    BOOST_CHECK_EQUAL(reloaded.GetClaimableAmount(nA, bob), 0);
    BOOST_CHECK_EQUAL(reloaded.GetTotalClaimed(nA, bob), COIN * 7 / 10);
    BOOST_CHECK_EQUAL(reloaded.GetClaimableAmount(nB, carol), 9);
    BOOST_CHECK(reloaded.IsApprovedForAll(alice, carol));
    BOOST_CHECK(reloaded.GetUserProjects(creator) == ledger.GetUserProjects(creator));
    BOOST_CHECK_EQUAL(reloaded.GetHeldBalance(), ledger.GetHeldBalance());
    BOOST_CHECK_EQUAL(reloaded.GetTotalSalesBalance(), ledger.GetTotalSalesBalance());
    BOOST_CHECK_EQUAL(reloaded.GetRewardLiability(), ledger.GetRewardLiability());
    BOOST_CHECK_EQUAL(reloaded.GetRescuableDust(), 1);

    SolarProject original, restored;
    BOOST_REQUIRE(ledger.GetProject(nA, original));
    BOOST_REQUIRE(reloaded.GetProject(nA, restored));
    BOOST_CHECK_EQUAL(restored.strName, original.strName);
    BOOST_CHECK_EQUAL(restored.nRewardPerUnitStored, original.nRewardPerUnitStored);
    BOOST_CHECK_EQUAL(restored.nTotalEnergyKwh, 1500U);
    BOOST_CHECK_EQUAL(restored.nCreatedAt, original.nCreatedAt);
    BOOST_CHECK(reloaded.CheckInvariants());
}

BOOST_AUTO_TEST_CASE(test_rewrite_removes_stale_records)
{
    const uint64_t nId = CreateTestProject(100, COIN / 100, 1);
    Buy(alice, nId, 40);
    Deposit(nId, COIN);

    CSolarLedgerDB db(pathDB, 1 << 20, true);
    BOOST_REQUIRE(db.FlushLedger(ledger));

    // Alice moves out and claims: her balance and reward records disappear
    CValidationState state;
    CAmount nClaimed;
    BOOST_REQUIRE(ledger.SafeTransferFrom(alice, alice, bob, nId, 40, state));
    BOOST_REQUIRE(ledger.Claim(alice, nId, nClaimed, state));
    BOOST_REQUIRE(ledger.SetApprovalForAll(bob, carol, true, state));
    BOOST_REQUIRE(ledger.SetApprovalForAll(bob, carol, false, state));
    BOOST_REQUIRE(db.FlushLedger(ledger));

    SolarLedgerSnapshot stored;
    BOOST_REQUIRE(db.ReadSnapshot(stored));
    const SolarLedgerSnapshot live = ledger.GetSnapshot();
    BOOST_CHECK_EQUAL(stored.balances.size(), live.balances.size());
    BOOST_CHECK_EQUAL(stored.rewards.size(), live.rewards.size());
    BOOST_CHECK(stored.balances.count(std::make_pair(nId, alice)) == 0);
    BOOST_CHECK(stored.approvals.empty());
    BOOST_CHECK_EQUAL(stored.globals.nHeldBalance, live.globals.nHeldBalance);
    BOOST_CHECK_EQUAL(stored.globals.nTotalRewardsClaimed, COIN);
}

BOOST_AUTO_TEST_CASE(test_wipe_discards_previous_state)
{
    CreateTestProject(10, 1, 1);
    {
        CSolarLedgerDB db(pathDB, 1 << 20, true);
        BOOST_REQUIRE(db.FlushLedger(ledger));
    }

    CSolarLedgerDB db(pathDB, 1 << 20, true);
    BOOST_CHECK(!db.HaveSnapshot());
}

BOOST_AUTO_TEST_SUITE_END()
