// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for CProjectRegistry: creation rules, ownership index, status
//

#include "test/test_solar.h"

#include "solar/solar_errors.h"
#include "solar/solar_registry.h"

#include <boost/test/unit_test.hpp>

namespace {

struct RegistryTestingSetup : public BasicTestingSetup {
    CProjectRegistry registry;
    const CAccountID creator;
    const CAccountID other;

    RegistryTestingSetup() : creator(TestAccount(0xc0)), other(TestAccount(0x07)) {}

    uint64_t Add(const CAccountID& owner)
    {
        return registry.AddProject(owner, "Rooftop", 100, COIN / 100, 1, TEST_MOCK_TIME);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(solar_registry_tests, RegistryTestingSetup)

BOOST_AUTO_TEST_CASE(test_create_rules)
{
    CValidationState state;
    BOOST_CHECK(registry.CheckNewProject(creator, 100, 1, 1, state));
    BOOST_CHECK(registry.CheckNewProject(creator, 100, 1, 100, state));

    CValidationState s1;
    BOOST_CHECK(!registry.CheckNewProject(creator, 0, 1, 1, s1));
    BOOST_CHECK(s1.GetError() == LedgerError::INVALID_SUPPLY);

    CValidationState s2;
    BOOST_CHECK(!registry.CheckNewProject(creator, 100, 0, 1, s2));
    BOOST_CHECK(s2.GetError() == LedgerError::INVALID_PRICE);

    CValidationState s3;
    BOOST_CHECK(!registry.CheckNewProject(creator, 100, 1, 0, s3));
    BOOST_CHECK(s3.GetError() == LedgerError::INVALID_MIN_PURCHASE);

    CValidationState s4;
    BOOST_CHECK(!registry.CheckNewProject(creator, 100, 1, 101, s4));
    BOOST_CHECK(s4.GetError() == LedgerError::INVALID_MIN_PURCHASE);

    CValidationState s5;
    BOOST_CHECK(!registry.CheckNewProject(CAccountID(), 100, 1, 1, s5));
    BOOST_CHECK(s5.GetError() == LedgerError::INVALID_CREATOR);
}

BOOST_AUTO_TEST_CASE(test_add_project)
{
    BOOST_CHECK(!registry.Exists(1));

    const uint64_t nFirst = Add(creator);
    const uint64_t nSecond = Add(creator);
    BOOST_CHECK_EQUAL(nFirst, 1U);
    BOOST_CHECK_EQUAL(nSecond, 2U);
    BOOST_CHECK_EQUAL(registry.GetProjectCount(), 2U);
    BOOST_CHECK(registry.Exists(1));
    BOOST_CHECK(!registry.Exists(0));
    BOOST_CHECK(!registry.Exists(3));

    SolarProject project;
    BOOST_REQUIRE(registry.GetProject(nFirst, project));
    BOOST_CHECK_EQUAL(project.nId, nFirst);
    BOOST_CHECK(project.creator == creator);
    BOOST_CHECK_EQUAL(project.strName, "Rooftop");
    BOOST_CHECK_EQUAL(project.nTotalSupply, 100U);
    BOOST_CHECK_EQUAL(project.nMinted, 0U);
    BOOST_CHECK_EQUAL(project.nPrice, COIN / 100);
    BOOST_CHECK(project.fActive);
    BOOST_CHECK_EQUAL(project.nCreatedAt, TEST_MOCK_TIME);
    BOOST_CHECK_EQUAL(project.nRewardPerUnitStored, 0);
    BOOST_CHECK_EQUAL(project.nSalesBalance, 0);
    BOOST_CHECK_EQUAL(project.GetAvailableSupply(), 100U);

    BOOST_CHECK(registry.GetUserProjects(creator) == std::vector<uint64_t>({1, 2}));
    BOOST_CHECK(registry.GetUserProjects(other).empty());
}

BOOST_AUTO_TEST_CASE(test_transfer_ownership_swap_and_pop)
{
    Add(creator);
    Add(creator);
    Add(creator);
    Add(creator);

    CValidationState state;
    BOOST_REQUIRE(registry.TransferOwnership(2, creator, other, state));

    // Last entry moved into the hole
    BOOST_CHECK(registry.GetUserProjects(creator) == std::vector<uint64_t>({1, 4, 3}));
    BOOST_CHECK(registry.GetUserProjects(other) == std::vector<uint64_t>({2}));
    BOOST_CHECK(registry.IsCreator(2, other));
    BOOST_CHECK(!registry.IsCreator(2, creator));

    // Index positions stay valid after the swap
    BOOST_REQUIRE(registry.TransferOwnership(4, creator, other, state));
    BOOST_CHECK(registry.GetUserProjects(creator) == std::vector<uint64_t>({1, 3}));
    BOOST_CHECK(registry.GetUserProjects(other) == std::vector<uint64_t>({2, 4}));

    BOOST_REQUIRE(registry.TransferOwnership(3, creator, other, state));
    BOOST_REQUIRE(registry.TransferOwnership(1, creator, other, state));
    BOOST_CHECK(registry.GetUserProjects(creator).empty());
    BOOST_CHECK_EQUAL(registry.GetUserProjects(other).size(), 4U);
}

BOOST_AUTO_TEST_CASE(test_transfer_ownership_rules)
{
    Add(creator);

    CValidationState s1;
    BOOST_CHECK(!registry.TransferOwnership(1, other, other, s1));
    BOOST_CHECK(s1.GetError() == LedgerError::UNAUTHORIZED);

    CValidationState s2;
    BOOST_CHECK(!registry.TransferOwnership(1, creator, CAccountID(), s2));
    BOOST_CHECK(s2.GetError() == LedgerError::INVALID_CREATOR);

    CValidationState s3;
    BOOST_CHECK(!registry.TransferOwnership(9, creator, other, s3));
    BOOST_CHECK(s3.GetError() == LedgerError::PROJECT_NOT_FOUND);

    BOOST_CHECK(registry.IsCreator(1, creator));
    BOOST_CHECK(registry.GetUserProjects(creator) == std::vector<uint64_t>({1}));
}

BOOST_AUTO_TEST_CASE(test_set_active)
{
    Add(creator);

    CValidationState state;
    BOOST_CHECK(registry.SetActive(1, creator, false, state));
    BOOST_CHECK(!registry.Lookup(1)->fActive);
    BOOST_CHECK(registry.SetActive(1, creator, true, state));
    BOOST_CHECK(registry.Lookup(1)->fActive);

    CValidationState s1;
    BOOST_CHECK(!registry.SetActive(1, other, false, s1));
    BOOST_CHECK(s1.GetError() == LedgerError::UNAUTHORIZED);

    CValidationState s2;
    BOOST_CHECK(!registry.SetActive(2, creator, false, s2));
    BOOST_CHECK(s2.GetError() == LedgerError::PROJECT_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(test_load_rejects_inconsistent_index)
{
    Add(creator);
    Add(other);

    CProjectRegistry copy;
    BOOST_CHECK(copy.Load(registry.GetProjects(), registry.GetUserIndex(), registry.GetNextProjectId()));
    BOOST_CHECK_EQUAL(copy.GetProjectCount(), 2U);
    BOOST_CHECK_EQUAL(copy.GetNextProjectId(), 3U);

    // Project listed under the wrong creator
    CProjectRegistry::UserIndex badIndex;
    badIndex[creator] = {1, 2};
    CProjectRegistry bad;
    BOOST_CHECK(!bad.Load(registry.GetProjects(), badIndex, 3));

    // Missing project in the index
    CProjectRegistry::UserIndex partialIndex;
    partialIndex[creator] = {1};
    BOOST_CHECK(!bad.Load(registry.GetProjects(), partialIndex, 3));

    // Next id would reuse an existing id
    BOOST_CHECK(!bad.Load(registry.GetProjects(), registry.GetUserIndex(), 2));
    BOOST_CHECK_EQUAL(bad.GetProjectCount(), 0U);
}

BOOST_AUTO_TEST_SUITE_END()
