// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Solar Test Suite

#include "test/test_solar.h"

#include "logging.h"
#include "utiltime.h"

#include <stdexcept>

CAccountID TestAccount(uint8_t n)
{
    return CAccountID(std::vector<unsigned char>(CAccountID::WIDTH, n));
}

BasicTestingSetup::BasicTestingSetup()
{
    LogInstance().DisconnectTestLogger();
    SetMockTime(TEST_MOCK_TIME);
}

BasicTestingSetup::~BasicTestingSetup()
{
    SetMockTime(0);
}

bool CTestValueTransfer::SendValue(const CAccountID& to, const CAmount& nAmount)
{
    if (onSend) {
        onSend(to, nAmount);
    }
    if (fThrow) {
        throw std::runtime_error("host transfer error");
    }
    if (fReject) {
        return false;
    }
    vPayments.push_back(Payment{to, nAmount});
    return true;
}

CAmount CTestValueTransfer::TotalSentTo(const CAccountID& to) const
{
    CAmount nTotal = 0;
    for (const Payment& payment : vPayments) {
        if (payment.to == to) nTotal += payment.nAmount;
    }
    return nTotal;
}

LedgerTestingSetup::LedgerTestingSetup(const CLedgerParams& params)
    : admin(TestAccount(0xad)),
      creator(TestAccount(0xc0)),
      alice(TestAccount(0xa1)),
      bob(TestAccount(0xb0)),
      carol(TestAccount(0xca)),
      ledger(admin, params, transfer)
{
}

uint64_t LedgerTestingSetup::CreateTestProject(uint64_t nTotalSupply, const CAmount& nPrice, uint64_t nMinPurchase)
{
    CValidationState state;
    uint64_t nProjectId = 0;
    BOOST_REQUIRE_MESSAGE(ledger.CreateProject(creator, "Test Solar Farm", nTotalSupply, nPrice, nMinPurchase, nProjectId, state),
                          state.ToString());
    return nProjectId;
}

void LedgerTestingSetup::Buy(const CAccountID& buyer, uint64_t nProjectId, uint64_t nAmount)
{
    SolarProject project;
    BOOST_REQUIRE(ledger.GetProject(nProjectId, project));
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(ledger.Purchase(buyer, nProjectId, nAmount, project.nPrice * nAmount, state), state.ToString());
}

void LedgerTestingSetup::Deposit(uint64_t nProjectId, const CAmount& nAmount, uint64_t nEnergyDelta)
{
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(ledger.DepositRevenue(creator, nProjectId, nEnergyDelta, nAmount, state), state.ToString());
}
