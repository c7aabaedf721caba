// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_solar.h"

#include "logging.h"
#include "serialize.h"
#include "solar/solar_account.h"
#include "solar/solar_errors.h"
#include "streams.h"
#include "utilmoneystr.h"

#include <fstream>
#include <iterator>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_FormatMoney)
{
    BOOST_CHECK_EQUAL(FormatMoney(0), "0.00");
    BOOST_CHECK_EQUAL(FormatMoney(COIN), "1.00");
    BOOST_CHECK_EQUAL(FormatMoney(COIN * 13 / 10), "1.30");
    BOOST_CHECK_EQUAL(FormatMoney(COIN / 100), "0.01");
    BOOST_CHECK_EQUAL(FormatMoney(COIN / 1000), "0.001");
    BOOST_CHECK_EQUAL(FormatMoney(1), "0.000000000000000001");
    BOOST_CHECK_EQUAL(FormatMoney(COIN * 123456789 + 9), "123456789.000000000000000009");
}

BOOST_AUTO_TEST_CASE(account_hex)
{
    CAccountID account;
    BOOST_CHECK(account.IsNull());

    BOOST_CHECK(account.SetHex("0x00112233445566778899AABBCCDDEEFF01234567"));
    BOOST_CHECK(!account.IsNull());
    BOOST_CHECK_EQUAL(account.GetHex(), "00112233445566778899aabbccddeeff01234567");
    BOOST_CHECK_EQUAL(account.ToString(), "0x00112233445566778899aabbccddeeff01234567");

    CAccountID other;
    BOOST_CHECK(other.SetHex("00112233445566778899aabbccddeeff01234567"));
    BOOST_CHECK(account == other);

    // Wrong length, bad digits
    BOOST_CHECK(!other.SetHex("0x0011"));
    BOOST_CHECK(!other.SetHex("zz112233445566778899aabbccddeeff01234567"));
    BOOST_CHECK(AccountIDFromHex("not an account").IsNull());
}

BOOST_AUTO_TEST_CASE(account_ordering_and_serialization)
{
    const CAccountID a = TestAccount(0x01);
    const CAccountID b = TestAccount(0x02);
    BOOST_CHECK(a < b);
    BOOST_CHECK(!(b < a));
    BOOST_CHECK(a != b);

    BOOST_CHECK_THROW(CAccountID(std::vector<unsigned char>(19, 0x01)), std::invalid_argument);

    CDataStream ss;
    ss << a << b;
    BOOST_CHECK_EQUAL(ss.size(), 2 * CAccountID::WIDTH);

    CAccountID a2, b2;
    ss >> a2 >> b2;
    BOOST_CHECK(a2 == a);
    BOOST_CHECK(b2 == b);
    BOOST_CHECK(ss.empty());

    CAccountID c;
    BOOST_CHECK_THROW(ss >> c, std::ios_base::failure);
}

BOOST_AUTO_TEST_CASE(compact_size_encoding)
{
    const uint64_t vSizes[] = {0, 252, 253, 0xffff, 0x10000, 0x1000000};
    const size_t vEncoded[] = {1, 1, 3, 3, 5, 5};
    for (size_t i = 0; i < 6; ++i) {
        CDataStream ss;
        WriteCompactSize(ss, vSizes[i]);
        BOOST_CHECK_EQUAL(ss.size(), vEncoded[i]);
        BOOST_CHECK_EQUAL(ReadCompactSize(ss), vSizes[i]);
        BOOST_CHECK(ss.empty());
    }

    // A 300 byte vector carries the 3 byte length prefix
    CDataStream ssVec;
    ssVec << std::vector<uint64_t>(300, 7);
    BOOST_CHECK_EQUAL(ssVec.size(), 3U + 300 * 8);
    std::vector<uint64_t> vRead;
    ssVec >> vRead;
    BOOST_CHECK_EQUAL(vRead.size(), 300U);

    // Sizes must use their shortest form
    const char vShort[] = {(char)253, (char)0xfc, 0x00};
    CDataStream ssShort(vShort, vShort + sizeof(vShort));
    BOOST_CHECK_THROW(ReadCompactSize(ssShort), std::ios_base::failure);

    const char vWide[] = {(char)254, (char)0xff, (char)0xff, 0x00, 0x00};
    CDataStream ssWide(vWide, vWide + sizeof(vWide));
    BOOST_CHECK_THROW(ReadCompactSize(ssWide), std::ios_base::failure);
}

BOOST_AUTO_TEST_CASE(error_kinds)
{
    BOOST_CHECK(GetErrorKind(LedgerError::INVALID_SUPPLY) == ErrorKind::VALIDATION);
    BOOST_CHECK(GetErrorKind(LedgerError::AMOUNT_OVERFLOW) == ErrorKind::VALIDATION);
    BOOST_CHECK(GetErrorKind(LedgerError::PROJECT_NOT_FOUND) == ErrorKind::NOT_FOUND);
    BOOST_CHECK(GetErrorKind(LedgerError::UNAUTHORIZED) == ErrorKind::UNAUTHORIZED);
    BOOST_CHECK(GetErrorKind(LedgerError::CONTRACT_PAUSED) == ErrorKind::STATE_CONFLICT);
    BOOST_CHECK(GetErrorKind(LedgerError::REENTRANT_CALL) == ErrorKind::STATE_CONFLICT);
    BOOST_CHECK(GetErrorKind(LedgerError::NOTHING_TO_CLAIM) == ErrorKind::INSUFFICIENT_RESOURCE);
    BOOST_CHECK(GetErrorKind(LedgerError::REWARD_INCREASE_TOO_SMALL) == ErrorKind::ECONOMIC_DEGENERATE);
    BOOST_CHECK(GetErrorKind(LedgerError::BATCH_SIZE_TOO_LARGE) == ErrorKind::ECONOMIC_DEGENERATE);
    BOOST_CHECK(GetErrorKind(LedgerError::TRANSFER_FAILED) == ErrorKind::TRANSFER_FAILURE);
    BOOST_CHECK(GetErrorKind(LedgerError::NONE) == ErrorKind::NONE);

    BOOST_CHECK_EQUAL(LedgerErrorName(LedgerError::INVALID_MIN_PURCHASE), "InvalidMinPurchase");
    BOOST_CHECK_EQUAL(LedgerErrorName(LedgerError::NO_TOKENS_MINTED), "NoTokensMinted");
    BOOST_CHECK_EQUAL(ErrorKindName(ErrorKind::INSUFFICIENT_RESOURCE), "InsufficientResource");

    CValidationState state;
    BOOST_CHECK(state.IsValid());
    BOOST_CHECK(!state.Invalid(LedgerError::INVALID_PRICE, "bad-project-price", "price=0"));
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK(state.GetError() == LedgerError::INVALID_PRICE);
    BOOST_CHECK(state.GetKind() == ErrorKind::VALIDATION);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-project-price");
    BOOST_CHECK_EQUAL(state.GetDebugMessage(), "price=0");
}

BOOST_AUTO_TEST_CASE(logging_categories_and_file)
{
    BCLog::LogFlags flag;
    BOOST_CHECK(GetLogCategory(flag, "reward"));
    BOOST_CHECK(flag == BCLog::REWARD);
    BOOST_CHECK(GetLogCategory(flag, ""));
    BOOST_CHECK(flag == BCLog::ALL);
    BOOST_CHECK(!GetLogCategory(flag, "mempool"));
    BOOST_CHECK_EQUAL(ListLogCategories(), "ledger, registry, reward, units, db");

    BCLog::Logger& logger = LogInstance();
    BOOST_CHECK(logger.EnableCategory("ledger"));
    BOOST_CHECK(!logger.EnableCategory("bogus"));
    BOOST_CHECK(LogAcceptCategory(BCLog::LEDGER));
    BOOST_CHECK(!LogAcceptCategory(BCLog::DB));

    const boost::filesystem::path path = boost::filesystem::temp_directory_path() /
                                         boost::filesystem::unique_path("solar_debug_%%%%-%%%%.log");
    logger.m_file_path = path;
    logger.m_log_timestamps = false;
    BOOST_REQUIRE(logger.OpenDebugLog());

    LogPrint(BCLog::LEDGER, "%s: project=%u\n", "Claim", 7);
    LogPrint(BCLog::DB, "not written\n");
    BOOST_CHECK(!error("%s: broken %s", "Load", "record"));

    logger.DisconnectTestLogger();
    BOOST_CHECK(logger.DisableCategory("ledger"));
    logger.m_log_timestamps = DEFAULT_LOGTIMESTAMPS;
    BOOST_CHECK_EQUAL(logger.GetCategoryMask(), 0U);

    std::ifstream file(path.string());
    const std::string strContents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    BOOST_CHECK_EQUAL(strContents, "Claim: project=7\nERROR: Load: broken record\n");

    boost::system::error_code ec;
    boost::filesystem::remove(path, ec);
}

BOOST_AUTO_TEST_SUITE_END()
