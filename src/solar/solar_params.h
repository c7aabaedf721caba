// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_PARAMS_H
#define SOLAR_SOLAR_PARAMS_H

#include <stdint.h>

/**
 * CLedgerParams - tunable bounds of a ledger instance
 *
 * Fixed at construction; the ledger never changes them.
 */
struct CLedgerParams
{
    //! Maximum number of projects in one claimMultiple call
    uint32_t nMaxClaimBatch;
    //! Page bound for creator project listings
    uint32_t nMaxUserProjectsPage;
    //! Page bound for holder portfolio listings
    uint32_t nMaxPortfolioPage;
    //! Page bound for the global project listing
    uint32_t nMaxProjectsPage;
    //! Administrator may change a project price until its first unit is sold
    bool fAllowPriceUpdate;

    /** Production values */
    static CLedgerParams Default();
};

static const uint32_t DEFAULT_MAX_CLAIM_BATCH = 100;
static const uint32_t DEFAULT_MAX_USER_PROJECTS_PAGE = 50;
static const uint32_t DEFAULT_MAX_PORTFOLIO_PAGE = 100;
static const uint32_t DEFAULT_MAX_PROJECTS_PAGE = 100;
static const bool DEFAULT_ALLOW_PRICE_UPDATE = true;

#endif // SOLAR_SOLAR_PARAMS_H
