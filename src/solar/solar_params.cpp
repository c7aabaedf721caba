// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_params.h"

CLedgerParams CLedgerParams::Default()
{
    CLedgerParams params;
    params.nMaxClaimBatch = DEFAULT_MAX_CLAIM_BATCH;
    params.nMaxUserProjectsPage = DEFAULT_MAX_USER_PROJECTS_PAGE;
    params.nMaxPortfolioPage = DEFAULT_MAX_PORTFOLIO_PAGE;
    params.nMaxProjectsPage = DEFAULT_MAX_PROJECTS_PAGE;
    params.fAllowPriceUpdate = DEFAULT_ALLOW_PRICE_UPDATE;
    return params;
}
