// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "solar/solar_errors.h"

ErrorKind GetErrorKind(LedgerError code)
{
    switch (code) {
    case LedgerError::NONE:
        return ErrorKind::NONE;
    case LedgerError::INVALID_SUPPLY:
    case LedgerError::INVALID_PRICE:
    case LedgerError::INVALID_MIN_PURCHASE:
    case LedgerError::INVALID_CREATOR:
    case LedgerError::INVALID_RECIPIENT:
    case LedgerError::INVALID_OPERATOR:
    case LedgerError::INVALID_AMOUNT:
    case LedgerError::ARRAY_LENGTH_MISMATCH:
    case LedgerError::AMOUNT_OVERFLOW:
        return ErrorKind::VALIDATION;
    case LedgerError::PROJECT_NOT_FOUND:
        return ErrorKind::NOT_FOUND;
    case LedgerError::UNAUTHORIZED:
        return ErrorKind::UNAUTHORIZED;
    case LedgerError::PROJECT_NOT_ACTIVE:
    case LedgerError::CONTRACT_PAUSED:
    case LedgerError::CONTRACT_NOT_PAUSED:
    case LedgerError::PRICE_LOCKED:
    case LedgerError::REENTRANT_CALL:
        return ErrorKind::STATE_CONFLICT;
    case LedgerError::INSUFFICIENT_PAYMENT:
    case LedgerError::EXCEEDS_SUPPLY:
    case LedgerError::BELOW_MIN_PURCHASE:
    case LedgerError::INSUFFICIENT_BALANCE:
    case LedgerError::INSUFFICIENT_SALES_BALANCE:
    case LedgerError::NO_TOKENS_MINTED:
    case LedgerError::NO_FUNDS_DEPOSITED:
    case LedgerError::NOTHING_TO_CLAIM:
    case LedgerError::NO_DUST_TO_RESCUE:
        return ErrorKind::INSUFFICIENT_RESOURCE;
    case LedgerError::REWARD_INCREASE_TOO_SMALL:
    case LedgerError::BATCH_SIZE_TOO_LARGE:
        return ErrorKind::ECONOMIC_DEGENERATE;
    case LedgerError::TRANSFER_FAILED:
        return ErrorKind::TRANSFER_FAILURE;
    } // no default case, so the compiler can warn about missing cases
    return ErrorKind::NONE;
}

std::string LedgerErrorName(LedgerError code)
{
    switch (code) {
    case LedgerError::NONE: return "None";
    case LedgerError::INVALID_SUPPLY: return "InvalidSupply";
    case LedgerError::INVALID_PRICE: return "InvalidPrice";
    case LedgerError::INVALID_MIN_PURCHASE: return "InvalidMinPurchase";
    case LedgerError::INVALID_CREATOR: return "InvalidCreator";
    case LedgerError::INVALID_RECIPIENT: return "InvalidRecipient";
    case LedgerError::INVALID_OPERATOR: return "InvalidOperator";
    case LedgerError::INVALID_AMOUNT: return "InvalidAmount";
    case LedgerError::ARRAY_LENGTH_MISMATCH: return "ArrayLengthMismatch";
    case LedgerError::AMOUNT_OVERFLOW: return "AmountOverflow";
    case LedgerError::PROJECT_NOT_FOUND: return "ProjectNotFound";
    case LedgerError::UNAUTHORIZED: return "Unauthorized";
    case LedgerError::PROJECT_NOT_ACTIVE: return "ProjectNotActive";
    case LedgerError::CONTRACT_PAUSED: return "ContractPaused";
    case LedgerError::CONTRACT_NOT_PAUSED: return "ContractNotPaused";
    case LedgerError::PRICE_LOCKED: return "PriceLocked";
    case LedgerError::REENTRANT_CALL: return "ReentrantCall";
    case LedgerError::INSUFFICIENT_PAYMENT: return "InsufficientPayment";
    case LedgerError::EXCEEDS_SUPPLY: return "ExceedsSupply";
    case LedgerError::BELOW_MIN_PURCHASE: return "BelowMinPurchase";
    case LedgerError::INSUFFICIENT_BALANCE: return "InsufficientBalance";
    case LedgerError::INSUFFICIENT_SALES_BALANCE: return "InsufficientSalesBalance";
    case LedgerError::NO_TOKENS_MINTED: return "NoTokensMinted";
    case LedgerError::NO_FUNDS_DEPOSITED: return "NoFundsDeposited";
    case LedgerError::NOTHING_TO_CLAIM: return "NothingToClaim";
    case LedgerError::NO_DUST_TO_RESCUE: return "NoDustToRescue";
    case LedgerError::REWARD_INCREASE_TOO_SMALL: return "RewardIncreaseTooSmall";
    case LedgerError::BATCH_SIZE_TOO_LARGE: return "BatchSizeTooLarge";
    case LedgerError::TRANSFER_FAILED: return "TransferFailed";
    }
    return "Unknown";
}

std::string ErrorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NONE: return "None";
    case ErrorKind::VALIDATION: return "Validation";
    case ErrorKind::NOT_FOUND: return "NotFound";
    case ErrorKind::UNAUTHORIZED: return "Unauthorized";
    case ErrorKind::STATE_CONFLICT: return "StateConflict";
    case ErrorKind::INSUFFICIENT_RESOURCE: return "InsufficientResource";
    case ErrorKind::ECONOMIC_DEGENERATE: return "EconomicDegenerate";
    case ErrorKind::TRANSFER_FAILURE: return "TransferFailure";
    }
    return "Unknown";
}

std::string CValidationState::ToString() const
{
    if (IsValid()) {
        return "Valid";
    }
    std::string str = LedgerErrorName(code) + " (" + strRejectReason + ")";
    if (!strDebugMessage.empty()) {
        str += ", " + strDebugMessage;
    }
    return str;
}
