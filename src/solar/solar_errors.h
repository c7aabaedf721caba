// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_ERRORS_H
#define SOLAR_SOLAR_ERRORS_H

#include <string>

/**
 * Ledger error codes.
 *
 * Every rejected operation reports exactly one of these through its
 * CValidationState. Codes are grouped into the kinds of ErrorKind.
 */
enum class LedgerError {
    NONE = 0,

    // Validation
    INVALID_SUPPLY,
    INVALID_PRICE,
    INVALID_MIN_PURCHASE,
    INVALID_CREATOR,
    INVALID_RECIPIENT,
    INVALID_OPERATOR,
    INVALID_AMOUNT,
    ARRAY_LENGTH_MISMATCH,
    AMOUNT_OVERFLOW,

    // NotFound
    PROJECT_NOT_FOUND,

    // Unauthorized
    UNAUTHORIZED,

    // StateConflict
    PROJECT_NOT_ACTIVE,
    CONTRACT_PAUSED,
    CONTRACT_NOT_PAUSED,
    PRICE_LOCKED,
    REENTRANT_CALL,

    // InsufficientResource
    INSUFFICIENT_PAYMENT,
    EXCEEDS_SUPPLY,
    BELOW_MIN_PURCHASE,
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_SALES_BALANCE,
    NO_TOKENS_MINTED,
    NO_FUNDS_DEPOSITED,
    NOTHING_TO_CLAIM,
    NO_DUST_TO_RESCUE,

    // EconomicDegenerate
    REWARD_INCREASE_TOO_SMALL,
    BATCH_SIZE_TOO_LARGE,

    // TransferFailure
    TRANSFER_FAILED,
};

enum class ErrorKind {
    NONE = 0,
    VALIDATION,
    NOT_FOUND,
    UNAUTHORIZED,
    STATE_CONFLICT,
    INSUFFICIENT_RESOURCE,
    ECONOMIC_DEGENERATE,
    TRANSFER_FAILURE,
};

ErrorKind GetErrorKind(LedgerError code);

/** CamelCase name of the error ("InvalidSupply") */
std::string LedgerErrorName(LedgerError code);
std::string ErrorKindName(ErrorKind kind);

/** Capture information about ledger operation failures */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< operation rejected, nothing was applied
    } mode;
    LedgerError code;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), code(LedgerError::NONE) {}

    bool Invalid(LedgerError codeIn, const std::string& strRejectReasonIn, const std::string& strDebugMessageIn = "")
    {
        mode = MODE_INVALID;
        code = codeIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        return false;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }

    LedgerError GetError() const { return code; }
    ErrorKind GetKind() const { return GetErrorKind(code); }
    const std::string& GetRejectReason() const { return strRejectReason; }
    const std::string& GetDebugMessage() const { return strDebugMessage; }

    std::string ToString() const;
};

#endif // SOLAR_SOLAR_ERRORS_H
