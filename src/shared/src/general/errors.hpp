#pragma once

#include "general/errors_forward.hpp"
#include <cstdint>
////////////////////////////////////
// LIST OF ERROR CODES            //
////////////////////////////////////
// The name of each code is what callers branch on
// (see Error::err_name()).

// Ledger errors, range [1-99]
// Calculation errors, range [100-199]
// Decimal and parsing errors, range [200-299]
// Storage and configuration errors, range [300-399]
#define ADDITIONAL_ERRNO_MAP(XX)                                                   \
    XX(0, ENOERROR, "no error")                                                    \
    XX(1, MISSING_CHANNEL, "channel_key is required")                              \
    XX(2, MISSING_CALLBACK, "required callback not provided")                      \
    XX(3, NO_POLICY, "no policy found for channel")                                \
    XX(4, ERR_LEDGER_ENTRY_NOT_FOUND, "ledger entry not found")                    \
    XX(5, ERR_NO_BREAKDOWN, "original entry has no breakdown")                     \
    XX(6, ERR_EXCEEDS_ORIGINAL, "refund exceeds original")                         \
    XX(7, ERR_LINE_NOT_FOUND, "line not found in original entry")                  \
    XX(8, ERR_CURRENCY_MISMATCH, "currency differs from original entry")           \
    XX(9, ERR_INVALID_ADJUSTMENT, "invalid adjustment")                            \
    XX(10, ERR_IDEMPOTENCY_CONFLICT, "idempotency key reused with other input")    \
    XX(100, INVALID_COMPONENT, "invalid component")                                \
    XX(101, MISSING_BASE_FIELD, "missing required base field")                     \
    XX(102, MISSING_LINES, "transaction has no lines")                             \
    XX(103, INVALID_LINE, "invalid transaction line")                              \
    XX(104, INVALID_BASE_SPEC, "invalid base specification")                       \
    XX(105, INVALID_CONDITION, "invalid condition")                                \
    XX(106, INVALID_LINE_SELECTOR, "invalid line selector")                        \
    XX(107, LINE_SELECTOR_NO_MATCH, "line selector matched no lines")              \
    XX(108, CAP_INVALID_BOUNDS, "cap min exceeds cap max")                         \
    XX(109, CAP_TARGETS_EMPTY, "cap targets are empty")                            \
    XX(110, INVALID_POLICY, "invalid policy")                                      \
    XX(200, INVALID_DECIMAL, "invalid decimal value")                              \
    XX(201, DIVISION_BY_ZERO, "division by zero")                                  \
    XX(300, PERSIST_FAILED, "cannot persist ledger entry")                         \
    XX(301, CONFIG_INVALID, "invalid configuration")                               \
    XX(1000, EBUG, "bug-related error")
#define ERR_DEFINE(code, name, _) constexpr int32_t name = code;
ADDITIONAL_ERRNO_MAP(ERR_DEFINE)
#undef ERR_DEFINE
