#pragma once
#include <string>

// FEELEDGER_VERSION_* are set by the build
#define FEELEDGER_STR_(x) #x
#define FEELEDGER_STR(x) FEELEDGER_STR_(x)
#define FEELEDGER_VERSION_STRING      \
    FEELEDGER_STR(FEELEDGER_VERSION_MAJOR) \
    "." FEELEDGER_STR(FEELEDGER_VERSION_MINOR) "." FEELEDGER_STR(FEELEDGER_VERSION_PATCH)

// part of every calculation signature, bump on changes to rounding or allocation
inline const std::string engine_version { "feeledger-" FEELEDGER_VERSION_STRING };
