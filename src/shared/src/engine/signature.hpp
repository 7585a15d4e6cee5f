#pragma once
#include "result.hpp"
#include <map>

// Canonical document the signature hashes: engine version, policy hash,
// precision, normalized input, total fee and the breakdown amounts.
nlohmann::json signature_payload(const Calculation&,
    const std::map<std::string, std::string>& context);

// hex SHA256 of the canonical payload, used for replay detection
std::string compute_signature(const Calculation&,
    const std::map<std::string, std::string>& context);
