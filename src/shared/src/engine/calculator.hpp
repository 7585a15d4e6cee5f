#pragma once
#include "policy/policy.hpp"
#include "result.hpp"

struct CalculateOptions {
    std::optional<uint8_t> precision; // overrides the policy
    std::optional<bool> strict; // overrides the policy
    ProrationMethod defaultProration { ProrationMethod::ByNet };
};

// Pure and deterministic. Structural failures are returned as errors,
// soft anomalies end up in Calculation::warnings.
[[nodiscard]] Result<Calculation> calculate(const Transaction&, const Policy&,
    const CalculateOptions& = {});
