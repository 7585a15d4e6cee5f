#pragma once
#include "result.hpp"

// Decimal weight of a line under a proration method.
Decimal proration_weight(const Line&, ProrationMethod);

// Distributes component amounts across lines. Shares are rounded to the
// precision and the last line absorbs the remainder, so per component the
// line shares sum exactly to the component amount.
class Allocator {
public:
    Allocator(const std::vector<Line>& lines, uint8_t precision);

    // Returns false if the weights summed to zero and the amount was
    // split equally instead.
    bool add(const BreakdownEntry&, const std::vector<size_t>& lineIndices);
    std::vector<LineAllocation> finish() && { return std::move(allocations); }

private:
    const std::vector<Line>& lines;
    uint8_t precision;
    std::vector<LineAllocation> allocations;
};

Reconciliation reconcile(const Decimal& totalFee, const std::vector<LineAllocation>&);
