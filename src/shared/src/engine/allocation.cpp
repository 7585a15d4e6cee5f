#include "allocation.hpp"

Decimal proration_weight(const Line& l, ProrationMethod m)
{
    switch (m) {
    case ProrationMethod::ByNet:
        return l.net;
    case ProrationMethod::ByGross:
        return l.gross;
    case ProrationMethod::ByQuantity:
        return l.quantity;
    case ProrationMethod::Equal:
        break;
    }
    return Decimal(1);
}

Allocator::Allocator(const std::vector<Line>& lines, uint8_t precision)
    : lines(lines)
    , precision(precision)
{
    allocations.reserve(lines.size());
    for (auto& l : lines)
        allocations.push_back({ .lineId = l.id });
}

bool Allocator::add(const BreakdownEntry& e, const std::vector<size_t>& lineIndices)
{
    if (lineIndices.empty())
        return true;
    auto method { e.proration };
    std::vector<Decimal> weights;
    weights.reserve(lineIndices.size());
    Decimal sum;
    for (auto i : lineIndices) {
        weights.push_back(proration_weight(lines[i], method));
        sum += weights.back();
    }
    const bool fellBack { sum.is_zero() && method != ProrationMethod::Equal };
    if (sum.is_zero()) {
        method = ProrationMethod::Equal;
        for (auto& w : weights)
            w = Decimal(1);
        sum = Decimal(int64_t(weights.size()));
    }

    auto shares { Decimal::allocate(e.amount, weights, precision) };
    for (size_t j = 0; j < lineIndices.size(); ++j) {
        auto& a { allocations[lineIndices[j]] };
        a.feeAmount += shares[j];
        a.components.push_back({
            .componentId = e.componentId,
            .amount = shares[j],
            .proration = method,
            .weight = Decimal::div_throw(weights[j], sum, Decimal::ratioScale),
        });
    }
    return !fellBack;
}

Reconciliation reconcile(const Decimal& totalFee, const std::vector<LineAllocation>& allocations)
{
    Reconciliation r;
    for (auto& a : allocations)
        r.allocatedSum += a.feeAmount;
    r.difference = totalFee - r.allocatedSum;
    r.balanced = r.difference.is_zero();
    return r;
}
