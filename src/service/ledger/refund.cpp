#include "fee_ledger.hpp"

namespace {
// reason the component is excluded from refunds, empty if it is refundable
std::string skip_reason(const BreakdownEntry& c)
{
    if (c.has_tag("non_refundable"))
        return "non_refundable_tag";
    if (!c.refund.refundable)
        return "not_refundable";
    if (c.refund.behavior == RefundBehavior::None)
        return "behavior_none";
    if (c.refund.behavior == RefundBehavior::FixedOnly && !is_fixed_type(c.type))
        return "fixed_only_skip";
    if (!c.applied)
        return "not_applied";
    return {};
}
}

Result<FeeLedger::RefundComputation> FeeLedger::compute_refund(const LedgerEntry& original,
    const Adjustment&, const Decimal& amount) const
{
    const uint32_t precision { original.precision };
    const auto ratio { Decimal::div_or_zero(amount, original.inputSnapshot.order.net, Decimal::ratioScale) };

    RefundComputation out;
    if (original.breakdown.empty()) {
        if (options.strict)
            return { ERR_NO_BREAKDOWN, "entry " + std::to_string(original.entryId ? original.entryId->value() : 0) + " has no breakdown to refund from" };
        auto refund { (original.totalFee * ratio).round(precision) };
        if (refund.abs() > original.totalFee.abs())
            refund = original.totalFee;
        out.total = -refund;
        return out;
    }

    for (auto& c : original.breakdown) {
        RefundPlanItem item {
            .componentId = c.componentId,
            .type = c.type,
            .originalAmount = c.amount,
        };
        item.reason = skip_reason(c);
        if (item.reason.empty()) {
            auto refund { (c.amount * ratio).round(precision) };
            item.reason = "proportional";
            if (c.refund.capRefundToOriginal && refund.abs() > c.amount.abs()) {
                refund = c.amount;
                item.reason = "capped_to_original";
            }
            item.refundAmount = refund;
        }

        // the adjustment carries every component, negated by its refund
        BreakdownEntry reversed { c };
        reversed.amount = -item.refundAmount;
        reversed.capApplied.reset();
        reversed.capDelta.reset();
        out.breakdown.push_back(std::move(reversed));

        out.total -= item.refundAmount;
        out.plan.push_back(std::move(item));
    }
    return out;
}
