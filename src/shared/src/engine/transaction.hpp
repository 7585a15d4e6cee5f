#pragma once
#include "decimal/decimal.hpp"
#include "general/result.hpp"
#include "nlohmann/json_fwd.hpp"
#include "policy/condition.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct LineInput {
    std::optional<std::string> lineId;
    std::optional<Decimal> net;
    std::optional<Decimal> gross;
    Decimal tax;
    std::optional<Decimal> taxRate; // percent, used to derive net from gross
    Decimal quantity { 1 };
    Decimal shipping;
    Decimal discount;
    std::optional<Decimal> unitPrice;
    std::string category;
    std::string sku;
    std::vector<std::string> flags;
    std::map<std::string, std::string> attributes;
    std::map<std::string, Decimal> amounts; // custom base fields
};

// explicitly given order totals, missing ones default to the line sums
struct OrderTotalsInput {
    std::optional<Decimal> net;
    std::optional<Decimal> gross;
    std::optional<Decimal> tax;
    std::optional<Decimal> shipping;
    std::optional<Decimal> discount;
    std::optional<Decimal> quantity;
};

struct Transaction {
    std::string transactionId;
    std::string channelKey;
    std::optional<std::string> currency;
    std::optional<std::string> asOf;
    std::optional<std::string> idempotencyKey;
    std::map<std::string, std::string> context;
    std::vector<LineInput> lines;
    OrderTotalsInput order;

    [[nodiscard]] static Result<Transaction> from_json(const nlohmann::json&);
};

struct Line {
    std::string id;
    Decimal net;
    Decimal gross;
    Decimal tax;
    Decimal quantity;
    Decimal shipping;
    Decimal discount;
    Decimal unitPrice;
    std::string category;
    std::string sku;
    std::vector<std::string> flags;
    std::map<std::string, std::string> attributes;
    std::map<std::string, Decimal> amounts;

    // numeric base field, custom amounts included
    std::optional<Decimal> amount(const std::string& field) const;
    // field as seen by line selector conditions
    FieldValue value(const std::string& path) const;
};

struct OrderTotals {
    Decimal net;
    Decimal gross;
    Decimal tax;
    Decimal shipping;
    Decimal discount;
    Decimal quantity;

    std::optional<Decimal> amount(const std::string& field) const;
};

struct NormalizedInput {
    std::vector<Line> lines;
    OrderTotals order;
};

// Fills defaults: gross = net + tax, net from gross and tax rate,
// unit price = net / quantity and order totals from the lines.
[[nodiscard]] Result<NormalizedInput> normalize(const Transaction&, uint8_t precision);
