#pragma once
#include "decimal/decimal.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Value of a resolved field or of a condition operand.
// std::monostate means the field does not exist.
using FieldValue = std::variant<std::monostate, Decimal, std::string, std::vector<std::string>>;

std::optional<Decimal> as_decimal(const FieldValue&);
std::string describe(const FieldValue&);

enum class Operator : uint8_t {
    Eq,
    Neq,
    Gt,
    Gte,
    Lt,
    Lte,
    In,
    NotIn,
    Contains,
    HasFlag,
    Exists,
    NotExists
};
std::optional<Operator> parse_operator(std::string_view);
const char* to_string(Operator);

struct Condition {
    std::string field;
    Operator op { Operator::Eq };
    FieldValue value;

    [[nodiscard]] bool holds(const FieldValue& actual) const;
};

// Restricts a line scoped component to a subset of lines.
// A line matches if all of `where` hold and, when `anyOf` is not
// empty, all conditions of at least one group hold.
struct LineSelector {
    std::vector<Condition> where;
    std::vector<std::vector<Condition>> anyOf;
    SelectorMode mode { SelectorMode::Include };
    bool requireMatch { false };

    template <typename Lookup>
    bool matches(Lookup&& lookup) const
    {
        auto all_hold = [&](const std::vector<Condition>& group) {
            for (auto& c : group) {
                if (!c.holds(lookup(c.field)))
                    return false;
            }
            return true;
        };
        bool match { all_hold(where) };
        if (match && !anyOf.empty()) {
            match = false;
            for (auto& g : anyOf) {
                if (all_hold(g)) {
                    match = true;
                    break;
                }
            }
        }
        return mode == SelectorMode::Include ? match : !match;
    }
};
