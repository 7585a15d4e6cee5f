#include "condition.hpp"
#include <algorithm>

namespace {
std::optional<std::string> as_scalar_string(const FieldValue& v)
{
    if (auto s { std::get_if<std::string>(&v) })
        return *s;
    if (auto d { std::get_if<Decimal>(&v) })
        return d->canonical_string();
    return {};
}

bool scalar_equal(const FieldValue& a, const FieldValue& b)
{
    if (std::holds_alternative<Decimal>(a) || std::holds_alternative<Decimal>(b)) {
        auto da { as_decimal(a) };
        auto db { as_decimal(b) };
        if (da && db)
            return *da == *db;
    }
    auto sa { as_scalar_string(a) };
    auto sb { as_scalar_string(b) };
    return sa && sb && *sa == *sb;
}

bool list_contains(const std::vector<std::string>& list, const FieldValue& needle)
{
    return std::any_of(list.begin(), list.end(), [&](const std::string& e) {
        return scalar_equal(FieldValue { e }, needle);
    });
}

bool is_in(const FieldValue& actual, const FieldValue& set)
{
    auto list { std::get_if<std::vector<std::string>>(&set) };
    if (!list)
        return scalar_equal(actual, set);
    if (auto actualList { std::get_if<std::vector<std::string>>(&actual) }) {
        return std::any_of(actualList->begin(), actualList->end(), [&](const std::string& e) {
            return list_contains(*list, FieldValue { e });
        });
    }
    return list_contains(*list, actual);
}

std::optional<std::strong_ordering> numeric_compare(const FieldValue& a, const FieldValue& b)
{
    auto da { as_decimal(a) };
    auto db { as_decimal(b) };
    if (!da || !db)
        return {};
    return *da <=> *db;
}
}

std::optional<Decimal> as_decimal(const FieldValue& v)
{
    if (auto d { std::get_if<Decimal>(&v) })
        return *d;
    if (auto s { std::get_if<std::string>(&v) })
        return Decimal::parse(*s);
    return {};
}

std::string describe(const FieldValue& v)
{
    if (std::holds_alternative<std::monostate>(v))
        return "null";
    if (auto l { std::get_if<std::vector<std::string>>(&v) }) {
        std::string out { "[" };
        for (size_t i = 0; i < l->size(); ++i) {
            if (i > 0)
                out += ",";
            out += (*l)[i];
        }
        return out + "]";
    }
    return *as_scalar_string(v);
}

std::optional<Operator> parse_operator(std::string_view s)
{
    for (auto op : { Operator::Eq, Operator::Neq, Operator::Gt, Operator::Gte, Operator::Lt, Operator::Lte, Operator::In, Operator::NotIn, Operator::Contains, Operator::HasFlag, Operator::Exists, Operator::NotExists }) {
        if (s == to_string(op))
            return op;
    }
    if (s == "==" || s == "=")
        return Operator::Eq;
    if (s == "!=")
        return Operator::Neq;
    if (s == ">")
        return Operator::Gt;
    if (s == ">=")
        return Operator::Gte;
    if (s == "<")
        return Operator::Lt;
    if (s == "<=")
        return Operator::Lte;
    return {};
}

const char* to_string(Operator op)
{
    switch (op) {
    case Operator::Eq:
        return "eq";
    case Operator::Neq:
        return "neq";
    case Operator::Gt:
        return "gt";
    case Operator::Gte:
        return "gte";
    case Operator::Lt:
        return "lt";
    case Operator::Lte:
        return "lte";
    case Operator::In:
        return "in";
    case Operator::NotIn:
        return "not_in";
    case Operator::Contains:
        return "contains";
    case Operator::HasFlag:
        return "has_flag";
    case Operator::Exists:
        return "exists";
    case Operator::NotExists:
        return "not_exists";
    }
    return "eq";
}

bool Condition::holds(const FieldValue& actual) const
{
    const bool missing { std::holds_alternative<std::monostate>(actual) };
    switch (op) {
    case Operator::Exists:
        return !missing;
    case Operator::NotExists:
        return missing;
    case Operator::Neq:
        return missing || !scalar_equal(actual, value);
    case Operator::NotIn:
        return missing || !is_in(actual, value);
    default:
        break;
    }
    if (missing)
        return false;

    switch (op) {
    case Operator::Eq:
        return scalar_equal(actual, value);
    case Operator::In:
        return is_in(actual, value);
    case Operator::Gt:
    case Operator::Gte:
    case Operator::Lt:
    case Operator::Lte: {
        auto c { numeric_compare(actual, value) };
        if (!c)
            return false;
        if (op == Operator::Gt)
            return *c > 0;
        if (op == Operator::Gte)
            return *c >= 0;
        if (op == Operator::Lt)
            return *c < 0;
        return *c <= 0;
    }
    case Operator::Contains:
    case Operator::HasFlag:
        if (auto list { std::get_if<std::vector<std::string>>(&actual) })
            return list_contains(*list, value);
        if (op == Operator::Contains) {
            auto haystack { as_scalar_string(actual) };
            auto needle { as_scalar_string(value) };
            return haystack && needle && haystack->find(*needle) != std::string::npos;
        }
        return false;
    default:
        return false;
    }
}
