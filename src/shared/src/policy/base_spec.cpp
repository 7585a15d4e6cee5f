#include "base_spec.hpp"
#include "nlohmann/json.hpp"

using nlohmann::json;

namespace {
Result<BaseSpec::Expr> parse_expr(const json& j, size_t depth)
{
    if (depth > 32)
        return { INVALID_BASE_SPEC, "base expression nested too deeply" };
    if (j.is_string()) {
        auto name { j.get<std::string>() };
        if (name.empty())
            return { INVALID_BASE_SPEC, "empty field name in base expression" };
        return BaseSpec::Expr { BaseSpec::Field { std::move(name) } };
    }
    if (!j.is_object())
        return { INVALID_BASE_SPEC, "base expression must be a string or an object" };

    if (auto it { j.find("fields") }; it != j.end()) {
        if (!it->is_array() || it->empty())
            return { INVALID_BASE_SPEC, "\"fields\" must be a non-empty array" };
        BaseSpec::Add add;
        for (auto& f : *it) {
            auto e { parse_expr(f, depth + 1) };
            if (!e)
                return e.error();
            add.operands.push_back(std::move(*e));
        }
        if (add.operands.size() == 1)
            return std::move(add.operands[0]);
        return BaseSpec::Expr { std::move(add) };
    }

    auto it { j.find("op") };
    if (it == j.end() || !it->is_string())
        return { INVALID_BASE_SPEC, "base expression object needs an \"op\"" };
    auto op { it->get<std::string>() };
    if (op == "field") {
        auto f { j.find("field") };
        if (f == j.end())
            return { INVALID_BASE_SPEC, "field node without \"field\"" };
        return parse_expr(*f, depth + 1);
    }
    if (op == "add") {
        auto l { j.find("left") };
        auto r { j.find("right") };
        if (l == j.end() || r == j.end())
            return { INVALID_BASE_SPEC, "add node needs \"left\" and \"right\"" };
        auto left { parse_expr(*l, depth + 1) };
        if (!left)
            return left.error();
        auto right { parse_expr(*r, depth + 1) };
        if (!right)
            return right.error();
        BaseSpec::Add add;
        add.operands.push_back(std::move(*left));
        add.operands.push_back(std::move(*right));
        return BaseSpec::Expr { std::move(add) };
    }
    return { INVALID_BASE_SPEC, "unsupported base operation \"" + op + "\"" };
}

json expr_json(const BaseSpec::Expr& e)
{
    if (auto f { std::get_if<BaseSpec::Field>(&e.node) })
        return f->name;
    auto& add { std::get<BaseSpec::Add>(e.node) };
    json j = expr_json(add.operands[0]);
    for (size_t i = 1; i < add.operands.size(); ++i) {
        j = json {
            { "op", "add" },
            { "left", std::move(j) },
            { "right", expr_json(add.operands[i]) }
        };
    }
    return j;
}

std::string expr_string(const BaseSpec::Expr& e)
{
    if (auto f { std::get_if<BaseSpec::Field>(&e.node) })
        return f->name;
    auto& add { std::get<BaseSpec::Add>(e.node) };
    std::string out { "add(" };
    for (size_t i = 0; i < add.operands.size(); ++i) {
        if (i > 0)
            out += ",";
        out += expr_string(add.operands[i]);
    }
    return out + ")";
}

void collect_fields(const BaseSpec::Expr& e, std::vector<std::string>& out)
{
    if (auto f { std::get_if<BaseSpec::Field>(&e.node) }) {
        out.push_back(f->name);
        return;
    }
    for (auto& o : std::get<BaseSpec::Add>(e.node).operands)
        collect_fields(o, out);
}

Result<Decimal> evaluate_expr(const BaseSpec::Expr& e, const BaseSpec::lookup_t& lookup)
{
    if (auto f { std::get_if<BaseSpec::Field>(&e.node) }) {
        if (auto v { lookup(f->name) })
            return *v;
        return { MISSING_BASE_FIELD, "missing base field \"" + f->name + "\"" };
    }
    Decimal sum;
    for (auto& o : std::get<BaseSpec::Add>(e.node).operands) {
        auto v { evaluate_expr(o, lookup) };
        if (!v)
            return v.error();
        sum += *v;
    }
    return sum;
}
}

BaseSpec BaseSpec::field(std::string name)
{
    return BaseSpec { Expr { Field { std::move(name) } } };
}

BaseSpec BaseSpec::add(BaseSpec left, BaseSpec right)
{
    Add a;
    a.operands.push_back(std::move(left.root));
    a.operands.push_back(std::move(right.root));
    return BaseSpec { Expr { std::move(a) } };
}

BaseSpec BaseSpec::sum(const std::vector<std::string>& fields)
{
    if (fields.empty())
        return field("net");
    BaseSpec res { field(fields[0]) };
    for (size_t i = 1; i < fields.size(); ++i)
        res = add(std::move(res), field(fields[i]));
    return res;
}

Result<BaseSpec> BaseSpec::from_json(const json& j)
{
    auto e { parse_expr(j, 0) };
    if (!e)
        return e.error();
    return BaseSpec { std::move(*e) };
}

json BaseSpec::to_json() const
{
    return expr_json(root);
}

std::string BaseSpec::to_string() const
{
    return expr_string(root);
}

std::vector<std::string> BaseSpec::fields() const
{
    std::vector<std::string> out;
    collect_fields(root, out);
    return out;
}

Result<Decimal> BaseSpec::evaluate(const lookup_t& lookup) const
{
    return evaluate_expr(root, lookup);
}
