#pragma once
#include "decimal/decimal.hpp"
#include "general/result.hpp"
#include "nlohmann/json_fwd.hpp"
#include <functional>
#include <string>
#include <variant>
#include <vector>

// Expression selecting the amount a rate or tier applies to. The default
// builder only knows field references and sums of them.
class BaseSpec {
public:
    struct Expr;
    struct Field {
        std::string name;
    };
    struct Add {
        std::vector<Expr> operands;
    };
    struct Expr {
        std::variant<Field, Add> node;
    };

    using lookup_t = std::function<std::optional<Decimal>(const std::string&)>;

    BaseSpec()
        : BaseSpec(field("net"))
    {
    }
    static BaseSpec field(std::string name);
    static BaseSpec add(BaseSpec left, BaseSpec right);
    static BaseSpec sum(const std::vector<std::string>& fields);

    // accepts "net", {"op":"add","left":..,"right":..}, {"op":"field","field":..}
    // and {"fields":[..]}
    [[nodiscard]] static Result<BaseSpec> from_json(const nlohmann::json&);
    nlohmann::json to_json() const;
    std::string to_string() const;
    std::vector<std::string> fields() const;

    [[nodiscard]] Result<Decimal> evaluate(const lookup_t& lookup) const;

private:
    explicit BaseSpec(Expr e)
        : root(std::move(e))
    {
    }
    Expr root;
};
