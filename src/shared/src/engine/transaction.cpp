#include "transaction.hpp"
#include "policy/json_reader.hpp"
#include <set>

using nlohmann::json;

namespace {
// aliases used by tier_by
std::string canonical_field(const std::string& field)
{
    if (field == "line_total" || field == "order_total")
        return "net";
    if (field == "order_gross")
        return "gross";
    if (field == "qty")
        return "quantity";
    return field;
}

LineInput parse_line(const json& j, size_t index)
{
    JsonReader r(j, INVALID_LINE, "line #" + std::to_string(index + 1));
    LineInput l;
    l.lineId = r.optional_string("line_id");
    l.net = r.optional_decimal("net");
    l.gross = r.optional_decimal("gross");
    l.tax = r.decimal_or("tax", Decimal::zero());
    l.taxRate = r.optional_decimal("tax_rate");
    l.quantity = r.decimal_or("quantity", Decimal(1));
    l.shipping = r.decimal_or("shipping", Decimal::zero());
    l.discount = r.decimal_or("discount", Decimal::zero());
    l.unitPrice = r.optional_decimal("unit_price");
    l.category = r.string_or("category", "");
    l.sku = r.string_or("sku", "");
    l.flags = r.strings("flags");
    l.attributes = r.string_map("attributes");
    l.amounts = r.decimal_map("amounts");
    return l;
}
}

Result<Transaction> Transaction::from_json(const json& j)
{
    try {
        JsonReader r(j, INVALID_LINE, "transaction");
        Transaction t;
        t.transactionId = r.string_or("transaction_id", "");
        t.channelKey = r.string_or("channel_key", "");
        t.currency = r.optional_string("currency");
        t.asOf = r.optional_string("as_of");
        t.idempotencyKey = r.optional_string("idempotency_key");
        t.context = r.string_map("context");
        if (auto lines { r.find("lines") }) {
            if (!lines->is_array())
                r.fail("lines", "must be an array");
            for (size_t i = 0; i < lines->size(); ++i)
                t.lines.push_back(parse_line((*lines)[i], i));
        }
        if (auto o { r.find("order") }) {
            JsonReader orr(*o, INVALID_LINE, "order");
            t.order.net = orr.optional_decimal("net");
            t.order.gross = orr.optional_decimal("gross");
            t.order.tax = orr.optional_decimal("tax");
            t.order.shipping = orr.optional_decimal("shipping");
            t.order.discount = orr.optional_decimal("discount");
            t.order.quantity = orr.optional_decimal("quantity");
        }
        return t;
    } catch (const ErrorMessage& e) {
        return e;
    } catch (const nlohmann::json::exception& e) {
        return { INVALID_LINE, e.what() };
    }
}

std::optional<Decimal> Line::amount(const std::string& f) const
{
    auto field { canonical_field(f) };
    if (field == "net")
        return net;
    if (field == "gross")
        return gross;
    if (field == "tax")
        return tax;
    if (field == "quantity")
        return quantity;
    if (field == "shipping")
        return shipping;
    if (field == "discount")
        return discount;
    if (field == "unit_price")
        return unitPrice;
    if (auto it { amounts.find(field) }; it != amounts.end())
        return it->second;
    return {};
}

FieldValue Line::value(const std::string& path) const
{
    if (path == "line_id" || path == "id")
        return id;
    if (path == "category")
        return category;
    if (path == "sku")
        return sku;
    if (path == "flags")
        return flags;
    constexpr std::string_view attr { "attributes." };
    if (path.starts_with(attr)) {
        if (auto it { attributes.find(path.substr(attr.size())) }; it != attributes.end())
            return it->second;
        return std::monostate {};
    }
    if (auto a { amount(path) })
        return *a;
    return std::monostate {};
}

std::optional<Decimal> OrderTotals::amount(const std::string& f) const
{
    auto field { canonical_field(f) };
    if (field == "net")
        return net;
    if (field == "gross")
        return gross;
    if (field == "tax")
        return tax;
    if (field == "quantity")
        return quantity;
    if (field == "shipping")
        return shipping;
    if (field == "discount")
        return discount;
    if (field == "unit_price") {
        if (quantity.is_zero())
            return Decimal::zero();
        return Decimal::div_throw(net, quantity, Decimal::ratioScale);
    }
    return {};
}

Result<NormalizedInput> normalize(const Transaction& tx, uint8_t precision)
{
    if (tx.lines.empty())
        return { MISSING_LINES, "transaction has no lines" };

    const uint32_t internalScale { uint32_t(precision) + 6 };
    NormalizedInput out;
    std::set<std::string> ids;
    for (size_t i = 0; i < tx.lines.size(); ++i) {
        auto& in { tx.lines[i] };
        Line l;
        l.id = in.lineId.value_or("LINE-" + std::to_string(i + 1));
        if (!ids.insert(l.id).second)
            return { INVALID_LINE, "duplicate line_id \"" + l.id + "\"" };
        if (!in.net && !in.gross)
            return { INVALID_LINE, "line \"" + l.id + "\" needs net or gross" };
        if (in.quantity.is_negative())
            return { INVALID_LINE, "line \"" + l.id + "\" has a negative quantity" };

        l.tax = in.tax;
        if (in.net) {
            l.net = *in.net;
            l.gross = in.gross ? *in.gross : l.net + l.tax;
        } else {
            l.gross = *in.gross;
            if (in.taxRate) {
                auto divisor { Decimal(1) + Decimal::percent(Decimal(1), *in.taxRate) };
                auto net { Decimal::div(l.gross, divisor, internalScale) };
                if (!net)
                    return { INVALID_LINE, "line \"" + l.id + "\" has tax_rate -100" };
                l.net = *net;
                l.tax = l.gross - l.net;
            } else {
                l.net = l.gross - l.tax;
            }
        }
        l.quantity = in.quantity;
        l.shipping = in.shipping;
        l.discount = in.discount;
        if (in.unitPrice)
            l.unitPrice = *in.unitPrice;
        else
            l.unitPrice = Decimal::div_or_zero(l.net, l.quantity, internalScale);
        l.category = in.category;
        l.sku = in.sku;
        l.flags = in.flags;
        l.attributes = in.attributes;
        l.amounts = in.amounts;

        out.order.net += l.net;
        out.order.gross += l.gross;
        out.order.tax += l.tax;
        out.order.shipping += l.shipping;
        out.order.discount += l.discount;
        out.order.quantity += l.quantity;
        out.lines.push_back(std::move(l));
    }

    // explicit order totals win over line sums
    auto& o { tx.order };
    if (o.net)
        out.order.net = *o.net;
    if (o.gross)
        out.order.gross = *o.gross;
    else if (o.net || o.tax)
        out.order.gross = out.order.net + (o.tax ? *o.tax : out.order.tax);
    if (o.tax)
        out.order.tax = *o.tax;
    if (o.shipping)
        out.order.shipping = *o.shipping;
    if (o.discount)
        out.order.discount = *o.discount;
    if (o.quantity)
        out.order.quantity = *o.quantity;
    return out;
}
