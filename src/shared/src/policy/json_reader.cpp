#include "json_reader.hpp"

using nlohmann::json;

void JsonReader::fail(const std::string& what) const
{
    throw ErrorMessage(code, context.empty() ? what : context + ": " + what);
}

void JsonReader::fail(const char* key, const std::string& what) const
{
    fail("\"" + std::string(key) + "\" " + what);
}

std::optional<Decimal> JsonReader::to_decimal(const json& j)
{
    if (j.is_string())
        return Decimal::parse(j.get<std::string>());
    if (j.is_number_unsigned())
        return Decimal::parse(std::to_string(j.get<uint64_t>()));
    if (j.is_number_integer())
        return Decimal(j.get<int64_t>());
    // binary floats are rejected, amounts must be exact
    return {};
}

std::optional<std::string> JsonReader::to_scalar_string(const json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    if (j.is_number_integer() || j.is_boolean())
        return j.dump();
    return {};
}

FieldValue JsonReader::to_field_value(const json& j)
{
    if (j.is_null())
        return std::monostate {};
    if (j.is_array()) {
        std::vector<std::string> out;
        for (auto& e : j) {
            if (auto s { to_scalar_string(e) })
                out.push_back(std::move(*s));
        }
        return out;
    }
    if (j.is_number_integer()) {
        if (auto d { to_decimal(j) })
            return *d;
    }
    if (auto s { to_scalar_string(j) })
        return *s;
    return std::monostate {};
}

std::string JsonReader::string(const char* key) const
{
    auto s { optional_string(key) };
    if (!s || s->empty())
        fail(key, "is required");
    return *s;
}

std::optional<std::string> JsonReader::optional_string(const char* key) const
{
    auto p { find(key) };
    if (!p)
        return {};
    if (!p->is_string())
        fail(key, "must be a string");
    return p->get<std::string>();
}

std::string JsonReader::string_or(const char* key, std::string def) const
{
    return optional_string(key).value_or(std::move(def));
}

bool JsonReader::boolean_or(const char* key, bool def) const
{
    auto p { find(key) };
    if (!p)
        return def;
    if (!p->is_boolean())
        fail(key, "must be a boolean");
    return p->get<bool>();
}

int64_t JsonReader::integer_or(const char* key, int64_t def) const
{
    auto p { find(key) };
    if (!p)
        return def;
    if (!p->is_number_integer())
        fail(key, "must be an integer");
    return p->get<int64_t>();
}

Decimal JsonReader::decimal(const char* key) const
{
    auto d { optional_decimal(key) };
    if (!d)
        fail(key, "is required");
    return *d;
}

std::optional<Decimal> JsonReader::optional_decimal(const char* key) const
{
    auto p { find(key) };
    if (!p)
        return {};
    auto d { to_decimal(*p) };
    if (!d)
        fail(key, "is not a valid decimal (use a string or an integer)");
    return d;
}

std::vector<std::string> JsonReader::strings(const char* key) const
{
    std::vector<std::string> out;
    auto p { find(key) };
    if (!p)
        return out;
    if (p->is_string()) {
        out.push_back(p->get<std::string>());
        return out;
    }
    if (!p->is_array())
        fail(key, "must be an array of strings");
    for (auto& e : *p) {
        if (!e.is_string())
            fail(key, "must be an array of strings");
        out.push_back(e.get<std::string>());
    }
    return out;
}

std::map<std::string, std::string> JsonReader::string_map(const char* key) const
{
    std::map<std::string, std::string> out;
    auto p { find(key) };
    if (!p)
        return out;
    if (!p->is_object())
        fail(key, "must be an object");
    for (auto& [k, v] : p->items()) {
        auto s { to_scalar_string(v) };
        if (!s)
            fail(key, "values must be strings");
        out.emplace(k, std::move(*s));
    }
    return out;
}

std::map<std::string, Decimal> JsonReader::decimal_map(const char* key) const
{
    std::map<std::string, Decimal> out;
    auto p { find(key) };
    if (!p)
        return out;
    if (!p->is_object())
        fail(key, "must be an object");
    for (auto& [k, v] : p->items()) {
        auto d { to_decimal(v) };
        if (!d)
            fail(key, "value of \"" + k + "\" is not a valid decimal");
        out.emplace(k, std::move(*d));
    }
    return out;
}
