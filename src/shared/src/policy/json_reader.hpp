#pragma once
#include "condition.hpp"
#include "decimal/decimal.hpp"
#include "general/errors.hpp"
#include "nlohmann/json.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Typed access to JSON objects. Conversion failures throw ErrorMessage
// carrying the code passed at construction, callers convert to Result.
class JsonReader {
public:
    JsonReader(const nlohmann::json& obj, Error code, std::string context = {})
        : obj(obj)
        , code(code)
        , context(std::move(context))
    {
        if (!obj.is_object())
            fail("expected an object");
    }

    bool has(const char* key) const
    {
        auto it { obj.find(key) };
        return it != obj.end() && !it->is_null();
    }
    const nlohmann::json* find(const char* key) const
    {
        auto it { obj.find(key) };
        if (it == obj.end() || it->is_null())
            return nullptr;
        return &*it;
    }

    std::string string(const char* key) const;
    std::optional<std::string> optional_string(const char* key) const;
    std::string string_or(const char* key, std::string def) const;
    bool boolean_or(const char* key, bool def) const;
    int64_t integer_or(const char* key, int64_t def) const;
    Decimal decimal(const char* key) const;
    std::optional<Decimal> optional_decimal(const char* key) const;
    Decimal decimal_or(const char* key, Decimal def) const { return optional_decimal(key).value_or(std::move(def)); }
    std::vector<std::string> strings(const char* key) const;
    std::map<std::string, std::string> string_map(const char* key) const;
    std::map<std::string, Decimal> decimal_map(const char* key) const;

    [[noreturn]] void fail(const std::string& what) const;
    [[noreturn]] void fail(const char* key, const std::string& what) const;

    static std::optional<Decimal> to_decimal(const nlohmann::json&);
    static std::optional<std::string> to_scalar_string(const nlohmann::json&);
    static FieldValue to_field_value(const nlohmann::json&);

    const nlohmann::json& obj;
    Error code;
    std::string context;
};
