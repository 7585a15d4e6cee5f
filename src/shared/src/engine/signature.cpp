#include "signature.hpp"
#include "crypto/hasher_sha256.hpp"
#include "nlohmann/json.hpp"

using nlohmann::json;

json signature_payload(const Calculation& c, const std::map<std::string, std::string>& context)
{
    json input(to_json(c.input));
    input["context"] = context;
    input["channel"] = c.channelKey;
    input["currency"] = c.currency;

    json breakdown(json::array());
    for (auto& e : c.breakdown)
        breakdown.push_back({ { "component_id", e.componentId }, { "amount", e.amount.to_string(c.precision) } });

    return {
        { "engine_version", c.meta.engineVersion },
        { "policy_hash", c.meta.policyHash },
        { "precision", c.precision },
        { "input", std::move(input) },
        { "total_fee", c.totalFee.to_string(c.precision) },
        { "breakdown", std::move(breakdown) }
    };
}

std::string compute_signature(const Calculation& c, const std::map<std::string, std::string>& context)
{
    // object keys of nlohmann::json are sorted, so dump() is canonical
    return hashSHA256(signature_payload(c, context).dump()).hex_string();
}
