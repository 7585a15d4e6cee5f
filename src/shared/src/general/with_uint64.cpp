#include "with_uint64.hpp"
#include "general/errors.hpp"
#include "nlohmann/json.hpp"

IsUint64::IsUint64(int64_t w)
    : val(w)
{
    if (w < 0)
        throw Error(EBUG);
}

IsUint64::operator nlohmann::json() const
{
    return nlohmann::json(val);
};
