#pragma once
#include "nlohmann/json_fwd.hpp"
#include <cstdint>

struct IsUint64 {
public:
    explicit IsUint64(int64_t w);
    explicit IsUint64(int w)
        : IsUint64((int64_t)(w)) { };
    explicit constexpr IsUint64(uint64_t val)
        : val(val) { };

    bool operator==(const IsUint64&) const = default;
    auto operator<=>(const IsUint64&) const = default;

    operator nlohmann::json() const;
    uint64_t value() const
    {
        return val;
    }

protected:
    uint64_t val;
};
