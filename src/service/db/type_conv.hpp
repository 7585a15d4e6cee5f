#pragma once

#include "db/sqlite_fwd.hpp"
#include "decimal/decimal.hpp"
#include "general/with_uint64.hpp"
#include "ledger/entry.hpp"
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace sqlite {
class ColumnConverter {
    const Column& c;

public:
    int64_t getInt64() const noexcept { return c.getInt64(); }
    uint64_t getUInt64() const
    {
        auto i { getInt64() };
        if (i < 0) {
            throw std::runtime_error("Database might be corrupted. Expected non-negative value.");
        }
        return i;
    }

    uint64_t getUInt32() const
    {
        auto i { getUInt64() };
        if (i > std::numeric_limits<uint32_t>::max())
            throw std::runtime_error("Database might be corrupted. Value overflows uint32_t.");
        return i;
    }
    ColumnConverter(const Column& c)
        : c(c)
    {
    }

    operator int64_t() const { return getInt64(); }
    operator uint64_t() const { return getUInt64(); }
    operator uint32_t() const { return getUInt32(); }
    operator uint8_t() const
    {
        auto i { getUInt64() };
        if (i > std::numeric_limits<uint8_t>::max())
            throw std::runtime_error("Database might be corrupted. Value overflows uint8_t.");
        return i;
    }
    operator bool() const { return getInt64() != 0; }
    operator std::string() const { return c.getString(); }
    operator IsUint64() const { return IsUint64(getUInt64()); }
    operator EntryId() const { return EntryId(getUInt64()); }
    operator Decimal() const
    {
        auto d { Decimal::parse(c.getString()) };
        if (!d)
            throw std::runtime_error("Database corrupted, invalid decimal \"" + c.getString() + "\"");
        return *d;
    }
};

namespace bind_convert {
    inline auto convert(int64_t i) { return i; }
    inline auto convert(uint64_t i) { return (int64_t)i; }
    inline auto convert(uint32_t i) { return (int64_t)i; }
    inline auto convert(int32_t i) { return (int64_t)i; }
    inline auto convert(uint8_t i) { return (int64_t)i; }
    inline auto convert(bool b) { return (int64_t)(b ? 1 : 0); }
    inline auto convert(IsUint64 i) { return (int64_t)i.value(); }
    inline auto convert(const Decimal& d) { return d.to_string(); }
    inline const auto& convert(const std::string& s) { return s; }
    inline std::string convert(const char* s) { return s; }
}
}
