#pragma once
#include <array>
#include <cstdint>
#include <string>

class Hash : public std::array<uint8_t, 32> {
    Hash() = default;

public:
    static constexpr size_t byte_size() { return 32; }
    static Hash uninitialized()
    {
        return {};
    }
    Hash(std::array<uint8_t, 32> other)
        : array(std::move(other))
    {
    }
    Hash(const Hash&) = default;
    Hash(Hash&&) = default;
    std::string hex_string() const;
    Hash& operator=(const Hash&) = default;
    bool operator==(const Hash&) const = default;
    bool operator!=(const Hash&) const = default;
};
