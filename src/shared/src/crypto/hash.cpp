#include "hash.hpp"
#include "general/hex.hpp"

std::string Hash::hex_string() const
{
    return serialize_hex(*this);
}
