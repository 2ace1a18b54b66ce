//----------------------------------------------------------------------------------------------------------------------
// File: Address.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Address.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Digits = "0123456789abcdef";

std::optional<std::uint8_t> ToNibble(char character);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Chain::Address::Address()
    : m_bytes()
{
    m_bytes.fill(0x00);
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address::Address(Bytes const& bytes)
    : m_bytes(bytes)
{
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Chain::Address> Chain::Address::FromString(std::string_view encoded)
{
    if (encoded.starts_with(Prefix) || encoded.starts_with("0X")) { encoded.remove_prefix(Prefix.size()); }
    if (encoded.size() != Size * 2) { return {}; }

    Bytes bytes;
    for (std::size_t idx = 0; idx < Size; ++idx) {
        auto const optHigh = local::ToNibble(encoded[idx * 2]);
        auto const optLow = local::ToNibble(encoded[idx * 2 + 1]);
        if (!optHigh || !optLow) { return {}; }
        bytes[idx] = static_cast<std::uint8_t>((*optHigh << 4) | *optLow);
    }

    return Address{ bytes };
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address::Bytes const& Chain::Address::GetBytes() const
{
    return m_bytes;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Chain::Address::ToString() const
{
    std::string encoded;
    encoded.reserve(EncodedSize);
    encoded.append(Prefix);
    for (auto const byte : m_bytes) {
        encoded.push_back(local::Digits[byte >> 4]);
        encoded.push_back(local::Digits[byte & 0x0F]);
    }
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

bool Chain::Address::IsZero() const
{
    return std::ranges::all_of(m_bytes, [] (std::uint8_t byte) { return byte == 0x00; });
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Chain::AddressHasher::operator()(Address const& address) const noexcept
{
    // FNV-1a over the address bytes.
    std::size_t hash = 14695981039346656037ULL;
    for (auto const byte : address.GetBytes()) {
        hash ^= byte;
        hash *= 1099511628211ULL;
    }
    return hash;
}

//----------------------------------------------------------------------------------------------------------------------

std::ostream& Chain::operator<<(std::ostream& stream, Address const& address)
{
    return stream << address.ToString();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint8_t> local::ToNibble(char character)
{
    if (character >= '0' && character <= '9') { return static_cast<std::uint8_t>(character - '0'); }
    if (character >= 'a' && character <= 'f') { return static_cast<std::uint8_t>(character - 'a' + 10); }
    if (character >= 'A' && character <= 'F') { return static_cast<std::uint8_t>(character - 'A' + 10); }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
