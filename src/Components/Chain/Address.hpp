//----------------------------------------------------------------------------------------------------------------------
// File: Address.hpp
// Description: A fixed width participant identifier. Addresses are the native width of EVM style domains and are
// exchanged in their 0x prefixed hexadecimal form.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "ChainTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Chain {
//----------------------------------------------------------------------------------------------------------------------

class Address;

struct AddressHasher;

std::ostream& operator<<(std::ostream& stream, Address const& address);

//----------------------------------------------------------------------------------------------------------------------
} // Chain namespace
//----------------------------------------------------------------------------------------------------------------------

class Chain::Address
{
public:
    static constexpr std::size_t Size = 20;
    static constexpr std::string_view Prefix = "0x";
    static constexpr std::size_t EncodedSize = Prefix.size() + Size * 2;

    using Bytes = std::array<std::uint8_t, Size>;

    Address();
    explicit Address(Bytes const& bytes);

    Address(Address const&) = default;
    Address(Address&&) = default;
    Address& operator=(Address const&) = default;
    Address& operator=(Address&&) = default;

    [[nodiscard]] bool operator==(Address const& other) const = default;
    [[nodiscard]] std::strong_ordering operator<=>(Address const& other) const = default;

    // Accepts exactly forty hexadecimal digits with or without the 0x prefix. Mixed case is accepted.
    [[nodiscard]] static std::optional<Address> FromString(std::string_view encoded);

    [[nodiscard]] Bytes const& GetBytes() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] bool IsZero() const;

private:
    Bytes m_bytes;
};

//----------------------------------------------------------------------------------------------------------------------

struct Chain::AddressHasher
{
    std::size_t operator()(Address const& address) const noexcept;
};

//----------------------------------------------------------------------------------------------------------------------

template <>
struct fmt::formatter<Chain::Address>
{
    constexpr auto parse(format_parse_context& ctx)
    {
        auto const begin = ctx.begin();
        if (begin != ctx.end() && *begin != '}') { throw format_error("invalid format"); }
        return begin;
    }

    template <typename FormatContext>
    auto format(Chain::Address const& address, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", address.ToString());
    }
};

//----------------------------------------------------------------------------------------------------------------------
