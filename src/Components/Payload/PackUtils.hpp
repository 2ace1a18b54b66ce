//----------------------------------------------------------------------------------------------------------------------
// File: PackUtils.hpp
// Description: Packing and unpacking of 32 byte big endian words, the unit of the relay service's tuple layout.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/endian/conversion.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace PackUtils {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t WordSize = 32;

[[nodiscard]] constexpr std::size_t PaddedSize(std::size_t size)
{
    return ((size + WordSize - 1) / WordSize) * WordSize;
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Integral values are right aligned in the word, the leading bytes are zero filled.
//----------------------------------------------------------------------------------------------------------------------
template<std::unsigned_integral Source>
void PackWord(Source source, std::vector<std::uint8_t>& destination)
{
    constexpr std::size_t SourceBytes = sizeof(Source);
    destination.resize(destination.size() + WordSize - SourceBytes, 0x00);

    auto const size = destination.size();
    destination.resize(size + SourceBytes, 0x00);
    boost::endian::endian_store<Source, SourceBytes, boost::endian::order::big>(destination.data() + size, source);
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Fixed width buffers smaller than a word are right aligned in the same manner as integral values.
//----------------------------------------------------------------------------------------------------------------------
template<std::size_t BufferSize> requires (BufferSize <= WordSize)
void PackWord(std::array<std::uint8_t, BufferSize> const& source, std::vector<std::uint8_t>& destination)
{
    destination.resize(destination.size() + WordSize - BufferSize, 0x00);
    destination.insert(destination.end(), source.begin(), source.end());
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Variable length buffers are left aligned and zero padded to the next word boundary. The caller is responsible
// for packing the length word that precedes the buffer.
//----------------------------------------------------------------------------------------------------------------------
inline void PackPadded(std::string_view source, std::vector<std::uint8_t>& destination)
{
    destination.insert(destination.end(), source.begin(), source.end());
    destination.resize(destination.size() + PaddedSize(source.size()) - source.size(), 0x00);
}

//----------------------------------------------------------------------------------------------------------------------

template<std::random_access_iterator Source>
[[nodiscard]] bool IsZeroFilled(Source begin, Source const& end)
{
    return std::all_of(begin, end, [] (std::uint8_t byte) { return byte == 0x00; });
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Unpacking fails if the word's leading bytes can not be represented by the destination type.
//----------------------------------------------------------------------------------------------------------------------
template<std::random_access_iterator Source, std::unsigned_integral Destination>
[[nodiscard]] bool UnpackWord(Source& begin, Source const& end, Destination& destination)
{
    constexpr std::size_t DestinationBytes = sizeof(Destination);
    constexpr std::size_t PaddingBytes = WordSize - DestinationBytes;

    // If the buffer does not contain enough data to unpack the chunk unpacking cannot occur.
    if (std::cmp_less(std::distance(begin, end), WordSize)) { return false; }
    if (!IsZeroFilled(begin, begin + PaddingBytes)) { return false; }

    std::array<std::uint8_t, DestinationBytes> bytes;
    std::copy_n(begin + PaddingBytes, DestinationBytes, bytes.begin());
    destination = boost::endian::endian_load<Destination, DestinationBytes, boost::endian::order::big>(bytes.data());

    begin += WordSize;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

template<std::random_access_iterator Source, std::size_t BufferSize> requires (BufferSize <= WordSize)
[[nodiscard]] bool UnpackWord(Source& begin, Source const& end, std::array<std::uint8_t, BufferSize>& destination)
{
    constexpr std::size_t PaddingBytes = WordSize - BufferSize;

    if (std::cmp_less(std::distance(begin, end), WordSize)) { return false; }
    if (!IsZeroFilled(begin, begin + PaddingBytes)) { return false; }

    std::copy_n(begin + PaddingBytes, BufferSize, destination.begin());

    begin += WordSize;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
// Note: The padding following the buffer must be zero filled and is consumed along with the buffer.
//----------------------------------------------------------------------------------------------------------------------
template<std::random_access_iterator Source>
[[nodiscard]] bool UnpackPadded(Source& begin, Source const& end, std::string& destination, std::size_t count)
{
    auto const padded = PaddedSize(count);
    if (std::cmp_less(std::distance(begin, end), padded)) { return false; }

    auto const boundary = begin + count;
    if (!IsZeroFilled(boundary, begin + padded)) { return false; }

    destination.assign(begin, boundary);

    begin += padded;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
} // PackUtils namespace
//----------------------------------------------------------------------------------------------------------------------
