/** \file
 *
 * \brief Hexadecimal output of binary data
 */

#ifndef HEXUTILITY_HH_
#define HEXUTILITY_HH_

#include <array>
#include <cstdint>
#include <iterator>
#include <ostream>
#include <string>
#include <utility>

namespace Trio {

/// \cond DOXYGEN_IGNORE

namespace HexUtilityImpl {

inline constexpr std::array<char, 16> HEXS {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
};

template<typename Data>
struct HexFormatter {
    Data data;
};

}

/// \endcond

/** \brief Encode a byte sequence as lowercase hex
 *
 * \param first, last the bytes to encode (one byte values)
 * \param out the output iterator receiving the characters
 *
 * \return \p out advanced past the written characters
 */
template<typename InputIterator, typename OutputIterator>
OutputIterator encodeHex(
    InputIterator first, InputIterator last, OutputIterator out)
{
    using InputByte = typename std::iterator_traits<InputIterator>::value_type;
    static_assert(sizeof(InputByte) == 1, "Input must be byte sequence");
    for (; first != last; ++first) {
        const auto c = static_cast<std::uint8_t>(*first);
        *out++ = HexUtilityImpl::HEXS[c >> 4];
        *out++ = HexUtilityImpl::HEXS[c & 0x0f];
    }
    return out;
}

/** \brief Hex encode a range of bytes into a string
 */
template<typename Bytes>
std::string toHex(const Bytes& bytes)
{
    auto ret = std::string {};
    ret.reserve(2 * std::size(bytes));
    encodeHex(std::begin(bytes), std::end(bytes), std::back_inserter(ret));
    return ret;
}

/// \cond DOXYGEN_IGNORE

namespace HexUtilityImpl {

template<typename Data>
std::ostream& operator<<(std::ostream& out, const HexFormatter<Data>& formatter)
{
    std::ostream::sentry s {out};
    if (s) {
        encodeHex(
            std::begin(formatter.data), std::end(formatter.data),
            std::ostreambuf_iterator {out});
    }
    return out;
}

}

/// \endcond

/** \brief Stream binary data as hex without copying it
 *
 * Used for printing routing ids in the log.
 */
template<typename Data>
auto formatHex(Data&& data)
{
    return HexUtilityImpl::HexFormatter<Data> {std::forward<Data>(data)};
}

}

#endif // HEXUTILITY_HH_
