/** \file
 *
 * \brief Definition of Trio::Blob and Trio::ByteSpan
 */

#ifndef BLOB_HH_
#define BLOB_HH_

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace Trio {

/** \brief Owned binary data, such as a message frame or a routing id
 */
class Blob : public std::vector<std::byte> {
public:
    using std::vector<std::byte>::vector;
};

/** \brief Non‐owning view to bytes, comparable by content
 */
class ByteSpan : public std::span<const std::byte>
{
public:
    using std::span<const std::byte>::span;
};

/** \brief Lexicographical comparison of the bytes
 */
constexpr auto operator<=>(const ByteSpan& lhs, const ByteSpan& rhs)
{
    return std::lexicographical_compare_three_way(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

/** \brief Bytewise equality
 */
constexpr bool operator==(const ByteSpan& lhs, const ByteSpan& rhs)
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

/** \brief Copy a range of one byte objects into a string
 */
template<typename ByteRange>
std::string blobToString(const ByteRange& bytes)
{
    static_assert(
        sizeof(*std::data(bytes)) == 1,
        "Argument must contain one byte values");
    return std::string(
        reinterpret_cast<const char*>(std::data(bytes)), std::size(bytes));
}

/** \brief Copy a string into a blob
 */
template<typename String>
Blob stringToBlob(const String& string)
{
    static_assert(
        sizeof(*std::data(string)) == 1,
        "Argument must contain one byte values");
    const auto* first = reinterpret_cast<const std::byte*>(std::data(string));
    return Blob(first, first + std::size(string));
}

/// \cond DOXYGEN_IGNORE

namespace BlobImpl {

// zmq::message_t exposes its data as void*, counted in bytes
template<typename Pointer>
constexpr std::size_t elementSize()
{
    using Element = std::remove_cv_t<std::remove_pointer_t<Pointer>>;
    if constexpr (std::is_void_v<Element>) {
        return 1;
    } else {
        return sizeof(Element);
    }
}

}

/// \endcond

/** \brief View the object representation of a contiguous container
 */
template<typename Container>
ByteSpan asBytes(const Container& container)
{
    const auto* data = reinterpret_cast<const std::byte*>(std::data(container));
    const auto size = std::size(container) *
        BlobImpl::elementSize<decltype(std::data(container))>();
    return {data, static_cast<ByteSpan::size_type>(size)};
}

inline namespace BlobLiterals {

/** \brief Blob from a string literal
 */
inline Blob operator"" _B(const char* str, std::size_t len)
{
    const auto* first = reinterpret_cast<const std::byte*>(str);
    return Blob(first, first + len);
}

/** \brief Byte span over a string literal
 */
inline ByteSpan operator"" _BS(const char* str, std::size_t len)
{
    return ByteSpan(reinterpret_cast<const std::byte*>(str), len);
}

}

}

#endif // BLOB_HH_
