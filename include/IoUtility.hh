/** \file
 *
 * \brief Stream helpers shared by the Trio modules
 */

#ifndef IOUTILITY_HH_
#define IOUTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace Trio {

/** \brief Write an optional value
 *
 * Writes the contained value, or “(none)” if \p t is empty.
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    if (t) {
        return os << *t;
    }
    return os << "(none)";
}

/** \brief Write the active alternative of a variant
 */
template<typename T, typename... Ts>
std::ostream& operator<<(std::ostream& os, const std::variant<T, Ts...>& t)
{
    std::visit([&os](const auto& v) { os << v; }, t);
    return os;
}

/** \brief Output an enumeration using a lookup map
 *
 * \param os the output stream
 * \param e the enumeration value
 * \param map a map (or a bimap view) from the enumeration to its name
 *
 * \return \p os
 */
template<typename Enum, typename Map>
std::ostream& outputEnum(std::ostream& os, const Enum e, const Map& map)
{
    const auto iter = map.find(e);
    if (iter == map.end()) {
        return os << "(invalid)";
    }
    return os << iter->second;
}

/** \brief Invoke a callback with a stream opened from \p path
 *
 * A hyphen (“-”) selects \c std::cin. Any other \p path is opened as a file
 * that stays open for the duration of the call.
 *
 * \param path a filesystem path or a hyphen
 * \param callback callable accepting \c std::istream&
 *
 * \return whatever \p callback returns
 *
 * \throw std::runtime_error if the file cannot be opened
 */
template<typename Callable>
decltype(auto) processStreamFromPath(std::string_view path, Callable&& callback)
{
    if (path == "-") {
        return std::invoke(std::forward<Callable>(callback), std::cin);
    }
    auto in = std::ifstream {std::string {path}};
    if (!in) {
        throw std::runtime_error {
            "Could not open " + std::string {path}};
    }
    return std::invoke(std::forward<Callable>(callback), in);
}

}

#endif // IOUTILITY_HH_
