/** \file
 *
 * \brief Utilities for converting between JSON and Trio types
 */

#ifndef MESSAGING_JSONSERIALIZERUTILITY_HH_
#define MESSAGING_JSONSERIALIZERUTILITY_HH_

#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace nlohmann {

/** \brief JSON converter for optional types
 *
 * An empty optional is \c null.
 */
template<typename T>
struct adl_serializer<std::optional<T>>
{
    /** \brief Convert optional type to JSON
     */
    static void to_json(json&, const std::optional<T>&);

    /** \brief Convert JSON to optional type
     */
    static void from_json(const json&, std::optional<T>&);
};

template<typename T>
void adl_serializer<std::optional<T>>::to_json(
    json& j, const std::optional<T>& t)
{
    if (t) {
        j = *t;
    } else {
        j = nullptr;
    }
}

template<typename T>
void adl_serializer<std::optional<T>>::from_json(
    const json& j, std::optional<T>& t)
{
    if (j.is_null()) {
        t = std::nullopt;
    } else {
        t = j.get<T>();
    }
}

}

namespace Trio {
namespace Messaging {

/** \brief Convert an enumeration to JSON string
 *
 * \param e the enumeration
 * \param map the left view of the enumeration to string bimap
 *
 * \throw SerializationFailureException if \p e is not in \p map
 */
template<typename Enum, typename LeftMap>
nlohmann::json enumToJson(const Enum e, const LeftMap& map)
{
    const auto iter = map.find(e);
    if (iter == map.end()) {
        throw SerializationFailureException {"Unknown enumeration"};
    }
    return iter->second;
}

}
}

#endif // MESSAGING_JSONSERIALIZERUTILITY_HH_
