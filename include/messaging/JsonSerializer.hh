/** \file
 *
 * \brief Definition of Trio::Messaging::JsonSerializer
 *
 * \page serializationpolicy SerializationPolicy concept
 *
 * A serialization policy converts the values of command arguments, replies
 * and events to and from frames. Given a policy \c s, \c s.serialize(t)
 * returns a contiguous container of bytes (a string) for a value \c t, and \c
 * s.template deserialize<T>(bytes) returns a value of type \c T parsed from a
 * ByteSpan. Deserialization failures are reported by throwing
 * Trio::Messaging::SerializationFailureException.
 */

#ifndef MESSAGING_JSONSERIALIZER_HH_
#define MESSAGING_JSONSERIALIZER_HH_

#include "messaging/SerializationFailureException.hh"
#include "Blob.hh"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace Trio {
namespace Messaging {

/** \brief Serialization policy that uses JSON
 *
 * All values in the Trio protocol, including plain strings and integers, are
 * sent as JSON documents.
 */
struct JsonSerializer {

    /** \brief Serialize an object
     *
     * \return the dump of the JSON conversion of \p t
     */
    template<typename T>
    static std::string serialize(T&& t)
    {
        return nlohmann::json(std::forward<T>(t)).dump();
    }

    /** \brief Deserialize an object
     *
     * \param bytes the JSON document
     *
     * \return the JSON document converted to \c T
     *
     * \throw SerializationFailureException if \p bytes is not valid JSON or
     * cannot be converted to \c T
     */
    template<typename T>
    static T deserialize(const ByteSpan bytes)
    {
        const auto sv = std::string_view(
            reinterpret_cast<const char*>(bytes.data()), bytes.size());
        try {
            return nlohmann::json::parse(sv).template get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationFailureException {e.what()};
        }
    }
};

}
}

#endif // MESSAGING_JSONSERIALIZER_HH_
