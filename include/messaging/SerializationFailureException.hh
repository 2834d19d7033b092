/** \file
 *
 * \brief Definition of Trio::Messaging::SerializationFailureException
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <stdexcept>

namespace Trio {
namespace Messaging {

/** \brief A value received from or sent to a client could not be converted
 *
 * Thrown by the serialization policies. BasicFunctionMessageHandler turns it
 * into a failed reply.
 */
class SerializationFailureException : public std::runtime_error {
public:

    SerializationFailureException() :
        std::runtime_error {"Serialization failure"}
    {
    }

    using std::runtime_error::runtime_error;
};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
