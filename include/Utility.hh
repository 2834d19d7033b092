/** \file
 *
 * \brief Definition of Trio::dereference
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <stdexcept>

namespace Trio {

/** \brief Dereference a smart or raw pointer, throwing if it is null
 *
 * Used where a room, player or socket is looked up through a pointer that
 * an earlier check should have made valid.
 *
 * \throw std::invalid_argument if \p p is null
 */
template<typename Pointer>
constexpr decltype(auto) dereference(const Pointer& p)
{
    if (!p) {
        throw std::invalid_argument {"Null pointer dereferenced"};
    }
    return *p;
}

}

#endif // UTILITY_HH_
