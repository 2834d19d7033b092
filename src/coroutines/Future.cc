#include "coroutines/Future.hh"

#include <utility>

namespace Trio {
namespace Coroutines {

void Future::nullResolve()
{
}

Future::Future() : resolveCallback {&nullResolve}, resolved {false}
{
}

void Future::resolve()
{
    if (resolved) {
        return;
    }
    resolved = true;
    // The callback may release the last reference to the awaiting coroutine
    const auto callback = std::exchange(resolveCallback, &nullResolve);
    callback();
}

}
}
