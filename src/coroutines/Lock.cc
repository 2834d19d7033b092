#include "coroutines/Lock.hh"

#include "coroutines/AsynchronousExecutionPolicy.hh"
#include "coroutines/Future.hh"
#include "Utility.hh"

#include <utility>

namespace Trio {
namespace Coroutines {

Mutex::Mutex() : locked {false}
{
}

void Mutex::lock(AsynchronousExecutionContext& context)
{
    if (!locked) {
        locked = true;
        return;
    }
    auto handover = std::make_shared<Future>();
    waiting.push_back(handover);
    context.await(std::move(handover));
}

void Mutex::unlock()
{
    if (waiting.empty()) {
        locked = false;
        return;
    }
    const auto next = std::move(waiting.front());
    waiting.pop_front();
    dereference(next).resolve();
}

Lock::Lock(AsynchronousExecutionContext& context, Mutex& mutex) :
    mutex {mutex}
{
    mutex.lock(context);
}

Lock::~Lock()
{
    mutex.unlock();
}

}
}
