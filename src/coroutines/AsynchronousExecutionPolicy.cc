#include "coroutines/AsynchronousExecutionPolicy.hh"

#include "coroutines/Future.hh"
#include "messaging/CallbackScheduler.hh"

#include <stdexcept>

namespace Trio {
namespace Coroutines {

AsynchronousExecutionContext::AsynchronousExecutionContext(
    CoroutineAdapter::Sink& sink,
    std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler) :
    sink {&sink},
    callbackScheduler {std::move(callbackScheduler)}
{
}

void AsynchronousExecutionContext::await(std::shared_ptr<Future> future)
{
    assert(sink);
    assert(future);
    (*sink)(std::move(future));
}

void AsynchronousExecutionContext::sleep(
    const std::chrono::milliseconds timeout)
{
    const auto callback_scheduler_ptr = callbackScheduler.lock();
    if (!callback_scheduler_ptr) {
        throw std::runtime_error {"Callback scheduler no longer exists"};
    }
    auto future = std::make_shared<Future>();
    callback_scheduler_ptr->callLater(timeout, &Future::resolve, future);
    await(std::move(future));
}

AsynchronousExecutionPolicy::AsynchronousExecutionPolicy(
    std::weak_ptr<Messaging::CallbackScheduler> callbackScheduler) :
    callbackScheduler {std::move(callbackScheduler)}
{
}

}
}
