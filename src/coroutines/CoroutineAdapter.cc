#include "coroutines/CoroutineAdapter.hh"

#include "coroutines/Future.hh"
#include "messaging/CallbackScheduler.hh"
#include "Utility.hh"

#include <cassert>
#include <utility>

namespace Trio {
namespace Coroutines {

namespace {

void scheduleResume(
    const std::weak_ptr<Messaging::CallbackScheduler>& callbackScheduler,
    std::function<void()> resume)
{
    if (const auto callback_scheduler_ptr = callbackScheduler.lock()) {
        callback_scheduler_ptr->callSoon(std::move(resume));
    }
}

}

const Future* CoroutineAdapter::getAwaited() const
{
    return source ? awaited.get() : nullptr;
}

void CoroutineAdapter::internalResume()
{
    [[maybe_unused]] const auto this_avoids_selfdestruct = shared_from_this();
    awaited.reset();
    source();
    internalUpdate();
}

void CoroutineAdapter::internalUpdate()
{
    if (!source) {
        return;
    }
    awaited = source.get();
    auto& future = dereference(awaited);
    auto resume = [this_ = shared_from_this()]()
    {
        assert(this_);
        this_->internalResume();
    };
    if (future.isResolved()) {
        scheduleResume(callbackScheduler, std::move(resume));
    } else {
        future.resolveCallback =
            [callbackScheduler = callbackScheduler,
             resume = std::move(resume)]() mutable
            {
                scheduleResume(callbackScheduler, std::move(resume));
            };
    }
}

}
}
