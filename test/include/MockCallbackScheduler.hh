#ifndef MOCKCALLBACKSCHEDULER_HH_
#define MOCKCALLBACKSCHEDULER_HH_

#include "messaging/CallbackScheduler.hh"

#include <gmock/gmock.h>

namespace Trio {
namespace Messaging {

class MockCallbackScheduler : public CallbackScheduler
{
public:
    using CallbackScheduler::Callback;
    MOCK_METHOD1(handleCallSoon, void(Callback));
    MOCK_METHOD2(handleCallLater, void(std::chrono::milliseconds, Callback));
};

}
}

#endif // MOCKCALLBACKSCHEDULER_HH_
