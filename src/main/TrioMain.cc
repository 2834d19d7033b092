#include "main/TrioMain.hh"

#include "coroutines/AsynchronousExecutionPolicy.hh"
#include "main/Config.hh"
#include "main/RoomManager.hh"
#include "messaging/EventSender.hh"
#include "messaging/MessageLoop.hh"
#include "messaging/MessageQueue.hh"
#include "messaging/PollingCallbackScheduler.hh"
#include "messaging/Sockets.hh"
#include "Logging.hh"

#include <cassert>
#include <utility>

namespace Trio {
namespace Main {

class TrioMain::Impl {
public:

    Impl(Messaging::MessageContext& context, const Config& config);

    void run();

private:

    Messaging::SharedSocket controlSocket;
    Messaging::MessageLoop messageLoop;
    std::shared_ptr<Messaging::PollingCallbackScheduler> callbackScheduler;
    Messaging::MessageQueue messageQueue;
    RoomManager roomManager;
};

TrioMain::Impl::Impl(
    Messaging::MessageContext& context, const Config& config) :
    controlSocket {
        Messaging::makeSharedSocket(context, Messaging::SocketType::router)},
    messageLoop {context},
    callbackScheduler {
        std::make_shared<Messaging::PollingCallbackScheduler>(
            context, messageLoop.createTerminationSubscriber())},
    messageQueue {},
    roomManager {
        std::make_shared<Messaging::RouterEventSender>(controlSocket),
        config.getMinPlayers(), config.getMaxPlayers(),
        config.getFailDelay()}
{
    controlSocket->set(zmq::sockopt::router_mandatory, 1);
    controlSocket->set(zmq::sockopt::router_handover, 1);
    const auto endpoint = config.getControlEndpoint();
    log(LogLevel::INFO, "Binding control socket to %s", endpoint);
    Messaging::bindSocket(*controlSocket, endpoint);
    messageQueue.addExecutionPolicy(
        Coroutines::AsynchronousExecutionPolicy {callbackScheduler});
    roomManager.addHandlers(messageQueue);
    messageLoop.addPollable(
        callbackScheduler->getSocket(),
        [callbackScheduler = this->callbackScheduler](auto& socket)
        {
            assert(callbackScheduler);
            (*callbackScheduler)(socket);
        });
    messageLoop.addPollable(
        controlSocket,
        [&queue = this->messageQueue](auto& socket) { queue(socket); });
}

void TrioMain::Impl::run()
{
    messageLoop.run();
}

TrioMain::TrioMain(zmq::context_t& context, const Config& config) :
    impl {std::make_unique<Impl>(context, config)}
{
}

TrioMain::~TrioMain() = default;

void TrioMain::run()
{
    assert(impl);
    impl->run();
}

}
}
