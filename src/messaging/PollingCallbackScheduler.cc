#include "messaging/PollingCallbackScheduler.hh"

#include "messaging/MessageUtility.hh"
#include "Logging.hh"

#include <algorithm>
#include <array>
#include <functional>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace Trio {
namespace Messaging {

namespace {

using Clock = std::chrono::steady_clock;
using Ms = std::chrono::milliseconds;

// Sent from the scheduler to the worker
struct CallbackRequest {
    Ms timeout;
    unsigned long callbackId;
};

struct ScheduledCallback {
    Clock::time_point due;
    unsigned long callbackId;
};

// Earliest deadline on top of the priority queue
struct LaterDeadline {
    bool operator()(
        const ScheduledCallback& lhs, const ScheduledCallback& rhs) const
    {
        return lhs.due > rhs.due;
    }
};

using CallbackQueue = std::priority_queue<
    ScheduledCallback, std::vector<ScheduledCallback>, LaterDeadline>;

Ms timeUntilNextCallback(const CallbackQueue& queue)
{
    if (queue.empty()) {
        return -1ms;
    }
    return std::max(
        0ms,
        std::chrono::duration_cast<Ms>(queue.top().due - Clock::now()));
}

template<typename T>
void recvValue(Socket& socket, T& value)
{
    const auto result = recvMessage(
        socket, messageBuffer(&value, sizeof(value)));
    if (result.truncated() || result.size != sizeof(value)) {
        throw std::runtime_error {"Unexpected message from callback scheduler"};
    }
}

void notifyCallbackDue(Socket& socket, unsigned long callbackId)
{
    if (!sendMessageNonblocking(
            socket, messageBuffer(&callbackId, sizeof(callbackId)))) {
        log(LogLevel::ERROR, "Failed to notify callback %s", callbackId);
    }
}

// The worker receives requests from the front socket, waits until they are
// due and sends the ids back through the back socket
void callbackSchedulerWorker(
    MessageContext& context, const std::string& backEndpoint,
    const std::string& frontEndpoint, Socket terminationSubscriber)
{
    auto queue = CallbackQueue {};
    auto front_socket = Socket {context, SocketType::pair};
    auto back_socket = Socket {context, SocketType::pair};
    connectSocket(front_socket, frontEndpoint);
    connectSocket(back_socket, backEndpoint);
    static_cast<void>(discardMessage(front_socket));
    sendEmptyMessage(back_socket);
    auto pollitems = std::array {
        Pollitem { terminationSubscriber.handle(), 0, ZMQ_POLLIN, 0 },
        Pollitem { front_socket.handle(), 0, ZMQ_POLLIN, 0 },
    };
    while (true) {
        pollSockets(pollitems, timeUntilNextCallback(queue));
        if (pollitems[0].revents & ZMQ_POLLIN) {
            break;
        }
        if (pollitems[1].revents & ZMQ_POLLIN) {
            const auto now = Clock::now();
            while (socketHasEvents(front_socket, ZMQ_POLLIN)) {
                auto request = CallbackRequest {};
                recvValue(front_socket, request);
                if (request.timeout <= 0ms) {
                    notifyCallbackDue(back_socket, request.callbackId);
                } else {
                    queue.push({now + request.timeout, request.callbackId});
                }
            }
        }
        const auto now = Clock::now();
        while (!queue.empty() && queue.top().due <= now) {
            notifyCallbackDue(back_socket, queue.top().callbackId);
            queue.pop();
        }
    }
}

std::string makeInprocEndpoint(const char* prefix, const void* addr)
{
    std::ostringstream os;
    os << "inproc://trio.callbackscheduler." << prefix << "." << addr;
    return os.str();
}

}

PollingCallbackScheduler::PollingCallbackScheduler(
    MessageContext& context, Socket terminationSubscriber) :
    frontSocket {context, SocketType::pair},
    backSocket {makeSharedSocket(context, SocketType::pair)}
{
    auto back_endpoint = makeInprocEndpoint("back", this);
    auto front_endpoint = makeInprocEndpoint("front", this);
    bindSocket(*backSocket, back_endpoint);
    bindSocket(frontSocket, front_endpoint);
    worker = std::jthread {
        callbackSchedulerWorker, std::ref(context), std::move(back_endpoint),
        std::move(front_endpoint), std::move(terminationSubscriber) };
    // Handshake to make sure both sockets are connected
    sendEmptyMessage(frontSocket);
    static_cast<void>(discardMessage(*backSocket));
}

void PollingCallbackScheduler::handleCallLater(
    const Ms timeout, Callback callback)
{
    const auto callback_id = nextCallbackId++;
    callbacks.emplace(callback_id, std::move(callback));
    auto request = CallbackRequest {timeout, callback_id};
    if (!sendMessageNonblocking(
            frontSocket, messageBuffer(&request, sizeof(request)))) {
        callbacks.erase(callback_id);
        throw std::runtime_error {"Failed to schedule callback"};
    }
}

SharedSocket PollingCallbackScheduler::getSocket()
{
    return backSocket;
}

void PollingCallbackScheduler::operator()(Socket& socket)
{
    if (&socket != backSocket.get()) {
        return;
    }
    while (socketHasEvents(socket, ZMQ_POLLIN)) {
        auto callback_id = 0ul;
        recvValue(socket, callback_id);
        const auto iter = callbacks.find(callback_id);
        if (iter != callbacks.end()) {
            const auto callback = std::move(iter->second);
            callbacks.erase(iter);
            callback();
        }
    }
}

}
}
