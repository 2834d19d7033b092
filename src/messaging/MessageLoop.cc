#include "messaging/MessageLoop.hh"

#include "Logging.hh"

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace Trio {
namespace Messaging {

namespace {

using SocketEntry = std::pair<MessageLoop::SocketCallback, SharedSocket>;
using FdEntry = std::pair<std::function<void(int)>, int>;
using PollEntry = std::variant<SocketEntry, FdEntry>;

struct InvokeEntry {
    void operator()(SocketEntry& entry) const
    {
        assert(entry.second);
        entry.first(*entry.second);
    }

    void operator()(FdEntry& entry) const
    {
        entry.first(entry.second);
    }
};

sigset_t makeTerminationSignalMask()
{
    auto mask = sigset_t {};
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    return mask;
}

[[noreturn]] void throwErrno(const char* what)
{
    throw std::system_error {errno, std::generic_category(), what};
}

}

class MessageLoop::Impl {
public:
    explicit Impl(MessageContext& context);
    ~Impl();

    void addPollable(SharedSocket socket, SocketCallback callback);
    void removePollable(Socket& socket);
    void run();
    Socket createTerminationSubscriber();

private:

    // Owns the signalfd polled in the first slot during run()
    class SignalFd : private boost::noncopyable {
    public:
        explicit SignalFd(Impl& impl);
        ~SignalFd();

        bool received() const { return signalReceived; }

    private:
        void handleSignal(int sfd);

        Impl& impl;
        int fd {-1};
        bool signalReceived {false};
    };

    std::string getTerminationEndpoint() const;

    MessageContext& context;
    Socket terminationPublisher;
    std::vector<Pollitem> pollitems {
        { nullptr, -1, ZMQ_POLLIN, 0 }
    };
    std::vector<PollEntry> entries {
        FdEntry {}
    };
    sigset_t oldMask {};
};

MessageLoop::Impl::SignalFd::SignalFd(Impl& impl) :
    impl {impl}
{
    const auto mask = makeTerminationSignalMask();
    errno = 0;
    fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd == -1) {
        throwErrno("signalfd");
    }
    impl.pollitems.front().fd = fd;
    impl.entries.front() = FdEntry {
        [this](const int sfd) { handleSignal(sfd); }, fd };
}

MessageLoop::Impl::SignalFd::~SignalFd()
{
    impl.pollitems.front().fd = -1;
    impl.entries.front() = FdEntry {};
    errno = 0;
    if (close(fd) != 0) {
        log(LogLevel::ERROR, "Failed to close signalfd: %s",
            std::strerror(errno));
    }
}

void MessageLoop::Impl::SignalFd::handleSignal(const int sfd)
{
    auto info = signalfd_siginfo {};
    errno = 0;
    if (read(sfd, &info, sizeof(info)) != sizeof(info)) {
        throwErrno("read signalfd");
    }
    log(LogLevel::DEBUG, "Signal received: %s", strsignal(info.ssi_signo));
    if (info.ssi_signo == SIGINT || info.ssi_signo == SIGTERM) {
        sendMessage(
            impl.terminationPublisher,
            messageBuffer(&info.ssi_signo, sizeof(info.ssi_signo)));
        signalReceived = true;
    }
}

MessageLoop::Impl::Impl(MessageContext& context) :
    context {context},
    terminationPublisher {context, SocketType::pub}
{
    const auto mask = makeTerminationSignalMask();
    const auto error = pthread_sigmask(SIG_BLOCK, &mask, &oldMask);
    if (error != 0) {
        throw std::system_error {
            error, std::generic_category(), "pthread_sigmask"};
    }
    bindSocket(terminationPublisher, getTerminationEndpoint());
}

MessageLoop::Impl::~Impl()
{
    const auto error = pthread_sigmask(SIG_SETMASK, &oldMask, nullptr);
    if (error != 0) {
        log(LogLevel::ERROR, "Failed to restore signal mask: %s",
            std::strerror(error));
    }
}

void MessageLoop::Impl::addPollable(
    SharedSocket socket, SocketCallback callback)
{
    const auto iter = std::find_if(
        pollitems.begin(), pollitems.end(),
        [handle = socket->handle()](const auto& pollitem)
        {
            return pollitem.socket == handle;
        });
    if (iter != pollitems.end()) {
        throw std::invalid_argument {"Socket already registered"};
    }
    pollitems.push_back({ socket->handle(), 0, ZMQ_POLLIN, 0 });
    try {
        entries.emplace_back(
            SocketEntry {std::move(callback), std::move(socket)});
    } catch (...) {
        pollitems.pop_back();
        throw;
    }
}

void MessageLoop::Impl::removePollable(Socket& socket)
{
    const auto iter = std::find_if(
        pollitems.begin(), pollitems.end(),
        [handle = socket.handle()](const auto& pollitem)
        {
            return pollitem.socket == handle;
        });
    if (iter != pollitems.end()) {
        const auto n = iter - pollitems.begin();
        pollitems.erase(iter);
        entries.erase(entries.begin() + n);
    }
}

void MessageLoop::Impl::run()
{
    SignalFd signal_fd {*this};
    while (!signal_fd.received()) {
        try {
            pollSockets(pollitems);
        } catch (const SocketError& e) {
            if (e.num() == EINTR) {
                continue;
            }
            throw;
        }
        assert(entries.size() == pollitems.size());
        // A callback may add or remove entries, so only the first readable
        // entry is handled before polling again
        const auto iter = std::find_if(
            pollitems.begin(), pollitems.end(),
            [](const auto& pollitem) { return pollitem.revents & ZMQ_POLLIN; });
        if (iter == pollitems.end()) {
            continue;
        }
        try {
            std::visit(InvokeEntry {}, entries[iter - pollitems.begin()]);
        } catch (const std::exception& e) {
            log(LogLevel::ERROR, "Exception caught in message loop: %s",
                e.what());
        }
    }
}

Socket MessageLoop::Impl::createTerminationSubscriber()
{
    auto subscriber = Socket {context, SocketType::sub};
    subscriber.set(zmq::sockopt::subscribe, "");
    connectSocket(subscriber, getTerminationEndpoint());
    return subscriber;
}

std::string MessageLoop::Impl::getTerminationEndpoint() const
{
    std::ostringstream os;
    os << "inproc://trio.messageloop.term." << this;
    return os.str();
}

MessageLoop::MessageLoop(MessageContext& context) :
    impl {std::make_unique<Impl>(context)}
{
}

MessageLoop::~MessageLoop() = default;

void MessageLoop::addPollable(SharedSocket socket, SocketCallback callback)
{
    assert(impl);
    if (!socket || !callback) {
        throw std::invalid_argument {"Invalid socket or callback"};
    }
    impl->addPollable(std::move(socket), std::move(callback));
}

void MessageLoop::removePollable(Socket& socket)
{
    assert(impl);
    impl->removePollable(socket);
}

void MessageLoop::run()
{
    assert(impl);
    impl->run();
}

Socket MessageLoop::createTerminationSubscriber()
{
    assert(impl);
    return impl->createTerminationSubscriber();
}

}
}
