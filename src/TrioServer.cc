#include "messaging/Sockets.hh"
#include "main/Config.hh"
#include "main/TrioMain.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

using namespace Trio;
using Main::TrioMain;

class TrioServerApp {
public:

    TrioServerApp(
        Messaging::MessageContext& zmqctx, const std::string& configPath) :
        app {zmqctx, Main::configFromPath(configPath)}
    {
        log(LogLevel::INFO, "Startup completed");
    }

    ~TrioServerApp()
    {
        log(LogLevel::INFO, "Shutting down");
    }

    void run()
    {
        app.run();
    }

private:

    TrioMain app;
};

TrioServerApp createApp(
    Messaging::MessageContext& zmqctx, int argc, char* argv[])
{
    auto configPath = std::string {};

    const auto short_opt = "vf:";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'f' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            configPath = optarg;
        } else {
            std::exit(EXIT_FAILURE);
        }
    }

    setupLogging(getLogLevel(verbosity), std::cerr);

    return TrioServerApp {zmqctx, configPath};
}

}

int trio_server_main(int argc, char* argv[])
{
    Messaging::MessageContext zmqctx;
    createApp(zmqctx, argc, argv).run();
    return EXIT_SUCCESS;
}
