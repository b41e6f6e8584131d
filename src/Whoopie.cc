#include "main/Config.hh"
#include "main/SelfPlay.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

using namespace Whoopie;

class WhoopieApp {
public:

    WhoopieApp(const std::string& configPath) :
        config {Main::configFromPath(configPath)},
        selfPlay {config, std::cout}
    {
        log(LogLevel::INFO, "Startup completed");
    }

    ~WhoopieApp()
    {
        log(LogLevel::INFO, "Shutting down");
    }

    void run()
    {
        selfPlay.run();
    }

private:

    Main::Config config;
    Main::SelfPlay selfPlay;
};

WhoopieApp createApp(int argc, char* argv[])
{
    auto configPath = std::string {};

    const auto short_opt = "vf:";
    auto long_opt = std::array {
        option { "verbose", no_argument, 0, 'v' },
        option { "config", required_argument, 0, 'f' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1 || c == '?') {
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

    return WhoopieApp {configPath};
}

}

int whoopie_main(int argc, char* argv[])
{
    createApp(argc, argv).run();
    return EXIT_SUCCESS;
}
