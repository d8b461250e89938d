#include <iostream>
#include <stdexcept>
#include <string>

#include "xpipe/api_client.hpp"
#include "xpipe/commands.hpp"
#include "xpipe/configuration.hpp"

namespace {
int usage_error(const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n\n"
              << xpipe::USAGE;
    return 2;
}

// Runs while the configuration's log sink is in place
int run(const xpipe::Configuration& config) {
    try {
        if (config.help() || config.command().empty() || config.command() == "help") {
            std::cout << xpipe::USAGE;
            return 0;
        }
        xpipe::HttpApiClient client(config);
        xpipe::CommandRunner runner(client, config.chunk_size());
        return runner.run(config.command(), config.command_args());
    } catch (const xpipe::UsageError& e) {
        return usage_error(e);
    } catch (const std::exception& e) {
        LOG(error) << e.what();
        return 1;
    }
}
}  // namespace

int main(const int argc, const char* const argv[]) {
    try {
        const xpipe::Configuration config(argc, argv);
        return run(config);
    } catch (const xpipe::UsageError& e) {
        return usage_error(e);
    } catch (const std::exception& e) {
        std::clog << "Exception: " << e.what() << std::endl;
        return 1;
    }
}
