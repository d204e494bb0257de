#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "peer/peer.hpp"

static std::string config_path;
static int         peer_id = 0;

static void printUsage() {
    std::cerr << "USAGE: chunkswarm [--config <file>] [--peer-id <#>]" << std::endl;
}

//returns EXIT_FAILURE on anything it doesn't recognize
static int parseArgs(int argc, char** argv) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config") {
            if (i+1 >= argc) {
                std::cerr << "USAGE: --config <file>" << std::endl;
                return EXIT_FAILURE;
            }
            config_path = argv[++i];
            continue;
        }

        if (arg == "--peer-id") {
            try {
                if (i+1 >= argc)
                    throw std::invalid_argument("");
                size_t used = 0;
                peer_id = std::stoi(argv[i+1], &used);
                if (used != std::string(argv[i+1]).size() || peer_id < 0 || peer_id > UINT16_MAX)
                    throw std::invalid_argument("");
            } catch (const std::logic_error&) {
                std::cerr << "USAGE: --peer-id <# between 0 and 65535>" << std::endl;
                return EXIT_FAILURE;
            }
            ++i;
            continue;
        }

        if (arg == "--help" || arg == "-h") {
            printUsage();
            exit(EXIT_SUCCESS);
        }

        std::cerr << "Unknown option: " << arg << std::endl;
        printUsage();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * main
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Starts one chunkswarm peer. Settings come from the defaults, then the
 *    config file if given, then the peer id offset.
 *
 * Returns:
 * -> On success:
 *    0
 * -> On failure:
 *    EXIT_FAILURE for bad arguments, a bad config or a failed startup.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int main(int argc, char** argv) {
    if (EXIT_SUCCESS != parseArgs(argc, argv))
        return EXIT_FAILURE;

    csw::Config config;
    if (!config_path.empty() && EXIT_SUCCESS != csw::loadConfig(config_path, config)) {
        std::cerr << "Could not load config from " << config_path << std::endl;
        return EXIT_FAILURE;
    }

    if (peer_id != 0 && EXIT_SUCCESS != csw::applyPeerId(config, static_cast<uint16_t>(peer_id)))
        return EXIT_FAILURE;

    return csw::runPeer(config);
}
