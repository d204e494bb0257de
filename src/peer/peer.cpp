#include "peer/peer.hpp"
#include "networking/fileParsing.hpp"

#include <atomic>
#include <iostream>
#include <iomanip>
#include <signal.h>

namespace csw {

static std::unique_ptr<DictionaryStore> openStore(const Config& config) {
    if (config.content_db.empty())
        return nullptr;

    try {
        return std::make_unique<DictionaryStore>(config.content_db);
    } catch (const SQLError& e) {
        std::cerr << "[Peer] Running without a persisted dictionary: " << e.what() << std::endl;
        return nullptr;
    }
}

Peer::Peer(Config config)
    :
    config_     (std::move(config)),
    dictionary_ (std::chrono::seconds(config_.stale_after)),
    store_      (openStore(config_)),
    listener_   (config_, dictionary_, store_.get()),
    server_     (config_.chunk_dir, config_.peer_port, std::chrono::seconds(config_.idle_timeout)),
    pool_       (std::chrono::seconds(config_.pool_idle_threshold),
                 std::chrono::milliseconds(config_.connect_timeout_ms),
                 config_.pool_max_idle_per_peer),
    downloads_  (dictionary_, pool_, config_.chunk_dir, config_.downloads_dir, RetryPolicy::fromConfig(config_)) {}

Peer::~Peer() {
    stop();
}

int Peer::start() {
    if (running_)
        return EXIT_SUCCESS;

    //undo a previous stop()
    downloads_.resume();
    pool_.reopen();

    if (0 > listener_.restoreFromStore(Clock::now()))
        std::cerr << "[Peer] Starting with an empty dictionary." << std::endl;

    if (EXIT_SUCCESS != listener_.start())
        return EXIT_FAILURE;

    if (EXIT_SUCCESS != server_.start()) {
        listener_.stop();
        return EXIT_FAILURE;
    }

    announcer_ = std::make_unique<Announcer>(config_, server_.boundPort());
    if (EXIT_SUCCESS != announcer_->start()) {
        announcer_.reset();
        server_.stop();
        listener_.stop();
        return EXIT_FAILURE;
    }

    pool_.startCleaner(std::chrono::seconds(config_.pool_clean_interval));
    running_ = true;
    return EXIT_SUCCESS;
}

void Peer::stop() {
    if (!running_)
        return;
    running_ = false;

    downloads_.abandonAll();
    if (announcer_) {
        announcer_->stop();
        announcer_.reset();
    }
    pool_.stopCleaner();
    pool_.closeAll();
    server_.stop();
    listener_.stop();
}

std::optional<uint32_t> Peer::share(const std::string& f_path) {
    auto count = splitFile(f_path, config_.chunk_dir, config_.chunk_size);
    if (!count) {
        std::cerr << "[Peer] Could not split " << f_path << std::endl;
        return std::nullopt;
    }

    //don't make the swarm wait a full interval for the new chunks
    if (announcer_ && EXIT_SUCCESS != announcer_->announceOnce())
        std::cerr << "[Peer] Announcement failed, the next periodic one will carry the file." << std::endl;

    return count;
}

DownloadResult Peer::download(const std::string& f_name) {
    return downloads_.download(f_name);
}

/*
 * Console
 */

static std::atomic<bool> shutdown_requested = false;

static void signalHandler(int) {
    shutdown_requested = true;
}

static void printHelp() {
    std::cout << "Available commands:\n";
    std::cout << "  list              - List files known to the swarm\n";
    std::cout << "  split <path>      - Chunk <path> and start sharing it\n";
    std::cout << "  download <name>   - Download <name> from the swarm\n";
    std::cout << "  help              - Show this message\n";
    std::cout << "  exit              - Quit\n";
}

namespace {

enum message_code {
    EXIT,
    LIST,
    HELP,
    SPLIT,
    DOWNLOAD,
};

} //anon

//splits a command on spaces, requiring exactly one argument after the command
static int getArg(const std::string& command, std::string& arg_container) {
    std::vector<std::string> args;
    std::string curr_str;
    for (const char& c : command) {
        if (c == ' ') {
            if (!curr_str.empty())
                args.push_back(curr_str);
            curr_str.clear();
        } else {
            curr_str.push_back(c);
        }
    }
    if (!curr_str.empty())
        args.push_back(curr_str);

    if (args.size() != 2)
        return EXIT_FAILURE;

    arg_container = args[1];
    return EXIT_SUCCESS;
}

static bool isCommand(const std::string& command, const std::string& name) {
    return command == name || command.rfind(name + " ", 0) == 0;
}

static std::optional<message_code> parseCommand(const std::string& command, std::string& command_arg) {
    //no arg commands
    if (isCommand(command, "exit")) return EXIT;
    if (isCommand(command, "list")) return LIST;
    if (isCommand(command, "help")) return HELP;

    if (isCommand(command, "split")) {
        if (EXIT_FAILURE == getArg(command, command_arg)) {
            std::cerr << "[err] Usage: split <path to file>" << std::endl;
            return std::nullopt;
        }
        return SPLIT;
    }

    if (isCommand(command, "download")) {
        if (EXIT_FAILURE == getArg(command, command_arg)) {
            std::cerr << "[err] Usage: download <file name>" << std::endl;
            return std::nullopt;
        }
        return DOWNLOAD;
    }

    std::cerr << "Unknown command. Type 'help' for usage." << std::endl;
    return std::nullopt;
}

static void printFiles(const std::vector<FileSummary>& files) {
    if (files.empty()) {
        std::cout << "No files announced yet." << std::endl;
        return;
    }

    std::cout << std::left << std::setw(32) << "FILE" << std::setw(10) << "CHUNKS"
              << std::setw(10) << "KNOWN" << "PEERS" << std::endl;
    for (const FileSummary& f : files) {
        std::cout << std::left << std::setw(32) << f.f_name << std::setw(10) << f.chunk_count
                  << std::setw(10) << f.indices_known << f.holders << std::endl;
    }
}

static void printDownload(const DownloadResult& result) {
    if (result.success) {
        std::cout << "Downloaded " << result.f_name << " to " << result.output_path->string() << std::endl;
        return;
    }

    std::cerr << "Download of " << result.f_name << " failed: " << result.error << std::endl;
    if (!result.missing.empty()) {
        std::cerr << "Missing chunks:";
        for (uint32_t i : result.missing)
            std::cerr << ' ' << i;
        std::cerr << std::endl;
    }
}

int runPeer(const Config& config) {
    Peer peer(config);
    if (EXIT_SUCCESS != peer.start()) {
        std::cerr << "Could not finish startup. Exiting..." << std::endl;
        return EXIT_FAILURE;
    }

    //no SA_RESTART so a pending getline is interrupted by CONTROL+C
    struct sigaction action{};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);

    std::cout << "Welcome to chunkswarm!"                                         << std::endl;
    std::cout << "Serving chunks from " << config.chunk_dir << " on port " << peer.servingPort() << std::endl;
    std::cout << "Downloads go to " << config.downloads_dir                       << std::endl;
    std::cout << "Type 'help' for commands."                                      << std::endl;

    while (!shutdown_requested) {
        std::string command;
        std::string command_arg;

        std::cout << "> ";
        if (!std::getline(std::cin, command))
            break;
        if (command.empty())
            continue;

        auto code = parseCommand(command, command_arg);
        if (!code)
            continue;

        switch (code.value()) {
            case EXIT: {
                shutdown_requested = true;
                break;
            }

            case LIST: {
                printFiles(peer.list());
                break;
            }

            case HELP: {
                printHelp();
                break;
            }

            case SPLIT: {
                auto count = peer.share(command_arg);
                if (count)
                    std::cout << "Split " << command_arg << " into " << count.value() << " chunks." << std::endl;
                break;
            }

            case DOWNLOAD: {
                printDownload(peer.download(command_arg));
                break;
            }
        }
    }

    std::cout << "Shutting down..." << std::endl;
    peer.stop();
    return EXIT_SUCCESS;
}

} //csw
