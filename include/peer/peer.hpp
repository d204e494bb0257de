#pragma once

#include "config.hpp"
#include "discovery/announcer.hpp"
#include "discovery/contentDictionary.hpp"
#include "discovery/internal/database/dictionaryStore.hpp"
#include "discovery/listener.hpp"
#include "transfer/connectionPool.hpp"
#include "transfer/downloadManager.hpp"
#include "transfer/peerServer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Peer
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> One running node. Owns the content dictionary and every background
 *    component, and starts them in dependency order: the dictionary is
 *    restored from disk, then the listener, the peer server, the announcer
 *    (which needs the server's port) and the pool cleaner come up. stop()
 *    tears them down in reverse.
 *
 *    A content_db that can't be opened is reported and the peer runs without
 *    persistence.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class Peer {
public:
    explicit Peer(Config config);
    ~Peer();

    Peer(const Peer&)            = delete;
    Peer& operator=(const Peer&) = delete;

    /*
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS, every component is running.
     * -> On failure:
     *    EXIT_FAILURE, whatever had started is stopped again.
     */
    int  start();
    void stop();

    //splits a local file into chunk storage and announces it right away
    std::optional<uint32_t> share(const std::string& f_path);

    DownloadResult download(const std::string& f_name);

    std::vector<FileSummary> list() const { return dictionary_.files(); }

    uint16_t servingPort()   const { return server_.boundPort(); }
    uint16_t discoveryPort() const { return listener_.boundPort(); }

    ContentDictionary& dictionary() { return dictionary_; }
    const Config&      config()     const { return config_; }

private:
    Config                           config_;
    ContentDictionary                dictionary_;
    std::unique_ptr<DictionaryStore> store_;
    Listener                         listener_;
    PeerServer                       server_;
    ConnectionPool                   pool_;
    DownloadManager                  downloads_;
    std::unique_ptr<Announcer>       announcer_;
    bool                             running_ = false;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * runPeer
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Starts a peer and runs the interactive console on stdin until "exit",
 *    end of input or SIGINT.
 *
 * Returns:
 * -> The process exit code.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int runPeer(const Config& config);

} //csw
