#pragma once

#include "config.hpp"
#include "networking/messageFormatting.hpp"
#include "util/periodicTask.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Announcer
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Tells the network which chunks this peer holds. Every announce_interval
 *    seconds chunk storage is scanned and one announcement naming every held
 *    chunk is sent to the broadcast address and every configured target.
 *
 *    Chunk digests are cached per chunk file and only recomputed when the
 *    file's size or modification time changes.
 *
 *    A failed send is logged and the next tick simply tries again.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class Announcer {
public:
    /*
     * Takes:
     * -> config:
     *    Source of chunk_dir, the discovery targets and the interval.
     * -> serving_port:
     *    The TCP port this peer's PeerServer is actually bound to.
     */
    Announcer(const Config& config, uint16_t serving_port);
    ~Announcer();

    Announcer(const Announcer&)            = delete;
    Announcer& operator=(const Announcer&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * start
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Opens the sending socket and starts announcing, the first
     *    announcement going out immediately.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE if the socket couldn't be set up.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int start();

    void stop();

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * buildAnnouncement
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Scans chunk storage and returns what would be announced right now.
     *    Chunks that can't be read are left out and logged.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    Announcement buildAnnouncement();

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * announceOnce
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Builds an announcement and sends it to every target. This is the body
     *    of the periodic task. Opens the socket first if start() hasn't.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS, every datagram reached the kernel for every target.
     * -> On failure:
     *    EXIT_FAILURE, at least one send failed.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int announceOnce();

    //broadcast address first, then the unicast targets
    std::vector<PeerAddress> targets() const;

    //number of digests computed since construction, cache hits excluded
    size_t digestsComputed() const;

private:
    struct CachedDigest {
        uint64_t                        size = 0;
        std::filesystem::file_time_type mtime;
        ChunkIdentity                   identity{};
    };

    int openSendSocket();

    Config                                    config_;
    uint16_t                                  serving_port_;
    int                                       send_fd_ = -1;

    mutable std::mutex                        mtx_; //cache and socket
    std::map<std::string, CachedDigest>       digest_cache_;
    size_t                                    digests_computed_ = 0;

    std::unique_ptr<PeriodicTask>             task_;
};

} //csw
