#pragma once

#include "peerAddress.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Config
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A struct to store every tunable this software offers. The defaults are
 *    sane for a LAN, and every field can be overridden from a config file via
 *    loadConfig(). Durations are in seconds unless the name says otherwise.
 *
 * Fields:
 * -> chunk_size:
 *    Bytes per chunk when splitting a file.
 * -> broadcast_addr:
 *    Where announcements are broadcast to. Empty disables the broadcast.
 * -> broadcast_port:
 *    UDP port announcements are sent to and received on.
 * -> peer_port:
 *    TCP port chunks are served on.
 * -> announce_targets:
 *    Extra unicast destinations for announcements. Useful for several peers on
 *    one machine where broadcast loopback is unreliable.
 * -> announce_interval:
 *    Time between two announcements.
 * -> stale_after:
 *    Time after which a peer that stopped announcing is dropped from the
 *    content dictionary. Has to be greater than announce_interval.
 * -> sweep_interval:
 *    Time between two stale-peer sweeps.
 * -> idle_timeout:
 *    How long the peer server waits on a silent connection before closing it.
 * -> pool_idle_threshold:
 *    How long an idle pooled connection may live.
 * -> pool_clean_interval:
 *    Time between two pool cleanups.
 * -> pool_max_idle_per_peer:
 *    Idle connections kept for a single peer. Extra ones are closed on return.
 * -> connect_timeout_ms / request_timeout_ms:
 *    Bounds on opening a connection and on one chunk request.
 * -> max_workers:
 *    Concurrent chunk downloads for one file.
 * -> retry_attempts / retry_backoff_ms:
 *    Times a chunk that failed against every holder is retried, and the wait
 *    before each retry.
 * -> chunk_dir / downloads_dir:
 *    Where chunks are stored and where reassembled files go.
 * -> content_db:
 *    SQLite file mirroring the content dictionary. Empty disables it.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct Config {
    uint64_t    chunk_size             = 100 * 1024;
    std::string broadcast_addr         = "255.255.255.255";
    uint16_t    broadcast_port         = 5001;
    uint16_t    peer_port              = 5000;
    std::vector<PeerAddress> announce_targets;
    uint32_t    announce_interval      = 10;
    uint32_t    stale_after            = 20;
    uint32_t    sweep_interval         = 5;
    uint32_t    idle_timeout           = 30;
    uint32_t    pool_idle_threshold    = 300;
    uint32_t    pool_clean_interval    = 60;
    uint32_t    pool_max_idle_per_peer = 4;
    uint32_t    connect_timeout_ms     = 2000;
    uint32_t    request_timeout_ms     = 10000;
    uint32_t    max_workers            = 5;
    uint32_t    retry_attempts         = 3;
    uint32_t    retry_backoff_ms       = 1000;
    std::string chunk_dir              = "./chunks";
    std::string downloads_dir          = "./downloads";
    std::string content_db             = "./content_dict.db";
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * loadConfig
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads KEY=VALUE lines from a file into the provided config. Blank lines
 *    and lines starting with '#' are skipped. Keys not present in the file keep
 *    whatever value dest already had. After parsing, the config is checked with
 *    validateConfig().
 *
 * Takes:
 * -> config_path:
 *    The file to read.
 * -> dest:
 *    The config to fill in.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE. The file couldn't be read, a key was unknown, a value didn't
 *    parse, or validation failed. dest may be partially updated.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int loadConfig(const std::string& config_path, Config& dest);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * validateConfig
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Checks relationships between fields. Most importantly stale_after must
 *    exceed announce_interval, otherwise a single dropped announcement evicts a
 *    healthy peer.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE, with the reason on stderr.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int validateConfig(const Config& config);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * applyPeerId
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Offsets both ports by peer_id so several peers can run on one machine.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE if either port would overflow.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int applyPeerId(Config& config, uint16_t peer_id);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parsePeerAddress
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Parses "ip:port". "localhost" is accepted for 127.0.0.1.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS, dest filled in.
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int parsePeerAddress(const std::string& text, PeerAddress& dest);

} //csw
