#pragma once

#include "config.hpp"
#include "discovery/contentDictionary.hpp"
#include "util/periodicTask.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace csw {

class DictionaryStore;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Listener
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Receives announcements on the discovery port and feeds them into the
 *    content dictionary. A second periodic task sweeps stale entries out of
 *    the dictionary and, if a store was given, persists what's left.
 *
 *    Malformed datagrams are logged and dropped before they touch the
 *    dictionary.
 *
 * Constructor:
 * -> Takes:
 *    -> config:
 *       Source of the discovery port and sweep interval. broadcast_port 0
 *       binds an ephemeral port, see boundPort().
 *    -> dictionary:
 *       The dictionary to fill. Must outlive the listener.
 *    -> store:
 *       Optional persistence, not owned. May be nullptr.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class Listener {
public:
    Listener(const Config& config, ContentDictionary& dictionary, DictionaryStore* store=nullptr);
    ~Listener();

    Listener(const Listener&)            = delete;
    Listener& operator=(const Listener&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * start
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Binds the discovery port and starts the receive thread and the sweep
     *    task.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE if the port couldn't be bound.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int start();

    //stops both threads and closes the socket, does a last persist
    void stop();

    uint16_t boundPort() const { return bound_port_.load(); }

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * handleDatagram
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Decodes one announcement and records every ref in it as held by
     *    sender_ip at the announced serving port.
     *
     * Takes:
     * -> sender_ip:
     *    Source address of the datagram.
     * -> datagram:
     *    The raw payload.
     * -> now:
     *    Receipt time.
     *
     * Returns:
     * -> On success:
     *    The number of refs recorded.
     * -> On failure:
     *    -1 if the datagram was dropped.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int handleDatagram(const std::string&          sender_ip,
                       const std::vector<uint8_t>& datagram,
                       TimePoint                   now);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * sweepOnce
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> One sweep: evicts stale entries, then persists the dictionary when a
     *    store is set. This is the body of the sweep task.
     *
     * Returns:
     * -> The number of entries evicted.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    size_t sweepOnce(TimePoint now);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * restoreFromStore
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Seeds the dictionary from the store, ages preserved.
     *
     * Returns:
     * -> On success:
     *    The number of entries restored (0 without a store).
     * -> On failure:
     *    -1
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int restoreFromStore(TimePoint now);

private:
    void receiveLoop();

    Config                        config_;
    ContentDictionary&            dictionary_;
    DictionaryStore*              store_;

    int                           socket_fd_  = -1;
    std::atomic<uint16_t>         bound_port_ = 0;
    std::atomic<bool>             shutdown_   = false;
    std::thread                   recv_thread_;
    std::unique_ptr<PeriodicTask> sweep_task_;
};

} //csw
