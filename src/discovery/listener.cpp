#include "discovery/listener.hpp"
#include "discovery/internal/database/dictionaryStore.hpp"
#include "networking/messageFormatting.hpp"
#include "networking/socket.hpp"

#include <iostream>

namespace csw {

//how often the receive thread checks for shutdown
static constexpr std::chrono::milliseconds RECV_POLL{500};

Listener::Listener(const Config& config, ContentDictionary& dictionary, DictionaryStore* store)
    :
    config_     (config),
    dictionary_ (dictionary),
    store_      (store) {}

Listener::~Listener() {
    stop();
}

int Listener::start() {
    if (socket_fd_ >= 0)
        return EXIT_SUCCESS;

    auto sock = openSocket(true, config_.broadcast_port, true);
    if (!sock) {
        std::cerr << "[Listener] Could not bind discovery port " << config_.broadcast_port << std::endl;
        return EXIT_FAILURE;
    }

    socket_fd_ = sock->first;
    bound_port_.store(sock->second);
    shutdown_.store(false);

    recv_thread_ = std::thread(&Listener::receiveLoop, this);

    sweep_task_ = std::make_unique<PeriodicTask>("Listener sweep",
                                                 std::chrono::seconds(config_.sweep_interval),
                                                 [this] { sweepOnce(Clock::now()); });
    sweep_task_->start();

    std::cout << "[Listener] Listening for announcements on port " << sock->second << std::endl;
    return EXIT_SUCCESS;
}

void Listener::stop() {
    bool was_running = socket_fd_ >= 0;

    shutdown_.store(true);
    if (recv_thread_.joinable())
        recv_thread_.join();

    if (sweep_task_) {
        sweep_task_->stop();
        sweep_task_.reset();
    }

    closeSocket(socket_fd_);
    socket_fd_ = -1;

    //last chance to save what was learned since the previous sweep
    if (was_running && store_) {
        if (EXIT_SUCCESS != store_->save(dictionary_.snapshot(), Clock::now()))
            std::cerr << "[Listener] Could not persist dictionary: " << store_->sqliteError() << std::endl;
    }
}

void Listener::receiveLoop() {
    std::vector<uint8_t> buffer;
    while (!shutdown_.load()) {
        PeerAddress sender;
        if (EXIT_SUCCESS != udp::recvMessage(socket_fd_, sender, buffer, RECV_POLL))
            continue; //timeout, check shutdown

        handleDatagram(sender.ip_addr, buffer, Clock::now());
    }
}

int Listener::handleDatagram(const std::string&          sender_ip,
                             const std::vector<uint8_t>& datagram,
                             TimePoint                   now) {
    auto announcement = parseAnnouncement(datagram);
    if (!announcement) {
        std::cerr << "[Listener] Dropped malformed datagram (" << datagram.size()
                  << " bytes) from " << sender_ip << std::endl;
        return -1;
    }

    PeerAddress holder{sender_ip, announcement->serving_port};
    int recorded = 0;
    for (const AnnouncedFile& file : announcement->files) {
        for (const auto& [index, identity] : file.chunks) {
            dictionary_.recordRef(ChunkRef{file.f_name, index, identity}, file.chunk_count, holder, now);
            ++recorded;
        }
    }

    return recorded;
}

size_t Listener::sweepOnce(TimePoint now) {
    size_t evicted = dictionary_.sweep(now);
    if (evicted > 0)
        std::cout << "[Listener] Evicted " << evicted << " stale holder entries." << std::endl;

    if (store_) {
        if (EXIT_SUCCESS != store_->save(dictionary_.snapshot(), now))
            std::cerr << "[Listener] Could not persist dictionary: " << store_->sqliteError() << std::endl;
    }

    return evicted;
}

int Listener::restoreFromStore(TimePoint now) {
    if (!store_)
        return 0;

    std::vector<HolderRecord> records;
    if (EXIT_SUCCESS != store_->load(records, now)) {
        std::cerr << "[Listener] Could not load dictionary: " << store_->sqliteError() << std::endl;
        return -1;
    }

    for (const HolderRecord& record : records)
        dictionary_.recordRef(record.ref, record.chunk_total, record.holder, record.last_seen);

    std::cout << "[Listener] Restored " << records.size() << " holder entries." << std::endl;
    return static_cast<int>(records.size());
}

} //csw
