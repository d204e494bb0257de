#include "discovery/announcer.hpp"
#include "networking/fileParsing.hpp"
#include "networking/socket.hpp"

#include <algorithm>
#include <iostream>
#include <set>

namespace csw {

Announcer::Announcer(const Config& config, uint16_t serving_port)
    :
    config_       (config),
    serving_port_ (serving_port) {}

Announcer::~Announcer() {
    stop();
}

int Announcer::openSendSocket() {
    if (send_fd_ >= 0)
        return EXIT_SUCCESS;

    auto sock = openSocket(false, 0, true);
    if (!sock) {
        std::cerr << "[Announcer] Could not open UDP socket." << std::endl;
        return EXIT_FAILURE;
    }

    if (EXIT_SUCCESS != udp::enableBroadcast(sock->first)) {
        std::cerr << "[Announcer] Could not enable broadcast." << std::endl;
        closeSocket(sock->first);
        return EXIT_FAILURE;
    }

    send_fd_ = sock->first;
    return EXIT_SUCCESS;
}

int Announcer::start() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (EXIT_SUCCESS != openSendSocket())
            return EXIT_FAILURE;
    }

    if (!task_) {
        task_ = std::make_unique<PeriodicTask>("Announcer",
                                               std::chrono::seconds(config_.announce_interval),
                                               [this] { announceOnce(); });
    }
    task_->start(true);
    return EXIT_SUCCESS;
}

void Announcer::stop() {
    if (task_)
        task_->stop();

    std::lock_guard<std::mutex> lock(mtx_);
    closeSocket(send_fd_);
    send_fd_ = -1;
}

std::vector<PeerAddress> Announcer::targets() const {
    std::vector<PeerAddress> dests;
    if (!config_.broadcast_addr.empty())
        dests.push_back(PeerAddress{config_.broadcast_addr, config_.broadcast_port});
    for (const PeerAddress& target : config_.announce_targets)
        dests.push_back(target);
    return dests;
}

size_t Announcer::digestsComputed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return digests_computed_;
}

Announcement Announcer::buildAnnouncement() {
    Announcement announcement;
    announcement.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    announcement.serving_port = serving_port_;

    std::vector<StoredChunk> chunks = listChunks(config_.chunk_dir);
    std::set<std::string>    present;

    std::lock_guard<std::mutex> lock(mtx_);
    for (const StoredChunk& chunk : chunks) {
        std::string key = chunk.path.string();
        present.insert(key);

        auto cached = digest_cache_.find(key);
        if (cached == digest_cache_.end()       ||
            cached->second.size  != chunk.size  ||
            cached->second.mtime != chunk.mtime) {
            auto data = readChunk(config_.chunk_dir, chunk.f_name, chunk.index);
            if (!data) {
                std::cerr << "[Announcer] Could not read " << key << std::endl;
                continue;
            }
            auto identity = sha256Digest(data.value());
            if (!identity) {
                std::cerr << "[Announcer] Could not digest " << key << std::endl;
                continue;
            }
            ++digests_computed_;
            cached = digest_cache_.insert_or_assign(key, CachedDigest{chunk.size, chunk.mtime, identity.value()}).first;
        }

        //chunks arrive sorted by file then index
        if (announcement.files.empty() || announcement.files.back().f_name != chunk.f_name) {
            AnnouncedFile file;
            file.f_name      = chunk.f_name;
            auto total       = readChunkTotal(config_.chunk_dir, chunk.f_name);
            file.chunk_count = total ? total.value() : 0;
            announcement.files.push_back(std::move(file));
        }

        AnnouncedFile& file = announcement.files.back();
        file.chunks.emplace_back(chunk.index, cached->second.identity);
    }

    //forget chunks that were removed from storage
    for (auto it = digest_cache_.begin(); it != digest_cache_.end();) {
        if (present.count(it->first) == 0)
            it = digest_cache_.erase(it);
        else
            ++it;
    }

    //files with no recorded total fall back to the highest index held
    for (AnnouncedFile& file : announcement.files) {
        if (file.chunk_count == 0) {
            file.chunk_count = file.chunks.back().first + 1;
            continue;
        }
        auto past_end = std::find_if(file.chunks.begin(), file.chunks.end(),
                                     [&file](const auto& c) { return c.first >= file.chunk_count; });
        if (past_end != file.chunks.end()) {
            std::cerr << "[Announcer] " << file.f_name << " has chunks past its recorded total, not announcing them." << std::endl;
            file.chunks.erase(past_end, file.chunks.end());
        }
    }

    //drop names that can't go on the wire, and files emptied above
    for (auto it = announcement.files.begin(); it != announcement.files.end();) {
        if (!validFileName(it->f_name) || it->chunks.empty()) {
            it = announcement.files.erase(it);
        } else if (it->chunk_count > MAX_CHUNK_COUNT) {
            std::cerr << "[Announcer] " << it->f_name << " has more chunks than peers accept, not announcing it." << std::endl;
            it = announcement.files.erase(it);
        } else {
            ++it;
        }
    }

    return announcement;
}

int Announcer::announceOnce() {
    Announcement announcement = buildAnnouncement();
    auto datagrams = splitAnnouncement(announcement, MAX_DATAGRAM_SIZE);
    if (datagrams.empty()) {
        std::cerr << "[Announcer] Could not encode announcement." << std::endl;
        return EXIT_FAILURE;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (EXIT_SUCCESS != openSendSocket())
        return EXIT_FAILURE;

    int result = EXIT_SUCCESS;
    for (const PeerAddress& target : targets()) {
        for (const auto& datagram : datagrams) {
            if (EXIT_SUCCESS != udp::sendMessage(send_fd_, target, datagram)) {
                std::cerr << "[Announcer] Send to " << target.toString() << " failed." << std::endl;
                result = EXIT_FAILURE;
            }
        }
    }

    return result;
}

} //csw
