#include "transfer/downloadManager.hpp"
#include "transfer/internal/chunkFetch.hpp"
#include "networking/fileParsing.hpp"
#include "networking/messageFormatting.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace csw {

//longest a waiting worker goes without checking for abandonment
static constexpr std::chrono::milliseconds ABANDON_POLL{200};

void mostRecentFirst(std::vector<PeerEntry>& holders) {
    std::sort(holders.begin(), holders.end(), [](const PeerEntry& a, const PeerEntry& b) {
        if (a.last_seen != b.last_seen)
            return a.last_seen > b.last_seen;
        return a.addr < b.addr;
    });
}

RetryPolicy RetryPolicy::fromConfig(const Config& config) {
    RetryPolicy policy;
    policy.max_workers     = config.max_workers;
    policy.retry_attempts  = config.retry_attempts;
    policy.retry_backoff   = std::chrono::milliseconds(config.retry_backoff_ms);
    policy.request_timeout = std::chrono::milliseconds(config.request_timeout_ms);
    return policy;
}

const char* chunkStateName(ChunkState state) {
    switch (state) {
        case ChunkState::Pending:  return "pending";
        case ChunkState::InFlight: return "in flight";
        case ChunkState::Verified: return "verified";
        case ChunkState::Failed:   return "failed";
    }
    return "unknown";
}

DownloadManager::DownloadManager(ContentDictionary&    dictionary,
                                 ConnectionPool&       pool,
                                 std::filesystem::path chunk_dir,
                                 std::filesystem::path downloads_dir,
                                 RetryPolicy           policy)
    :
    dictionary_    (dictionary),
    pool_          (pool),
    chunk_dir_     (std::move(chunk_dir)),
    downloads_dir_ (std::move(downloads_dir)),
    policy_        (std::move(policy)) {
    if (!policy_.ordering)
        policy_.ordering = mostRecentFirst;
}

DownloadResult DownloadManager::download(const std::string& f_name) {
    DownloadResult result;
    result.f_name = f_name;

    if (!validFileName(f_name)) {
        result.error = "invalid file name";
        return result;
    }

    auto count = dictionary_.chunkCount(f_name);
    if (!count || count.value() == 0) {
        std::cerr << "[DownloadManager] No peer announced " << f_name << std::endl;
        result.error = "unknown file";
        return result;
    }

    //a count restored from disk skips the datagram check
    if (count.value() > MAX_CHUNK_COUNT) {
        std::cerr << "[DownloadManager] " << f_name << " was announced with " << count.value()
                  << " chunks, refusing" << std::endl;
        result.error = "chunk count too large";
        return result;
    }

    if (EXIT_SUCCESS != writeChunkTotal(chunk_dir_, f_name, count.value())) {
        result.error = "could not write to chunk storage";
        return result;
    }

    Job job;
    job.f_name      = f_name;
    job.chunk_count = count.value();
    job.states.assign(job.chunk_count, ChunkState::Pending);
    job.rounds.assign(job.chunk_count, 0);
    job.unresolved  = job.chunk_count;

    TimePoint now = Clock::now();
    for (uint32_t i = 0; i < job.chunk_count; ++i)
        job.queue.emplace_back(i, now);

    size_t worker_count = std::min<size_t>(std::max<size_t>(policy_.max_workers, 1), job.chunk_count);
    std::cout << "[DownloadManager] Downloading " << f_name << ": " << job.chunk_count
              << " chunks with " << worker_count << " workers." << std::endl;

    std::vector<std::thread> workers;
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back(&DownloadManager::workerLoop, this, std::ref(job));
    for (auto& t : workers)
        t.join();

    result.states = job.states;
    for (uint32_t i = 0; i < job.chunk_count; ++i)
        if (job.states[i] != ChunkState::Verified)
            result.missing.push_back(i);

    if (!result.missing.empty()) {
        result.error = abandoned_.load() ? "download abandoned"
                                         : std::to_string(result.missing.size()) + " chunks could not be fetched";
        std::cerr << "[DownloadManager] " << f_name << " incomplete, missing chunks:";
        for (uint32_t i : result.missing)
            std::cerr << ' ' << i;
        std::cerr << std::endl;
        return result;
    }

    auto output = stitchChunks(chunk_dir_, f_name, job.chunk_count, downloads_dir_);
    if (!output) {
        result.error = "could not assemble the output file";
        return result;
    }

    result.success     = true;
    result.output_path = output;
    std::cout << "[DownloadManager] " << f_name << " complete: " << output->string() << std::endl;
    return result;
}

void DownloadManager::workerLoop(Job& job) {
    std::unique_lock<std::mutex> lock(job.mtx);
    while (true) {
        if (job.unresolved == 0 || abandoned_.load())
            break;

        if (job.queue.empty()) {
            //the rest is in flight, one of those may come back for a retry
            job.cv.wait_for(lock, ABANDON_POLL);
            continue;
        }

        //retries are queued behind everything else with a fixed backoff, so the front is due first
        auto [index, not_before] = job.queue.front();
        TimePoint now = Clock::now();
        if (not_before > now) {
            job.cv.wait_until(lock, std::min(not_before, now + ABANDON_POLL));
            continue;
        }

        job.queue.pop_front();
        job.states[index] = ChunkState::InFlight;

        lock.unlock();
        bool verified = fetchIndex(job, index);
        lock.lock();

        if (verified) {
            job.states[index] = ChunkState::Verified;
            --job.unresolved;
        } else if (job.rounds[index] < policy_.retry_attempts && !abandoned_.load()) {
            ++job.rounds[index];
            job.states[index] = ChunkState::Pending;
            job.queue.emplace_back(index, Clock::now() + policy_.retry_backoff);
            std::cerr << "[DownloadManager] " << job.f_name << "->" << index << " failed, retry "
                      << job.rounds[index] << "/" << policy_.retry_attempts << std::endl;
        } else {
            job.states[index] = ChunkState::Failed;
            --job.unresolved;
            std::cerr << "[DownloadManager] Giving up on " << job.f_name << "->" << index << std::endl;
        }

        job.cv.notify_all();
    }
}

bool DownloadManager::alreadyStored(const std::string&   f_name,
                                    uint32_t             index,
                                    const ChunkIdentity& expected) const {
    auto stored = readChunk(chunk_dir_, f_name, index);
    if (!stored)
        return false;
    auto digest = sha256Digest(stored.value());
    return digest && digest.value() == expected;
}

bool DownloadManager::fetchIndex(const Job& job, uint32_t index) {
    auto candidates = dictionary_.candidates(job.f_name, index);
    if (!candidates) {
        std::cerr << "[DownloadManager] No live holders for " << job.f_name << "->" << index << std::endl;
        return false;
    }

    if (alreadyStored(job.f_name, index, candidates->expected))
        return true;

    //expected identity's holders first, by_identity already leads with it
    std::vector<PeerEntry> attempts;
    for (auto& [identity, holders] : candidates->by_identity) {
        policy_.ordering(holders);
        attempts.insert(attempts.end(), holders.begin(), holders.end());
    }

    std::vector<uint8_t> chunk;
    for (const PeerEntry& holder : attempts) {
        if (abandoned_.load())
            return false;

        auto conn = pool_.checkout(holder.addr);
        if (!conn) {
            std::cerr << "[DownloadManager] " << holder.addr.toString() << " unreachable." << std::endl;
            continue;
        }

        FetchStatus status = fetchChunk(conn->fd, holder.f_name, holder.index, policy_.request_timeout, chunk);
        pool_.release(std::move(conn), connectionReusable(status));

        if (status == FetchStatus::NOT_FOUND) {
            std::cerr << "[DownloadManager] " << holder.addr.toString() << " no longer has "
                      << holder.f_name << "->" << holder.index << std::endl;
            continue;
        }
        if (status != FetchStatus::OK) {
            std::cerr << "[DownloadManager] Request to " << holder.addr.toString()
                      << " failed (" << (status == FetchStatus::IO_ERROR ? "timeout or i/o error" : "protocol error")
                      << ")" << std::endl;
            continue;
        }

        auto digest = sha256Digest(chunk);
        if (!digest || digest.value() != candidates->expected) {
            std::cerr << "[DownloadManager] Digest mismatch for " << job.f_name << "->" << index
                      << " from " << holder.addr.toString() << std::endl;
            continue;
        }

        if (EXIT_SUCCESS != writeChunk(chunk_dir_, job.f_name, index, chunk)) {
            std::cerr << "[DownloadManager] Could not store " << job.f_name << "->" << index << std::endl;
            return false;
        }
        return true;
    }

    return false;
}

} //csw
