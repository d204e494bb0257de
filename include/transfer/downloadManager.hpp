#pragma once

#include "chunkInfo.hpp"
#include "config.hpp"
#include "discovery/contentDictionary.hpp"
#include "transfer/connectionPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace csw {

//reorders the holders of one identity in place, first is tried first
using CandidateOrdering = std::function<void(std::vector<PeerEntry>&)>;

//newest last_seen first, address breaks ties
void mostRecentFirst(std::vector<PeerEntry>& holders);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * RetryPolicy
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Everything that decides how hard a download tries.
 *
 * Fields:
 * -> max_workers:
 *    Chunks fetched concurrently within one download.
 * -> retry_attempts:
 *    Rounds an index gets after its first one failed against every holder.
 * -> retry_backoff:
 *    Wait before each of those rounds. The dictionary is queried again when
 *    the round starts.
 * -> request_timeout:
 *    Bound on one request to one holder. A timeout costs that holder the
 *    attempt and its connection.
 * -> ordering:
 *    Order in which holders of one identity are tried.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct RetryPolicy {
    size_t                    max_workers     = 5;
    uint32_t                  retry_attempts  = 3;
    std::chrono::milliseconds retry_backoff   {1000};
    std::chrono::milliseconds request_timeout {10000};
    CandidateOrdering         ordering        = mostRecentFirst;

    static RetryPolicy fromConfig(const Config& config);
};

enum class ChunkState {
    Pending,
    InFlight,
    Verified,
    Failed
};

const char* chunkStateName(ChunkState state);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * DownloadResult
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Fields:
 * -> success:
 *    Every chunk verified and the output file is in place.
 * -> output_path:
 *    Set only on success.
 * -> missing:
 *    Indices that never verified, ascending. Empty for an unknown file since
 *    its chunk count is unknown too.
 * -> states:
 *    Final state of every index.
 * -> error:
 *    Why the download failed, empty on success.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct DownloadResult {
    std::string                          f_name;
    bool                                 success = false;
    std::optional<std::filesystem::path> output_path;
    std::vector<uint32_t>                missing;
    std::vector<ChunkState>              states;
    std::string                          error;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * DownloadManager
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Downloads a file chunk by chunk from whichever peers the dictionary says
 *    hold it.
 *
 *    For every index the identity with the most holders is expected. Holders
 *    of the expected identity are tried first, in policy order, then holders
 *    of any other identity advertised for that index. Bytes whose digest
 *    doesn't match the expected identity are thrown away and the next holder
 *    is tried.
 *
 *    Verified chunks land in chunk storage as they arrive and stay there, so
 *    this peer starts serving them right away. The output file is stitched
 *    only once every index is verified. A chunk already in storage with the
 *    expected digest is never fetched again.
 *
 *    Several downloads may run at once on one manager. They share the pool
 *    and the dictionary and nothing else.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class DownloadManager {
public:
    DownloadManager(ContentDictionary&    dictionary,
                    ConnectionPool&       pool,
                    std::filesystem::path chunk_dir,
                    std::filesystem::path downloads_dir,
                    RetryPolicy           policy);

    DownloadManager(const DownloadManager&)            = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * download
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Blocks until f_name is complete, some index ran out of retries, or
     *    abandonAll() was called.
     *
     * Returns:
     * -> The outcome. See DownloadResult.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    DownloadResult download(const std::string& f_name);

    //running downloads give up at their next chance, used on shutdown
    void abandonAll() { abandoned_.store(true); }
    void resume()     { abandoned_.store(false); }

    const RetryPolicy& policy() const { return policy_; }

private:
    struct Job {
        std::string             f_name;
        uint32_t                chunk_count = 0;
        std::vector<ChunkState> states;
        std::vector<uint32_t>   rounds;     //retry rounds used per index
        std::deque<std::pair<uint32_t, TimePoint>> queue; //index, not before
        uint32_t                unresolved  = 0;

        std::mutex              mtx;
        std::condition_variable cv;
    };

    void workerLoop(Job& job);
    bool fetchIndex(const Job& job, uint32_t index);
    bool alreadyStored(const std::string& f_name, uint32_t index, const ChunkIdentity& expected) const;

    ContentDictionary&    dictionary_;
    ConnectionPool&       pool_;
    std::filesystem::path chunk_dir_;
    std::filesystem::path downloads_dir_;
    RetryPolicy           policy_;
    std::atomic<bool>     abandoned_ = false;
};

} //csw
