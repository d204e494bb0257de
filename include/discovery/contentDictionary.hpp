#pragma once

#include "chunkInfo.hpp"
#include "peerAddress.hpp"

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PeerEntry
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> One peer known to hold one chunk identity.
 *
 * Fields:
 * -> addr:
 *    Where the peer serves chunks.
 * -> f_name / index:
 *    The name the peer most recently advertised the chunk under. Requests go
 *    out under this name, which lets identical content be fetched from a peer
 *    that stores it as part of a different file.
 * -> last_seen:
 *    Receipt time of the newest announcement naming this chunk. Never moves
 *    backwards.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct PeerEntry {
    PeerAddress addr;
    std::string f_name;
    uint32_t    index = 0;
    TimePoint   last_seen;
};

//every identity advertised for one index of one file, expected identity first
struct ChunkCandidates {
    uint32_t      index = 0;
    ChunkIdentity expected{};
    std::vector<std::pair<ChunkIdentity, std::vector<PeerEntry>>> by_identity;
};

struct FileSummary {
    std::string f_name;
    uint32_t    chunk_count   = 0;
    uint32_t    indices_known = 0; //indices with at least one live holder
    size_t      holders       = 0; //distinct peers holding any chunk of it
};

//flat form of one entry, used to persist the dictionary
struct HolderRecord {
    ChunkRef    ref;
    uint32_t    chunk_total = 0;
    PeerAddress holder;
    TimePoint   last_seen;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ContentDictionary
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Maps chunk identities to the peers currently known to hold them, plus a
 *    catalog of file name -> chunk count and index -> advertised identities.
 *
 *    Identities are spread over SHARD_COUNT shards, each behind its own
 *    reader/writer lock, so writes for different identities don't contend and
 *    readers only block on the shard they touch. The catalog has its own lock.
 *    When both are needed the catalog lock is always taken first.
 *
 *    Every time-dependent operation takes the current time as an argument.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class ContentDictionary {
public:
    static constexpr size_t SHARD_COUNT = 16;

    explicit ContentDictionary(std::chrono::milliseconds stale_after);

    ContentDictionary(const ContentDictionary&)            = delete;
    ContentDictionary& operator=(const ContentDictionary&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * recordRef
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Upserts holder as a holder of ref.identity seen at now, and files
     *    the ref in the catalog. An existing entry for the same address is
     *    refreshed in place, never duplicated. Its last_seen only advances.
     *
     * Takes:
     * -> ref:
     *    The chunk advertised.
     * -> chunk_count:
     *    Total chunks of ref.f_name per the advertiser. The newest count wins
     *    if peers disagree.
     * -> holder:
     *    Who advertised it.
     * -> now:
     *    Receipt time.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    void recordRef(const ChunkRef&    ref,
                   uint32_t           chunk_count,
                   const PeerAddress& holder,
                   TimePoint          now);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * sweep
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Evicts every entry whose last_seen is more than the staleness window
     *    before now. Identities left with no holder are dropped, and so are
     *    catalog indices and files left with no identity.
     *
     * Returns:
     * -> The number of entries evicted.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    size_t sweep(TimePoint now);

    //copy of the holders of identity, empty if unknown
    std::vector<PeerEntry> holders(const ChunkIdentity& identity) const;

    std::optional<uint32_t> chunkCount(const std::string& f_name) const;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * candidates
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Snapshots who can serve index of f_name. When several identities
     *    were advertised for the index, the one with the most holders is the
     *    expected identity (ties go to the one seen most recently) and is
     *    listed first. Identities with no live holder are left out.
     *
     * Returns:
     * -> On success:
     *    The candidates.
     * -> On failure:
     *    std::nullopt if no live holder is known for that index.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    std::optional<ChunkCandidates> candidates(const std::string& f_name, uint32_t index) const;

    std::vector<FileSummary> files() const;

    size_t identityCount() const;

    //every entry, for persisting
    std::vector<HolderRecord> snapshot() const;

    std::chrono::milliseconds staleAfter() const { return stale_after_; }

private:
    using HolderMap = std::unordered_map<ChunkIdentity, std::vector<PeerEntry>, ChunkIdentityHash>;

    struct Shard {
        mutable std::shared_mutex mtx;
        HolderMap                 holders;
    };

    struct CatalogFile {
        uint32_t chunk_count = 0;
        std::map<uint32_t, std::set<ChunkIdentity>> indices;
    };

    Shard&       shardFor(const ChunkIdentity& identity);
    const Shard& shardFor(const ChunkIdentity& identity) const;

    std::chrono::milliseconds               stale_after_;
    std::array<Shard, SHARD_COUNT>          shards_;

    mutable std::shared_mutex               catalog_mtx_;
    std::map<std::string, CatalogFile>      catalog_;
};

} //csw
