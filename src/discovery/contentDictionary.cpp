#include "discovery/contentDictionary.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace csw {

ContentDictionary::ContentDictionary(std::chrono::milliseconds stale_after)
    :
    stale_after_(stale_after) {}

ContentDictionary::Shard& ContentDictionary::shardFor(const ChunkIdentity& identity) {
    return shards_[ChunkIdentityHash()(identity) % SHARD_COUNT];
}

const ContentDictionary::Shard& ContentDictionary::shardFor(const ChunkIdentity& identity) const {
    return shards_[ChunkIdentityHash()(identity) % SHARD_COUNT];
}

void ContentDictionary::recordRef(const ChunkRef&    ref,
                                  uint32_t           chunk_count,
                                  const PeerAddress& holder,
                                  TimePoint          now) {
    {
        Shard& shard = shardFor(ref.identity);
        std::unique_lock<std::shared_mutex> lock(shard.mtx);
        auto& entries = shard.holders[ref.identity];

        auto it = std::find_if(entries.begin(), entries.end(),
                               [&holder](const PeerEntry& e) { return e.addr == holder; });
        if (it == entries.end()) {
            entries.push_back(PeerEntry{holder, ref.f_name, ref.index, now});
        } else if (now >= it->last_seen) {
            it->last_seen = now;
            it->f_name    = ref.f_name;
            it->index     = ref.index;
        }
    }

    //shard lock released above, catalog comes first in lock order
    std::unique_lock<std::shared_mutex> lock(catalog_mtx_);
    CatalogFile& file = catalog_[ref.f_name];
    file.chunk_count  = chunk_count;
    file.indices[ref.index].insert(ref.identity);
}

size_t ContentDictionary::sweep(TimePoint now) {
    size_t evicted = 0;

    for (Shard& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mtx);
        for (auto it = shard.holders.begin(); it != shard.holders.end();) {
            auto& entries = it->second;
            auto stale = std::remove_if(entries.begin(), entries.end(), [&](const PeerEntry& e) {
                return now - e.last_seen > stale_after_;
            });
            evicted += std::distance(stale, entries.end());
            entries.erase(stale, entries.end());

            if (entries.empty())
                it = shard.holders.erase(it);
            else
                ++it;
        }
    }

    //prune catalog references to identities nobody holds anymore
    std::unique_lock<std::shared_mutex> cat_lock(catalog_mtx_);
    for (auto f_it = catalog_.begin(); f_it != catalog_.end();) {
        auto& indices = f_it->second.indices;
        for (auto i_it = indices.begin(); i_it != indices.end();) {
            auto& identities = i_it->second;
            for (auto id_it = identities.begin(); id_it != identities.end();) {
                const Shard& shard = shardFor(*id_it);
                std::shared_lock<std::shared_mutex> lock(shard.mtx);
                if (shard.holders.count(*id_it) == 0)
                    id_it = identities.erase(id_it);
                else
                    ++id_it;
            }

            if (identities.empty())
                i_it = indices.erase(i_it);
            else
                ++i_it;
        }

        if (indices.empty())
            f_it = catalog_.erase(f_it);
        else
            ++f_it;
    }

    return evicted;
}

std::vector<PeerEntry> ContentDictionary::holders(const ChunkIdentity& identity) const {
    const Shard& shard = shardFor(identity);
    std::shared_lock<std::shared_mutex> lock(shard.mtx);
    auto it = shard.holders.find(identity);
    if (it == shard.holders.end())
        return {};
    return it->second;
}

std::optional<uint32_t> ContentDictionary::chunkCount(const std::string& f_name) const {
    std::shared_lock<std::shared_mutex> lock(catalog_mtx_);
    auto it = catalog_.find(f_name);
    if (it == catalog_.end())
        return std::nullopt;
    return it->second.chunk_count;
}

std::optional<ChunkCandidates> ContentDictionary::candidates(const std::string& f_name,
                                                             uint32_t           index) const {
    ChunkCandidates result;
    result.index = index;

    {
        std::shared_lock<std::shared_mutex> cat_lock(catalog_mtx_);
        auto f_it = catalog_.find(f_name);
        if (f_it == catalog_.end())
            return std::nullopt;
        auto i_it = f_it->second.indices.find(index);
        if (i_it == f_it->second.indices.end())
            return std::nullopt;

        for (const ChunkIdentity& identity : i_it->second) {
            const Shard& shard = shardFor(identity);
            std::shared_lock<std::shared_mutex> lock(shard.mtx);
            auto h_it = shard.holders.find(identity);
            if (h_it != shard.holders.end() && !h_it->second.empty())
                result.by_identity.emplace_back(identity, h_it->second);
        }
    }

    if (result.by_identity.empty())
        return std::nullopt;

    auto newest = [](const std::vector<PeerEntry>& entries) {
        TimePoint latest = TimePoint::min();
        for (const PeerEntry& e : entries)
            latest = std::max(latest, e.last_seen);
        return latest;
    };

    //most holders first, then most recently seen, then identity for a stable order
    std::sort(result.by_identity.begin(), result.by_identity.end(), [&](const auto& a, const auto& b) {
        if (a.second.size() != b.second.size())
            return a.second.size() > b.second.size();
        TimePoint a_seen = newest(a.second);
        TimePoint b_seen = newest(b.second);
        if (a_seen != b_seen)
            return a_seen > b_seen;
        return a.first < b.first;
    });

    result.expected = result.by_identity.front().first;
    return result;
}

std::vector<FileSummary> ContentDictionary::files() const {
    std::vector<FileSummary> summaries;
    std::shared_lock<std::shared_mutex> cat_lock(catalog_mtx_);

    for (const auto& [f_name, file] : catalog_) {
        FileSummary summary;
        summary.f_name      = f_name;
        summary.chunk_count = file.chunk_count;
        std::set<PeerAddress> peers;

        for (const auto& [index, identities] : file.indices) {
            bool held = false;
            for (const ChunkIdentity& identity : identities) {
                const Shard& shard = shardFor(identity);
                std::shared_lock<std::shared_mutex> lock(shard.mtx);
                auto h_it = shard.holders.find(identity);
                if (h_it == shard.holders.end())
                    continue;
                for (const PeerEntry& e : h_it->second) {
                    held = true;
                    peers.insert(e.addr);
                }
            }
            if (held && index < file.chunk_count)
                ++summary.indices_known;
        }

        summary.holders = peers.size();
        summaries.push_back(std::move(summary));
    }

    return summaries;
}

size_t ContentDictionary::identityCount() const {
    size_t count = 0;
    for (const Shard& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mtx);
        count += shard.holders.size();
    }
    return count;
}

std::vector<HolderRecord> ContentDictionary::snapshot() const {
    std::vector<HolderRecord> records;
    std::shared_lock<std::shared_mutex> cat_lock(catalog_mtx_);

    for (const Shard& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mtx);
        for (const auto& [identity, entries] : shard.holders) {
            for (const PeerEntry& e : entries) {
                HolderRecord record;
                record.ref         = ChunkRef{e.f_name, e.index, identity};
                record.holder      = e.addr;
                record.last_seen   = e.last_seen;

                auto f_it = catalog_.find(e.f_name);
                record.chunk_total = f_it == catalog_.end() ? e.index + 1 : f_it->second.chunk_count;
                records.push_back(std::move(record));
            }
        }
    }

    return records;
}

} //csw
