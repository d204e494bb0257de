#include "discovery/contentDictionary.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace csw;
using namespace std::chrono_literals;

namespace {

const PeerAddress PEER_A{"10.0.0.1", 5000};
const PeerAddress PEER_B{"10.0.0.2", 5000};
const PeerAddress PEER_C{"10.0.0.3", 5000};

} //anon

TEST(ContentDictionary, RecordsAndRefreshesWithoutDuplicates) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;
    ChunkRef ref{"movie", 0, test::fakeIdentity(1)};

    dict.recordRef(ref, 2, PEER_A, t0);
    dict.recordRef(ref, 2, PEER_A, t0 + 5s);
    dict.recordRef(ref, 2, PEER_A, t0 + 10s);

    auto holders = dict.holders(ref.identity);
    ASSERT_EQ(1u, holders.size());
    EXPECT_EQ(PEER_A, holders[0].addr);
    EXPECT_EQ(t0 + 10s, holders[0].last_seen);
    EXPECT_EQ("movie", holders[0].f_name);
    EXPECT_EQ(2u, dict.chunkCount("movie").value_or(0));
    EXPECT_EQ(1u, dict.identityCount());
}

TEST(ContentDictionary, LastSeenNeverMovesBackwards) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;
    ChunkRef ref{"movie", 0, test::fakeIdentity(1)};

    dict.recordRef(ref, 1, PEER_A, t0 + 10s);
    dict.recordRef(ref, 1, PEER_A, t0); //delayed datagram
    EXPECT_EQ(t0 + 10s, dict.holders(ref.identity)[0].last_seen);
}

TEST(ContentDictionary, SweepKeepsPeersWithinWindowAndEvictsAfter) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;
    ChunkRef r0{"movie", 0, test::fakeIdentity(1)};
    ChunkRef r1{"movie", 1, test::fakeIdentity(2)};

    dict.recordRef(r0, 2, PEER_A, t0);
    dict.recordRef(r1, 2, PEER_A, t0);
    dict.recordRef(r0, 2, PEER_B, t0 + 15s);

    EXPECT_EQ(0u, dict.sweep(t0 + 20s)); //exactly at the window is still fresh
    EXPECT_EQ(2u, dict.holders(r0.identity).size());

    EXPECT_EQ(2u, dict.sweep(t0 + 21s)); //two missed intervals
    auto holders = dict.holders(r0.identity);
    ASSERT_EQ(1u, holders.size());
    EXPECT_EQ(PEER_B, holders[0].addr);
    EXPECT_TRUE(dict.holders(r1.identity).empty());
    EXPECT_FALSE(dict.candidates("movie", 1));
    EXPECT_TRUE(dict.candidates("movie", 0));

    EXPECT_EQ(1u, dict.sweep(t0 + 40s));
    EXPECT_EQ(0u, dict.identityCount());
    EXPECT_FALSE(dict.chunkCount("movie"));
    EXPECT_TRUE(dict.files().empty());
}

TEST(ContentDictionary, SameContentUnderDifferentNamesSharesHolders) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;
    ChunkIdentity shared = test::fakeIdentity(7);

    dict.recordRef(ChunkRef{"movie", 3, shared}, 4, PEER_A, t0);
    dict.recordRef(ChunkRef{"copy-of-movie", 0, shared}, 1, PEER_B, t0);

    auto cands = dict.candidates("movie", 3);
    ASSERT_TRUE(cands.has_value());
    ASSERT_EQ(1u, cands->by_identity.size());
    auto& holders = cands->by_identity[0].second;
    ASSERT_EQ(2u, holders.size());

    //each holder is asked under the name it advertised
    for (const PeerEntry& e : holders) {
        if (e.addr == PEER_B) {
            EXPECT_EQ("copy-of-movie", e.f_name);
            EXPECT_EQ(0u, e.index);
        } else {
            EXPECT_EQ("movie", e.f_name);
            EXPECT_EQ(3u, e.index);
        }
    }
}

TEST(ContentDictionary, ExpectedIdentityHasMostHolders) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;
    ChunkIdentity good = test::fakeIdentity(1);
    ChunkIdentity odd  = test::fakeIdentity(2);

    dict.recordRef(ChunkRef{"movie", 0, odd},  1, PEER_A, t0 + 5s);
    dict.recordRef(ChunkRef{"movie", 0, good}, 1, PEER_B, t0);
    dict.recordRef(ChunkRef{"movie", 0, good}, 1, PEER_C, t0);

    auto cands = dict.candidates("movie", 0);
    ASSERT_TRUE(cands.has_value());
    EXPECT_EQ(good, cands->expected);
    ASSERT_EQ(2u, cands->by_identity.size());
    EXPECT_EQ(good, cands->by_identity[0].first);
    EXPECT_EQ(odd,  cands->by_identity[1].first);
}

TEST(ContentDictionary, HolderCountTieGoesToMostRecent) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;
    ChunkIdentity older = test::fakeIdentity(1);
    ChunkIdentity newer = test::fakeIdentity(2);

    dict.recordRef(ChunkRef{"f", 0, older}, 1, PEER_A, t0);
    dict.recordRef(ChunkRef{"f", 0, newer}, 1, PEER_B, t0 + 1s);

    auto cands = dict.candidates("f", 0);
    ASSERT_TRUE(cands.has_value());
    EXPECT_EQ(newer, cands->expected);
}

TEST(ContentDictionary, NewestChunkCountWins) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;
    dict.recordRef(ChunkRef{"f", 0, test::fakeIdentity(1)}, 3, PEER_A, t0);
    dict.recordRef(ChunkRef{"f", 0, test::fakeIdentity(2)}, 5, PEER_B, t0 + 1s);
    EXPECT_EQ(5u, dict.chunkCount("f").value_or(0));
}

TEST(ContentDictionary, FileSummaries) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;
    dict.recordRef(ChunkRef{"movie", 0, test::fakeIdentity(1)}, 3, PEER_A, t0);
    dict.recordRef(ChunkRef{"movie", 1, test::fakeIdentity(2)}, 3, PEER_B, t0);
    dict.recordRef(ChunkRef{"notes", 0, test::fakeIdentity(3)}, 1, PEER_A, t0);

    auto files = dict.files();
    ASSERT_EQ(2u, files.size());
    EXPECT_EQ("movie", files[0].f_name);
    EXPECT_EQ(3u, files[0].chunk_count);
    EXPECT_EQ(2u, files[0].indices_known);
    EXPECT_EQ(2u, files[0].holders);
    EXPECT_EQ("notes", files[1].f_name);
    EXPECT_EQ(1u, files[1].holders);

    EXPECT_EQ(3u, dict.snapshot().size());
}

TEST(ContentDictionary, ConcurrentWritersAndReaders) {
    ContentDictionary dict(20s);
    TimePoint t0 = TimePoint{} + 1h;

    std::vector<std::thread> threads;
    for (uint8_t w = 0; w < 4; ++w) {
        threads.emplace_back([&dict, w, t0] {
            PeerAddress peer{"10.0.1." + std::to_string(w), 5000};
            for (uint32_t i = 0; i < 200; ++i)
                dict.recordRef(ChunkRef{"big", i, test::fakeIdentity(static_cast<uint8_t>(i))}, 200, peer, t0);
        });
    }
    threads.emplace_back([&dict] {
        for (int i = 0; i < 200; ++i) {
            dict.candidates("big", static_cast<uint32_t>(i));
            dict.files();
        }
    });
    for (auto& t : threads)
        t.join();

    //fakeIdentity(i) for i < 200 gives 200 distinct identities
    EXPECT_EQ(200u, dict.identityCount());
    EXPECT_EQ(4u, dict.holders(test::fakeIdentity(9)).size());
}
