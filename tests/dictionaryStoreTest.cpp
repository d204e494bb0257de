#include "discovery/internal/database/dictionaryStore.hpp"
#include "discovery/contentDictionary.hpp"
#include "testUtil.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <sqlite3.h>

using namespace csw;
using namespace std::chrono_literals;

namespace {

const PeerAddress PEER_A{"10.0.0.1", 5000};
const PeerAddress PEER_B{"10.0.0.2", 5001};

void execRaw(const std::string& db_path, const std::string& sql) {
    sqlite3* db = nullptr;
    ASSERT_EQ(SQLITE_OK, sqlite3_open(db_path.c_str(), &db));
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    ASSERT_EQ(SQLITE_OK, rc) << msg;
}

} //anon

TEST(DictionaryStore, OpenFailureThrows) {
    EXPECT_THROW(DictionaryStore("/nonexistent/dir/dict.db"), SQLError);
}

TEST(DictionaryStore, SavedDictionaryLoadsWithSameHolders) {
    test::TempDir dir;
    DictionaryStore store((dir / "dict.db").string());
    TimePoint now = Clock::now();

    ContentDictionary dict(20s);
    dict.recordRef(ChunkRef{"movie", 0, test::fakeIdentity(1)}, 2, PEER_A, now - 3s);
    dict.recordRef(ChunkRef{"movie", 1, test::fakeIdentity(2)}, 2, PEER_A, now - 3s);
    dict.recordRef(ChunkRef{"movie", 0, test::fakeIdentity(1)}, 2, PEER_B, now);
    dict.recordRef(ChunkRef{"it's.txt", 0, test::fakeIdentity(3)}, 1, PEER_B, now); //quote in a name

    ASSERT_EQ(EXIT_SUCCESS, store.save(dict.snapshot(), now));

    std::vector<HolderRecord> records;
    ASSERT_EQ(EXIT_SUCCESS, store.load(records, now));
    ASSERT_EQ(4u, records.size());

    ContentDictionary fresh(20s);
    for (const HolderRecord& r : records)
        fresh.recordRef(r.ref, r.chunk_total, r.holder, r.last_seen);

    for (uint8_t id = 1; id <= 3; ++id) {
        auto before = dict.holders(test::fakeIdentity(id));
        auto after  = fresh.holders(test::fakeIdentity(id));
        ASSERT_EQ(before.size(), after.size());
        for (const PeerEntry& e : before) {
            auto match = std::find_if(after.begin(), after.end(), [&](const PeerEntry& a) { return a.addr == e.addr; });
            ASSERT_NE(after.end(), match);
            EXPECT_EQ(e.f_name, match->f_name);
            EXPECT_EQ(e.index, match->index);
            //ms precision on disk plus the time between save and load
            EXPECT_LT(std::chrono::abs(match->last_seen - e.last_seen), 1s);
        }
    }
    EXPECT_EQ(2u, fresh.chunkCount("movie").value_or(0));
    EXPECT_EQ(1u, fresh.chunkCount("it's.txt").value_or(0));
}

TEST(DictionaryStore, SaveReplacesPreviousContents) {
    test::TempDir dir;
    DictionaryStore store((dir / "dict.db").string());
    TimePoint now = Clock::now();

    HolderRecord a{ChunkRef{"a", 0, test::fakeIdentity(1)}, 1, PEER_A, now};
    HolderRecord b{ChunkRef{"b", 0, test::fakeIdentity(2)}, 1, PEER_B, now};
    ASSERT_EQ(EXIT_SUCCESS, store.save({a, b}, now));
    ASSERT_EQ(EXIT_SUCCESS, store.save({b}, now));

    std::vector<HolderRecord> records;
    ASSERT_EQ(EXIT_SUCCESS, store.load(records, now));
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("b", records[0].ref.f_name);

    ASSERT_EQ(EXIT_SUCCESS, store.save({}, now));
    ASSERT_EQ(EXIT_SUCCESS, store.load(records, now));
    EXPECT_TRUE(records.empty());
}

TEST(DictionaryStore, DuplicateKeysKeepFreshest) {
    test::TempDir dir;
    DictionaryStore store((dir / "dict.db").string());
    TimePoint now = Clock::now();

    //same holder, file and index under two identities
    HolderRecord old_rec{ChunkRef{"a", 0, test::fakeIdentity(1)}, 1, PEER_A, now - 10s};
    HolderRecord new_rec{ChunkRef{"a", 0, test::fakeIdentity(2)}, 1, PEER_A, now};
    ASSERT_EQ(EXIT_SUCCESS, store.save({old_rec, new_rec}, now));

    std::vector<HolderRecord> records;
    ASSERT_EQ(EXIT_SUCCESS, store.load(records, now));
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(test::fakeIdentity(2), records[0].ref.identity);
}

TEST(DictionaryStore, MalformedRowsAreSkipped) {
    test::TempDir dir;
    std::string path = (dir / "dict.db").string();
    DictionaryStore store(path);
    TimePoint now = Clock::now();

    HolderRecord good{ChunkRef{"a", 0, test::fakeIdentity(1)}, 1, PEER_A, now};
    ASSERT_EQ(EXIT_SUCCESS, store.save({good}, now));

    execRaw(path, "INSERT INTO CHUNK_HOLDERS VALUES "
                  "('x|bad-digest|0', 'bad-digest', 0, 1, 'zz', '10.0.0.3', 5000, 0);");
    execRaw(path, "INSERT INTO CHUNK_HOLDERS VALUES "
                  "('x|bad-index|5', 'bad-index', 5, 1, '" + identityToHex(test::fakeIdentity(4)) + "', '10.0.0.3', 5000, 0);");

    std::vector<HolderRecord> records;
    ASSERT_EQ(EXIT_SUCCESS, store.load(records, now));
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("a", records[0].ref.f_name);
}
