#include "discovery/announcer.hpp"
#include "networking/fileParsing.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>

using namespace csw;

namespace {

Config announcerConfig(const test::TempDir& dir) {
    Config config;
    config.chunk_dir      = (dir / "chunks").string();
    config.broadcast_addr = "";
    return config;
}

} //anon

TEST(Announcer, AdvertisesEveryStoredChunkWithItsDigest) {
    test::TempDir dir;
    Config config = announcerConfig(dir);
    test::writeFile(dir / "movie", test::patternBytes(2500, 1));
    ASSERT_EQ(3u, splitFile(dir / "movie", config.chunk_dir, 1000).value_or(0));

    Announcer announcer(config, 5000);
    Announcement ann = announcer.buildAnnouncement();
    EXPECT_EQ(5000, ann.serving_port);
    EXPECT_GT(ann.timestamp_ms, 0u);
    ASSERT_EQ(1u, ann.files.size());
    EXPECT_EQ("movie", ann.files[0].f_name);
    EXPECT_EQ(3u, ann.files[0].chunk_count);
    ASSERT_EQ(3u, ann.files[0].chunks.size());

    for (const auto& [index, identity] : ann.files[0].chunks) {
        auto data = readChunk(config.chunk_dir, "movie", index);
        ASSERT_TRUE(data.has_value());
        EXPECT_EQ(sha256Digest(*data).value(), identity);
    }
}

TEST(Announcer, PartialFileAnnouncesTheChunksItHas) {
    test::TempDir dir;
    Config config = announcerConfig(dir);
    ASSERT_EQ(EXIT_SUCCESS, writeChunkTotal(config.chunk_dir, "movie", 4));
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(config.chunk_dir, "movie", 2, test::patternBytes(10, 1)));

    Announcer announcer(config, 5000);
    Announcement ann = announcer.buildAnnouncement();
    ASSERT_EQ(1u, ann.files.size());
    EXPECT_EQ(4u, ann.files[0].chunk_count);
    ASSERT_EQ(1u, ann.files[0].chunks.size());
    EXPECT_EQ(2u, ann.files[0].chunks[0].first);
}

TEST(Announcer, ChunksWithoutTotalFallBackToHighestIndex) {
    test::TempDir dir;
    Config config = announcerConfig(dir);
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(config.chunk_dir, "loose", 0, test::patternBytes(10, 1)));
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(config.chunk_dir, "loose", 5, test::patternBytes(10, 2)));

    Announcer announcer(config, 5000);
    Announcement ann = announcer.buildAnnouncement();
    ASSERT_EQ(1u, ann.files.size());
    EXPECT_EQ(6u, ann.files[0].chunk_count);
}

TEST(Announcer, DropsChunksPastRecordedTotal) {
    test::TempDir dir;
    Config config = announcerConfig(dir);
    ASSERT_EQ(EXIT_SUCCESS, writeChunkTotal(config.chunk_dir, "f", 1));
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(config.chunk_dir, "f", 0, test::patternBytes(10, 1)));
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(config.chunk_dir, "f", 3, test::patternBytes(10, 2)));

    Announcer announcer(config, 5000);
    Announcement ann = announcer.buildAnnouncement();
    ASSERT_EQ(1u, ann.files.size());
    ASSERT_EQ(1u, ann.files[0].chunks.size());
    EXPECT_EQ(0u, ann.files[0].chunks[0].first);
}

TEST(Announcer, DigestsAreCachedUntilTheChunkChanges) {
    test::TempDir dir;
    Config config = announcerConfig(dir);
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(config.chunk_dir, "f", 0, test::patternBytes(100, 1)));
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(config.chunk_dir, "f", 1, test::patternBytes(100, 2)));

    Announcer announcer(config, 5000);
    announcer.buildAnnouncement();
    EXPECT_EQ(2u, announcer.digestsComputed());
    announcer.buildAnnouncement();
    EXPECT_EQ(2u, announcer.digestsComputed());

    //different size guarantees the change is noticed regardless of mtime resolution
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(config.chunk_dir, "f", 1, test::patternBytes(150, 3)));
    Announcement ann = announcer.buildAnnouncement();
    EXPECT_EQ(3u, announcer.digestsComputed());
    EXPECT_EQ(sha256Digest(test::patternBytes(150, 3)).value(), ann.files[0].chunks[1].second);
}

TEST(Announcer, TargetsBroadcastThenUnicast) {
    test::TempDir dir;
    Config config = announcerConfig(dir);
    config.broadcast_addr   = "255.255.255.255";
    config.broadcast_port   = 5001;
    config.announce_targets = {PeerAddress{"127.0.0.1", 5002}};

    Announcer announcer(config, 5000);
    auto targets = announcer.targets();
    ASSERT_EQ(2u, targets.size());
    EXPECT_EQ((PeerAddress{"255.255.255.255", 5001}), targets[0]);
    EXPECT_EQ((PeerAddress{"127.0.0.1", 5002}), targets[1]);

    config.broadcast_addr = "";
    Announcer unicast_only(config, 5000);
    EXPECT_EQ(1u, unicast_only.targets().size());
}

TEST(Announcer, EmptyStorageStillAnnounces) {
    test::TempDir dir;
    Config config = announcerConfig(dir);
    config.announce_targets = {PeerAddress{"127.0.0.1", 9}}; //discard port, nobody needs to listen

    Announcer announcer(config, 5000);
    EXPECT_TRUE(announcer.buildAnnouncement().files.empty());
    EXPECT_EQ(EXIT_SUCCESS, announcer.announceOnce());
}
