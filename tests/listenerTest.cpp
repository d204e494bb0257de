#include "discovery/listener.hpp"
#include "discovery/announcer.hpp"
#include "discovery/internal/database/dictionaryStore.hpp"
#include "networking/fileParsing.hpp"
#include "networking/messageFormatting.hpp"
#include "networking/socket.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace csw;
using namespace std::chrono_literals;

namespace {

Config listenerConfig() {
    Config config;
    config.broadcast_port = 0; //ephemeral, tests never collide
    config.broadcast_addr = "";
    config.sweep_interval = 3600;
    config.stale_after    = 20;
    return config;
}

std::vector<uint8_t> announcementFor(uint16_t port, const std::string& f_name, uint32_t count, uint8_t seed) {
    Announcement ann;
    ann.timestamp_ms = 1;
    ann.serving_port = port;
    AnnouncedFile file{f_name, count, {}};
    for (uint32_t i = 0; i < count; ++i)
        file.chunks.emplace_back(i, test::fakeIdentity(static_cast<uint8_t>(seed + i)));
    ann.files.push_back(file);
    return createAnnouncement(ann);
}

//polls until pred holds or a couple of seconds pass
template <typename Pred>
bool eventually(Pred pred) {
    for (int i = 0; i < 200; ++i) {
        if (pred())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

} //anon

TEST(Listener, RecordsSenderAtAnnouncedPort) {
    ContentDictionary dict(20s);
    Listener listener(listenerConfig(), dict);
    TimePoint t0 = TimePoint{} + 1h;

    EXPECT_EQ(2, listener.handleDatagram("10.0.0.9", announcementFor(6001, "movie", 2, 10), t0));

    auto holders = dict.holders(test::fakeIdentity(11));
    ASSERT_EQ(1u, holders.size());
    EXPECT_EQ((PeerAddress{"10.0.0.9", 6001}), holders[0].addr);
    EXPECT_EQ(1u, holders[0].index);
    EXPECT_EQ(2u, dict.chunkCount("movie").value_or(0));
}

TEST(Listener, MalformedDatagramsNeverReachTheDictionary) {
    ContentDictionary dict(20s);
    Listener listener(listenerConfig(), dict);
    TimePoint t0 = TimePoint{} + 1h;

    auto good = announcementFor(6001, "movie", 2, 10);

    auto truncated = good;
    truncated.resize(good.size() - 5);
    auto trailing = good;
    trailing.push_back(0xFF);
    auto bad_code = good;
    bad_code[0] = 0x7F;

    EXPECT_EQ(-1, listener.handleDatagram("10.0.0.9", truncated, t0));
    EXPECT_EQ(-1, listener.handleDatagram("10.0.0.9", trailing, t0));
    EXPECT_EQ(-1, listener.handleDatagram("10.0.0.9", bad_code, t0));
    EXPECT_EQ(-1, listener.handleDatagram("10.0.0.9", {}, t0));
    EXPECT_EQ(0u, dict.identityCount());
}

TEST(Listener, HugeChunkCountIsDropped) {
    ContentDictionary dict(20s);
    Listener listener(listenerConfig(), dict);
    TimePoint t0 = TimePoint{} + 1h;

    auto datagram = announcementFor(6001, "movie", 1, 10);
    ASSERT_FALSE(datagram.empty());
    for (size_t i = 13 + 1 + 5; i < 13 + 1 + 5 + 4; ++i)
        datagram[i] = 0xFF; //4294967295 chunks

    EXPECT_EQ(-1, listener.handleDatagram("10.0.0.9", datagram, t0));
    EXPECT_EQ(0u, dict.identityCount());
    EXPECT_FALSE(dict.chunkCount("movie"));
}

TEST(Listener, PeerSurvivesWhileAnnouncingAndGoesAfterTwoMissedIntervals) {
    Config config = listenerConfig();
    config.announce_interval = 10;
    config.stale_after       = 20;
    ContentDictionary dict(std::chrono::seconds(config.stale_after));
    Listener listener(config, dict);
    TimePoint t0 = TimePoint{} + 1h;

    auto datagram = announcementFor(6001, "movie", 2, 10);
    for (int tick = 0; tick < 5; ++tick) {
        TimePoint now = t0 + std::chrono::seconds(tick * config.announce_interval);
        listener.handleDatagram("10.0.0.9", datagram, now);
        listener.sweepOnce(now + 5s);
        EXPECT_EQ(1u, dict.holders(test::fakeIdentity(10)).size());
        EXPECT_EQ(1u, dict.holders(test::fakeIdentity(11)).size());
    }

    //last heard at t0+40s, silent for two intervals and a bit
    EXPECT_EQ(2u, listener.sweepOnce(t0 + 61s));
    EXPECT_TRUE(dict.holders(test::fakeIdentity(10)).empty());
    EXPECT_FALSE(dict.chunkCount("movie"));
}

TEST(Listener, SweepPersistsAndRestoreRebuilds) {
    test::TempDir dir;
    DictionaryStore store((dir / "dict.db").string());
    TimePoint t0 = Clock::now();

    {
        ContentDictionary dict(20s);
        Listener listener(listenerConfig(), dict, &store);
        listener.handleDatagram("10.0.0.9", announcementFor(6001, "movie", 2, 10), t0 - 5s);
        listener.handleDatagram("10.0.0.8", announcementFor(6002, "movie", 2, 10), t0);
        listener.sweepOnce(t0);
    }

    ContentDictionary fresh(20s);
    Listener restorer(listenerConfig(), fresh, &store);
    EXPECT_EQ(4, restorer.restoreFromStore(t0));
    EXPECT_EQ(2u, fresh.holders(test::fakeIdentity(10)).size());
    EXPECT_EQ(2u, fresh.chunkCount("movie").value_or(0));

    //the older peer kept its age: it goes stale first
    EXPECT_EQ(2u, fresh.sweep(t0 + 17s));
    auto left = fresh.holders(test::fakeIdentity(10));
    ASSERT_EQ(1u, left.size());
    EXPECT_EQ((PeerAddress{"10.0.0.8", 6002}), left[0].addr);
}

TEST(Listener, ReceivesAnnouncementsOverLoopback) {
    ContentDictionary dict(20s);
    Listener listener(listenerConfig(), dict);
    ASSERT_EQ(EXIT_SUCCESS, listener.start());
    ASSERT_NE(0, listener.boundPort());

    auto sock = openSocket(false, 0, true);
    ASSERT_TRUE(sock.has_value());
    ASSERT_EQ(EXIT_SUCCESS, udp::sendMessage(sock->first,
                                             PeerAddress{"127.0.0.1", listener.boundPort()},
                                             announcementFor(6001, "movie", 2, 10)));
    closeSocket(sock->first);

    EXPECT_TRUE(eventually([&] { return dict.holders(test::fakeIdentity(10)).size() == 1; }));
    auto holders = dict.holders(test::fakeIdentity(10));
    ASSERT_EQ(1u, holders.size());
    EXPECT_EQ((PeerAddress{"127.0.0.1", 6001}), holders[0].addr);

    listener.stop();
}

TEST(Listener, HearsAnAnnouncerThroughUnicastTarget) {
    test::TempDir dir;
    ContentDictionary dict(20s);
    Listener listener(listenerConfig(), dict);
    ASSERT_EQ(EXIT_SUCCESS, listener.start());

    Config announcer_config;
    announcer_config.chunk_dir        = (dir / "chunks").string();
    announcer_config.broadcast_addr   = "";
    announcer_config.announce_targets = {PeerAddress{"127.0.0.1", listener.boundPort()}};
    test::writeFile(dir / "movie", test::patternBytes(3000, 4));
    ASSERT_TRUE(splitFile(dir / "movie", announcer_config.chunk_dir, 1024));

    Announcer announcer(announcer_config, 7777);
    ASSERT_EQ(EXIT_SUCCESS, announcer.announceOnce());

    EXPECT_TRUE(eventually([&] { return dict.chunkCount("movie").value_or(0) == 3; }));
    auto chunk = readChunk(announcer_config.chunk_dir, "movie", 2);
    ASSERT_TRUE(chunk.has_value());
    auto holders = dict.holders(sha256Digest(*chunk).value());
    ASSERT_EQ(1u, holders.size());
    EXPECT_EQ(7777, holders[0].addr.port);

    listener.stop();
}
