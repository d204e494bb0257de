#include "peer/peer.hpp"
#include "networking/socket.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace csw;
using namespace std::chrono_literals;

namespace {

Config peerConfig(const test::TempDir& dir, const std::string& name) {
    Config config;
    config.broadcast_addr = "";
    config.broadcast_port = 0;
    config.peer_port      = 0;
    config.chunk_size     = 4096;
    config.chunk_dir      = (dir / (name + "_chunks")).string();
    config.downloads_dir  = (dir / (name + "_downloads")).string();
    config.content_db     = "";
    return config;
}

uint16_t freeUdpPort() {
    auto sock = openSocket(true, 0, true);
    if (!sock)
        return 0;
    closeSocket(sock->first);
    return sock->second;
}

bool learnsAbout(Peer& peer, const std::string& f_name, uint32_t count) {
    for (int i = 0; i < 300; ++i) {
        for (const FileSummary& f : peer.list())
            if (f.f_name == f_name && f.indices_known == count)
                return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} //anon

TEST(Peer, SharedFileReachesAnotherPeer) {
    test::TempDir dir;

    Peer receiver(peerConfig(dir, "b"));
    ASSERT_EQ(EXIT_SUCCESS, receiver.start());
    ASSERT_NE(0, receiver.discoveryPort());

    Config sender_config = peerConfig(dir, "a");
    sender_config.announce_targets = {PeerAddress{"127.0.0.1", receiver.discoveryPort()}};
    Peer sender(sender_config);
    ASSERT_EQ(EXIT_SUCCESS, sender.start());

    auto original = test::patternBytes(20000, 5);
    test::writeFile(dir / "movie", original);
    ASSERT_EQ(5u, sender.share((dir / "movie").string()).value_or(0));

    bool known = false;
    for (int i = 0; i < 300 && !known; ++i) {
        for (const FileSummary& f : receiver.list())
            if (f.f_name == "movie" && f.indices_known == 5)
                known = true;
        if (!known)
            std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(known);

    DownloadResult result = receiver.download("movie");
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(original, test::readFile(*result.output_path));

    receiver.stop();
    sender.stop();
}

TEST(Peer, UnopenableDatabaseFallsBackToMemory) {
    test::TempDir dir;
    Config config = peerConfig(dir, "a");
    config.content_db = (dir / "missing_dir" / "dict.db").string();

    Peer peer(config);
    EXPECT_EQ(EXIT_SUCCESS, peer.start());
    peer.stop();
}

TEST(Peer, RestartedPeerCanDownloadAgain) {
    test::TempDir dir;

    //fixed discovery port so the sender still reaches it after the restart
    Config receiver_config = peerConfig(dir, "b");
    receiver_config.broadcast_port = freeUdpPort();
    ASSERT_NE(0, receiver_config.broadcast_port);
    Peer receiver(receiver_config);
    ASSERT_EQ(EXIT_SUCCESS, receiver.start());
    receiver.stop();
    ASSERT_EQ(EXIT_SUCCESS, receiver.start());

    Config sender_config = peerConfig(dir, "a");
    sender_config.announce_targets = {PeerAddress{"127.0.0.1", receiver.discoveryPort()}};
    Peer sender(sender_config);
    ASSERT_EQ(EXIT_SUCCESS, sender.start());

    auto original = test::patternBytes(9000, 3);
    test::writeFile(dir / "clip", original);
    ASSERT_EQ(3u, sender.share((dir / "clip").string()).value_or(0));
    ASSERT_TRUE(learnsAbout(receiver, "clip", 3));

    DownloadResult result = receiver.download("clip");
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(original, test::readFile(*result.output_path));

    receiver.stop();
    sender.stop();
}
