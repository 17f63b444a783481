#include <gtest/gtest.h>
#include "fake_channel.hpp"
#include "handshake.hpp"

class HandshakeServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_debug(false);
        tmp.write_file("alpha.txt", 5000);
        tmp.write_file("beta.bin", 1016);
        tmp.write_file("empty", 0);
    }

    TempDir tmp;
    struct sockaddr_in client = make_addr("10.0.0.2", 4000);
};

TEST_F(HandshakeServerTest, AcceptsSynAndSendsListing) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_syn());

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    EXPECT_TRUE(same_peer(session.peer, client));
    EXPECT_EQ(server.get_state(), HandshakeServer::WAIT_REQ);

    ASSERT_EQ(channel.sent.size(), 1u);
    EXPECT_TRUE(has_flags(channel.sent[0], TYPE_SYN | TYPE_ACK));
    EXPECT_EQ(parse_listing(channel.sent[0]),
        (std::vector<std::string>{"alpha.txt", "beta.bin", "empty"}));
    EXPECT_TRUE(same_peer(channel.sent_to[0], client));
}

TEST_F(HandshakeServerTest, WaitSynIgnoresReqAndAck) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_req("alpha.txt"));
    channel.push_packet(make_ack(3));
    channel.push_packet(make_syn_ack(""));

    Session session;
    EXPECT_EQ(server.wait_syn(session, 1), HS_FAILED);
    EXPECT_EQ(server.get_state(), HandshakeServer::WAIT_SYN);
    EXPECT_TRUE(channel.sent.empty());
    EXPECT_EQ(session.peer.sin_port, 0);
}

TEST_F(HandshakeServerTest, WaitSynSkipsCorruptedSyn) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_corrupted(make_syn());
    channel.push_bytes({0x00, 0x01, 0x02});
    channel.push_timeout();
    channel.push_packet(make_syn());

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    EXPECT_EQ(channel.recv_calls, 4u);
    EXPECT_EQ(channel.sent.size(), 1u);
}

TEST_F(HandshakeServerTest, RequestForExistingFile) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_syn());
    channel.push_packet(make_req("alpha.txt"));

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    ASSERT_EQ(server.wait_req(session, 3), HS_OK);
    EXPECT_EQ(server.get_state(), HandshakeServer::DATA_PHASE);
    EXPECT_EQ(session.file_name, "alpha.txt");
    EXPECT_EQ(session.file_size, 5000u);
    EXPECT_EQ(session.num_packets, 5u);

    std::vector<LiteFTPPacket> status = channel.sent_with(TYPE_ACK | TYPE_REQ);
    ASSERT_EQ(status.size(), 1u);
    bool found = false;
    uint32_t num_packets = 0;
    uint32_t file_size = 0;
    ASSERT_EQ(parse_status(status[0], &found, &num_packets, &file_size), 0);
    EXPECT_TRUE(found);
    EXPECT_EQ(num_packets, 5u);
    EXPECT_EQ(file_size, 5000u);
}

TEST_F(HandshakeServerTest, RequestNameIsNulTerminated) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    LiteFTPPacket req;
    req.header.flags = TYPE_REQ;
    const char raw[] = "beta.bin\0\0\0";
    req.payload.assign(raw, raw + sizeof(raw));
    LiteFTPSetChecksum(&req);
    channel.push_packet(make_syn());
    channel.push_packet(req);

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    ASSERT_EQ(server.wait_req(session, 3), HS_OK);
    EXPECT_EQ(session.file_name, "beta.bin");
    EXPECT_EQ(session.num_packets, 1u);
}

TEST_F(HandshakeServerTest, MissingFileAnswersNotFound) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_syn());
    channel.push_packet(make_req("nope.txt"));

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    EXPECT_EQ(server.wait_req(session, 3), HS_NOT_FOUND);
    EXPECT_EQ(server.get_state(), HandshakeServer::WAIT_SYN);

    std::vector<LiteFTPPacket> status = channel.sent_with(TYPE_ACK | TYPE_REQ);
    ASSERT_EQ(status.size(), 1u);
    ASSERT_EQ(status[0].payload.size(), 1u);
    EXPECT_EQ(status[0].payload[0], STATUS_NOT_FOUND);
}

TEST_F(HandshakeServerTest, PathOutsideDirectoryIsNotFound) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_syn());
    channel.push_packet(make_req("../alpha.txt"));

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    EXPECT_EQ(server.wait_req(session, 3), HS_NOT_FOUND);
}

TEST_F(HandshakeServerTest, RepeatedSynResendsListing) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_syn());
    channel.push_packet(make_syn());
    channel.push_packet(make_req("empty"));

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    ASSERT_EQ(server.wait_req(session, 3), HS_OK);
    std::vector<LiteFTPPacket> syn_acks = channel.sent_with(TYPE_SYN | TYPE_ACK);
    ASSERT_EQ(syn_acks.size(), 2u);
    EXPECT_EQ(syn_acks[0].payload, syn_acks[1].payload);
    EXPECT_EQ(session.num_packets, 0u);
    EXPECT_EQ(session.file_size, 0u);
}

TEST_F(HandshakeServerTest, WaitReqIgnoresOtherPeersAndBadPackets) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_syn());
    channel.push_packet(make_req("empty"), make_addr("10.0.0.3", 4000));
    channel.push_corrupted(make_req("empty"));
    channel.push_packet(make_ack(0));
    channel.push_packet(make_req("beta.bin"));

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    ASSERT_EQ(server.wait_req(session, 3), HS_OK);
    EXPECT_EQ(session.file_name, "beta.bin");
}

TEST_F(HandshakeServerTest, WaitReqGivesUpAfterIdleTimeouts) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_syn());

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    EXPECT_EQ(server.wait_req(session, 4), HS_FAILED);
    EXPECT_EQ(server.get_state(), HandshakeServer::WAIT_SYN);
    EXPECT_EQ(channel.recv_calls, 5u);
}

TEST_F(HandshakeServerTest, WaitReqIdleCountsOnlyOwnClient) {
    FakeChannel channel(client);
    Directory directory(tmp.path());
    HandshakeServer server(channel, directory, 10);
    channel.push_packet(make_syn());
    for (int i = 0; i < 20; i++) {
        channel.push_timeout();
        channel.push_timeout();
        channel.push_packet(make_syn(), make_addr("10.0.0.9", 4000));
        channel.push_corrupted(make_req("beta.bin"));
    }

    Session session;
    ASSERT_EQ(server.wait_syn(session), HS_OK);
    EXPECT_EQ(server.wait_req(session, 3), HS_FAILED);
    EXPECT_EQ(server.get_state(), HandshakeServer::WAIT_SYN);
    // SYN, two timeouts, the other host, the damaged REQ, the third timeout
    EXPECT_EQ(channel.recv_calls, 6u);
    EXPECT_TRUE(channel.sent_with(TYPE_ACK | TYPE_REQ).empty());
}

class HandshakeClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_debug(false);
        session.peer = server;
    }

    struct sockaddr_in server = make_addr("10.0.0.1", 5000);
    Session session;
};

TEST_F(HandshakeClientTest, ConnectReadsListing) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);
    channel.push_packet(make_syn_ack("a.txt;b.txt"));

    std::vector<std::string> files;
    ASSERT_EQ(client.connect(session, files), HS_OK);
    EXPECT_EQ(files, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(client.get_state(), HandshakeClient::SEND_REQ);
    ASSERT_EQ(channel.sent.size(), 1u);
    EXPECT_TRUE(has_flags(channel.sent[0], TYPE_SYN));
    EXPECT_TRUE(channel.sent[0].payload.empty());
}

TEST_F(HandshakeClientTest, ConnectRetriesAfterTimeout) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);
    channel.push_timeout();
    channel.push_packet(make_syn_ack("only"));

    std::vector<std::string> files;
    ASSERT_EQ(client.connect(session, files), HS_OK);
    EXPECT_EQ(channel.sent_with(TYPE_SYN).size(), 2u);
    EXPECT_EQ(files, (std::vector<std::string>{"only"}));
}

TEST_F(HandshakeClientTest, ConnectFailsAfterThreeAttempts) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);
    channel.push_timeout();
    channel.push_packet(make_status(false, 0, 0));
    channel.push_corrupted(make_syn_ack("x"));
    channel.push_packet(make_syn_ack("late"));

    std::vector<std::string> files;
    EXPECT_EQ(client.connect(session, files), HS_FAILED);
    EXPECT_EQ(client.get_state(), HandshakeClient::CLOSED);
    EXPECT_EQ(channel.sent_with(TYPE_SYN).size(), 3u);
    EXPECT_TRUE(files.empty());
}

TEST_F(HandshakeClientTest, ConnectIgnoresOtherSender) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);
    channel.push_packet(make_syn_ack("evil"), make_addr("10.9.9.9", 5000));
    channel.push_packet(make_syn_ack("good"));

    std::vector<std::string> files;
    ASSERT_EQ(client.connect(session, files), HS_OK);
    EXPECT_EQ(files, (std::vector<std::string>{"good"}));
}

TEST_F(HandshakeClientTest, RequestFound) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);
    channel.push_packet(make_status(true, 5, 5000));

    ASSERT_EQ(client.request(session, "alpha.txt"), HS_OK);
    EXPECT_EQ(client.get_state(), HandshakeClient::DATA_PHASE);
    EXPECT_EQ(session.num_packets, 5u);
    EXPECT_EQ(session.file_size, 5000u);
    ASSERT_EQ(channel.sent.size(), 1u);
    EXPECT_TRUE(has_flags(channel.sent[0], TYPE_REQ));
    EXPECT_EQ(parse_file_name(channel.sent[0]), "alpha.txt");
}

TEST_F(HandshakeClientTest, RequestNotFound) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);
    channel.push_packet(make_status(false, 0, 0));

    EXPECT_EQ(client.request(session, "missing"), HS_NOT_FOUND);
    EXPECT_EQ(client.get_state(), HandshakeClient::CLOSED);
}

TEST_F(HandshakeClientTest, RequestRejectsInconsistentStatus) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);
    // 5000 bytes need 5 packets, not 4
    channel.push_packet(make_status(true, 4, 5000));
    channel.push_packet(make_syn_ack("stale"));
    channel.push_packet(make_status(true, 5, 5000));

    ASSERT_EQ(client.request(session, "alpha.txt"), HS_OK);
    EXPECT_EQ(session.num_packets, 5u);
    EXPECT_EQ(channel.sent_with(TYPE_REQ).size(), 3u);
}

TEST_F(HandshakeClientTest, RequestFailsWhenServerSilent) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);

    EXPECT_EQ(client.request(session, "alpha.txt"), HS_FAILED);
    EXPECT_EQ(channel.sent_with(TYPE_REQ).size(), 3u);
}

TEST_F(HandshakeClientTest, RequestRefusesOversizeName) {
    FakeChannel channel(server);
    HandshakeClient client(channel, 10, 3);

    EXPECT_EQ(client.request(session, std::string(MAX_DATA + 1, 'n')), HS_FAILED);
    EXPECT_EQ(client.request(session, ""), HS_FAILED);
    EXPECT_TRUE(channel.sent.empty());
}
