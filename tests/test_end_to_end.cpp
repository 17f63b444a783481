#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <thread>
#include "fake_channel.hpp"
#include "ftp.hpp"

namespace {

// Wraps a real socket and damages outgoing DATA packets: every 7th is
// dropped, every 11th goes out with a wrong checksum.
class LossyChannel : public Channel {
public:
    explicit LossyChannel(Channel &inner) : inner(inner) {}

    int send_packet(const LiteFTPPacket &packet, const struct sockaddr_in &addr) override {
        if (packet.header.flags != TYPE_DATA) {
            return inner.send_packet(packet, addr);
        }
        count++;
        if (count % 7 == 0) {
            dropped++;
            return static_cast<int>(HEADER_SIZE + packet.payload.size());
        }
        if (count % 11 == 0) {
            damaged++;
            LiteFTPPacket bad = packet;
            bad.header.checksum ^= 0x0101;
            return inner.send_packet(bad, addr);
        }
        return inner.send_packet(packet, addr);
    }

    RecvResult recv_packet(unsigned int timeout) override {
        return inner.recv_packet(timeout);
    }

    unsigned int count = 0;
    unsigned int dropped = 0;
    unsigned int damaged = 0;

private:
    Channel &inner;
};

}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_debug(false);
        ASSERT_EQ(server_udp.bind("127.0.0.1", 0), 0);
        ASSERT_EQ(client_udp.bind("127.0.0.1", 0), 0);

        server_config.directory = served.path();
        server_config.send_timeout = 200;
        server_config.request_wait = 20;

        client_config.server_ip = "127.0.0.1";
        client_config.server_port = server_udp.local_port();
        client_config.output_dir = downloads.path();
        client_config.recv_timeout = 500;
    }

    // serve one session on its own thread while the client runs here
    void transfer(Channel &server_channel, const std::string &input = "") {
        FTPServer server(server_config, server_channel);
        std::thread thread([&]() {
            server_result = server.serve_one();
        });
        std::istringstream in(input);
        std::ostringstream out;
        Prompt prompt(in, out);
        FTPClient client(client_config, client_udp, prompt);
        client_result = client.run();
        listing = client.files;
        thread.join();
    }

    void expect_copy(const std::string &name, size_t size) {
        std::vector<uint8_t> data = served.write_file(name, size);
        client_config.file = name;
        transfer(server_udp);
        ASSERT_EQ(server_result, SESSION_OK);
        ASSERT_EQ(client_result, SESSION_OK);
        EXPECT_EQ(downloads.read_file(name), data);
    }

    TempDir served;
    TempDir downloads;
    UDP server_udp;
    UDP client_udp;
    Config server_config;
    Config client_config;
    SessionResult server_result = SESSION_FAILED;
    SessionResult client_result = SESSION_FAILED;
    std::vector<std::string> listing;
};

TEST_F(EndToEndTest, EmptyFile) {
    expect_copy("empty.txt", 0);
    EXPECT_TRUE(std::filesystem::exists(downloads.file("empty.txt")));
}

TEST_F(EndToEndTest, ExactMultipleOfPayload) {
    expect_copy("three.bin", 3 * MAX_DATA);
}

TEST_F(EndToEndTest, PartialLastPacket) {
    expect_copy("a.bin", 5000);
}

TEST_F(EndToEndTest, ManyWindows) {
    expect_copy("large.bin", 100 * 1000);
}

TEST_F(EndToEndTest, ListingAndPromptedChoice) {
    served.write_file("b.txt", 10);
    std::vector<uint8_t> data = served.write_file("a.txt", 1500);
    transfer(server_udp, "a.txt\n");
    ASSERT_EQ(client_result, SESSION_OK);
    EXPECT_EQ(listing, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(downloads.read_file("a.txt"), data);
}

TEST_F(EndToEndTest, MissingFile) {
    served.write_file("a.txt", 10);
    client_config.file = "nope.txt";
    transfer(server_udp);
    EXPECT_EQ(server_result, SESSION_NOT_FOUND);
    EXPECT_EQ(client_result, SESSION_NOT_FOUND);
    EXPECT_FALSE(std::filesystem::exists(downloads.file("nope.txt")));
}

TEST_F(EndToEndTest, SurvivesLossAndCorruption) {
    std::vector<uint8_t> data = served.write_file("lossy.bin", 20 * 1000);
    client_config.file = "lossy.bin";
    client_config.stall_rounds = 10;
    LossyChannel lossy(server_udp);
    transfer(lossy);
    ASSERT_EQ(server_result, SESSION_OK);
    ASSERT_EQ(client_result, SESSION_OK);
    EXPECT_GT(lossy.dropped, 0u);
    EXPECT_GT(lossy.damaged, 0u);
    EXPECT_EQ(downloads.read_file("lossy.bin"), data);
}
