#ifndef SESSION_HPP
#define SESSION_HPP
#include <cstdint>
#include <cstring>
#include <string>
#include <netinet/in.h>

// One side's view of a single connection. Created fresh for every
// connection attempt and dropped when the transfer ends.
struct Session {
    struct sockaddr_in peer;

    // fixed once the handshake has agreed on them
    std::string file_name;
    uint32_t file_size = 0;
    uint32_t num_packets = 0;

    // sender: lowest unacknowledged sequence number
    // receiver: last sequence number accepted
    uint32_t window_base = 0;
    unsigned int retry_count = 0;
    unsigned int stall_rounds = 0;

    Session() {
        memset(&peer, 0, sizeof(peer));
    }
};

#endif
