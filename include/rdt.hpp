#ifndef RDT_HPP
#define RDT_HPP
#include <vector>
#include "protocol.hpp"
#include "session.hpp"
#include "files.hpp"
#include "utils.hpp"
#include "udp.hpp"

extern const int E_NO_RESPONSE;
extern const int E_STALLED;
extern const int E_IO;
extern const int E_SOCKET;

// Go-Back-N sender. Each round sends the whole window, then waits for one
// cumulative ACK; a timeout resends the same window unchanged.
class RDTSender {
public:
    RDTSender(Channel &channel, unsigned int window, unsigned int timeout, unsigned int max_retries);

    // 0 once every packet is acknowledged, E_* on failure
    int send_file(Session &session, FileReader &reader);

    unsigned int misses = 0;
    unsigned int rounds = 0;

private:
    Channel &channel;
    unsigned int N;
    unsigned int timeout;
    unsigned int max_retries;

    // file bytes covering packets base+1 .. base+N
    std::vector<uint8_t> window_data;

    int load_window(Session &session, FileReader &reader);
    int send_window(const Session &session);
    // 1 when an ACK arrived, 0 when the round timed out, E_* on failure
    int wait_ack(Session &session);
};

// In-order receiver. Each round takes up to N datagrams, keeps only the next
// expected packet, then answers with one cumulative ACK.
class RDTReceiver {
public:
    RDTReceiver(Channel &channel, unsigned int window, unsigned int timeout, unsigned int max_stall);

    // 0 once the last packet is written, E_* on failure
    int recv_file(Session &session, FileWriter &writer);

    unsigned int discarded = 0;
    unsigned int corrupted = 0;

private:
    Channel &channel;
    unsigned int N;
    unsigned int timeout;
    unsigned int max_stall;
    uint64_t bytes_received = 0;

    int recv_round(Session &session, FileWriter &writer);
};

#endif
