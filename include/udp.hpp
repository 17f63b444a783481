#ifndef UDP_HPP
#define UDP_HPP
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "protocol.hpp"
#include "utils.hpp"

// outcome of one receive call
struct RecvResult {
    enum Status {
        OK,
        TIMEOUT,
        CHECKSUM_MISMATCH,
        MALFORMED,
        ERROR
    };

    Status status = TIMEOUT;
    LiteFTPPacket packet;
    struct sockaddr_in from;
    uint16_t expected_sum = 0;
    uint16_t received_sum = 0;

    RecvResult() {
        memset(&from, 0, sizeof(from));
    }
};

// turn a raw datagram into a RecvResult
RecvResult classify_datagram(const uint8_t *buf, size_t len, const struct sockaddr_in &from);

// warn about a corrupted or short datagram
void report_bad_packet(const char *prefix, const RecvResult &result);

bool same_peer(const struct sockaddr_in &a, const struct sockaddr_in &b);

// dotted IPv4 or host name, 0 on success
int resolve_address(const char *host, int port, struct sockaddr_in *out);

class Channel {
public:
    virtual ~Channel() {}
    // send packet to addr, return the number of bytes sent or -1
    virtual int send_packet(const LiteFTPPacket &packet, const struct sockaddr_in &addr) = 0;
    // wait at most timeout ms (0 for no timeout) for one datagram
    virtual RecvResult recv_packet(unsigned int timeout) = 0;
};

class UDP : public Channel {
public:
    UDP();
    ~UDP();
    UDP(const UDP &) = delete;
    UDP &operator=(const UDP &) = delete;

    // create and bind the socket, -1 if the address is unusable or taken
    int bind(const char *ip, int port);
    int local_port() const;

    int send_packet(const LiteFTPPacket &packet, const struct sockaddr_in &addr) override;
    RecvResult recv_packet(unsigned int timeout) override;

private:
    int sock = -1;
    unsigned int current_timeout = 0;
    struct sockaddr_in addr;

    int set_timeout(unsigned int timeout);
};

#endif
