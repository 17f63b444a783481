#ifndef HANDSHAKE_HPP
#define HANDSHAKE_HPP
#include <string>
#include <vector>
#include "protocol.hpp"
#include "session.hpp"
#include "udp.hpp"
#include "files.hpp"

enum HandshakeResult {
    HS_OK,
    HS_NOT_FOUND,
    HS_FAILED
};

// Server side: WaitSyn -> SendSynAck -> WaitReq -> SendStatus -> DataPhase
class HandshakeServer {
public:
    enum State {
        WAIT_SYN,
        SEND_SYN_ACK,
        WAIT_REQ,
        SEND_STATUS,
        DATA_PHASE
    };

    HandshakeServer(Channel &channel, const Directory &directory, unsigned int timeout);

    // block until a valid SYN, record the peer and answer with the listing.
    // max_idle consecutive timeouts give up with HS_FAILED, 0 waits forever
    HandshakeResult wait_syn(Session &session, unsigned int max_idle = 0);
    // wait for the file request and answer with its status
    HandshakeResult wait_req(Session &session, unsigned int max_idle);

    State get_state() const {
        return state;
    }

private:
    Channel &channel;
    const Directory &directory;
    unsigned int timeout;
    State state = WAIT_SYN;
    LiteFTPPacket syn_ack;
};

// Client side: SendSyn -> WaitSynAck -> SendReq -> WaitReqAck -> DataPhase
class HandshakeClient {
public:
    enum State {
        CLOSED,
        SEND_SYN,
        WAIT_SYN_ACK,
        SEND_REQ,
        WAIT_REQ_ACK,
        DATA_PHASE
    };

    HandshakeClient(Channel &channel, unsigned int timeout, unsigned int attempts);

    // session.peer must be set, fills files with the server listing
    HandshakeResult connect(Session &session, std::vector<std::string> &files);
    // ask for file_name, fills file_size and num_packets when found
    HandshakeResult request(Session &session, const std::string &file_name);

    State get_state() const {
        return state;
    }

private:
    Channel &channel;
    unsigned int timeout;
    unsigned int attempts;
    State state = CLOSED;
};

#endif
