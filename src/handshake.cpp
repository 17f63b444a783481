#include "handshake.hpp"
#include <limits>

HandshakeServer::HandshakeServer(Channel &channel, const Directory &directory, unsigned int timeout)
    : channel(channel), directory(directory), timeout(timeout) {
}

HandshakeResult HandshakeServer::wait_syn(Session &session, unsigned int max_idle) {
    state = WAIT_SYN;
    debug("HandshakeServer::wait_syn(): Waiting for SYN");
    unsigned int idle = 0;
    while (true) {
        RecvResult r = channel.recv_packet(timeout);
        if (r.status == RecvResult::TIMEOUT) {
            if (max_idle > 0 && ++idle >= max_idle) {
                return HS_FAILED;
            }
            continue;
        }
        idle = 0;
        if (r.status == RecvResult::ERROR) {
            return HS_FAILED;
        }
        if (r.status != RecvResult::OK) {
            report_bad_packet("HandshakeServer::wait_syn()", r);
            continue;
        }
        // exactly SYN, a stale REQ or ACK is not a connect
        if (!has_flags(r.packet, TYPE_SYN)) {
            warn(get_debug_str("HandshakeServer::wait_syn(): Received unexpected packet", &r.packet).c_str());
            continue;
        }
        session.peer = r.from;
        break;
    }
    log(("Received SYN packet from " + addr_str(session.peer)).c_str());

    state = SEND_SYN_ACK;
    std::vector<std::string> names = directory.list();
    std::string listing = join_listing(names);
    if (listing.size() < join_listing(names, std::numeric_limits<size_t>::max()).size()) {
        warn("HandshakeServer::wait_syn(): Listing too long, sending a partial list");
    }
    syn_ack = make_syn_ack(listing);
    if (channel.send_packet(syn_ack, session.peer) < 0) {
        return HS_FAILED;
    }
    log("Sent SYN+ACK to client");
    state = WAIT_REQ;
    return HS_OK;
}

HandshakeResult HandshakeServer::wait_req(Session &session, unsigned int max_idle) {
    state = WAIT_REQ;
    unsigned int idle = 0;
    std::string name;
    while (true) {
        RecvResult r = channel.recv_packet(timeout);
        if (r.status == RecvResult::TIMEOUT) {
            if (max_idle > 0 && ++idle >= max_idle) {
                warn("HandshakeServer::wait_req(): Client did not send a request");
                state = WAIT_SYN;
                return HS_FAILED;
            }
            continue;
        }
        if (r.status == RecvResult::ERROR) {
            state = WAIT_SYN;
            return HS_FAILED;
        }
        if (r.status != RecvResult::OK) {
            report_bad_packet("HandshakeServer::wait_req()", r);
            continue;
        }
        if (!same_peer(r.from, session.peer)) {
            report_bad_packet("HandshakeServer::wait_req()", r);
            continue;
        }
        // only our client keeps the request slot open
        idle = 0;
        // client lost our SYN+ACK and connects again
        if (has_flags(r.packet, TYPE_SYN)) {
            debug("HandshakeServer::wait_req(): Repeated SYN, resending SYN+ACK");
            if (channel.send_packet(syn_ack, session.peer) < 0) {
                state = WAIT_SYN;
                return HS_FAILED;
            }
            continue;
        }
        if (!has_flags(r.packet, TYPE_REQ)) {
            warn(get_debug_str("HandshakeServer::wait_req(): Received unexpected packet", &r.packet).c_str());
            continue;
        }
        name = parse_file_name(r.packet);
        break;
    }
    log(("Client is requesting \"" + name + "\"").c_str());

    state = SEND_STATUS;
    session.file_name = name;
    std::optional<uint64_t> size = directory.lookup(name);
    if (size && *size > std::numeric_limits<uint32_t>::max()) {
        warn(("File '" + name + "' is too large for a 32-bit size field").c_str());
        size.reset();
    }
    if (!size) {
        warn(("File '" + name + "' not found.").c_str());
        state = WAIT_SYN;
        if (channel.send_packet(make_status(false, 0, 0), session.peer) < 0) {
            return HS_FAILED;
        }
        return HS_NOT_FOUND;
    }
    session.file_size = static_cast<uint32_t>(*size);
    session.num_packets = packet_count(*size);
    if (channel.send_packet(make_status(true, session.num_packets, session.file_size), session.peer) < 0) {
        state = WAIT_SYN;
        return HS_FAILED;
    }
    state = DATA_PHASE;
    return HS_OK;
}

HandshakeClient::HandshakeClient(Channel &channel, unsigned int timeout, unsigned int attempts)
    : channel(channel), timeout(timeout), attempts(attempts) {
}

HandshakeResult HandshakeClient::connect(Session &session, std::vector<std::string> &files) {
    log(("Attempting to connect to server at " + addr_str(session.peer)).c_str());
    LiteFTPPacket syn = make_syn();
    // retry until SYN+ACK received
    for (unsigned int i = 1; i <= attempts; i++) {
        state = SEND_SYN;
        if (channel.send_packet(syn, session.peer) < 0) {
            break;
        }
        state = WAIT_SYN_ACK;
        RecvResult r = channel.recv_packet(timeout);
        if (r.status == RecvResult::TIMEOUT) {
            warn(("Connection attempt " + std::to_string(i) + " timed out.").c_str());
            continue;
        }
        if (r.status == RecvResult::ERROR) {
            break;
        }
        if (r.status != RecvResult::OK || !same_peer(r.from, session.peer)) {
            report_bad_packet("HandshakeClient::connect()", r);
            continue;
        }
        if (!has_flags(r.packet, TYPE_SYN | TYPE_ACK)) {
            warn(get_debug_str("HandshakeClient::connect(): Received unexpected packet", &r.packet).c_str());
            continue;
        }
        log("Got connection acknowledgement from server");
        files = parse_listing(r.packet);
        state = SEND_REQ;
        return HS_OK;
    }
    warn("Unable to establish connection");
    state = CLOSED;
    return HS_FAILED;
}

HandshakeResult HandshakeClient::request(Session &session, const std::string &file_name) {
    if (file_name.empty() || file_name.size() > MAX_DATA) {
        warn(("Invalid file name \"" + file_name + "\"").c_str());
        state = CLOSED;
        return HS_FAILED;
    }
    session.file_name = file_name;
    LiteFTPPacket req = make_req(file_name);
    log(("Requesting file \"" + file_name + "\"").c_str());
    for (unsigned int i = 1; i <= attempts; i++) {
        state = SEND_REQ;
        if (channel.send_packet(req, session.peer) < 0) {
            break;
        }
        state = WAIT_REQ_ACK;
        RecvResult r = channel.recv_packet(timeout);
        if (r.status == RecvResult::TIMEOUT) {
            warn(("Request " + std::to_string(i) + " timed out.").c_str());
            continue;
        }
        if (r.status == RecvResult::ERROR) {
            break;
        }
        if (r.status != RecvResult::OK || !same_peer(r.from, session.peer)) {
            report_bad_packet("HandshakeClient::request()", r);
            continue;
        }
        if (!has_flags(r.packet, TYPE_ACK | TYPE_REQ)) {
            warn(get_debug_str("HandshakeClient::request(): Received unexpected packet", &r.packet).c_str());
            continue;
        }
        bool found = false;
        uint32_t num_packets = 0;
        uint32_t file_size = 0;
        if (parse_status(r.packet, &found, &num_packets, &file_size) < 0
            || (found && num_packets != packet_count(file_size))) {
            warn("HandshakeClient::request(): Malformed status packet");
            continue;
        }
        if (!found) {
            warn("Server does not recognize requested file");
            state = CLOSED;
            return HS_NOT_FOUND;
        }
        session.num_packets = num_packets;
        session.file_size = file_size;
        log(("File \"" + file_name + "\" is " + std::to_string(file_size) + " bytes").c_str());
        state = DATA_PHASE;
        return HS_OK;
    }
    warn("Server not responding to request");
    state = CLOSED;
    return HS_FAILED;
}
