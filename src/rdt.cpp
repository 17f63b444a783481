#include "rdt.hpp"
#include <algorithm>

const int E_NO_RESPONSE = -2;
const int E_STALLED = -3;
const int E_IO = -4;
const int E_SOCKET = -5;

RDTSender::RDTSender(Channel &channel, unsigned int window, unsigned int timeout, unsigned int max_retries)
    : channel(channel), N(window), timeout(timeout), max_retries(max_retries) {
}

int RDTSender::send_file(Session &session, FileReader &reader) {
    // status again as the start-of-data marker
    if (channel.send_packet(make_status(true, session.num_packets, session.file_size), session.peer) < 0) {
        return E_SOCKET;
    }
    log("Sending request acknowledgement to client");

    session.window_base = 0;
    session.retry_count = 0;
    if (session.num_packets > 0 && load_window(session, reader) < 0) {
        return E_IO;
    }
    while (session.window_base < session.num_packets) {
        if (send_window(session) < 0) {
            return E_SOCKET;
        }
        rounds++;
        uint32_t old_base = session.window_base;
        int ret = wait_ack(session);
        if (ret < 0) {
            return ret;
        }
        if (ret == 0) {
            // go back N, window_data is left as it was
            misses++;
            continue;
        }
        if (session.window_base != old_base && session.window_base < session.num_packets) {
            if (load_window(session, reader) < 0) {
                return E_IO;
            }
        }
    }
    log("File transfer complete.");
    return 0;
}

int RDTSender::load_window(Session &session, FileReader &reader) {
    uint64_t offset = static_cast<uint64_t>(session.window_base) * MAX_DATA;
    if (reader.read(offset, N * MAX_DATA, window_data) < 0) {
        warn(("RDTSender::load_window(): Error reading " + session.file_name).c_str());
        return -1;
    }
    debug(("RDTSender::load_window(): slide window to ["
        + std::to_string(session.window_base + 1)
        + ", "
        + std::to_string(std::min<uint64_t>(static_cast<uint64_t>(session.window_base) + N, session.num_packets))
        + "]").c_str());
    return 0;
}

int RDTSender::send_window(const Session &session) {
    uint64_t last = std::min<uint64_t>(static_cast<uint64_t>(session.window_base) + N, session.num_packets);
    for (uint64_t seq = session.window_base + 1; seq <= last; seq++) {
        size_t start = static_cast<size_t>(seq - session.window_base - 1) * MAX_DATA;
        uint64_t left = session.file_size - (seq - 1) * MAX_DATA;
        size_t len = static_cast<size_t>(std::min<uint64_t>(MAX_DATA, left));
        // file may have shrunk since the handshake
        if (start >= window_data.size()) {
            len = 0;
        } else {
            len = std::min(len, window_data.size() - start);
        }
        LiteFTPPacket packet = make_data(static_cast<uint32_t>(seq), window_data.data() + start, len);
        if (channel.send_packet(packet, session.peer) < 0) {
            return -1;
        }
        log(("\tSent packet number " + std::to_string(seq)).c_str());
    }
    return 0;
}

int RDTSender::wait_ack(Session &session) {
    uint64_t highest = std::min<uint64_t>(static_cast<uint64_t>(session.window_base) + N, session.num_packets);
    while (true) {
        RecvResult r = channel.recv_packet(timeout);
        if (r.status == RecvResult::TIMEOUT) {
            if (++session.retry_count > max_retries) {
                warn("Client not responding.");
                return E_NO_RESPONSE;
            }
            warn(("Acknowledgement timed out. Resending from packet "
                + std::to_string(session.window_base + 1)).c_str());
            return 0;
        }
        if (r.status == RecvResult::ERROR) {
            return E_SOCKET;
        }
        if (r.status != RecvResult::OK || !same_peer(r.from, session.peer)) {
            report_bad_packet("RDTSender::wait_ack()", r);
            continue;
        }
        if (!has_flags(r.packet, TYPE_ACK)) {
            warn(get_debug_str("RDTSender::wait_ack(): Received unexpected packet", &r.packet).c_str());
            continue;
        }
        uint32_t ack = r.packet.header.seq;
        if (ack < session.window_base || ack > highest) {
            warn(("RDTSender::wait_ack(): Ignoring stale acknowledgement " + std::to_string(ack)).c_str());
            continue;
        }
        session.retry_count = 0;
        session.window_base = ack;
        log(("Got acknowledgement of packet " + std::to_string(ack)).c_str());
        return 1;
    }
}

RDTReceiver::RDTReceiver(Channel &channel, unsigned int window, unsigned int timeout, unsigned int max_stall)
    : channel(channel), N(window), timeout(timeout), max_stall(max_stall) {
}

int RDTReceiver::recv_file(Session &session, FileWriter &writer) {
    session.window_base = 0;
    session.stall_rounds = 0;
    bytes_received = 0;
    while (session.window_base != session.num_packets) {
        uint32_t before = session.window_base;
        int ret = recv_round(session, writer);
        if (ret < 0) {
            return ret;
        }
        if (session.window_base == before) {
            if (++session.stall_rounds >= max_stall) {
                warn("Server not responding.");
                return E_STALLED;
            }
        } else {
            session.stall_rounds = 0;
        }
        // cumulative, repeats the old position when nothing new arrived
        if (channel.send_packet(make_ack(session.window_base), session.peer) < 0) {
            return E_SOCKET;
        }
        log(("Sending acknowledgement of packet " + std::to_string(session.window_base)).c_str());
    }
    if (bytes_received != session.file_size) {
        warn(("Received " + std::to_string(bytes_received) + " of "
            + std::to_string(session.file_size) + " bytes").c_str());
        return E_IO;
    }
    log("File transfer complete.");
    return 0;
}

int RDTReceiver::recv_round(Session &session, FileWriter &writer) {
    unsigned int slot = 0;
    while (slot < N && session.window_base != session.num_packets) {
        RecvResult r = channel.recv_packet(timeout);
        if (r.status == RecvResult::TIMEOUT) {
            // ends this round only
            return 0;
        }
        if (r.status == RecvResult::ERROR) {
            return E_SOCKET;
        }
        if (r.status == RecvResult::CHECKSUM_MISMATCH) {
            // same slot again
            corrupted++;
            report_bad_packet("RDTReceiver::recv_round()", r);
            continue;
        }
        slot++;
        if (r.status != RecvResult::OK || !same_peer(r.from, session.peer)) {
            discarded++;
            report_bad_packet("RDTReceiver::recv_round()", r);
            continue;
        }
        if (!has_flags(r.packet, TYPE_DATA)) {
            discarded++;
            warn(get_debug_str("RDTReceiver::recv_round(): Received unexpected packet", &r.packet).c_str());
            continue;
        }
        uint32_t seq = r.packet.header.seq;
        if (seq != session.window_base + 1) {
            discarded++;
            warn(("Got unexpected packet. Sequence number: " + std::to_string(seq)).c_str());
            continue;
        }
        // the last packet may carry more than the file has left
        uint64_t left = session.file_size - bytes_received;
        size_t len = static_cast<size_t>(std::min<uint64_t>(r.packet.payload.size(), left));
        if (writer.write(r.packet.payload.data(), len) < 0) {
            warn(("RDTReceiver::recv_round(): Error writing " + session.file_name).c_str());
            return E_IO;
        }
        session.window_base = seq;
        bytes_received += len;

        char msg[64];
        double percentage = session.file_size == 0 ? 100.0
            : static_cast<double>(bytes_received) / session.file_size * 100.0;
        snprintf(msg, sizeof(msg), "Received packet number %u \t%4.2f%%", seq, percentage);
        log(msg);
    }
    return 0;
}
