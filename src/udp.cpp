#include "udp.hpp"
#include "checksum.hpp"
#include <netdb.h>
#include <sys/time.h>

RecvResult classify_datagram(const uint8_t *buf, size_t len, const struct sockaddr_in &from) {
    RecvResult result;
    result.from = from;
    if (LiteFTPParse(buf, len, &result.packet) < 0) {
        result.status = RecvResult::MALFORMED;
        return result;
    }
    result.expected_sum = LiteFTPChecksum(buf, len);
    result.received_sum = stored_checksum(buf, len);
    if (result.expected_sum != result.received_sum) {
        result.status = RecvResult::CHECKSUM_MISMATCH;
        return result;
    }
    result.status = RecvResult::OK;
    return result;
}

void report_bad_packet(const char *prefix, const RecvResult &result) {
    std::string msg = prefix;
    if (result.status == RecvResult::CHECKSUM_MISMATCH) {
        msg += ": Caught bad checksum. Expected: " + std::to_string(result.expected_sum)
            + " Got: " + std::to_string(result.received_sum);
    } else if (result.status == RecvResult::MALFORMED) {
        msg += ": Datagram shorter than header from " + addr_str(result.from);
    } else {
        msg += ": Unexpected packet from " + addr_str(result.from);
    }
    warn(msg.c_str());
}

bool same_peer(const struct sockaddr_in &a, const struct sockaddr_in &b) {
    return a.sin_addr.s_addr == b.sin_addr.s_addr && a.sin_port == b.sin_port;
}

int resolve_address(const char *host, int port, struct sockaddr_in *out) {
    memset(out, 0, sizeof(*out));
    out->sin_family = AF_INET;
    out->sin_port = htons(port);
    if (inet_pton(AF_INET, host, &out->sin_addr) == 1) {
        return 0;
    }
    // not dotted, try a host name lookup
    struct addrinfo hints, *info = nullptr;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    if (getaddrinfo(host, nullptr, &hints, &info) != 0 || info == nullptr) {
        return -1;
    }
    out->sin_addr = reinterpret_cast<struct sockaddr_in *>(info->ai_addr)->sin_addr;
    freeaddrinfo(info);
    return 0;
}

UDP::UDP() {
    memset(&addr, 0, sizeof(addr));
}

UDP::~UDP() {
    if (sock >= 0) {
        close(sock);
    }
}

int UDP::bind(const char *ip, int port) {
    if (sock >= 0) {
        close(sock);
    }
    // new socket starts without SO_RCVTIMEO
    current_timeout = 0;
    // create socket
    sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        warn(("UDP::bind(): Error creating socket: " + std::string(strerror(errno))).c_str());
        return -1;
    }
    // set addr
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip, &addr.sin_addr) <= 0) {
        warn(("UDP::bind(): Error converting ip address " + std::string(ip)).c_str());
        close(sock);
        sock = -1;
        return -1;
    }
    // bind addr
    if (::bind(sock, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        warn(("UDP::bind(): Error binding socket: " + std::string(strerror(errno))).c_str());
        close(sock);
        sock = -1;
        return -1;
    }
    return 0;
}

int UDP::local_port() const {
    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (sock < 0 || getsockname(sock, (struct sockaddr *)&bound, &len) < 0) {
        return -1;
    }
    return ntohs(bound.sin_port);
}

// send packet to addr and return the number of bytes sent
int UDP::send_packet(const LiteFTPPacket &packet, const struct sockaddr_in &addr) {
    std::vector<uint8_t> buf = LiteFTPSerialize(packet);
    ssize_t ret = sendto(sock, buf.data(), buf.size(), 0, (const struct sockaddr *)&addr, sizeof(struct sockaddr_in));
    if (ret < 0) {
        warn(("UDP::send_packet(): Error sending packet: " + std::string(strerror(errno))).c_str());
        return -1;
    }

    debug(get_debug_str("UDP::send_packet(): Sent packet", &packet).c_str());
    return static_cast<int>(ret);
}

int UDP::set_timeout(unsigned int timeout) {
    if (timeout == current_timeout) {
        return 0;
    }
    struct timeval tv;
    tv.tv_sec = timeout / 1000;
    tv.tv_usec = (timeout % 1000) * 1000;
    if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return -1;
    }
    current_timeout = timeout;
    return 0;
}

// recv one datagram with timeout in milliseconds (0 for no timeout)
RecvResult UDP::recv_packet(unsigned int timeout) {
    RecvResult result;
    if (set_timeout(timeout) < 0) {
        warn(("UDP::recv_packet(): Error setting timeout: " + std::string(strerror(errno))).c_str());
        result.status = RecvResult::ERROR;
        return result;
    }
    uint8_t buffer[MAX_PACKET_SIZE];
    struct sockaddr_in from;
    socklen_t addr_len = sizeof(from);
    memset(&from, 0, sizeof(from));
    ssize_t ret = recvfrom(sock, buffer, sizeof(buffer), 0, (struct sockaddr *)&from, &addr_len);
    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            result.status = RecvResult::TIMEOUT;
            return result;
        }
        if (errno == EINTR) {
            result.status = RecvResult::TIMEOUT;
            return result;
        }
        warn(("UDP::recv_packet(): Error receiving packet: " + std::string(strerror(errno))).c_str());
        result.status = RecvResult::ERROR;
        return result;
    }
    result = classify_datagram(buffer, static_cast<size_t>(ret), from);
    if (result.status == RecvResult::OK) {
        debug(get_debug_str("UDP::recv_packet(): Recv packet", &result.packet).c_str());
    }
    return result;
}
