#include "protocol.hpp"
#include "checksum.hpp"
#include <algorithm>

static void put_u32(uint8_t *out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v >> 24);
    out[1] = static_cast<uint8_t>(v >> 16);
    out[2] = static_cast<uint8_t>(v >> 8);
    out[3] = static_cast<uint8_t>(v);
}

static uint32_t get_u32(const uint8_t *in) {
    return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16)
        | (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

// encode header
void LiteFTPHeaderEncode(const LiteFTPHeader &header, uint8_t *out) {
    put_u32(out, header.seq);
    out[4] = static_cast<uint8_t>(header.checksum >> 8);
    out[5] = static_cast<uint8_t>(header.checksum);
    out[6] = header.flags;
    out[7] = header.reserved;
}

// decode header, flag and reserved bits are taken as-is
int LiteFTPHeaderDecode(const uint8_t *buf, size_t len, LiteFTPHeader *header) {
    if (len < HEADER_SIZE) {
        return E_MALFORMED;
    }
    header->seq = get_u32(buf);
    header->checksum = static_cast<uint16_t>((buf[4] << 8) | buf[5]);
    header->flags = buf[6];
    header->reserved = buf[7];
    return 0;
}

std::vector<uint8_t> LiteFTPSerialize(const LiteFTPPacket &packet) {
    std::vector<uint8_t> buf(HEADER_SIZE + packet.payload.size());
    LiteFTPHeaderEncode(packet.header, buf.data());
    std::copy(packet.payload.begin(), packet.payload.end(), buf.begin() + HEADER_SIZE);
    return buf;
}

int LiteFTPParse(const uint8_t *buf, size_t len, LiteFTPPacket *packet) {
    if (LiteFTPHeaderDecode(buf, len, &packet->header) < 0) {
        return E_MALFORMED;
    }
    packet->payload.assign(buf + HEADER_SIZE, buf + len);
    return 0;
}

// calc checksum, field is zeroed first
void LiteFTPSetChecksum(LiteFTPPacket *packet) {
    packet->header.checksum = 0;
    std::vector<uint8_t> buf = LiteFTPSerialize(*packet);
    packet->header.checksum = LiteFTPChecksum(buf.data(), buf.size());
}

uint32_t packet_count(uint64_t file_size) {
    return static_cast<uint32_t>((file_size + MAX_DATA - 1) / MAX_DATA);
}

static LiteFTPPacket make_packet(uint8_t flags, uint32_t seq, const uint8_t *data, size_t len) {
    LiteFTPPacket packet;
    packet.header.flags = flags;
    packet.header.seq = seq;
    if (len > 0) {
        packet.payload.assign(data, data + len);
    }
    LiteFTPSetChecksum(&packet);
    return packet;
}

LiteFTPPacket make_syn() {
    return make_packet(TYPE_SYN, 0, nullptr, 0);
}

LiteFTPPacket make_syn_ack(const std::string &listing) {
    return make_packet(TYPE_SYN | TYPE_ACK, 0,
        reinterpret_cast<const uint8_t *>(listing.data()), listing.size());
}

LiteFTPPacket make_req(const std::string &file_name) {
    return make_packet(TYPE_REQ, 0,
        reinterpret_cast<const uint8_t *>(file_name.data()), file_name.size());
}

// status byte, then num_packets and file_size only when found
LiteFTPPacket make_status(bool found, uint32_t num_packets, uint32_t file_size) {
    uint8_t data[STATUS_FOUND_SIZE] = {0};
    if (!found) {
        data[0] = STATUS_NOT_FOUND;
        return make_packet(TYPE_ACK | TYPE_REQ, 0, data, 1);
    }
    data[0] = STATUS_FOUND;
    put_u32(data + 1, num_packets);
    put_u32(data + 5, file_size);
    return make_packet(TYPE_ACK | TYPE_REQ, 0, data, STATUS_FOUND_SIZE);
}

LiteFTPPacket make_data(uint32_t seq, const uint8_t *data, size_t len) {
    return make_packet(TYPE_DATA, seq, data, len);
}

LiteFTPPacket make_ack(uint32_t seq) {
    return make_packet(TYPE_ACK, seq, nullptr, 0);
}

// name runs up to the first NUL or the end of the payload
std::string parse_file_name(const LiteFTPPacket &packet) {
    std::string name;
    for (uint8_t c : packet.payload) {
        if (c == '\0') {
            break;
        }
        name += static_cast<char>(c);
    }
    return name;
}

std::vector<std::string> parse_listing(const LiteFTPPacket &packet) {
    std::vector<std::string> names;
    std::string name;
    for (uint8_t c : packet.payload) {
        if (c == ';') {
            if (!name.empty()) {
                names.push_back(name);
            }
            name.clear();
        } else {
            name += static_cast<char>(c);
        }
    }
    if (!name.empty()) {
        names.push_back(name);
    }
    return names;
}

int parse_status(const LiteFTPPacket &packet, bool *found, uint32_t *num_packets, uint32_t *file_size) {
    if (packet.payload.empty()) {
        return E_MALFORMED;
    }
    *found = packet.payload[0] == STATUS_FOUND;
    *num_packets = 0;
    *file_size = 0;
    if (!*found) {
        return 0;
    }
    if (packet.payload.size() < STATUS_FOUND_SIZE) {
        return E_MALFORMED;
    }
    *num_packets = get_u32(packet.payload.data() + 1);
    *file_size = get_u32(packet.payload.data() + 5);
    return 0;
}

std::string join_listing(const std::vector<std::string> &names, size_t max_len) {
    std::string listing;
    for (const auto &name : names) {
        // the separator cannot appear inside a name
        if (name.empty() || name.find(';') != std::string::npos) {
            continue;
        }
        size_t needed = listing.empty() ? name.size() : listing.size() + 1 + name.size();
        if (needed > max_len) {
            break;
        }
        if (!listing.empty()) {
            listing += ';';
        }
        listing += name;
    }
    return listing;
}
