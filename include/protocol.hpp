#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                     Sequence Number (32)                      |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |          Checksum (16)        |   Flags (8)   |  Reserved (8) |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                            Payload ...                        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// LiteFTP Header, all fields big-endian on the wire
// Flags: 8 bits
//   7   6   5   4   3   2   1   0
// +---+---+---+---+---+---+---+---+
// |SYN|ACK|REQ|      Unused       |
// +---+---+---+---+---+---+---+---+
// Payload length is implied by the datagram length.

struct LiteFTPHeader {
    uint32_t seq = 0;
    uint16_t checksum = 0;
    uint8_t flags = 0;
    uint8_t reserved = 0;

    bool operator==(const LiteFTPHeader &rhs) const {
        return seq == rhs.seq && checksum == rhs.checksum
            && flags == rhs.flags && reserved == rhs.reserved;
    }
};

struct LiteFTPPacket {
    LiteFTPHeader header;
    std::vector<uint8_t> payload;
};

const size_t HEADER_SIZE = 8;
const size_t MAX_PACKET_SIZE = 1024;
const size_t MAX_DATA = MAX_PACKET_SIZE - HEADER_SIZE;

const uint8_t TYPE_SYN = 1 << 7;
const uint8_t TYPE_ACK = 1 << 6;
const uint8_t TYPE_REQ = 1 << 5;
const uint8_t TYPE_DATA = 0;

const uint8_t STATUS_FOUND = 0x80;
const uint8_t STATUS_NOT_FOUND = 0x00;
const size_t STATUS_FOUND_SIZE = 9;

const int E_MALFORMED = -1;

// encode header into out[0..HEADER_SIZE)
void LiteFTPHeaderEncode(const LiteFTPHeader &header, uint8_t *out);
// decode header, E_MALFORMED if len < HEADER_SIZE
int LiteFTPHeaderDecode(const uint8_t *buf, size_t len, LiteFTPHeader *header);

// header + payload as sent on the wire
std::vector<uint8_t> LiteFTPSerialize(const LiteFTPPacket &packet);
// split a datagram into header and payload, E_MALFORMED if too short
int LiteFTPParse(const uint8_t *buf, size_t len, LiteFTPPacket *packet);

// calc checksum over header + payload and store it in the header
void LiteFTPSetChecksum(LiteFTPPacket *packet);

// flags must match exactly, unused bits included
inline bool has_flags(const LiteFTPPacket &packet, uint8_t flags) {
    return packet.header.flags == flags;
}

// number of data packets needed for a file of file_size bytes
uint32_t packet_count(uint64_t file_size);

// packet builders, checksum already set
LiteFTPPacket make_syn();
LiteFTPPacket make_syn_ack(const std::string &listing);
LiteFTPPacket make_req(const std::string &file_name);
LiteFTPPacket make_status(bool found, uint32_t num_packets, uint32_t file_size);
LiteFTPPacket make_data(uint32_t seq, const uint8_t *data, size_t len);
LiteFTPPacket make_ack(uint32_t seq);

// payload readers
std::string parse_file_name(const LiteFTPPacket &packet);
std::vector<std::string> parse_listing(const LiteFTPPacket &packet);
int parse_status(const LiteFTPPacket &packet, bool *found, uint32_t *num_packets, uint32_t *file_size);

// ';'-joined names, cut at the last whole name that fits in max_len
std::string join_listing(const std::vector<std::string> &names, size_t max_len = MAX_DATA);

#endif
