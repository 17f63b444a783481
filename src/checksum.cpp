#include "checksum.hpp"

static uint8_t byte_at(const uint8_t *buf, size_t i) {
    if (i == CHECKSUM_OFFSET || i == CHECKSUM_OFFSET + 1) {
        return 0;
    }
    return buf[i];
}

// calc checksum
uint16_t LiteFTPChecksum(const uint8_t *buf, size_t len) {
    uint32_t sum = 0;
    size_t i = 0;
    for (; i + 1 < len; i += 2) {
        sum += (static_cast<uint32_t>(byte_at(buf, i)) << 8) + byte_at(buf, i + 1);
    }
    // odd length, lone byte is the high half
    if (i < len) {
        sum += static_cast<uint32_t>(byte_at(buf, i)) << 8;
    }
    // fold once
    uint32_t folded = (sum & 0xffff) + (sum >> 16);
    return static_cast<uint16_t>(~folded & 0xffff);
}

uint16_t stored_checksum(const uint8_t *buf, size_t len) {
    if (len < CHECKSUM_OFFSET + 2) {
        return 0;
    }
    return static_cast<uint16_t>((buf[CHECKSUM_OFFSET] << 8) | buf[CHECKSUM_OFFSET + 1]);
}

// test checksum
bool checkSum(const uint8_t *buf, size_t len) {
    return LiteFTPChecksum(buf, len) == stored_checksum(buf, len);
}
