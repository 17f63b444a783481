#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP
#include <cstdint>
#include <cstddef>

// offset of the checksum field inside the header
const size_t CHECKSUM_OFFSET = 4;

// 16-bit folded sum over buf with bytes 4-5 read as zero.
// An odd trailing byte counts as the high byte of a word whose low byte is zero.
uint16_t LiteFTPChecksum(const uint8_t *buf, size_t len);

// checksum stored in a received datagram
uint16_t stored_checksum(const uint8_t *buf, size_t len);

// test checksum
bool checkSum(const uint8_t *buf, size_t len);

#endif
