/*
 * Helpers for getting bytes into the CRC engine on the host.
 */

#pragma once

#include "crc_status.h"
#include "stm32_crc.h"
#include <stddef.h>
#include <stdint.h>
#include <vector>

// Chunk size for file reads. Must be a multiple of crcWordSize so
// chained chunks give the same result as a single pass.
const size_t crcFileChunkSize = 64 * 1024;
static_assert(crcFileChunkSize % crcWordSize == 0, "File chunks must be word-aligned");

// Copies logical byte values into `out`.
// Returns NonByteInput (and leaves `out` empty) if any value exceeds 0xFF.
CrcStatus packBytes(const uint32_t* values, size_t count, std::vector<uint8_t>& out);

// Parses text such as "fe ff 0x88" or "de:ad:be:ef" into bytes.
// Tokens are separated by whitespace, ',' or ':'.
// Returns MalformedInput for non-hex characters and
// NonByteInput for tokens larger than 0xFF.
CrcStatus parseHexBytes(const char* text, std::vector<uint8_t>& out);

// Parses a decimal or 0x-prefixed hex 32-bit value.
// Returns false if the whole string is not a valid number.
bool parseU32(const char* text, uint32_t& value);

// Chained CRC of everything readable from fd.
// Returns ReadError on a failed read.
CrcStatus crcFd(int fd, uint32_t seed, uint32_t& crc);

// Chained CRC of a file's contents. Path "-" reads stdin.
// Returns ReadError if the file can't be opened or read.
CrcStatus crcFile(const char* path, uint32_t seed, uint32_t& crc);
