/*
 * CRC32 matching the STM32 CRC peripheral.
 *
 * The peripheral consumes 32-bit words. A little-endian buffer fed to it
 * word-by-word has each word's bytes processed from last to first.
 *
 * Poly    	    Init   	    RefIn  	RefOut 	XorOut
 * 0x04C11DB7 	0xFFFFFFFF 	false 	false 	0x00000000
 *
 * Buffers that are not a multiple of 4 bytes long end with a partial word.
 * The partial word is reversed and then zero-padded to 4 bytes before being
 * consumed like any other word. This matches what the hardware reports for
 * such buffers, so leave it alone.
 *
 * Results may be chained by passing one call's return value as the seed of
 * the next. Chaining only equals a single call over the concatenation when
 * every intermediate boundary lands on a word boundary.
 */

#pragma once

#include "crc_status.h"
#include <stddef.h>
#include <stdint.h>
#include <vector>

const uint32_t crcPoly = 0x04C11DB7;
const uint32_t crcInit = 0xFFFFFFFF;
const uint32_t crcWordSize = 4;

// Width of the table used by the word engine
const uint32_t crcByteTableBits = 8;
const uint32_t crcByteTableSize = 1 << crcByteTableBits;
const uint32_t crcMaxTableBits = 32;

// Fills `table` with 2^bits entries.
// Widths outside 1..32 return InvalidTableWidth and leave `table` empty.
// Large widths need 4 * 2^bits bytes. If that can't be allocated,
// returns TableTooLarge and leaves `table` empty.
CrcStatus buildCrcTable(uint32_t bits, std::vector<uint32_t>& table);

/*
 * Byte-indexed lookup table used by the word engine.
 * Read-only after construction, so one instance may be shared by any
 * number of concurrent computations.
 */
class CrcTable
{
public:
  CrcTable();

  uint32_t operator[](uint8_t i) const { return entries[i]; }
  const uint32_t* data() const { return entries; }
  static constexpr uint32_t size() { return crcByteTableSize; }

private:
  uint32_t entries[crcByteTableSize];
};

// Process-wide table, built on first use.
const CrcTable& sharedCrcTable();

// Folds a single byte into crc
inline uint32_t crcProcessByte(const CrcTable& table, uint8_t b, uint32_t crc)
{
  return (crc << 8) ^ table[static_cast<uint8_t>((crc >> 24) ^ b)];
}

// Folds one word of `length` bytes (1 to 4) into crc.
// Only the last word of a buffer may be shorter than 4 bytes.
uint32_t crcProcessWord(const CrcTable& table, const uint8_t* word, uint32_t length, uint32_t crc);

// Chainable CRC of a buffer, starting from `seed`.
// An empty buffer returns `seed`.
uint32_t crcCompute(const CrcTable& table, const void* data, size_t length, uint32_t seed = crcInit);

// Same as above, using the shared table.
uint32_t crcCompute(const void* data, size_t length, uint32_t seed = crcInit);

// CRC of a complete buffer, as reported by the hardware after a reset.
uint32_t stm32Crc32(const void* data, size_t length);
