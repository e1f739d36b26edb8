/*
 * Software model of the STM32 CRC peripheral.
 * See header for notes.
 *
 * Helpful for comparing against host-side values:
 * 	http://www.sunshine2k.de/articles/coding/crc/understanding_crc.html
 * 	https://crccalc.com/ (CRC-32/MPEG-2 matches for word-aligned, byte-swapped input)
 */

#include "stm32_crc.h"
#include "basic.h"
#include <new>       // bad_alloc
#include <stdexcept> // length_error

// Remainder of `index` after `bits` rounds of MSB-first division, no reflection.
// Callers keep bits within 1..32.
static uint32_t crcTableEntry(uint32_t index, uint32_t bits)
{
  uint32_t reg = index << (32 - bits);

  for (uint32_t i = 0; i < bits; i++) {
    if (reg & 0x80000000) {
      reg = (reg << 1) ^ crcPoly;
    } else {
      reg <<= 1;
    }
  }
  return reg;
}

CrcStatus buildCrcTable(uint32_t bits, std::vector<uint32_t>& table)
{
  table.clear();

  if (bits == 0 || bits > crcMaxTableBits) {
    return CrcStatus::InvalidTableWidth;
  }

  // 64-bit count, since 1 << 32 overflows
  uint64_t count = uint64_t(1) << bits;
  try {
    table.reserve(count);
  } catch (const std::bad_alloc&) {
    return CrcStatus::TableTooLarge;
  } catch (const std::length_error&) {
    return CrcStatus::TableTooLarge;
  }
  for (uint64_t i = 0; i < count; i++) {
    table.push_back(crcTableEntry(static_cast<uint32_t>(i), bits));
  }
  return CrcStatus::Ok;
}

CrcTable::CrcTable()
{
  for (uint32_t i = 0; i < crcByteTableSize; i++) {
    entries[i] = crcTableEntry(i, crcByteTableBits);
  }
}

const CrcTable& sharedCrcTable()
{
  // Initialization of function-local statics is thread-safe
  static const CrcTable table;
  return table;
}

uint32_t crcProcessWord(const CrcTable& table, const uint8_t* word, uint32_t length, uint32_t crc)
{
  uint8_t padded[crcWordSize] = { 0 };

  if (length < crcWordSize) {
    // The partial word is reversed, then zero-padded on the right.
    // Reverse iteration below then consumes the padding first.
    for (uint32_t i = 0; i < length; i++) {
      padded[i] = word[length - 1 - i];
    }
    word = padded;
  }

  for (int i = crcWordSize - 1; i >= 0; i--) {
    crc = crcProcessByte(table, word[i], crc);
  }
  return crc;
}

uint32_t crcCompute(const CrcTable& table, const void* data, size_t length, uint32_t seed)
{
  const uint8_t* bytes = static_cast<const uint8_t*>(data);
  size_t wordCount = roundUpDiv(length, size_t(crcWordSize));

  uint32_t crc = seed;
  for (size_t i = 0; i < wordCount; i++) {
    size_t offset = i * crcWordSize;
    uint32_t wordLength = static_cast<uint32_t>(min(length - offset, size_t(crcWordSize)));
    crc = crcProcessWord(table, bytes + offset, wordLength, crc);
  }
  return crc;
}

uint32_t crcCompute(const void* data, size_t length, uint32_t seed)
{
  return crcCompute(sharedCrcTable(), data, length, seed);
}

uint32_t stm32Crc32(const void* data, size_t length)
{
  return crcCompute(data, length, crcInit);
}
