/*
 * Status codes returned by the CRC library and host tools.
 */

#pragma once

#include "basic.h"

enum class CrcStatus
{
  Ok,
  InvalidTableWidth, // table width outside 1..32
  TableTooLarge,     // not enough memory for the requested table width
  NonByteInput,      // logical byte value outside 0..255
  MalformedInput,    // text that does not describe bytes
  ReadError,         // file could not be opened or read
  Mismatch,          // computed CRC differs from expected
};

constexpr const char* crcStatusToString(CrcStatus status)
{
  switch (status) {
    ENUM_STRING(CrcStatus, Ok)
    ENUM_STRING(CrcStatus, InvalidTableWidth)
    ENUM_STRING(CrcStatus, TableTooLarge)
    ENUM_STRING(CrcStatus, NonByteInput)
    ENUM_STRING(CrcStatus, MalformedInput)
    ENUM_STRING(CrcStatus, ReadError)
    ENUM_STRING(CrcStatus, Mismatch)
  }
  return "InvalidStatus";
}
