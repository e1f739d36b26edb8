/*
 * Common logging functions.
 * Notes
 * - These could be enhanced with macros that note filename, line number, and function.
 */

#include "logging.h"
#include "basic.h"
#include <stdint.h>
#include <string.h>

static LogLevel currentLevel = LogLevel::Normal;

void setLogLevel(LogLevel level)
{
  currentLevel = level;
}

LogLevel logLevel()
{
  return currentLevel;
}

bool logEnabled(LogLevel level)
{
  return static_cast<int>(level) <= static_cast<int>(currentLevel);
}

// Helper function to be called from another variadic function.
// Writes a format string to a msg.
// Truncated output is clamped to the buffer.
void vmsgPrintf(struct LogMsg& msg, const char* fmt, va_list va)
{
  int n = vsnprintf(msg.buf, sizeof(msg.buf), fmt, va);
  if (n < 0) {
    n = 0;
  }
  msg.len = min(static_cast<size_t>(n), sizeof(msg.buf) - 1);
}

// Version of above that can be called from regular functions.
void msgPrintf(struct LogMsg& msg, const char* fmt, ...)
{
  va_list va;
  va_start(va, fmt);
  vmsgPrintf(msg, fmt, va);
  va_end(va);
}

void logSendMsg(const struct LogMsg& msg)
{
  fwrite(msg.buf, 1, msg.len, stdout);
}

void logPrintf(LogLevel level, struct LogMsg& msg, const char* fmt, ...)
{
  va_list va;
  va_start(va, fmt);
  vmsgPrintf(msg, fmt, va);
  va_end(va);
  if (logEnabled(level)) {
    logSendMsg(msg);
  }
}

// Expands msg to hex in-place
// Returns number of bytes lost due to truncation
size_t toHex(LogMsg& msg)
{
  // Number of bytes we're going to print (might be less than maximum)
  size_t printableBytes = min(MaxHexBytes, msg.len);
  // check for truncation
  size_t bytesLost = msg.len - printableBytes;
  // Setup newline char
  msg.buf[printableBytes * 3] = '\n';
  // temporary storage to capture null character
  char tmpHex[4];
  // Replace from back to front
  for (int i = printableBytes - 1; i >= 0; i--) {
    // Note that there's no way to tell printf to omit the null terminator
    snprintf(tmpHex, sizeof(tmpHex), " %02x", static_cast<uint8_t>(msg.buf[i]));
    memcpy(msg.buf + i * 3, tmpHex, 3);
  }
  // Update length
  msg.len = printableBytes * 3 + 1;
  return bytesLost;
}

// Prints message as hex.
// Returns number of bytes lost due to truncation
size_t logPrintHex(LogLevel level, LogMsg& msg)
{
  size_t truncated = toHex(msg);
  if (logEnabled(level)) {
    if (truncated) {
      // Calling function can make another print with specific truncation number
      fputs("Truncated:\n", stdout);
    }
    logSendMsg(msg);
  }
  return truncated;
}

// For noting errors
void error(const char* str)
{
  // Keep ordering with anything already printed to stdout
  fflush(stdout);
  fprintf(stderr, "ERROR: %s\n", str);
}

// A less severe error()
void warn(const char* str)
{
  fflush(stdout);
  fprintf(stderr, "Warning: %s\n", str);
}
