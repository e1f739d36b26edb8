/*
 * Host-side logging.
 * Messages are formatted into fixed-size LogMsg buffers, then written
 * to stdout. Errors and warnings go to stderr and are never filtered.
 */

#pragma once

#include "stdarg.h"
#include "stddef.h"
#include <stdio.h>

#define println(format, ...) printf(format "\n", ##__VA_ARGS__)

const size_t LogMsgLength = 128;
const size_t MaxLogMsgChars = LogMsgLength - sizeof(size_t);

// Maximum number of hex bytes we could display in the message
// 3 chars per byte, plus newline
const size_t MaxHexBytes = (MaxLogMsgChars - 1) / 3;

struct LogMsg
{
  size_t len;
  char buf[MaxLogMsgChars];
};

// check if things are packed as expected
static_assert(sizeof(LogMsg) == LogMsgLength, "Unexpected size calculation");

enum class LogLevel
{
  Quiet,   // errors only
  Normal,  // results
  Verbose, // progress details
};

void setLogLevel(LogLevel level);

LogLevel logLevel();

// True if messages at `level` are currently shown
bool logEnabled(LogLevel level);

void logSendMsg(const struct LogMsg& msg);

// printf to stdout, if `level` is enabled.
void logPrintf(LogLevel level, struct LogMsg& msg, const char* fmt, ...);

// Expands msg to hex in-place.
// Returns number of bytes lost due to truncation
size_t toHex(LogMsg& msg);

// Prints message as hex, if `level` is enabled.
// Returns number of bytes lost due to truncation
size_t logPrintHex(LogLevel level, LogMsg& msg);

// For noting errors
void error(const char* str);

// A less severe error()
void warn(const char* str);

// Helper function to be called from another variadic function.
// Writes a format string to a msg
void vmsgPrintf(struct LogMsg& msg, const char* fmt, va_list va);

// Version of above that can be called from regular functions.
void msgPrintf(struct LogMsg& msg, const char* fmt, ...);
