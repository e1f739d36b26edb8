/*
 * Functions for turning host-side input into bytes and CRCs
 */

#include "byte_input.h"
#include <ctype.h>
#include <errno.h>
#include <fcntl.h>  // open
#include <stdio.h>  // perror
#include <stdlib.h> // strtoull
#include <string.h>
#include <unistd.h> // read, close

CrcStatus packBytes(const uint32_t* values, size_t count, std::vector<uint8_t>& out)
{
  out.clear();
  for (size_t i = 0; i < count; i++) {
    if (values[i] > 0xFF) {
      out.clear();
      return CrcStatus::NonByteInput;
    }
    out.push_back(static_cast<uint8_t>(values[i]));
  }
  return CrcStatus::Ok;
}

static bool isSeparator(char c)
{
  return isspace(static_cast<unsigned char>(c)) || c == ',' || c == ':';
}

static int hexValue(char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

/*
 * Walks the text one token at a time.
 * A whole token is scanned before deciding on an error, so "1fz" is
 * reported as malformed rather than too large.
 */
CrcStatus parseHexBytes(const char* text, std::vector<uint8_t>& out)
{
  out.clear();
  const char* p = text;

  while (*p) {
    if (isSeparator(*p)) {
      p++;
      continue;
    }

    // Optional prefix
    if (p[0] == '0' && (p[1] == 'x' || p[1] == 'X')) {
      p += 2;
    }

    uint32_t value = 0;
    uint32_t digits = 0;
    bool tooBig = false;
    bool malformed = false;

    for (; *p && !isSeparator(*p); p++) {
      int v = hexValue(*p);
      if (v < 0) {
        malformed = true;
        continue;
      }
      digits++;
      value = (value << 4) | v;
      if (value > 0xFF) {
        tooBig = true;
        // Keep value small so it can't wrap back into range
        value = 0x100;
      }
    }

    if (malformed || digits == 0) {
      out.clear();
      return CrcStatus::MalformedInput;
    }
    if (tooBig) {
      out.clear();
      return CrcStatus::NonByteInput;
    }
    out.push_back(static_cast<uint8_t>(value));
  }
  return CrcStatus::Ok;
}

bool parseU32(const char* text, uint32_t& value)
{
  int base = 10;
  const char* digits = text;
  if (text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    base = 16;
    digits = text + 2;
  }

  // strtoull would otherwise accept a sign or leading whitespace
  if (*digits == '\0' || hexValue(*digits) < 0 || (base == 10 && !isdigit(static_cast<unsigned char>(*digits)))) {
    return false;
  }

  errno = 0;
  char* end = nullptr;
  unsigned long long parsed = strtoull(digits, &end, base);
  if (errno != 0 || *end != '\0' || parsed > 0xFFFFFFFFull) {
    return false;
  }

  value = static_cast<uint32_t>(parsed);
  return true;
}

/*
 * Reads fd in chunks of crcFileChunkSize and chains each chunk into crc.
 * Short reads are accumulated until the chunk is full (or EOF), so only the
 * final chunk can end on a partial word.
 */
CrcStatus crcFd(int fd, uint32_t seed, uint32_t& crc)
{
  std::vector<uint8_t> buf(crcFileChunkSize);
  // How many bytes are waiting in buf
  size_t bufLen = 0;
  uint32_t reg = seed;

  // Loop until EOF
  while (1) {
    ssize_t numRead = read(fd, buf.data() + bufLen, buf.size() - bufLen);
    if (numRead == -1) {
      if (errno == EINTR) {
        continue;
      }
      perror("Got an error reading input");
      return CrcStatus::ReadError;
    }
    if (numRead == 0) {
      break;
    }

    bufLen += numRead;
    if (bufLen == buf.size()) {
      reg = crcCompute(buf.data(), bufLen, reg);
      bufLen = 0;
    }
  }

  crc = crcCompute(buf.data(), bufLen, reg);
  return CrcStatus::Ok;
}

CrcStatus crcFile(const char* path, uint32_t seed, uint32_t& crc)
{
  if (strcmp(path, "-") == 0) {
    return crcFd(STDIN_FILENO, seed, crc);
  }

  int fd = open(path, O_RDONLY);
  if (fd == -1) {
    perror("failed to open input file");
    return CrcStatus::ReadError;
  }

  CrcStatus status = crcFd(fd, seed, crc);
  close(fd);
  return status;
}
