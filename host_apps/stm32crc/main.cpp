#include <argp.h>
#include <stdlib.h>
#include <string.h>
#include <vector>

#include "basic.h"
#include "byte_input.h"
#include "logging.h"
#include "stm32_crc.h"

// Exit codes
#define EXIT_MISMATCH 2

// ------
// argp command line options
// https://www.gnu.org/software/libc/manual/html_node/Argp.html

#define DEFAULT_SEED "0xFFFFFFFF"

// Available options
static struct argp_option options[] = { //
  { "hex", 'x', "BYTES", 0, "Checksum these hex bytes instead of a file, e.g. \"fe ff 88\"" },
  { "seed", 's', "SEED", 0, "Starting CRC value, for chaining. Default: " DEFAULT_SEED },
  { "expect", 'e', "CRC", 0, "Expected CRC. Exits with 2 on mismatch" },
  { "table", 't', "BITS", 0, "Print the lookup table for BITS as a C array and exit" },
  { "selftest", 'c', 0, 0, "Check against known hardware values and exit" },
  { "verbose", 'v', 0, 0, "Log progress and dump --hex input" },
  { "quiet", 'q', 0, 0, "Only print errors" },
  { 0 }
};

// Additional program usage docs
static char doc[] = "Computes the CRC32 that an STM32 CRC peripheral reports for FILE.\n"
                    "Use FILE of - to read stdin.";

static char args_doc[] = "[FILE]";

// Program's arguments and options
struct arguments
{
  const char* file;
  const char* hex;
  uint32_t seed;
  bool hasExpect;
  uint32_t expect;
  bool hasTable;
  uint32_t tableBits;
  bool selfTest;
  LogLevel level;
};

// Parses a numeric option, or exits with a usage error
static uint32_t parseNumberArg(const char* arg, const char* name, struct argp_state* state)
{
  uint32_t value = 0;
  if (!parseU32(arg, value)) {
    argp_error(state, "invalid %s: %s", name, arg);
  }
  return value;
}

// How to parse a single option or argument
static error_t parse_arg(int key, char* arg, struct argp_state* state)
{
  struct arguments* arguments = (struct arguments*)state->input;

  switch (key) {
    case 'x': //
      arguments->hex = arg;
      break;

    case 's': //
      arguments->seed = parseNumberArg(arg, "seed", state);
      break;

    case 'e':
      arguments->hasExpect = true;
      arguments->expect = parseNumberArg(arg, "expected crc", state);
      break;

    case 't':
      arguments->hasTable = true;
      arguments->tableBits = parseNumberArg(arg, "table width", state);
      break;

    case 'c': //
      arguments->selfTest = true;
      break;

    case 'v': //
      arguments->level = LogLevel::Verbose;
      break;

    case 'q': //
      arguments->level = LogLevel::Quiet;
      break;

    case ARGP_KEY_ARG:
      // Only one file allowed
      if (arguments->file) {
        argp_usage(state);
      }
      arguments->file = arg;
      break;

    case ARGP_KEY_END:
      if (arguments->hasTable || arguments->selfTest) {
        break;
      }
      // Need exactly one input source
      if (!arguments->file == !arguments->hex) {
        argp_error(state, "provide either FILE or --hex");
      }
      break;

    default: //
      return ARGP_ERR_UNKNOWN;
  }
  return 0;
}

// Prints the table in a form that can be pasted into source
static int printTable(uint32_t bits)
{
  if (bits > 16 && bits <= crcMaxTableBits) {
    warn("Building a very large table");
  }

  std::vector<uint32_t> table;
  CrcStatus status = buildCrcTable(bits, table);
  if (status != CrcStatus::Ok) {
    LogMsg msg;
    msgPrintf(msg, "Can't build table of width %u: %s", bits, crcStatusToString(status));
    error(msg.buf);
    return EXIT_FAILURE;
  }

  println("// CRC32 poly 0x%08X, %u-bit index", crcPoly, bits);
  println("const uint32_t crcTable[%zu] = {", table.size());
  for (size_t i = 0; i < table.size(); i++) {
    // 6 entries per line
    printf("%s0x%08X,", i % 6 ? " " : "  ", table[i]);
    if (i % 6 == 5 || i + 1 == table.size()) {
      println();
    }
  }
  println("};");
  return EXIT_SUCCESS;
}

struct KnownValue
{
  const char* data;
  size_t length;
  uint32_t crc;
};

// Values read back from the peripheral
static const KnownValue knownValues[] = {
  { "", 0, 0xFFFFFFFF },
  { "123 567 901 34", 14, 0x89f3bab2 },
  { "123456789", 9, 0xaff19057 },
  { "\xfe\xff\xfe\xff", 4, 0x0519b130 },
  { "\xfe\xff\xfe\xff\x88", 5, 0x495e02ca },
};

static int selfTest()
{
  int failures = 0;
  for (size_t i = 0; i < countOf(knownValues); i++) {
    const KnownValue& known = knownValues[i];
    uint32_t crc = stm32Crc32(known.data, known.length);
    if (crc != known.crc) {
      LogMsg msg;
      msgPrintf(msg, "vector %zu: expected 0x%08X, calculated 0x%08X", i, known.crc, crc);
      error(msg.buf);
      failures++;
    }
  }

  if (failures) {
    return EXIT_FAILURE;
  }

  LogMsg msg;
  logPrintf(LogLevel::Normal, msg, "All tests passed!\n");
  return EXIT_SUCCESS;
}

// Computes the crc of whichever input was selected
static CrcStatus computeInput(const struct arguments& args, uint32_t& crc)
{
  LogMsg msg;

  if (args.hex) {
    std::vector<uint8_t> bytes;
    CrcStatus status = parseHexBytes(args.hex, bytes);
    if (status != CrcStatus::Ok) {
      msgPrintf(msg, "Can't parse hex bytes \"%s\": %s", args.hex, crcStatusToString(status));
      error(msg.buf);
      return status;
    }

    logPrintf(LogLevel::Verbose, msg, "Got %zu bytes:\n", bytes.size());
    // Dump in message-sized pieces
    for (size_t pos = 0; pos < bytes.size(); pos += MaxHexBytes) {
      msg.len = min(MaxHexBytes, bytes.size() - pos);
      memcpy(msg.buf, bytes.data() + pos, msg.len);
      logPrintHex(LogLevel::Verbose, msg);
    }

    crc = crcCompute(bytes.data(), bytes.size(), args.seed);
    return CrcStatus::Ok;
  }

  logPrintf(LogLevel::Verbose, msg, "Reading %s with seed 0x%08X\n", args.file, args.seed);
  CrcStatus status = crcFile(args.file, args.seed, crc);
  if (status != CrcStatus::Ok) {
    msgPrintf(msg, "Failed to read file %s", args.file);
    error(msg.buf);
  }
  return status;
}

int main(int argc, char** argv)
{
  // argp parser
  struct argp argp = { options, parse_arg, args_doc, doc };

  struct arguments arguments;

  // Default argument values
  arguments.file = nullptr;
  arguments.hex = nullptr;
  arguments.seed = crcInit;
  arguments.hasExpect = false;
  arguments.expect = 0;
  arguments.hasTable = false;
  arguments.tableBits = crcByteTableBits;
  arguments.selfTest = false;
  arguments.level = LogLevel::Normal;

  // Parse program arguments
  argp_parse(&argp, argc, argv, 0, 0, &arguments);

  setLogLevel(arguments.level);

  if (arguments.hasTable) {
    return printTable(arguments.tableBits);
  }

  if (arguments.selfTest) {
    return selfTest();
  }

  uint32_t crc = 0;
  CrcStatus status = computeInput(arguments, crc);
  if (status != CrcStatus::Ok) {
    return EXIT_FAILURE;
  }

  LogMsg msg;
  logPrintf(LogLevel::Normal, msg, "%u or 0x%x\n", crc, crc);

  if (arguments.hasExpect && crc != arguments.expect) {
    msgPrintf(msg, "%s: expected 0x%08X, calculated 0x%08X", crcStatusToString(CrcStatus::Mismatch), arguments.expect, crc);
    error(msg.buf);
    return EXIT_MISMATCH;
  }

  return EXIT_SUCCESS;
}
