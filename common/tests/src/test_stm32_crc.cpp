#include "CppUTest/TestHarness.h"

#include "stm32_crc.h"
#include <pthread.h>
#include <string.h>
#include <sys/resource.h>
#include <vector>

// Helper for checksumming string literals without their null terminator
static uint32_t crcOf(const char* str)
{
  return stm32Crc32(str, strlen(str));
}

TEST_GROUP(TestCrcTable){ void setup(){} void teardown(){} };

TEST(TestCrcTable, byte_table_entries)
{
  std::vector<uint32_t> table;
  LONGS_EQUAL(static_cast<int>(CrcStatus::Ok), static_cast<int>(buildCrcTable(8, table)));
  LONGS_EQUAL(256, table.size());

  // Index 0 never sets the top bit, so the poly is never applied
  UNSIGNED_LONGS_EQUAL(0x00000000, table[0]);
  UNSIGNED_LONGS_EQUAL(crcPoly, table[1]);
  UNSIGNED_LONGS_EQUAL(0x09823B6E, table[2]);
  UNSIGNED_LONGS_EQUAL(0x0D4326D9, table[3]);
  UNSIGNED_LONGS_EQUAL(0x690CE0EE, table[0x80]);
  UNSIGNED_LONGS_EQUAL(0xB1F740B4, table[0xFF]);
}

TEST(TestCrcTable, builds_are_identical)
{
  std::vector<uint32_t> first;
  std::vector<uint32_t> second;
  buildCrcTable(8, first);
  buildCrcTable(8, second);
  CHECK(first == second);

  // Class and free function agree
  CrcTable table;
  MEMCMP_EQUAL(first.data(), table.data(), CrcTable::size() * sizeof(uint32_t));
  MEMCMP_EQUAL(table.data(), sharedCrcTable().data(), CrcTable::size() * sizeof(uint32_t));
}

TEST(TestCrcTable, other_widths)
{
  std::vector<uint32_t> table;

  LONGS_EQUAL(static_cast<int>(CrcStatus::Ok), static_cast<int>(buildCrcTable(1, table)));
  LONGS_EQUAL(2, table.size());
  UNSIGNED_LONGS_EQUAL(0, table[0]);
  UNSIGNED_LONGS_EQUAL(crcPoly, table[1]);

  LONGS_EQUAL(static_cast<int>(CrcStatus::Ok), static_cast<int>(buildCrcTable(4, table)));
  LONGS_EQUAL(16, table.size());
  UNSIGNED_LONGS_EQUAL(0x384FBDBD, table[15]);

  LONGS_EQUAL(static_cast<int>(CrcStatus::Ok), static_cast<int>(buildCrcTable(16, table)));
  LONGS_EQUAL(65536, table.size());
  UNSIGNED_LONGS_EQUAL(crcPoly, table[1]);
  UNSIGNED_LONGS_EQUAL(0xFF48647D, table[0xFFFF]);
}

TEST(TestCrcTable, invalid_widths)
{
  std::vector<uint32_t> table(3, 1);

  LONGS_EQUAL(static_cast<int>(CrcStatus::InvalidTableWidth), static_cast<int>(buildCrcTable(0, table)));
  CHECK(table.empty());

  table.assign(3, 1);
  LONGS_EQUAL(static_cast<int>(CrcStatus::InvalidTableWidth), static_cast<int>(buildCrcTable(33, table)));
  CHECK(table.empty());

  // Rejected before any shifting happens
  LONGS_EQUAL(static_cast<int>(CrcStatus::InvalidTableWidth), static_cast<int>(buildCrcTable(0xFFFFFFFF, table)));
  CHECK(table.empty());
}

/*
 * A 32-bit table needs 16 GiB.
 * Caps the address space well below that so the allocation fails.
 */
TEST(TestCrcTable, allocation_failure_is_reported)
{
  struct rlimit saved;
  LONGS_EQUAL(0, getrlimit(RLIMIT_AS, &saved));

  struct rlimit capped = saved;
  const rlim_t cap = rlim_t(4) << 30; // 4 GiB
  if (capped.rlim_max == RLIM_INFINITY || capped.rlim_max > cap) {
    capped.rlim_cur = cap;
  }
  LONGS_EQUAL(0, setrlimit(RLIMIT_AS, &capped));

  std::vector<uint32_t> table(3, 1);
  CrcStatus status = buildCrcTable(32, table);

  LONGS_EQUAL(0, setrlimit(RLIMIT_AS, &saved));

  LONGS_EQUAL(static_cast<int>(CrcStatus::TableTooLarge), static_cast<int>(status));
  CHECK(table.empty());
  STRCMP_EQUAL("TableTooLarge", crcStatusToString(status));
}

TEST_GROUP(TestStm32Crc){ void setup(){} void teardown(){} };

TEST(TestStm32Crc, known_hardware_values)
{
  UNSIGNED_LONGS_EQUAL(0xaff19057, crcOf("123456789"));
  UNSIGNED_LONGS_EQUAL(0x89f3bab2, crcOf("123 567 901 34"));
  UNSIGNED_LONGS_EQUAL(0x0519b130, crcOf("\xfe\xff\xfe\xff"));
  UNSIGNED_LONGS_EQUAL(0x495e02ca, crcOf("\xfe\xff\xfe\xff\x88"));
}

TEST(TestStm32Crc, empty_buffer_returns_seed)
{
  UNSIGNED_LONGS_EQUAL(0xFFFFFFFF, stm32Crc32("", 0));
  UNSIGNED_LONGS_EQUAL(0x12345678, crcCompute("", 0, 0x12345678));
  UNSIGNED_LONGS_EQUAL(0, crcCompute(nullptr, 0, 0));
}

TEST(TestStm32Crc, zero_word)
{
  const uint8_t zeros[4] = { 0 };
  UNSIGNED_LONGS_EQUAL(0xC704DD7B, stm32Crc32(zeros, sizeof(zeros)));
  // Zero seed and zero data stay zero
  UNSIGNED_LONGS_EQUAL(0, crcCompute(zeros, sizeof(zeros), 0));
}

/*
 * A partial word is reversed and zero-padded, so it matches
 * the full word made of its reversed bytes followed by zeros.
 */
TEST(TestStm32Crc, partial_word_padding)
{
  const uint8_t one[] = { 0x88 };
  const uint8_t onePadded[] = { 0x88, 0x00, 0x00, 0x00 };
  UNSIGNED_LONGS_EQUAL(0x8800d02d, stm32Crc32(one, sizeof(one)));
  UNSIGNED_LONGS_EQUAL(stm32Crc32(onePadded, sizeof(onePadded)), stm32Crc32(one, sizeof(one)));

  // Padding on the other side is a different word
  const uint8_t onePaddedLeft[] = { 0x00, 0x00, 0x00, 0x88 };
  UNSIGNED_LONGS_EQUAL(0x9808786c, stm32Crc32(onePaddedLeft, sizeof(onePaddedLeft)));

  const uint8_t three[] = { 0x01, 0x02, 0x03 };
  const uint8_t threePadded[] = { 0x03, 0x02, 0x01, 0x00 };
  UNSIGNED_LONGS_EQUAL(0x6b6dc92a, stm32Crc32(three, sizeof(three)));
  UNSIGNED_LONGS_EQUAL(stm32Crc32(threePadded, sizeof(threePadded)), stm32Crc32(three, sizeof(three)));
}

TEST(TestStm32Crc, process_word_reverses_bytes)
{
  const CrcTable& table = sharedCrcTable();
  const uint8_t word[] = { 0x11, 0x22, 0x33, 0x44 };

  uint32_t expected = crcInit;
  expected = crcProcessByte(table, 0x44, expected);
  expected = crcProcessByte(table, 0x33, expected);
  expected = crcProcessByte(table, 0x22, expected);
  expected = crcProcessByte(table, 0x11, expected);

  UNSIGNED_LONGS_EQUAL(expected, crcProcessWord(table, word, 4, crcInit));
  UNSIGNED_LONGS_EQUAL(expected, stm32Crc32(word, sizeof(word)));
}

TEST(TestStm32Crc, chaining_on_word_boundaries)
{
  const char* data = "123 567 901 34";
  uint32_t whole = crcOf(data);

  // Every word-aligned split point
  for (size_t split = 0; split <= 12; split += 4) {
    uint32_t crc = crcCompute(data, split);
    crc = crcCompute(data + split, strlen(data) - split, crc);
    UNSIGNED_LONGS_EQUAL(whole, crc);
  }

  // Three pieces
  uint32_t crc = crcCompute(data, 4);
  crc = crcCompute(data + 4, 8, crc);
  crc = crcCompute(data + 12, 2, crc);
  UNSIGNED_LONGS_EQUAL(whole, crc);

  UNSIGNED_LONGS_EQUAL(0xfefc54f9, crcCompute("5678", 4, crcCompute("1234", 4)));
}

TEST(TestStm32Crc, chaining_off_word_boundary_differs)
{
  uint32_t crc = crcCompute("12", 2);
  crc = crcCompute("3456789", 7, crc);
  UNSIGNED_LONGS_EQUAL(0xc1e2e225, crc);
  CHECK(crc != crcOf("123456789"));
}

TEST(TestStm32Crc, caller_owned_table)
{
  CrcTable table;
  UNSIGNED_LONGS_EQUAL(0xaff19057, crcCompute(table, "123456789", 9));
  UNSIGNED_LONGS_EQUAL(0x97f8efa0, crcCompute(table, "12345678", 8, 0));
  UNSIGNED_LONGS_EQUAL(0x1d839e03, crcCompute(table, "1234", 4, 0x12345678));
}

// Results from one reader thread
struct SharedTableReader
{
  pthread_t thread;
  pthread_barrier_t* start;
  uint32_t crc;
  const uint32_t* tableData;
};

static void* readSharedTable(void* arg)
{
  SharedTableReader* reader = static_cast<SharedTableReader*>(arg);
  pthread_barrier_wait(reader->start);
  reader->crc = stm32Crc32("123456789", 9);
  reader->tableData = sharedCrcTable().data();
  return nullptr;
}

TEST_GROUP(TestSharedTable){ void setup(){} void teardown(){} };

/*
 * Readers are released together, so when this test runs first they race
 * to build the shared table. All of them must see the same fully built table.
 */
TEST(TestSharedTable, concurrent_first_use)
{
  const int numReaders = 8;
  SharedTableReader readers[numReaders];
  pthread_barrier_t start;
  LONGS_EQUAL(0, pthread_barrier_init(&start, nullptr, numReaders));

  for (int i = 0; i < numReaders; i++) {
    readers[i].crc = 0;
    readers[i].tableData = nullptr;
    readers[i].start = &start;
    LONGS_EQUAL(0, pthread_create(&readers[i].thread, nullptr, readSharedTable, &readers[i]));
  }
  for (int i = 0; i < numReaders; i++) {
    LONGS_EQUAL(0, pthread_join(readers[i].thread, nullptr));
  }
  pthread_barrier_destroy(&start);

  const uint32_t* expectedData = sharedCrcTable().data();
  CrcTable fresh;
  for (int i = 0; i < numReaders; i++) {
    UNSIGNED_LONGS_EQUAL(0xaff19057, readers[i].crc);
    POINTERS_EQUAL(expectedData, readers[i].tableData);
  }
  MEMCMP_EQUAL(fresh.data(), expectedData, CrcTable::size() * sizeof(uint32_t));
}
