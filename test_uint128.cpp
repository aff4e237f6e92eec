// test_uint128.cpp
// Exercises the 128-bit unique ids that break timestamp ties

#include "unique_id.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

using namespace lww_crdt;

int main() {
  std::cout << "Testing 128-bit unique ids..." << std::endl;

  uint128_t id1 = UniqueIdTraits::generate();
  uint128_t id2 = UniqueIdTraits::generate();

  std::cout << "Id 1: " << UniqueIdTraits::to_uuid_string(id1) << std::endl;
  std::cout << "Id 2: " << UniqueIdTraits::to_uuid_string(id2) << std::endl;
  assert(id1 != id2);

  // libuuid version 4: version nibble 4, variant bits 10
  auto bytes = UniqueIdTraits::to_bytes(id1);
  assert((bytes[6] >> 4) == 0x4);
  assert((bytes[8] & 0xC0) == 0x80);

  std::cout << "✅ Generated ids are RFC 4122 version 4" << std::endl;

  // Test collision resistance
  std::cout << "\nTesting collision resistance..." << std::endl;
  std::unordered_set<uint128_t> ids;
  const int num_ids = 10000;
  for (int i = 0; i < num_ids; i++) {
    ids.insert(UniqueIdTraits::generate());
  }
  assert(ids.size() == num_ids);
  std::cout << "✅ Generated " << num_ids << " unique ids (no collisions)" << std::endl;

  // Test string conversion
  std::cout << "\nTesting string conversion..." << std::endl;
  uint128_t test_id = (static_cast<uint128_t>(0x123456789ABCDEF0ULL) << 64) | 0x0FEDCBA987654321ULL;

  std::string hex = UniqueIdTraits::to_string(test_id);
  std::cout << "Hex:  " << hex << std::endl;
  assert(hex == "123456789abcdef00fedcba987654321");
  assert(UniqueIdTraits::from_string(hex) == test_id);

  std::string uuid = UniqueIdTraits::to_uuid_string(test_id);
  std::cout << "UUID: " << uuid << std::endl;
  assert(uuid == "12345678-9ABC-DEF0-0FED-CBA987654321");
  assert(UniqueIdTraits::from_string(uuid) == test_id);
  assert(UniqueIdTraits::from_string("12345678-9abc-def0-0fed-cba987654321") == test_id);
  std::cout << "✅ Hex and UUID forms parse back to the same id" << std::endl;

  // Test malformed input
  std::cout << "\nTesting malformed input..." << std::endl;
  const std::string bad_inputs[] = {
      "",
      "1234",
      "123456789abcdef00fedcba98765432g",
      "12345678-9ABC-DEF0-0FED-CBA98765432Z",
      "12345678_9ABC_DEF0_0FED_CBA987654321",
  };
  for (const auto &input : bad_inputs) {
    bool threw = false;
    try {
      UniqueIdTraits::from_string(input);
    } catch (const std::invalid_argument &e) {
      threw = true;
      std::cout << "  rejected '" << input << "': " << e.what() << std::endl;
    }
    assert(threw);
  }
  std::cout << "✅ Malformed ids throw std::invalid_argument" << std::endl;

  // Test byte order
  std::cout << "\nTesting byte order..." << std::endl;
  auto test_bytes = UniqueIdTraits::to_bytes(test_id);
  assert(test_bytes[0] == 0x12);
  assert(test_bytes[15] == 0x21);
  assert(UniqueIdTraits::from_bytes(test_bytes) == test_id);

  // Numeric order matches byte-wise order of the big-endian form
  uint128_t smaller = UniqueIdTraits::from_string("00ffffffffffffffffffffffffffffff");
  uint128_t larger = UniqueIdTraits::from_string("01000000000000000000000000000000");
  assert(smaller < larger);
  assert(UniqueIdTraits::to_bytes(smaller) < UniqueIdTraits::to_bytes(larger));
  std::cout << "✅ Numeric order matches byte order" << std::endl;

  std::cout << "\n✅ All unique id tests passed!" << std::endl;
  return 0;
}
