// test_timestamp.cpp
#include "timestamp.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

using namespace lww_crdt;

/// Simple assertion helper
void assert_true(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << "Assertion failed: " << message << std::endl;
    exit(1);
  }
}

int main() {
  // Test Case: Fresh timestamps start at zero with distinct ids
  {
    Timestamp a;
    Timestamp b;
    assert_true(a.count() == 0, "Fresh: count should be 0");
    assert_true(b.count() == 0, "Fresh: count should be 0");
    assert_true(a.id() != b.id(), "Fresh: ids should differ");
    assert_true(a != b, "Fresh: timestamps with different ids are not equal");
    std::cout << "Test 'Fresh Timestamps' passed." << std::endl;
  }

  // Test Case: tick is pure and keeps the id
  {
    const Timestamp t(41, 0xABCDEF);
    Timestamp next = t.tick();
    assert_true(t.count() == 41, "Tick: original count must not change");
    assert_true(next.count() == 42, "Tick: count should increase by one");
    assert_true(next.id() == t.id(), "Tick: id should be preserved");
    assert_true(next > t, "Tick: ticked timestamp should be greater");
    std::cout << "Test 'Tick Purity' passed." << std::endl;
  }

  // Test Case: tick saturates instead of wrapping
  {
    Timestamp near_end(Timestamp::max_count - 1, 7);
    Timestamp last = near_end.tick();
    assert_true(last.count() == Timestamp::max_count, "Saturate: should reach max_count");
    assert_true(last > near_end, "Saturate: should still advance before the limit");
    assert_true(last.tick().count() == Timestamp::max_count, "Saturate: must not wrap to zero");
    assert_true(!(last.tick() < last), "Saturate: tick must never go backwards");
    std::cout << "Test 'Tick Saturation' passed." << std::endl;
  }

  // Test Case: count dominates the id
  {
    Timestamp low_count_high_id(1, ~static_cast<uint128_t>(0));
    Timestamp high_count_low_id(2, 0);
    assert_true(low_count_high_id < high_count_low_id, "Order: count must be compared first");
    std::cout << "Test 'Count Dominates' passed." << std::endl;
  }

  // Test Case: id breaks ties at equal count
  {
    Timestamp a(5, 1);
    Timestamp b(5, 2);
    assert_true(a < b, "Tie-break: smaller id should be less");
    assert_true(!(b < a), "Tie-break: order must be asymmetric");
    assert_true(a != b, "Tie-break: distinct ids must not compare equal");

    // Byte-wise order of the big-endian form decides, so the high byte dominates
    Timestamp high_byte(5, static_cast<uint128_t>(1) << 120);
    Timestamp low_bytes(5, 0x00FFFFFFFFFFFFFFULL);
    assert_true(low_bytes < high_byte, "Tie-break: high byte should dominate");
    std::cout << "Test 'Tie Break' passed." << std::endl;
  }

  // Test Case: exactly one of <, >, == holds for any pair
  {
    std::vector<Timestamp> samples;
    for (int i = 0; i < 8; ++i) {
      Timestamp t;
      samples.push_back(t);
      samples.push_back(t.tick());
      samples.push_back(Timestamp(1, t.id()));
    }
    samples.push_back(samples.front());

    for (const auto &a : samples) {
      for (const auto &b : samples) {
        int holds = (a < b ? 1 : 0) + (b < a ? 1 : 0) + (a == b ? 1 : 0);
        assert_true(holds == 1, "Total order: exactly one relation must hold");
      }
    }
    std::cout << "Test 'Total Order' passed." << std::endl;
  }

  // Test Case: equality and hashing agree
  {
    Timestamp a;
    Timestamp copy = a;
    Timestamp rebuilt(a.count(), a.id());
    assert_true(copy == a, "Equality: copies should be equal");
    assert_true(rebuilt == a, "Equality: same fields should be equal");
    assert_true(std::hash<Timestamp>{}(rebuilt) == std::hash<Timestamp>{}(a), "Hash: equal timestamps hash alike");

    std::unordered_set<Timestamp> set;
    set.insert(a);
    set.insert(rebuilt);
    set.insert(a.tick());
    assert_true(set.size() == 2, "Hash: set should hold two distinct timestamps");
    std::cout << "Test 'Equality and Hash' passed." << std::endl;
  }

  // Test Case: encoded form is 24 big-endian bytes
  {
    Timestamp t(0x0102030405060708ULL, (static_cast<uint128_t>(0xA0A1A2A3A4A5A6A7ULL) << 64) | 0xB0B1B2B3B4B5B6B7ULL);
    std::vector<uint8_t> out;
    t.encode(out);
    assert_true(out.size() == Timestamp::encoded_size, "Encode: should write 24 bytes");
    assert_true(out[0] == 0x01 && out[7] == 0x08, "Encode: count should be big-endian");
    assert_true(out[8] == 0xA0 && out[23] == 0xB7, "Encode: id should be big-endian");

    size_t offset = 0;
    auto decoded = Timestamp::decode(out.data(), out.size(), offset);
    assert_true(decoded.has_value() && *decoded == t, "Decode: should restore the timestamp");
    assert_true(offset == out.size(), "Decode: offset should advance past the timestamp");

    size_t short_offset = 0;
    assert_true(!Timestamp::decode(out.data(), out.size() - 1, short_offset).has_value(),
                "Decode: truncated input should be rejected");
    assert_true(short_offset == 0, "Decode: offset must not move on failure");

    std::vector<uint8_t> exhausted;
    Timestamp(Timestamp::max_count, 1).encode(exhausted);
    size_t exhausted_offset = 0;
    assert_true(!Timestamp::decode(exhausted.data(), exhausted.size(), exhausted_offset).has_value(),
                "Decode: a count that cannot advance should be rejected");
    std::cout << "Test 'Encoding' passed." << std::endl;
  }

  // Test Case: debug rendering shows count and id prefix/suffix
  {
    Timestamp t(3, UniqueIdTraits::from_string("AB000000-0000-4000-8000-0000000000CD"));
    std::ostringstream oss;
    oss << t;
    assert_true(oss.str() == "Timestamp { 3, AB..CD }", "Render: unexpected output " + oss.str());
    std::cout << "Test 'Debug Rendering' passed." << std::endl;
  }

  std::cout << "All timestamp tests passed." << std::endl;
  return 0;
}
