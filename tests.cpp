// tests.cpp
#include "lww_register.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
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

// A value type with its own identity and no equality, hashing or codec
struct Document {
  uint64_t doc_id;
  std::string title;

  uint64_t id() const { return doc_id; }
};

static_assert(!std::equality_comparable<LWWRegister<Document>>);
static_assert(!Hashable<LWWRegister<Document>>);
static_assert(!Serializable<Document>);
static_assert(Crdt<LWWRegister<Document>>);

// Explicit constructors of the value type must not become implicit conversions
static_assert(std::is_convertible_v<double, LWWRegister<double>>);
static_assert(std::is_convertible_v<const char (&)[6], LWWRegister<std::string>>);
static_assert(!std::is_convertible_v<int, LWWRegister<std::vector<int>>>);
static_assert(std::is_constructible_v<LWWRegister<std::vector<int>>, int>);
static_assert(!std::is_convertible_v<int *, LWWRegister<std::unique_ptr<int>>>);

// Copies throw on demand; copy assignment leaves a half-written value behind when it does
struct FragileValue {
  static inline bool fail_copies = false;
  std::string text;

  explicit FragileValue(std::string t) : text(std::move(t)) {}
  FragileValue(const FragileValue &other) : text(other.text) {
    if (fail_copies)
      throw std::runtime_error("copy failed");
  }
  FragileValue(FragileValue &&) noexcept = default;
  FragileValue &operator=(const FragileValue &other) {
    text = other.text.substr(0, other.text.size() / 2);
    if (fail_copies)
      throw std::runtime_error("copy failed");
    text = other.text;
    return *this;
  }
  FragileValue &operator=(FragileValue &&) noexcept = default;
};

int main() {
  // Test Case: Basics
  {
    LWWRegister<int> sut(1);
    assert_true(sut.state().value == 1, "Basics: state value should be 1");
    assert_true(sut.state().timestamp.count() == 0, "Basics: count should start at 0");
    assert_true(sut.value() == 1, "Basics: value should be 1");

    sut.set_value(sut.value() + 10);
    assert_true(sut.state().value == 11, "Basics: state value should be 11");
    assert_true(sut.state().timestamp.count() == 1, "Basics: count should be 1 after one write");
    assert_true(sut.value() == 11, "Basics: value should be 11");
    std::cout << "Test 'Basics' passed." << std::endl;
  }

  // Test Case: Monotonic timestamps
  {
    LWWRegister<std::string> sut("start");
    uint128_t id = sut.timestamp().id();
    Timestamp previous = sut.timestamp();
    for (uint64_t n = 1; n <= 100; ++n) {
      sut.set_value("write " + std::to_string(n));
      assert_true(sut.timestamp().count() == n, "Monotonic: count should equal number of writes");
      assert_true(sut.timestamp() > previous, "Monotonic: timestamp should strictly increase");
      assert_true(sut.timestamp().id() == id, "Monotonic: id should never change");
      previous = sut.timestamp();
    }
    std::cout << "Test 'Monotonic Timestamps' passed." << std::endl;
  }

  // Test Case: modify applies one write
  {
    LWWRegister<int> sut(1);
    sut.modify([](int &v) { v += 10; });
    assert_true(sut.value() == 11, "Modify: value should be 11");
    assert_true(sut.timestamp().count() == 1, "Modify: one modify should tick once");
    std::cout << "Test 'Modify' passed." << std::endl;
  }

  // Test Case: Merge Principles
  {
    const LWWRegister<std::string> a("a");
    LWWRegister<std::string> b = a;
    b.set_value("b");
    LWWRegister<std::string> c = b;
    c.set_value("c");

    assert_true(b.timestamp() > a.timestamp(), "Merge Principles: b should be later than a");
    assert_true(c.timestamp() > b.timestamp(), "Merge Principles: c should be later than b");

    // Commutative
    auto sut1 = a.merged(b);
    auto sut2 = b.merged(a);
    assert_true(sut1 == sut2, "Merge Principles: merge should be commutative");
    assert_true(sut1 == b, "Merge Principles: later write should win");

    // Associative
    sut1 = (a.merged(b)).merged(c);
    sut2 = a.merged(b.merged(c));
    assert_true(sut1 == sut2, "Merge Principles: merge should be associative");
    assert_true(sut1 == c, "Merge Principles: latest write should win");

    // Idempotent
    sut1 = a.merged(a);
    assert_true(sut1 == a, "Merge Principles: merge should be idempotent");
    std::cout << "Test 'Merge Principles' passed." << std::endl;
  }

  // Test Case: Merge laws across independent replicas
  {
    std::vector<LWWRegister<int>> replicas;
    for (int i = 0; i < 4; ++i) {
      LWWRegister<int> r(i);
      for (int w = 0; w < i % 3; ++w) {
        r.set_value(r.value() * 10 + w);
      }
      replicas.push_back(r);
    }
    // Two replicas with equal counts, so only the id can decide
    replicas.push_back(LWWRegister<int>(100));
    replicas.push_back(LWWRegister<int>(200));

    for (const auto &a : replicas) {
      assert_true(a.merged(a) == a, "Laws: idempotence");
      for (const auto &b : replicas) {
        assert_true(a.merged(b) == b.merged(a), "Laws: commutativity");
        for (const auto &c : replicas) {
          assert_true(a.merged(b).merged(c) == a.merged(b.merged(c)), "Laws: associativity");
        }
      }
    }
    std::cout << "Test 'Merge Laws' passed." << std::endl;
  }

  // Test Case: merge keeps the greater timestamp and discards the other value
  {
    LWWRegister<std::string> node1("from node 1");
    LWWRegister<std::string> node2("from node 2");
    node2.set_value("node 2 edited");

    auto result = node1.merged(node2);
    assert_true(result.value() == "node 2 edited", "Selection: greater timestamp should win");
    assert_true(result.timestamp() == node2.timestamp(), "Selection: winner's timestamp should be kept");
    assert_true(node1.value() == "from node 1", "Selection: inputs must not be modified");

    // Equal counts: the id alone decides, from either side
    LWWRegister<std::string> left("left");
    LWWRegister<std::string> right("right");
    const auto &expected = left.timestamp() > right.timestamp() ? left : right;
    assert_true(left.merged(right) == expected, "Selection: id should break the tie");
    assert_true(right.merged(left) == expected, "Selection: tie break should not depend on order");
    std::cout << "Test 'Merge Selection' passed." << std::endl;
  }

  // Test Case: in-place merge
  {
    LWWRegister<int> local(1);
    LWWRegister<int> remote = local;
    remote.set_value(2);
    remote.set_value(3);

    LWWRegister<int> expected = local.merged(remote);
    local.merge(remote);
    assert_true(local == expected, "Merge In Place: should equal merged()");
    assert_true(local.value() == 3, "Merge In Place: remote write should win");

    // Merging an older replica is a no-op
    LWWRegister<int> stale(0);
    local.merge(stale);
    assert_true(local == expected, "Merge In Place: older replica should not win");

    local.merge(local);
    assert_true(local == expected, "Merge In Place: self merge should be a no-op");
    std::cout << "Test 'Merge In Place' passed." << std::endl;
  }

  // Test Case: a failed merge leaves the register untouched
  {
    LWWRegister<FragileValue> local(FragileValue("local"));
    LWWRegister<FragileValue> remote = local;
    remote.set_value(FragileValue("remote value"));
    const Timestamp before = local.timestamp();

    FragileValue::fail_copies = true;
    bool threw = false;
    try {
      local.merge(remote);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    FragileValue::fail_copies = false;

    assert_true(threw, "Failed Merge: copy error should propagate");
    assert_true(local.value().text == "local", "Failed Merge: value should be unchanged");
    assert_true(local.timestamp() == before, "Failed Merge: timestamp should be unchanged");

    local.merge(remote);
    assert_true(local.value().text == "remote value", "Failed Merge: retry should succeed");
    std::cout << "Test 'Failed Merge' passed." << std::endl;
  }

  // Test Case: concurrent replicas converge regardless of merge order
  {
    LWWRegister<std::string> origin("draft");
    LWWRegister<std::string> alice = origin;
    LWWRegister<std::string> bob("bob's own");
    LWWRegister<std::string> carol = origin;

    alice.set_value("alice 1");
    alice.set_value("alice 2");
    bob.set_value("bob 1");
    carol.set_value("carol 1");
    carol.set_value("carol 2");
    carol.set_value("carol 3");

    std::vector<LWWRegister<std::string>> forward = {alice, bob, carol};
    std::vector<LWWRegister<std::string>> backward = {carol, bob, alice};
    auto converged1 = merge_all(forward);
    auto converged2 = merge_all(backward.begin(), backward.end());
    assert_true(converged1.has_value() && converged2.has_value(), "Converge: merge_all should produce a value");
    assert_true(*converged1 == *converged2, "Converge: order should not matter");
    assert_true(converged1->value() == "carol 3", "Converge: most writes should win");

    std::vector<LWWRegister<std::string>> none;
    assert_true(!merge_all(none).has_value(), "Converge: empty range should give nullopt");
    std::cout << "Test 'Converge' passed." << std::endl;
  }

  // Test Case: Expressibility
  {
    LWWRegister float_sut = 3.14;
    assert_true(float_sut.value() == 3.14, "Expressibility: float literal");

    LWWRegister int_sut = 1;
    assert_true(int_sut.value() == 1, "Expressibility: integer literal");

    LWWRegister bool_sut = false;
    assert_true(bool_sut.value() == false, "Expressibility: boolean literal");

    LWWRegister string_sut = "Hello, world";
    static_assert(std::is_same_v<decltype(string_sut), LWWRegister<std::string>>);
    assert_true(string_sut.value() == "Hello, world", "Expressibility: string literal");

    LWWRegister<double> typed = 2.5;
    assert_true(typed.value() == 2.5 && typed.timestamp().count() == 0, "Expressibility: typed initialisation");
    std::cout << "Test 'Expressibility' passed." << std::endl;
  }

  // Test Case: Hashing
  {
    LWWRegister<std::string> a("x");
    LWWRegister<std::string> b = a;
    assert_true(std::hash<LWWRegister<std::string>>{}(a) == std::hash<LWWRegister<std::string>>{}(b),
                "Hashing: equal registers should hash alike");

    std::unordered_set<LWWRegister<std::string>> set;
    set.insert(a);
    set.insert(b);
    b.set_value("x");
    set.insert(b);
    assert_true(set.size() == 2, "Hashing: same value with a later timestamp is a different register");
    std::cout << "Test 'Hashing' passed." << std::endl;
  }

  // Test Case: Identity and values without equality
  {
    LWWRegister<Document> doc(Document{42, "first"});
    assert_true(doc.id() == 42, "Identity: id should forward to the value");

    LWWRegister<Document> edited = doc;
    edited.set_value(Document{42, "second"});
    auto merged = doc.merged(edited);
    assert_true(merged.value().title == "second", "Identity: merge should not need value equality");
    assert_true(merged.timestamp() == edited.timestamp(), "Identity: later write should win");
    std::cout << "Test 'Identity' passed." << std::endl;
  }

  // Test Case: Debug rendering
  {
    LWWRegister<int> sut(7);
    sut.set_value(11);
    std::ostringstream oss;
    oss << sut;
    std::string text = oss.str();
    assert_true(text.rfind("LWWRegister<int> { 11, Timestamp { 1, ", 0) == 0, "Render: unexpected output " + text);
    assert_true(text.size() >= 4 && text.substr(text.size() - 4) == " } }", "Render: unexpected ending " + text);

    LWWRegister<bool> flag(true);
    std::ostringstream flag_text;
    flag_text << flag;
    assert_true(flag_text.str().rfind("LWWRegister<bool> { true, ", 0) == 0, "Render: bool should print as text");

    LWWRegister<uint8_t> byte(65);
    std::ostringstream byte_text;
    byte_text << byte;
    assert_true(byte_text.str().rfind("LWWRegister<unsigned char> { 65, ", 0) == 0,
                "Render: byte should print as a number, got " + byte_text.str());

    LWWRegister<int8_t> small(-3);
    std::ostringstream small_text;
    small_text << small;
    assert_true(small_text.str().rfind("LWWRegister<signed char> { -3, ", 0) == 0,
                "Render: signed byte should print as a number, got " + small_text.str());
    std::cout << "Test 'Debug Rendering' passed." << std::endl;
  }

  std::cout << "All register tests passed." << std::endl;
  return 0;
}
