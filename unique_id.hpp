// unique_id.hpp
// 128-bit unique identifiers used as timestamp tie-breakers.
// Generated by libuuid (RFC 4122 version 4), stored as a big-endian packed __uint128_t.

#ifndef LWW_CRDT_UNIQUE_ID_HPP
#define LWW_CRDT_UNIQUE_ID_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <uuid/uuid.h> // libuuid

#ifndef __SIZEOF_INT128__
#error "lww_crdt requires 128-bit integer support (__uint128_t)"
#endif

namespace lww_crdt {

using uint128_t = __uint128_t;

struct UniqueIdTraits {
  using type = uint128_t;
  using bytes_type = std::array<uint8_t, 16>;

  static constexpr size_t byte_size = 16;

  /// Big-endian byte form. Numeric order of ids equals byte-wise order of this form.
  static constexpr bytes_type to_bytes(uint128_t id) {
    bytes_type bytes{};
    for (size_t i = 0; i < byte_size; i++) {
      bytes[byte_size - 1 - i] = static_cast<uint8_t>((id >> (i * 8)) & 0xFF);
    }
    return bytes;
  }

  static constexpr uint128_t from_bytes(const uint8_t *bytes) {
    uint128_t result = 0;
    for (size_t i = 0; i < byte_size; i++) {
      result = (result << 8) | bytes[i];
    }
    return result;
  }

  static constexpr uint128_t from_bytes(const bytes_type &bytes) { return from_bytes(bytes.data()); }

  /// Generate a random identifier
  ///
  /// Collision probability (birthday paradox, 122 random bits):
  /// - 2^32 ids:  ~2^-59 chance of collision (negligible)
  /// - 2^61 ids:  ~50% chance of collision
  static uint128_t generate() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    return from_bytes(uuid);
  }

  // Convert to hex string (32 chars)
  static std::string to_string(uint128_t id) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(32, '0');
    for (size_t i = 0; i < 32; i++) {
      out[31 - i] = digits[static_cast<unsigned>((id >> (i * 4)) & 0xF)];
    }
    return out;
  }

  // Canonical 8-4-4-4-12 form, uppercase
  static std::string to_uuid_string(uint128_t id) {
    bytes_type bytes = to_bytes(id);
    char text[37];
    uuid_unparse_upper(bytes.data(), text);
    return std::string(text);
  }

  // Parse either the 32-char hex form or the 36-char UUID form
  static uint128_t from_string(const std::string &s) {
    if (s.length() == 36) {
      uuid_t uuid;
      if (uuid_parse(s.c_str(), uuid) != 0) {
        throw std::invalid_argument("malformed UUID string: " + s);
      }
      return from_bytes(uuid);
    }

    if (s.length() != 32) {
      throw std::invalid_argument("unique id must be 32 hex chars or a 36 char UUID, got " +
                                  std::to_string(s.length()) + " chars");
    }

    uint128_t result = 0;
    for (char c : s) {
      unsigned nibble;
      if (c >= '0' && c <= '9') {
        nibble = static_cast<unsigned>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        nibble = static_cast<unsigned>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        nibble = static_cast<unsigned>(c - 'A' + 10);
      } else {
        throw std::invalid_argument("invalid hex digit in unique id: " + s);
      }
      result = (result << 4) | nibble;
    }
    return result;
  }
};

} // namespace lww_crdt

// Hash function for uint128_t (required for std::unordered_set/map and register hashing)
//
// Modern libc++ (19.0+) and libstdc++ in GNU mode (-std=gnu++NN) provide
// std::hash<__uint128_t> automatically. To prevent redefinition errors, users can
// define LWW_CRDT_HAS_UINT128_HASH if their standard library already provides it.
#ifndef LWW_CRDT_HAS_UINT128_HASH
  #if defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 190000
    #define LWW_CRDT_HAS_UINT128_HASH 1
  #elif defined(__GLIBCXX__) && !defined(__STRICT_ANSI__)
    #define LWW_CRDT_HAS_UINT128_HASH 1
  #else
    #define LWW_CRDT_HAS_UINT128_HASH 0
  #endif
#endif

#if !LWW_CRDT_HAS_UINT128_HASH
namespace std {
template <> struct hash<__uint128_t> {
  size_t operator()(const __uint128_t &val) const noexcept {
    uint64_t high = static_cast<uint64_t>(val >> 64);
    uint64_t low = static_cast<uint64_t>(val & 0xFFFFFFFFFFFFFFFF);

    // boost hash_combine, plain XOR would collide (A,B) with (B,A)
    size_t seed = std::hash<uint64_t>{}(high);
    seed ^= std::hash<uint64_t>{}(low) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};
} // namespace std
#endif

#endif // LWW_CRDT_UNIQUE_ID_HPP
