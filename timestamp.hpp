// timestamp.hpp
#ifndef LWW_CRDT_TIMESTAMP_HPP
#define LWW_CRDT_TIMESTAMP_HPP

#include "unique_id.hpp"

#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace lww_crdt {

/// A counter-based logical timestamp carrying a random 128-bit id that breaks ties
/// between instances with the same count.
///
/// Ordered lexicographically by `(count, id)`. Two timestamps compare equal only when
/// both fields are equal, so the order is total.
class Timestamp {
public:
  /// Size of the encoded form: big-endian count followed by the 16 big-endian id bytes.
  static constexpr size_t encoded_size = sizeof(uint64_t) + UniqueIdTraits::byte_size;

  /// A "zero" timestamp with a freshly generated id.
  Timestamp() : count_(0), id_(UniqueIdTraits::generate()) {}

  /// Restores a known timestamp.
  constexpr Timestamp(uint64_t count, uint128_t id) : count_(count), id_(id) {}

  constexpr uint64_t count() const { return count_; }
  constexpr uint128_t id() const { return id_; }

  /// Largest count a timestamp can advance to. decode() rejects it, so only a
  /// timestamp restored locally with this count can reach it.
  static constexpr uint64_t max_count = std::numeric_limits<uint64_t>::max();

  /// Returns the next timestamp for the same id. Does not modify `this`.
  ///
  /// Saturates at max_count instead of wrapping to zero.
  [[nodiscard]] constexpr Timestamp tick() const {
    return Timestamp(count_ == max_count ? max_count : count_ + 1, id_);
  }

  constexpr std::strong_ordering operator<=>(const Timestamp &other) const {
    if (auto cmp = count_ <=> other.count_; cmp != 0) {
      return cmp;
    }
    // __uint128_t has no <=> in every compiler, compare by hand
    if (id_ < other.id_)
      return std::strong_ordering::less;
    if (id_ > other.id_)
      return std::strong_ordering::greater;
    return std::strong_ordering::equal;
  }

  constexpr bool operator==(const Timestamp &other) const { return count_ == other.count_ && id_ == other.id_; }

  /// Appends the encoded form to `out`.
  void encode(std::vector<uint8_t> &out) const {
    for (int i = 7; i >= 0; --i) {
      out.push_back(static_cast<uint8_t>((count_ >> (i * 8)) & 0xFF));
    }
    auto bytes = UniqueIdTraits::to_bytes(id_);
    out.insert(out.end(), bytes.begin(), bytes.end());
  }

  /// Reads a timestamp at `offset`, advancing it. Returns std::nullopt if the buffer is too
  /// short or the count is max_count, which could no longer advance.
  static std::optional<Timestamp> decode(const uint8_t *data, size_t size, size_t &offset) {
    if (offset > size || size - offset < encoded_size) {
      return std::nullopt;
    }

    uint64_t count = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
      count = (count << 8) | data[offset + i];
    }
    if (count == max_count) {
      return std::nullopt;
    }
    uint128_t id = UniqueIdTraits::from_bytes(data + offset + sizeof(uint64_t));

    offset += encoded_size;
    return Timestamp(count, id);
  }

  // Renders as `Timestamp { 3, AB..CD }`
  friend std::ostream &operator<<(std::ostream &os, const Timestamp &ts) {
    std::string uuid = UniqueIdTraits::to_uuid_string(ts.id_);
    os << "Timestamp { " << ts.count_ << ", " << uuid.substr(0, 2) << ".." << uuid.substr(uuid.size() - 2) << " }";
    return os;
  }

private:
  uint64_t count_;
  uint128_t id_;
};

} // namespace lww_crdt

namespace std {
template <> struct hash<lww_crdt::Timestamp> {
  size_t operator()(const lww_crdt::Timestamp &ts) const noexcept {
    size_t seed = std::hash<uint64_t>{}(ts.count());
    seed ^= std::hash<__uint128_t>{}(ts.id()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};
} // namespace std

#endif // LWW_CRDT_TIMESTAMP_HPP
