// value_codec.hpp
// Byte codecs for values wrapped in a register.
//
// Specialize ValueCodec<T> for your own types to make LWWRegister<T> serializable:
//
//   template <> struct lww_crdt::ValueCodec<Color> {
//     static void encode(const Color &c, std::vector<uint8_t> &out);
//     static std::optional<Color> decode(const uint8_t *data, size_t size, size_t &offset);
//   };
//
// decode() reads starting at `offset`, advances it past the consumed bytes and
// returns std::nullopt on malformed or truncated input.

#ifndef LWW_CRDT_VALUE_CODEC_HPP
#define LWW_CRDT_VALUE_CODEC_HPP

#include <bit>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace lww_crdt {

// No codec by default
template <typename T> struct ValueCodec {};

template <typename T>
concept Serializable = requires(const T &value, std::vector<uint8_t> &out, const uint8_t *data, size_t size, size_t &offset) {
  { ValueCodec<T>::encode(value, out) };
  { ValueCodec<T>::decode(data, size, offset) } -> std::same_as<std::optional<T>>;
};

namespace detail {

template <typename U> void put_big_endian(U value, std::vector<uint8_t> &out) {
  for (int i = static_cast<int>(sizeof(U)) - 1; i >= 0; --i) {
    out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

template <typename U> std::optional<U> get_big_endian(const uint8_t *data, size_t size, size_t &offset) {
  if (offset > size || size - offset < sizeof(U)) {
    return std::nullopt;
  }
  U value = 0;
  for (size_t i = 0; i < sizeof(U); ++i) {
    if constexpr (sizeof(U) == 1) {
      value = static_cast<U>(data[offset + i]);
    } else {
      value = static_cast<U>((value << 8) | data[offset + i]);
    }
  }
  offset += sizeof(U);
  return value;
}

} // namespace detail

// Integers: fixed width, two's complement, big-endian
template <typename T>
  requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
struct ValueCodec<T> {
  using bits_type = std::make_unsigned_t<T>;

  static void encode(const T &value, std::vector<uint8_t> &out) {
    detail::put_big_endian(static_cast<bits_type>(value), out);
  }

  static std::optional<T> decode(const uint8_t *data, size_t size, size_t &offset) {
    auto bits = detail::get_big_endian<bits_type>(data, size, offset);
    if (!bits) {
      return std::nullopt;
    }
    return static_cast<T>(*bits);
  }
};

template <> struct ValueCodec<bool> {
  static void encode(const bool &value, std::vector<uint8_t> &out) { out.push_back(value ? 1 : 0); }

  static std::optional<bool> decode(const uint8_t *data, size_t size, size_t &offset) {
    if (offset >= size || data[offset] > 1) {
      return std::nullopt;
    }
    return data[offset++] == 1;
  }
};

// IEEE-754 binary32/binary64, bit pattern stored big-endian
template <typename T>
  requires(std::is_floating_point_v<T> && std::numeric_limits<T>::is_iec559 && (sizeof(T) == 4 || sizeof(T) == 8))
struct ValueCodec<T> {
  using bits_type = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;

  static void encode(const T &value, std::vector<uint8_t> &out) {
    detail::put_big_endian(std::bit_cast<bits_type>(value), out);
  }

  static std::optional<T> decode(const uint8_t *data, size_t size, size_t &offset) {
    auto bits = detail::get_big_endian<bits_type>(data, size, offset);
    if (!bits) {
      return std::nullopt;
    }
    return std::bit_cast<T>(*bits);
  }
};

// u32 big-endian length followed by the raw bytes
template <> struct ValueCodec<std::string> {
  static void encode(const std::string &value, std::vector<uint8_t> &out) {
    detail::put_big_endian(static_cast<uint32_t>(value.size()), out);
    out.insert(out.end(), value.begin(), value.end());
  }

  static std::optional<std::string> decode(const uint8_t *data, size_t size, size_t &offset) {
    size_t cursor = offset;
    auto length = detail::get_big_endian<uint32_t>(data, size, cursor);
    if (!length || size - cursor < *length) {
      return std::nullopt;
    }
    std::string value(reinterpret_cast<const char *>(data + cursor), *length);
    offset = cursor + *length;
    return value;
  }
};

} // namespace lww_crdt

#endif // LWW_CRDT_VALUE_CODEC_HPP
