// lww_register.hpp
#ifndef LWW_CRDT_LWW_REGISTER_HPP
#define LWW_CRDT_LWW_REGISTER_HPP

#include "crdt.hpp"
#include "timestamp.hpp"
#include "value_codec.hpp"

#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace lww_crdt {

template <typename T>
concept Hashable = requires(const T &value) {
  { std::hash<T>{}(value) } -> std::convertible_to<size_t>;
};

template <typename T>
concept Streamable = requires(std::ostream &os, const T &value) { os << value; };

// Types exposing a stable identity through `id()`
template <typename T>
concept Identifiable = requires(const T &value) { value.id(); };

namespace detail {

template <typename T> std::string type_name() {
  if constexpr (std::is_same_v<T, std::string>) {
    return "std::string";
  } else {
    const char *name = typeid(T).name();
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
      return std::string(demangled.get());
    }
#endif
    return std::string(name);
  }
}

} // namespace detail

/// A "last writer wins" register.
///
/// Wraps a value of any type together with the timestamp of its last local write.
/// Every write through set_value() or modify() advances the timestamp. Merging two
/// replicas keeps whichever has the greater timestamp and discards the other value
/// entirely; the wrapped values are never compared.
///
/// Replicas are plain values: copy a register to hand it to another replica, mutate
/// copies independently and reconcile them with merge(). A single instance shared
/// between threads needs external synchronisation.
///
/// Equality, hashing, serialization, identity and stream output are available when
/// `T` supports the corresponding capability.
template <typename T> class LWWRegister {
public:
  using value_type = T;

  struct State {
    T value;
    Timestamp timestamp;

    bool operator==(const State &) const = default;
  };

  /// Wraps a value with a "zero" timestamp and a fresh id.
  ///
  /// Implicit whenever `U` converts implicitly to `T`, so registers can be initialised
  /// straight from a value: `LWWRegister<double> r = 3.14;`. Explicit constructors of
  /// `T` stay explicit.
  template <typename U = T>
    requires(std::constructible_from<T, U &&> && !std::same_as<std::remove_cvref_t<U>, LWWRegister>)
  explicit(!std::is_convertible_v<U &&, T>) LWWRegister(U &&value) : state_{T(std::forward<U>(value)), Timestamp()} {}

  const T &value() const { return state_.value; }

  /// Replaces the value and advances the timestamp.
  void set_value(T new_value) {
    State next{std::move(new_value), state_.timestamp.tick()};
    state_ = std::move(next);
  }

  /// Applies `fn` to a copy of the value and stores the result as a single write.
  ///
  ///   reg.modify([](int &v) { v += 10; });
  template <typename Fn> void modify(Fn &&fn) {
    T next = state_.value;
    std::invoke(std::forward<Fn>(fn), next);
    set_value(std::move(next));
  }

  const Timestamp &timestamp() const { return state_.timestamp; }
  const State &state() const { return state_; }

  /// Returns the replica with the strictly greater timestamp. Neither input is modified.
  ///
  /// When both timestamps are equal the two replicas carry the same write and
  /// `other` is returned.
  [[nodiscard]] LWWRegister merged(const LWWRegister &other) const noexcept(std::is_nothrow_copy_constructible_v<T>) {
    return state_.timestamp > other.state_.timestamp ? *this : other;
  }

  /// In-place merge, equivalent to `*this = this->merged(other)`.
  /// The winning state is copied before it replaces ours, so a throwing copy leaves
  /// `*this` unchanged.
  void merge(const LWWRegister &other) noexcept(std::is_nothrow_copy_constructible_v<T> &&
                                                std::is_nothrow_move_assignable_v<T>) {
    if (this != &other && !(state_.timestamp > other.state_.timestamp)) {
      State next = other.state_;
      state_ = std::move(next);
    }
  }

  bool operator==(const LWWRegister &other) const
    requires std::equality_comparable<T>
  {
    return state_ == other.state_;
  }

  auto id() const
    requires Identifiable<T>
  {
    return state_.value.id();
  }

  /// Encodes the timestamp followed by the value.
  std::vector<uint8_t> serialize() const
    requires Serializable<T>
  {
    std::vector<uint8_t> out;
    out.reserve(Timestamp::encoded_size + sizeof(T));
    state_.timestamp.encode(out);
    ValueCodec<T>::encode(state_.value, out);
    return out;
  }

  /// Decodes the output of serialize(). Truncated input, a malformed value or
  /// trailing bytes yield std::nullopt.
  static std::optional<LWWRegister> deserialize(const std::vector<uint8_t> &data)
    requires Serializable<T>
  {
    size_t offset = 0;
    auto timestamp = Timestamp::decode(data.data(), data.size(), offset);
    if (!timestamp) {
      return std::nullopt;
    }

    auto value = ValueCodec<T>::decode(data.data(), data.size(), offset);
    if (!value || offset != data.size()) {
      return std::nullopt;
    }

    return LWWRegister(RestoreTag{}, State{std::move(*value), *timestamp});
  }

  // Renders as `LWWRegister<int> { 11, Timestamp { 1, AB..CD } }`
  friend std::ostream &operator<<(std::ostream &os, const LWWRegister &reg)
    requires Streamable<T>
  {
    os << "LWWRegister<" << detail::type_name<T>() << "> { ";
    if constexpr (std::is_same_v<T, bool>) {
      os << (reg.state_.value ? "true" : "false");
    } else if constexpr (std::is_same_v<T, signed char> || std::is_same_v<T, unsigned char>) {
      os << +reg.state_.value;
    } else {
      os << reg.state_.value;
    }
    os << ", " << reg.state_.timestamp << " }";
    return os;
  }

private:
  struct RestoreTag {};

  LWWRegister(RestoreTag, State state) : state_(std::move(state)) {}

  State state_;
};

template <typename T> LWWRegister(T) -> LWWRegister<T>;
LWWRegister(const char *) -> LWWRegister<std::string>;

static_assert(Crdt<LWWRegister<int>>);
static_assert(Crdt<LWWRegister<std::string>>);

} // namespace lww_crdt

namespace std {
template <lww_crdt::Hashable T> struct hash<lww_crdt::LWWRegister<T>> {
  size_t operator()(const lww_crdt::LWWRegister<T> &reg) const noexcept {
    size_t seed = std::hash<T>{}(reg.value());
    seed ^= std::hash<lww_crdt::Timestamp>{}(reg.timestamp()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};
} // namespace std

#endif // LWW_CRDT_LWW_REGISTER_HPP
