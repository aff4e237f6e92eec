// crdt.hpp
#ifndef LWW_CRDT_CRDT_HPP
#define LWW_CRDT_CRDT_HPP

#include <concepts>
#include <iterator>
#include <optional>
#include <ranges>

namespace lww_crdt {

/// A conflict-free replicated data type: replicas are updated independently and
/// synchronised peer to peer by merging, without a server/client relationship.
///
/// A correct `merged` obeys three laws:
/// 1. Commutative: `a.merged(b) == b.merged(a)`
/// 2. Associative: `a.merged(b.merged(c)) == a.merged(b).merged(c)`
/// 3. Idempotent:  `a.merged(a) == a`
///
/// `merge` updates an instance in place and must be equivalent to `a = a.merged(b)`.
template <typename C>
concept Crdt = std::copyable<C> && requires(const C &c, C &m, const C &other) {
  { c.merged(other) } -> std::same_as<C>;
  { m.merge(other) };
};

/// Folds a range of replicas into one. Returns std::nullopt for an empty range.
///
/// The merge laws make the result independent of the order of the range.
///
/// Complexity: O(n) merges
template <std::input_iterator It>
  requires Crdt<std::iter_value_t<It>>
std::optional<std::iter_value_t<It>> merge_all(It first, It last) {
  if (first == last) {
    return std::nullopt;
  }
  std::optional<std::iter_value_t<It>> result(*first);
  for (++first; first != last; ++first) {
    result->merge(*first);
  }
  return result;
}

/// Range overload of merge_all.
template <typename Range>
  requires std::ranges::common_range<const Range> && Crdt<std::ranges::range_value_t<Range>>
std::optional<std::ranges::range_value_t<Range>> merge_all(const Range &replicas) {
  return merge_all(std::ranges::begin(replicas), std::ranges::end(replicas));
}

} // namespace lww_crdt

#endif // LWW_CRDT_CRDT_HPP
