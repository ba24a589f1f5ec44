#pragma once

#include <unordered-core/fwd.hh>

#include <concepts>
#include <cstddef>
#include <functional>

// =========================================================================================================
// Hashing primitives
// =========================================================================================================
//
//   hashable<T>                  - std::hash<T> is usable on T const&
//   hash_combine(seed, h)        - order-sensitive mix of h into seed
//   hash_sequence(ptr, count)    - length-prefixed, order-sensitive hash of [ptr, ptr + count)
//
// Hashes are 64 bit. They are not stable across platforms or standard library versions and must
// never be persisted.
//

namespace uc
{
/// True if std::hash<T> is enabled and callable on T const&.
template <class T>
concept hashable = requires(T const& v) {
    { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
};

/// Mixes h into seed; combining the same values in a different order gives a different result.
/// 64 bit variant of the boost::hash_combine mix (golden ratio constant plus shifted seed).
[[nodiscard]] constexpr u64 hash_combine(u64 seed, u64 h)
{
    return seed ^ (h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}

/// Hashes count elements starting at values, in order.
/// The count is mixed in first so that sequences of different length but equal prefix differ.
template <hashable T>
[[nodiscard]] u64 hash_sequence(T const* values, isize count)
{
    auto h = hash_combine(0, u64(count));
    for (isize i = 0; i < count; ++i)
        h = hash_combine(h, u64(std::hash<T>{}(values[i])));
    return h;
}
} // namespace uc
