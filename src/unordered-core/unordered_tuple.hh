#pragma once

#include <unordered-core/assert.hh>
#include <unordered-core/fixed_array.hh>
#include <unordered-core/fwd.hh>
#include <unordered-core/hash.hh>
#include <unordered-core/pair.hh>
#include <unordered-core/to_debug_string.hh>
#include <unordered-core/utility.hh>

#include <algorithm>
#include <concepts>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

/// Unordered tuple of exactly N elements of type T (unordered pair for N == 2, triple for N == 3, ...).
/// Behaves like a multiset of fixed size: equality, hashing and debug output ignore the order in
/// which elements are stored, duplicates are kept and counted.
///
///   uc::unordered_tuple<int, 3>{0, 3, 5} == uc::unordered_tuple<int, 3>{5, 0, 3} // true
///   uc::unordered_tuple<int, 2>{1, 1}    == uc::unordered_tuple<int, 2>{1, 2}    // false
///
/// Elements live in a fixed_array<T, N> in "storage order". Element access, iteration,
/// to_array() and the msgpack form expose that order, but it carries no meaning: two tuples that
/// only differ in storage order are the same value.
///
/// Capabilities are opt-in per element type:
///   equality      - T == T
///   hashing       - additionally T totally ordered, copyable and std::hash<T> (see std::hash below)
///   serialization - msgpack adaptors for T, see unordered-core/msgpack.hh
///
/// Trivially copyable when T is. Holds its elements inline, no shared state.
template <class T, uc::isize N>
struct uc::unordered_tuple
{
    static_assert(N >= 0, "unordered_tuple arity must be non-negative");

    using element_t = T;
    static constexpr isize arity = N;

    // construction
public:
    unordered_tuple() = default;

    /// Wraps the array verbatim, its order becomes the storage order.
    constexpr unordered_tuple(fixed_array<T, N> const& elements) : _elements(elements) {} // NOLINT
    constexpr unordered_tuple(fixed_array<T, N>&& elements) : _elements(uc::move(elements)) {} // NOLINT

    /// Constructs from exactly N values: unordered_tuple<int, 3>{0, 3, 5}
    template <class... Args>
        requires(sizeof...(Args) == N && N > 0 && (!std::is_same_v<std::remove_cvref_t<Args>, unordered_tuple> && ...)
                 && (std::is_constructible_v<T, Args &&> && ...))
    constexpr unordered_tuple(Args&&... args) : _elements{T(uc::forward<Args>(args))...}
    {
    }

    /// Unordered pair from an ordered pair, storage order is [p.first, p.second].
    constexpr unordered_tuple(pair<T, T> const& p) // NOLINT
        requires(N == 2)
      : _elements{p.first, p.second}
    {
    }
    constexpr unordered_tuple(pair<T, T>&& p) // NOLINT
        requires(N == 2)
      : _elements{uc::move(p.first), uc::move(p.second)}
    {
    }

    // conversion
public:
    /// Returns the elements in current storage order.
    /// Callers must not rely on this order, tuples that compare equal may return different arrays.
    [[nodiscard]] constexpr fixed_array<T, N> to_array() const& { return _elements; }
    [[nodiscard]] constexpr fixed_array<T, N> to_array() && { return uc::move(_elements); }

    /// Returns the two elements as an ordered pair, in current storage order.
    /// NOT order-stable: unordered_pair{a, b} == unordered_pair{b, a}, so a pair built from (a, b)
    /// may come back as (b, a) once it went through a copy of an equal value (e.g. a
    /// deserialized or hash-set-deduplicated one). Track the original order separately if needed.
    [[nodiscard]] constexpr pair<T, T> to_pair() const&
        requires(N == 2)
    {
        return {_elements._data[0], _elements._data[1]};
    }
    [[nodiscard]] constexpr pair<T, T> to_pair() &&
        requires(N == 2)
    {
        return {uc::move(_elements._data[0]), uc::move(_elements._data[1])};
    }

    constexpr explicit operator fixed_array<T, N>() const& { return _elements; }
    constexpr explicit operator fixed_array<T, N>() && { return uc::move(_elements); }

    constexpr explicit operator pair<T, T>() const&
        requires(N == 2)
    {
        return to_pair();
    }
    constexpr explicit operator pair<T, T>() &&
        requires(N == 2)
    {
        return uc::move(*this).to_pair();
    }

    // element access (storage order)
public:
    /// Precondition: 0 <= i < N.
    [[nodiscard]] constexpr T& operator[](isize i) { return _elements[i]; }
    [[nodiscard]] constexpr T const& operator[](isize i) const { return _elements[i]; }

    [[nodiscard]] constexpr fixed_array<T, N>& elements() { return _elements; }
    [[nodiscard]] constexpr fixed_array<T, N> const& elements() const { return _elements; }

    [[nodiscard]] constexpr T* begin() { return _elements.begin(); }
    [[nodiscard]] constexpr T* end() { return _elements.end(); }
    [[nodiscard]] constexpr T const* begin() const { return _elements.begin(); }
    [[nodiscard]] constexpr T const* end() const { return _elements.end(); }

    [[nodiscard]] constexpr isize size() const { return N; }
    [[nodiscard]] constexpr bool empty() const { return N == 0; }

    /// Supports structured bindings: auto [a, b] = edge;
    template <isize I>
    [[nodiscard]] constexpr T& get()
    {
        return _elements.template get<I>();
    }
    template <isize I>
    [[nodiscard]] constexpr T const& get() const
    {
        return _elements.template get<I>();
    }

    // comparison
public:
    /// Multiset equality: true iff rhs is a permutation of lhs (with multiplicities).
    /// Only needs T == T, in particular no ordering.
    ///
    /// Greedy matching, O(N^2): every lhs element claims the leftmost unclaimed equal rhs slot.
    /// A claimed slot is never matched twice, so {1, 1} != {1, 2}.
    [[nodiscard]] friend constexpr bool operator==(unordered_tuple const& lhs, unordered_tuple const& rhs)
        requires requires(T const& a, T const& b) {
            { a == b } -> std::convertible_to<bool>;
        }
    {
        if constexpr (N == 0)
        {
            return true;
        }
        else
        {
            bool used[N] = {};

            for (auto const& l : lhs._elements)
            {
                auto found = false;
                for (isize i = 0; i < N; ++i)
                {
                    if (used[i])
                        continue;

                    if (l == rhs._elements._data[i])
                    {
                        used[i] = true;
                        found = true;
                        break;
                    }
                }

                if (!found)
                    return false;
            }

            return true;
        }
    }

    // debug output
public:
    /// Renders as {a, b, c} in storage order. Elements are rendered with the same config.
    [[nodiscard]] friend std::string to_string(unordered_tuple const& t, debug_string_config const& cfg = {})
    {
        auto s = std::string("{");
        for (auto const& e : t._elements)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "}";
        return s;
    }

    // members
private:
    fixed_array<T, N> _elements;
};

namespace uc
{
/// unordered_tuple{1, 2, 3} -> unordered_tuple<int, 3>
template <class T, class... U>
    requires(std::is_same_v<T, U> && ...)
unordered_tuple(T, U...) -> unordered_tuple<T, 1 + sizeof...(U)>;

template <class T, isize N>
unordered_tuple(fixed_array<T, N>) -> unordered_tuple<T, N>;

template <class T>
unordered_tuple(pair<T, T>) -> unordered_tuple<T, 2>;

/// Element types that unordered_tuple can hash: equal tuples must produce equal hashes, which
/// requires sorting into a canonical order first.
template <class T>
concept unordered_hashable = std::totally_ordered<T> && std::copy_constructible<T> && hashable<T>;

/// Order-independent hash, see std::hash<unordered_tuple<T, N>>.
/// Sorts a copy of the elements and hashes that sequence, so permutations collapse to the same input.
/// Equal tuples hash equally; unequal tuples may collide.
template <unordered_hashable T, isize N>
[[nodiscard]] u64 hash_value(unordered_tuple<T, N> const& t)
{
    auto sorted = t.to_array();
    std::sort(sorted.begin(), sorted.end());
    return uc::hash_sequence(sorted.data(), N);
}
} // namespace uc

template <class T, uc::isize N>
    requires uc::unordered_hashable<T>
struct std::hash<uc::unordered_tuple<T, N>>
{
    [[nodiscard]] std::size_t operator()(uc::unordered_tuple<T, N> const& t) const
    {
        return std::size_t(uc::hash_value(t));
    }
};

template <class T, uc::isize N>
struct std::tuple_size<uc::unordered_tuple<T, N>> : std::integral_constant<std::size_t, static_cast<std::size_t>(N)>
{
};

template <std::size_t I, class T, uc::isize N>
struct std::tuple_element<I, uc::unordered_tuple<T, N>>
{
    using type = T;
};
