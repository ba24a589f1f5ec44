#pragma once

#include <unordered-core/assert.hh>
#include <unordered-core/fwd.hh>

#include <type_traits>
#include <utility>


/// Fixed-size array of exactly N elements of type T.
/// Storage of unordered_tuple and its "ordered" counterpart in conversions.
/// Trivial aggregate type - supports aggregate initialization: fixed_array<int, 3> arr = {1, 2, 3}.
/// Equality is positional: {1, 2} != {2, 1}. For order-independent comparison use unordered_tuple.
template <class T, uc::isize N>
struct uc::fixed_array
{
    static_assert(N >= 0, "fixed_array size must be non-negative");

    // members
public:
    T _data[N];

    // element access
public:
    /// Precondition: 0 <= i < N.
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        UC_ASSERT(0 <= i && i < N, "index out of bounds");
        return _data[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        UC_ASSERT(0 <= i && i < N, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() { return _data; }
    [[nodiscard]] constexpr T const* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data; }
    [[nodiscard]] constexpr T* end() { return _data + N; }
    [[nodiscard]] constexpr T const* begin() const { return _data; }
    [[nodiscard]] constexpr T const* end() const { return _data + N; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return N; }
    [[nodiscard]] constexpr bool empty() const { return N == 0; }

    // comparison
public:
    /// Element-wise, in order.
    [[nodiscard]] friend constexpr bool operator==(fixed_array const&, fixed_array const&) = default;

    // tuple protocol
public:
    /// Supports structured bindings: auto [a, b] = arr;
    template <isize I>
    [[nodiscard]] constexpr T& get()
    {
        static_assert(0 <= I && I < N, "index out of bounds");
        return _data[I];
    }
    template <isize I>
    [[nodiscard]] constexpr T const& get() const
    {
        static_assert(0 <= I && I < N, "index out of bounds");
        return _data[I];
    }
};

/// Specialization for N == 0, T[0] is not valid C++.
/// Has no element access, only the empty range.
template <class T>
struct uc::fixed_array<T, 0>
{
    [[nodiscard]] constexpr T* data() { return nullptr; }
    [[nodiscard]] constexpr T const* data() const { return nullptr; }

    [[nodiscard]] constexpr T* begin() { return nullptr; }
    [[nodiscard]] constexpr T* end() { return nullptr; }
    [[nodiscard]] constexpr T const* begin() const { return nullptr; }
    [[nodiscard]] constexpr T const* end() const { return nullptr; }

    [[nodiscard]] constexpr isize size() const { return 0; }
    [[nodiscard]] constexpr bool empty() const { return true; }

    [[nodiscard]] friend constexpr bool operator==(fixed_array const&, fixed_array const&) { return true; }
};

namespace uc
{
/// Deduction guide: fixed_array{1, 2, 3} -> fixed_array<int, 3>
template <class T, class... U>
fixed_array(T, U...) -> fixed_array<T, 1 + sizeof...(U)>;
} // namespace uc

template <class T, uc::isize N>
struct std::tuple_size<uc::fixed_array<T, N>> : std::integral_constant<std::size_t, static_cast<std::size_t>(N)>
{
};

template <std::size_t I, class T, uc::isize N>
struct std::tuple_element<I, uc::fixed_array<T, N>>
{
    using type = T;
};
