#pragma once

#include <unordered-core/fwd.hh>
#include <unordered-core/utility.hh>

#include <compare>
#include <type_traits>
#include <utility>

/// Ordered pair, the positional counterpart of unordered_pair:
///   uc::pair{1, 2} != uc::pair{2, 1}
///   uc::unordered_pair<int>{1, 2} == uc::unordered_pair<int>{2, 1}
///
/// Aggregate without user-declared constructors, trivially copyable when T and U are.
/// Used wherever an unordered pair has to be handed out with an explicit order (see unordered_tuple::to_pair).
template <class T, class U>
struct uc::pair
{
    using first_t = T;
    using second_t = U;

    T first;
    U second;

    /// Lexicographic, first then second.
    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;
    [[nodiscard]] friend constexpr auto operator<=>(pair const&, pair const&) = default;

    /// Supports structured bindings: auto [a, b] = p;
    template <std::size_t I, class Self>
    [[nodiscard]] constexpr auto&& get(this Self&& self)
    {
        static_assert(I < 2, "pair index out of bounds");
        if constexpr (I == 0)
            return uc::forward<Self>(self).first;
        else
            return uc::forward<Self>(self).second;
    }
};

namespace uc
{
template <class T, class U>
pair(T, U) -> pair<T, U>;
} // namespace uc

template <class T, class U>
struct std::tuple_size<uc::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct std::tuple_element<I, uc::pair<T, U>>
{
    static_assert(I < 2, "pair index out of bounds");
    using type = std::conditional_t<I == 0, T, U>;
};
