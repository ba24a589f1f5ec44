#pragma once

#include <unordered-core/fwd.hh>

#include <format>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // for tuple_size

namespace uc
{
struct debug_string_config
{
    // soft limit, the element that crosses it is still printed in full
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics (test output, logs of the caller).
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..."
//   - char: wrap in single quotes, control characters escaped
//   - bool: true / false
//   - arithmetic: std::format("{}")
//   - ADL to_string(v, cfg) (e.g. unordered_tuple renders as {a, b}), ADL to_string(v), then member v.to_string()
//   - For ranges, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Otherwise emit raw memory dump
//
// No stability guarantees: output may change, be lossy, or depend on build configuration.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
/// Appends ", " + element unless the string already exceeds the configured length.
/// Returns false once the limit is hit and "..." was appended.
template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += uc::to_debug_string(v, cfg);
    return true;
}

/// Member get<I>() (uc::pair, uc::fixed_array) or std/ADL get<I>(v) (std::tuple, std::pair).
template <std::size_t I, class T>
decltype(auto) to_debug_string_get(T const& v)
{
    if constexpr (requires { v.template get<I>(); })
        return v.template get<I>();
    else
    {
        using std::get;
        return get<I>(v);
    }
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(uc::impl::to_debug_string_append_elem(s, uc::impl::to_debug_string_get<I>(v), cfg) && ...);
}

std::string to_debug_string_char(char c);
std::string to_debug_string_memory(void const* p, std::size_t size, std::size_t align);
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (std::is_same_v<T, char>)
    {
        return impl::to_debug_string_char(v);
    }
    else if constexpr (requires { std::string_view(v); })
    {
        return std::format("\"{}\"", std::string_view(v));
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::format("{}", v);
    }
    else if constexpr (requires { to_string(v, cfg); })
    {
        return std::string(to_string(v, cfg));
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           v.begin();
                           v.end();
                       })
    {
        auto s = std::string("[");
        for (auto const& e : v)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        return impl::to_debug_string_memory(&v, sizeof(T), alignof(T));
    }
}
} // namespace uc
