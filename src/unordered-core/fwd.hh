#pragma once

#include <cstddef>
#include <cstdint>


namespace uc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters for correctness.
// Plain "int" stays the default for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, indices and arities are signed i64.
using isize = i64;

//
// Values
//

template <class T, class U>
struct pair;

template <class T, isize N>
struct fixed_array;

template <class T, isize N>
struct unordered_tuple;

/// Unordered tuple of exactly two elements, see unordered_tuple.hh
template <class T>
using unordered_pair = unordered_tuple<T, 2>;

//
// Errors
//

struct length_mismatch_error;

} // namespace uc
