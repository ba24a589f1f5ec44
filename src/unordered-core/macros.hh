#pragma once

// =========================================================================================================
// Platform
// =========================================================================================================
//
//   UC_COMPILER_MSVC, UC_COMPILER_CLANG, UC_COMPILER_GCC   - exactly one is defined
//   UC_COMPILER_POSIX                                      - clang or gcc (attribute syntax, raise())
//   UC_OS_LINUX, UC_OS_WINDOWS                             - only where the library behaves differently
//

#if defined(_MSC_VER)
#define UC_COMPILER_MSVC
#elif defined(__clang__)
#define UC_COMPILER_CLANG
#define UC_COMPILER_POSIX
#elif defined(__GNUC__)
#define UC_COMPILER_GCC
#define UC_COMPILER_POSIX
#else
#error "unordered-core: unsupported compiler"
#endif

#if defined(_WIN32)
#define UC_OS_WINDOWS
#elif defined(__linux__)
#define UC_OS_LINUX
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
//
// CMake defines one of UC_DEBUG, UC_RELWITHDEBINFO, UC_RELEASE per build type.
// UC_ENABLE_ASSERT_IN_RELEASE keeps UC_ASSERT in release builds.
//
// UC_ASSERT_ENABLED is 0 only for plain release builds; a translation unit compiled without any
// configuration macro keeps its assertions.
//

#if defined(UC_RELEASE) && !defined(UC_ENABLE_ASSERT_IN_RELEASE)
#define UC_ASSERT_ENABLED 0
#else
#define UC_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

#if defined(UC_COMPILER_MSVC)
#define UC_FORCE_INLINE __forceinline
#define UC_COLD_FUNC
#else
// gcc needs the extra 'inline' for always_inline on non-member templates
#define UC_FORCE_INLINE __attribute__((always_inline)) inline
#define UC_COLD_FUNC __attribute__((cold))
#endif

// UC_UNUSED(expr) - type-checks expr without evaluating it
#define UC_UNUSED(expr) (void)(sizeof((expr)))
