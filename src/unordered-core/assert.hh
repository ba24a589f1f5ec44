#pragma once

// Lean header: only macros and source_location, safe to include from every value type.
#include <unordered-core/macros.hh>
#include <unordered-core/source_location.hh>

// =========================================================================================================
// UC_ASSERT - Runtime assertion with string literal message
//
// Checks a condition at runtime and, on failure, reports it through the active assertion handler,
// breaks into an attached debugger and aborts.
//
// When assertions are active:
//   Everywhere except UC_RELEASE builds (see UC_ASSERT_ENABLED in macros.hh).
//   UC_ENABLE_ASSERT_IN_RELEASE turns them back on in release.
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions
//                        (slot index out of range)
//   - exceptions      -> malformed or mismatched msgpack input, thrown by msgpack or as
//                        uc::length_mismatch_error (see msgpack.hh)
//
// Never assert on external input. A decoder that sees the wrong number of elements throws, it
// does not assert.
//
// Usage:
//   UC_ASSERT(0 <= i && i < N, "slot index out of bounds");
//
#define UC_ASSERT(cond, msg) UC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// UC_ASSERT_ALWAYS - Always-active assertion
//
// Like UC_ASSERT but active in all build configurations, including release builds.
//
// Usage:
//   UC_ASSERT_ALWAYS(handler != nullptr, "no assertion handler installed");
//
#define UC_ASSERT_ALWAYS(cond, msg) UC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// UC_DEBUG_BREAK - Breaks into the debugger if one is attached, otherwise does nothing
//
#define UC_DEBUG_BREAK() UC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// UC_BREAK_AND_ABORT - Debug break (if attached) followed by program termination
//
#define UC_BREAK_AND_ABORT() (UC_DEBUG_BREAK(), ::uc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace uc::impl
{
// Called when an assertion fails
// Dispatches to the topmost handler from assert-handler.hh or prints to stderr
// Note: does not abort, caller must follow with UC_BREAK_AND_ABORT()
UC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, uc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace uc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef UC_COMPILER_MSVC

#define UC_IMPL_DEBUG_BREAK() (::uc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(UC_COMPILER_POSIX)

// raise(SIGTRAP) without pulling in <csignal>; SIGTRAP is 5 on all supported posix targets
extern "C" int raise(int) noexcept;
#define UC_IMPL_DEBUG_BREAK() (::uc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define UC_IMPL_DEBUG_BREAK() void(0)

#endif

#define UC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::uc::impl::handle_assert_failure(#cond, msg, ::uc::source_location::current()); \
            UC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if UC_ASSERT_ENABLED

#define UC_IMPL_ASSERT(cond, msg) UC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message must still compile
#define UC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        UC_UNUSED(cond);          \
        UC_UNUSED(msg);           \
    } while (false)

#endif
