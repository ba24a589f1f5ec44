#pragma once

#include <unordered-core/macros.hh>
#include <unordered-core/source_location.hh>

#include <functional>
#include <string>
#include <utility>

// =========================================================================================================
// Assertion handlers
// =========================================================================================================
//
// A failed UC_ASSERT is reported to the most recently pushed handler, or printed to stderr when
// no handler is installed. Afterwards the process aborts, unless the handler leaves by throwing.
//
// Tests use this to turn precondition violations into exceptions:
//
//   auto handler = uc::impl::scoped_assertion_handler([](uc::impl::assertion_info const& info) {
//       throw assertion_failure{info.message};
//   });
//   (void)uc::unordered_tuple<int, 3>{1, 2, 3}[3]; // throws instead of aborting
//
// The handler stack is process-global and not synchronized.
//

namespace uc::impl
{
/// What failed and where.
struct assertion_info
{
    std::string expression; // stringified condition
    std::string message;
    uc::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// No-op if no handler is installed.
void pop_assertion_handler();

/// Pushes on construction, pops on destruction (also during unwinding from a throwing handler).
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler) { push_assertion_handler(std::move(handler)); }
    ~scoped_assertion_handler() { pop_assertion_handler(); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace uc::impl
