#pragma once

#include <source_location>

namespace uc
{
/// Source code location (file, line, column, function) captured at the call site.
/// Used by assertion failures to report where they fired.
using source_location = std::source_location;
} // namespace uc
