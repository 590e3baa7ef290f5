#pragma once

#include <source_location>

namespace rr
{
/// Type alias for std::source_location
/// Every reported fault carries the site of the failed check (file, line, column, function)
/// Usage:
///   void log(rr::source_location loc = rr::source_location::current()) {
///       std::cout << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace rr
