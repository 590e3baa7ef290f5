#pragma once

#include <raw-region/fault.hh>
#include <raw-region/macros.hh>
#include <raw-region/source_location.hh>

#include <functional>
#include <string>

namespace rr::impl
{
// Customizable fault handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = rr::impl::scoped_assertion_handler([](rr::impl::assertion_info const& info) {
//           if (info.kind == rr::fault::out_of_bounds)
//               log_bad_access(info);
//           throw region_fault{info.kind};
//       });
//
//       // Any failed assertion or region check in this scope will use the custom handler
//       parse_packet(allocation);
//   } // handler is automatically popped here

struct assertion_info
{
    rr::fault kind = rr::fault::assertion;
    std::string expression;
    std::string message;
    rr::source_location location;
};

// Push a custom handler onto the handler stack
// The handler will be called for all assertion and check failures until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler from the stack
// NOTE: prefer scoped_assertion_handler, it pops even when a handler throws
void pop_assertion_handler();

// RAII wrapper for pushing/popping handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace rr::impl
