#pragma once

#include <raw-region/assert-handler.hh>

#include <optional>

// Helpers for observing region faults in tests.
// A throwing handler unwinds out of the failed check, so the code after it never runs.

namespace test
{
/// Runs f with a throwing handler installed and returns the reported failure, if any.
template <class F>
std::optional<rr::impl::assertion_info> capture_fault(F&& f)
{
    struct fault_thrown
    {
    };

    std::optional<rr::impl::assertion_info> captured;
    {
        auto handler = rr::impl::scoped_assertion_handler(
            [&](rr::impl::assertion_info const& info)
            {
                captured = info;
                throw fault_thrown{};
            });

        try
        {
            f();
        }
        catch (fault_thrown const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    return captured;
}

/// True iff f reports exactly a fault of the given kind.
template <class F>
bool faults_with(rr::fault kind, F&& f)
{
    auto const info = test::capture_fault(f);
    return info.has_value() && info->kind == kind;
}

/// True iff f runs to completion without reporting anything.
template <class F>
bool is_fault_free(F&& f)
{
    return !test::capture_fault(f).has_value();
}
} // namespace test
