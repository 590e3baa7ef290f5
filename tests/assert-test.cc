#include <raw-region/assert-handler.hh>
#include <raw-region/assertf.hh>

#include <nexus/test.hh>

#include <optional>
#include <vector>


TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<rr::impl::assertion_info> captured;
    // CAREFUL: this is a bit brittle wrt. formatting but it should be fine
    int const test_line = __LINE__ + 11; // line where RR_ASSERTF_ALWAYS is called

    {
        auto handler = rr::impl::scoped_assertion_handler(
            [&](rr::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            RR_ASSERTF_ALWAYS(false, "hello {}", 42);
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    auto const is_plain_assertion = captured->kind == rr::fault::assertion;
    CHECK(is_plain_assertion);
    CHECK(captured->expression.find("false") != std::string::npos);
    CHECK(captured->message == "hello 42");

    auto file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - region checks report their fault kind")
{
    std::vector<rr::fault> kinds;
    std::vector<std::string> messages;

    auto handler = rr::impl::scoped_assertion_handler(
        [&](rr::impl::assertion_info const& info)
        {
            kinds.push_back(info.kind);
            messages.push_back(info.message);
            throw 0;
        });

    auto const offset = 12;
    try
    {
        RR_CHECKF(rr::fault::out_of_bounds, offset < 8, "offset={}, size={}", offset, 8);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }
    try
    {
        RR_CHECKF(rr::fault::already_released, false, "gone");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(kinds.size() == 2);
    CHECK(std::string(rr::to_string(kinds[0])) == "out of bounds");
    CHECK(std::string(rr::to_string(kinds[1])) == "already released");
    CHECK(messages[0] == "offset=12, size=8");
    CHECK(messages[1] == "gone");
}

TEST("assertions - fault kinds have readable names")
{
    CHECK(std::string(rr::to_string(rr::fault::assertion)) == "assertion");
    CHECK(std::string(rr::to_string(rr::fault::invalid_argument)) == "invalid argument");
    CHECK(std::string(rr::to_string(rr::fault::address_overflow)) == "address overflow");
    CHECK(std::string(rr::to_string(rr::fault::out_of_bounds)) == "out of bounds");
    CHECK(std::string(rr::to_string(rr::fault::already_released)) == "already released");
    CHECK(std::string(rr::to_string(rr::fault::out_of_memory)) == "out of memory");
}

TEST("assertions - passing checks do not call handler")
{
    bool handler_called = false;
    int counter = 0;

    auto expensive = [&]() -> int
    {
        ++counter;
        return 99;
    };

    {
        auto handler
            = rr::impl::scoped_assertion_handler([&](rr::impl::assertion_info const&) { handler_called = true; });
        RR_ASSERTF_ALWAYS(true, "should not matter {}", expensive());
        RR_CHECKF(rr::fault::out_of_bounds, true, "should not matter either {}", expensive());
    }

    CHECK(!handler_called);
    CHECK(counter == 0); // message args aren't evaluated on pass
}

TEST("assertions - handler stack is LIFO and nesting works")
{
    std::vector<int> events;

    auto handler_a = rr::impl::scoped_assertion_handler(
        [&](rr::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    {
        auto handler_b = rr::impl::scoped_assertion_handler(
            [&](rr::impl::assertion_info const&)
            {
                events.push_back(2);
                throw 0;
            });

        try
        {
            RR_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    // B is now popped

    try
    {
        RR_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - scoped_assertion_handler pops on scope exit even when handler throws")
{
    std::vector<int> events;

    auto outer = rr::impl::scoped_assertion_handler(
        [&](rr::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    struct sentinel_exception
    {
    };

    try
    {
        auto inner = rr::impl::scoped_assertion_handler(
            [&](rr::impl::assertion_info const&)
            {
                events.push_back(2);
                throw sentinel_exception{};
            });

        RR_ASSERT_ALWAYS(false, "trigger inner");
        CHECK(false); // should not reach here
    }
    catch (sentinel_exception const&) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 1);
    CHECK(events[0] == 2);

    try
    {
        RR_ASSERT_ALWAYS(false, "trigger outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[1] == 1);
}
