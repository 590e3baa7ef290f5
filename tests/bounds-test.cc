#include <raw-region/bounds.hh>

#include <nexus/test.hh>

#include "fault-capture.hh"

#include <limits>

namespace
{
constexpr rr::isize isize_max = std::numeric_limits<rr::isize>::max();
constexpr rr::u64 u64_max = std::numeric_limits<rr::u64>::max();
} // namespace

// the predicates are usable at compile time
static_assert(rr::is_in_bounds(64, 0, 64));
static_assert(!rr::is_in_bounds(64, 60, 8));
static_assert(rr::is_address_range_valid(0x1000, 0, 64));

TEST("bounds - is_in_bounds")
{
    SECTION("ranges inside the region")
    {
        CHECK(rr::is_in_bounds(64, 0, 64));
        CHECK(rr::is_in_bounds(64, 60, 4));
        CHECK(rr::is_in_bounds(64, 63, 1));
    }

    SECTION("empty ranges up to and including the end")
    {
        CHECK(rr::is_in_bounds(64, 0, 0));
        CHECK(rr::is_in_bounds(64, 64, 0));
        CHECK(!rr::is_in_bounds(64, 65, 0));
    }

    SECTION("ranges crossing the end")
    {
        CHECK(!rr::is_in_bounds(64, 61, 4));
        CHECK(!rr::is_in_bounds(64, 0, 65));
        CHECK(!rr::is_in_bounds(64, 64, 1));
    }

    SECTION("negative offset or length")
    {
        CHECK(!rr::is_in_bounds(64, -1, 1));
        CHECK(!rr::is_in_bounds(64, 0, -1));
        CHECK(!rr::is_in_bounds(64, -4, 8));
    }

    SECTION("huge values do not wrap into range")
    {
        CHECK(!rr::is_in_bounds(64, isize_max, 1));
        CHECK(!rr::is_in_bounds(64, 1, isize_max));
        CHECK(!rr::is_in_bounds(64, isize_max, isize_max));
        CHECK(rr::is_in_bounds(isize_max, isize_max, 0));
    }
}

TEST("bounds - is_address_range_valid")
{
    CHECK(rr::is_address_range_valid(0x1000, 0, 64));
    CHECK(rr::is_address_range_valid(u64_max - 64, 0, 64));
    CHECK(rr::is_address_range_valid(u64_max - 64, 32, 32));

    CHECK(!rr::is_address_range_valid(u64_max - 15, 0, 32));
    CHECK(!rr::is_address_range_valid(u64_max - 15, 8, 16));
    CHECK(!rr::is_address_range_valid(u64_max, 1, 0));
    CHECK(!rr::is_address_range_valid(0x1000, isize_max, isize_max));

    CHECK(!rr::is_address_range_valid(0x1000, -1, 4));
    CHECK(!rr::is_address_range_valid(0x1000, 0, -1));
}

TEST("bounds - check_bounds")
{
    CHECK(test::is_fault_free([] { rr::check_bounds(64, 0, 64); }));
    CHECK(test::is_fault_free([] { rr::check_bounds(64, 64, 0); }));

    CHECK(test::faults_with(rr::fault::out_of_bounds, [] { rr::check_bounds(64, 61, 4); }));
    CHECK(test::faults_with(rr::fault::out_of_bounds, [] { rr::check_bounds(64, -1, 1); }));
    CHECK(test::faults_with(rr::fault::out_of_bounds, [] { rr::check_bounds(64, isize_max, 1); }));

    SECTION("message names the offending range")
    {
        auto const info = test::capture_fault([] { rr::check_bounds(64, 61, 4); });
        REQUIRE(info.has_value());
        CHECK(info->message == "offset=61, length=4, size=64");
    }
}

TEST("bounds - check_address_range")
{
    CHECK(test::is_fault_free([] { rr::check_address_range(0x1000, 0, 64); }));
    CHECK(test::is_fault_free([] { rr::check_address_range(u64_max - 64, 0, 64); }));

    CHECK(test::faults_with(rr::fault::address_overflow, [] { rr::check_address_range(u64_max - 15, 0, 32); }));
    CHECK(test::faults_with(rr::fault::address_overflow, [] { rr::check_address_range(u64_max - 64, 60, 8); }));
}
