#include <raw-region/span.hh>

#include <nexus/test.hh>

#include <array>
#include <cstddef>
#include <vector>

// buffers cross the region API by value
static_assert(std::is_trivially_copyable_v<rr::span<rr::byte>>, "span should be trivially copyable");
static_assert(std::is_trivially_copyable_v<rr::span<rr::byte const>>, "span should be trivially copyable");

// only mutable -> const converts implicitly
static_assert(std::is_convertible_v<rr::span<rr::byte>, rr::span<rr::byte const>>);
static_assert(!std::is_convertible_v<rr::span<rr::byte const>, rr::span<rr::byte>>);

TEST("span - construction")
{
    SECTION("default construction")
    {
        auto const s = rr::span<rr::byte>{};
        CHECK(s.data() == nullptr);
        CHECK(s.size() == 0);
        CHECK(s.empty());
    }

    SECTION("pointer + size construction")
    {
        rr::byte data[4] = {};
        auto const s = rr::span<rr::byte>(data, 4);
        CHECK(s.data() == data);
        CHECK(s.size() == 4);
        CHECK(!s.empty());
    }

    SECTION("C array construction")
    {
        int data[] = {1, 2, 3};
        auto const s = rr::span<int>(data);
        CHECK(s.size() == 3);
        CHECK(s[2] == 3);
    }

    SECTION("container construction - vector")
    {
        auto vec = std::vector<rr::byte>(16);
        auto const s = rr::span<rr::byte>(vec);
        CHECK(s.data() == vec.data());
        CHECK(s.size() == 16);
    }

    SECTION("container construction - const array")
    {
        auto const arr = std::array<rr::byte, 3>{rr::byte(1), rr::byte(2), rr::byte(3)};
        auto const s = rr::span<rr::byte const>(arr);
        CHECK(s.size() == 3);
        CHECK(int(s[1]) == 2);
    }

    SECTION("mutable to const conversion")
    {
        auto vec = std::vector<rr::byte>(8);
        auto const s = rr::span<rr::byte>(vec);
        rr::span<rr::byte const> const cs = s;
        CHECK(cs.data() == s.data());
        CHECK(cs.size() == 8);
    }
}

TEST("span - element access and iteration")
{
    auto vec = std::vector<int>{10, 20, 30, 40};
    auto const s = rr::span<int>(vec);

    s[1] = 21;
    CHECK(vec[1] == 21);

    int sum = 0;
    for (auto v : s)
        sum += v;
    CHECK(sum == 101);

    CHECK(s.end() - s.begin() == 4);
}
