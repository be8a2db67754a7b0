#include <alloc-core/shared.hh>

#include <nexus/test.hh>

#include "test-resources.hh"

#include <string>

namespace
{
struct counted_value
{
    static inline int live = 0;
    int value = 0;

    explicit counted_value(int v) : value(v) { ++live; }
    counted_value(counted_value const& rhs) : value(rhs.value) { ++live; }
    ~counted_value() { --live; }
};
} // namespace

TEST("weak - empty handle")
{
    ac::weak<std::string> w;
    CHECK(w.is_empty());
    CHECK(!w.upgrade().has_value());
    CHECK(w.strong_count() == 0);
    CHECK(w.weak_count() == 0);
    CHECK(w.as_ptr() == nullptr);

    auto copy = w;
    CHECK(copy.is_empty());
    CHECK(ac::weak<std::string>::ptr_eq(w, copy));
}

TEST("weak - downgrade and upgrade")
{
    test::counting_resource res;
    counted_value::live = 0;

    auto s = ac::shared<counted_value>::create_in(res.aborting(), 8);
    auto w = s.downgrade();

    CHECK(!w.is_empty());
    CHECK(s.weak_count() == 1);
    CHECK(w.weak_count() == 1);
    CHECK(w.strong_count() == 1);
    CHECK(w.as_ptr() == s.as_ptr());

    {
        auto up = w.upgrade();
        REQUIRE(up.has_value());
        CHECK(up.value()->value == 8);
        CHECK(s.strong_count() == 2);
    }
    CHECK(s.strong_count() == 1);

    SECTION("upgrade fails once the last strong handle is gone")
    {
        {
            auto sink = ac::move(s);
        }

        CHECK(counted_value::live == 0);
        CHECK(!w.upgrade().has_value());
        CHECK(w.strong_count() == 0);
        CHECK(w.weak_count() == 0);

        // the block itself is still there for w
        CHECK(res.live_blocks() == 1);
    }

    SECTION("weak handles outliving the value release the block")
    {
        auto w2 = w;
        CHECK(s.weak_count() == 2);

        {
            auto sink = ac::move(s);
        }
        CHECK(res.live_blocks() == 1);

        w = ac::weak<counted_value>();
        CHECK(res.live_blocks() == 1);

        w2 = ac::weak<counted_value>();
        CHECK(res.live_blocks() == 0);
    }
}

TEST("weak - copy and move")
{
    auto s = ac::shared<int>::create_from(1);
    auto a = s.downgrade();

    auto b = a;
    CHECK(s.weak_count() == 2);
    CHECK(ac::weak<int>::ptr_eq(a, b));

    auto c = ac::move(b);
    CHECK(b.is_empty()); // NOLINT(bugprone-use-after-move)
    CHECK(s.weak_count() == 2);

    a = c;
    CHECK(s.weak_count() == 2);

    c = ac::weak<int>();
    CHECK(s.weak_count() == 1);
}

TEST("weak - raw pointer round trip")
{
    test::counting_resource res;

    auto s = ac::shared<int>::create_in(res.aborting(), 21);
    auto w = s.downgrade();

    int const* raw = ac::move(w).into_raw();
    CHECK(raw == s.as_ptr());
    CHECK(w.is_empty()); // NOLINT(bugprone-use-after-move)
    CHECK(s.weak_count() == 1);

    auto back = ac::weak<int>::from_raw(raw);
    CHECK(s.weak_count() == 1);

    auto up = back.upgrade();
    REQUIRE(up.has_value());
    CHECK(*up.value() == 21);

    SECTION("empty handles map to null")
    {
        ac::weak<int> empty;
        CHECK(ac::move(empty).into_raw() == nullptr);
        CHECK(ac::weak<int>::from_raw(nullptr).is_empty());
    }
}

TEST("weak - array blocks")
{
    test::counting_resource res;

    auto s = ac::shared<int[]>::create_copy_of({1, 2, 3}, res.aborting());
    auto w = s.downgrade();

    auto up = w.upgrade();
    REQUIRE(up.has_value());
    CHECK(up.value().size() == 3);
    CHECK(up.value()[2] == 3);
}

TEST("weak - allocator outlives the payload")
{
    test::counting_resource res;
    counted_value::live = 0;

    auto s = ac::shared<counted_value>::create_in(res.aborting(), 4);
    auto w = s.downgrade();
    CHECK(w.allocator() == s.allocator());

    s = ac::shared<counted_value>::create_in(res.aborting(), 5);
    CHECK(counted_value::live == 1);
    CHECK(!w.upgrade().has_value());
    CHECK(w.allocator() == res.aborting());

    SECTION("upgraded handles can be taken out of the optional")
    {
        auto w2 = s.downgrade();
        auto up = w2.upgrade().take();
        CHECK(up->value == 5);
        CHECK(s.strong_count() == 2);
    }

    SECTION("empty handles have no allocator")
    {
        ac::weak<counted_value> empty;
        auto const info = test::capture_failure([&] { (void)empty.allocator(); });
        REQUIRE(info.has_value());
        CHECK(info->message == "accessing the allocator of an empty weak");
    }
}
