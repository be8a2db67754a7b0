#include <alloc-core/shared.hh>

#include <nexus/test.hh>

#include "test-resources.hh"

#include <compare>
#include <functional>
#include <string>
#include <vector>

namespace
{
// Instrumented type that tracks construction and destruction
struct tracked
{
    int value = 0;
    static inline int live = 0;
    static inline int copies = 0;
    static inline int moves = 0;

    static void reset_counters()
    {
        live = 0;
        copies = 0;
        moves = 0;
    }

    tracked() { ++live; }
    explicit tracked(int v) : value(v) { ++live; }
    tracked(tracked const& rhs) : value(rhs.value)
    {
        ++live;
        ++copies;
    }
    tracked(tracked&& rhs) noexcept : value(rhs.value)
    {
        ++live;
        ++moves;
    }
    tracked& operator=(tracked const&) = default;
    tracked& operator=(tracked&&) noexcept = default;
    ~tracked() { --live; }

    friend bool operator==(tracked const& a, tracked const& b) { return a.value == b.value; }
};

struct throws_on_construction
{
    explicit throws_on_construction(int) { throw 13; }
};

struct alignas(64) over_aligned
{
    int value = 0;
};
} // namespace

TEST("shared - clone and drop")
{
    test::counting_resource res;
    tracked::reset_counters();

    {
        auto a = ac::shared<tracked>::create_in(res.aborting(), 42);
        CHECK(a->value == 42);
        CHECK(a.strong_count() == 1);
        CHECK(a.weak_count() == 0);
        CHECK(tracked::live == 1);
        CHECK(res.allocations == 1);

        {
            auto b = a;
            CHECK(a.strong_count() == 2);
            CHECK(ac::shared<tracked>::ptr_eq(a, b));
            CHECK((*b).value == 42);
        }

        CHECK(a.strong_count() == 1);
        CHECK(tracked::live == 1);
    }

    CHECK(tracked::live == 0);
    CHECK(res.live_blocks() == 0);
}

TEST("shared - last drop order does not matter")
{
    test::counting_resource res;
    tracked::reset_counters();

    auto original = ac::shared<tracked>::create_in(res.aborting(), 42);
    auto clone = ac::optional<ac::shared<tracked>>(original);
    CHECK(original.strong_count() == 2);

    // drop the original first
    {
        auto sink = ac::move(original);
    }
    CHECK(clone.value().strong_count() == 1);
    CHECK(tracked::live == 1);

    clone = ac::nullopt;
    CHECK(tracked::live == 0);
    CHECK(res.live_blocks() == 0);
}

TEST("shared - assignment")
{
    test::counting_resource res;
    tracked::reset_counters();

    auto a = ac::shared<tracked>::create_in(res.aborting(), 1);
    auto b = ac::shared<tracked>::create_in(res.aborting(), 2);
    CHECK(tracked::live == 2);

    SECTION("copy assignment releases the old value")
    {
        b = a;
        CHECK(tracked::live == 1);
        CHECK(a.strong_count() == 2);
        CHECK(b->value == 1);

        auto const& alias = b;
        b = alias;
        CHECK(a.strong_count() == 2);
    }

    SECTION("move assignment")
    {
        b = ac::move(a);
        CHECK(!a.is_valid()); // NOLINT(bugprone-use-after-move)
        CHECK(b.strong_count() == 1);
        CHECK(tracked::live == 1);
        CHECK(res.live_blocks() == 1);
    }
}

TEST("shared - create_from uses the default allocator")
{
    auto s = ac::shared<std::string>::create_from("hello");
    CHECK(*s == "hello");
    CHECK(s->size() == 5);

    auto t = ac::shared<std::string>::create_from(3, 'x');
    CHECK(*t == "xxx");
}

TEST("shared - payload alignment")
{
    test::counting_resource res;
    auto s = ac::shared<over_aligned>::create_in(res.aborting(), over_aligned{7});
    CHECK(ac::is_aligned(reinterpret_cast<std::uintptr_t>(s.as_ptr()), 64));
    CHECK(s->value == 7);

    auto c = ac::shared<char>::create_in(res.aborting(), 'c');
    CHECK(*c == 'c');
}

TEST("shared - allocation failure")
{
    test::counting_resource res;
    res.fail_all = true;

    SECTION("fallible allocator")
    {
        auto r = ac::shared<int, ac::resource_allocator>::try_create_in(res.fallible(), 5);
        REQUIRE(r.has_error());
        CHECK(r.error().is_allocation_failure());
    }

    SECTION("aborting allocator")
    {
        CHECK(test::reports_fatal("allocation failure", [&] { (void)ac::shared<int>::create_in(res.aborting(), 5); }));
    }
}

TEST("shared - throwing constructor releases the block")
{
    test::counting_resource res;

    try
    {
        (void)ac::shared<throws_on_construction>::create_in(res.aborting(), 1);
        CHECK(false);
    }
    catch (int e)
    {
        CHECK(e == 13);
    }

    CHECK(res.allocations == 1);
    CHECK(res.live_blocks() == 0);
}

TEST("shared - get_mut")
{
    test::counting_resource res;
    auto a = ac::shared<int>::create_in(res.aborting(), 10);

    SECTION("unique handle")
    {
        auto* p = a.get_mut();
        REQUIRE(p != nullptr);
        *p = 11;
        CHECK(*a == 11);
        CHECK(a.is_unique());
    }

    SECTION("another strong handle")
    {
        auto b = a;
        CHECK(a.get_mut() == nullptr);
        CHECK(!a.is_unique());
    }

    SECTION("a weak handle")
    {
        auto w = a.downgrade();
        CHECK(a.get_mut() == nullptr);
        CHECK(!a.is_unique());
        CHECK(a.weak_count() == 1);
    }

    SECTION("weak handle dropped again")
    {
        {
            auto w = a.downgrade();
        }
        CHECK(a.get_mut() != nullptr);
    }

    // the exclusivity check leaves the counters intact
    CHECK(a.strong_count() == 1);
    CHECK(a.weak_count() == 0);
}

TEST("shared - get_mut_unchecked")
{
    auto a = ac::shared<int>::create_from(1);
    auto b = a;
    *a.get_mut_unchecked() = 2;
    CHECK(*b == 2);
}

TEST("shared - make_mut")
{
    test::counting_resource res;
    tracked::reset_counters();

    auto a = ac::shared<tracked>::create_in(res.aborting(), 5);
    CHECK(res.allocations == 1);

    SECTION("unique: no allocation")
    {
        a.make_mut().value = 6;
        CHECK(a->value == 6);
        CHECK(res.allocations == 1);
        CHECK(tracked::copies == 0);
        CHECK(a.strong_count() == 1);
    }

    SECTION("shared: clones the payload")
    {
        auto b = a;
        a.make_mut().value = 6;

        CHECK(res.allocations == 2);
        CHECK(tracked::copies == 1);
        CHECK(!ac::shared<tracked>::ptr_eq(a, b));
        CHECK(a->value == 6);
        CHECK(b->value == 5);
        CHECK(a.strong_count() == 1);
        CHECK(b.strong_count() == 1);

        // a is unique now
        a.make_mut().value = 7;
        CHECK(res.allocations == 2);
    }

    SECTION("only weak handles: moves the payload and detaches them")
    {
        auto w = a.downgrade();
        auto const* old_ptr = a.as_ptr();

        a.make_mut().value = 6;

        CHECK(res.allocations == 2);
        CHECK(tracked::copies == 0);
        CHECK(tracked::moves == 1);
        CHECK(tracked::live == 1);
        CHECK(a.as_ptr() != old_ptr);
        CHECK(a->value == 6);
        CHECK(a.weak_count() == 0);

        // the old block stays alive for w, but its value is gone
        CHECK(w.strong_count() == 0);
        CHECK(!w.upgrade().has_value());
        CHECK(res.live_blocks() == 2);
    }

    SECTION("new block uses the same allocator")
    {
        auto b = a;
        (void)a.make_mut();
        CHECK(a.allocator() == b.allocator());
    }
}

TEST("shared - try_unwrap")
{
    test::counting_resource res;
    tracked::reset_counters();

    auto a = ac::shared<tracked>::create_in(res.aborting(), 9);

    SECTION("sole owner gets the value")
    {
        auto r = ac::move(a).try_unwrap();
        REQUIRE(r.has_value());
        CHECK(r.value().value == 9);
        CHECK(res.live_blocks() == 0);
        CHECK(tracked::live == 1);
    }

    SECTION("shared owner gets the handle back")
    {
        auto b = a;
        auto r = ac::move(a).try_unwrap();
        REQUIRE(r.has_error());
        CHECK(ac::shared<tracked>::ptr_eq(r.error(), b));
        CHECK(b.strong_count() == 2);
    }

    SECTION("weak handles do not prevent unwrapping")
    {
        auto w = a.downgrade();
        auto r = ac::move(a).try_unwrap();
        REQUIRE(r.has_value());
        CHECK(!w.upgrade().has_value());
        CHECK(res.live_blocks() == 1);
    }
}

TEST("shared - raw pointer round trip")
{
    test::counting_resource res;
    tracked::reset_counters();

    auto a = ac::shared<tracked>::create_in(res.aborting(), 3);
    auto const* expected = a.as_ptr();

    tracked const* raw = ac::move(a).into_raw();
    CHECK(raw == expected);
    CHECK(raw->value == 3);
    CHECK(tracked::live == 1);

    ac::shared<tracked>::increment_strong_count(raw);
    auto b = ac::shared<tracked>::from_raw(raw);
    CHECK(b.strong_count() == 2);

    ac::shared<tracked>::decrement_strong_count(raw);
    CHECK(b.strong_count() == 1);
    CHECK(b->value == 3);

    SECTION("decrementing the last count releases everything")
    {
        auto const* again = ac::move(b).into_raw();
        ac::shared<tracked>::decrement_strong_count(again);
        CHECK(tracked::live == 0);
        CHECK(res.live_blocks() == 0);
    }
}

TEST("shared - value equality")
{
    auto a = ac::shared<int>::create_from(4);
    auto b = ac::shared<int>::create_from(4);
    auto c = ac::shared<int>::create_from(5);

    CHECK(a == b);
    CHECK(!(a == c));
    CHECK(!ac::shared<int>::ptr_eq(a, b));
}

TEST("shared - cyclic construction")
{
    struct node
    {
        ac::weak<node> self;
        int value = 0;
    };

    test::counting_resource res;

    bool upgrade_during_init = true;
    auto n = ac::shared<node>::create_cyclic_in(res.aborting(),
                                               [&](ac::weak<node> const& w)
                                               {
                                                   upgrade_during_init = w.upgrade().has_value();
                                                   return node{w, 17};
                                               });

    CHECK(!upgrade_during_init);
    CHECK(n.strong_count() == 1);
    CHECK(n.weak_count() == 1);

    auto up = n->self.upgrade();
    REQUIRE(up.has_value());
    CHECK(ac::shared<node>::ptr_eq(up.value(), n));
    CHECK(up.value()->value == 17);
    CHECK(n.strong_count() == 2);

    SECTION("throwing initializer releases the block")
    {
        test::counting_resource res2;
        try
        {
            (void)ac::shared<node>::create_cyclic_in(res2.aborting(), [](ac::weak<node> const&) -> node { throw 1; });
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
        CHECK(res2.allocations == 1);
        CHECK(res2.live_blocks() == 0);
    }
}

TEST("shared - cyclic construction with the default allocator")
{
    struct parent
    {
        ac::weak<parent> me;
    };

    auto p = ac::shared<parent>::create_cyclic([](ac::weak<parent> const& w) { return parent{w}; });
    CHECK(p->me.strong_count() == 1);
    CHECK(ac::weak<parent>::ptr_eq(p->me, p.downgrade()));
}

TEST("shared - arrays")
{
    test::counting_resource res;
    tracked::reset_counters();

    SECTION("copy of trivially copyable elements")
    {
        auto a = ac::shared<int[]>::create_copy_of({1, 2, 3, 4}, res.aborting());
        REQUIRE(a.size() == 4);
        CHECK(a[0] == 1);
        CHECK(a[3] == 4);
        CHECK(a.as_span().size() == 4);
        CHECK(a.strong_count() == 1);
    }

    SECTION("copy of non-trivial elements")
    {
        std::vector<tracked> source;
        source.emplace_back(1);
        source.emplace_back(2);
        tracked::copies = 0;

        {
            auto a = ac::shared<tracked[]>::create_copy_of(ac::span<tracked const>(source.data(), 2), res.aborting());
            CHECK(tracked::copies == 2);
            CHECK(a[1].value == 2);
            CHECK(tracked::live == 4);
        }
        CHECK(tracked::live == 2);
    }

    SECTION("defaulted elements")
    {
        auto a = ac::shared<ac::u64[]>::create_defaulted(8, res.aborting());
        REQUIRE(a.size() == 8);
        for (auto v : a.as_span())
            CHECK(v == 0u);
    }

    SECTION("empty array")
    {
        auto a = ac::shared<tracked[]>::create_defaulted(0, res.aborting());
        CHECK(a.size() == 0);
        CHECK(a.as_span().empty());
        CHECK(res.allocations == 1);
    }

    SECTION("make_mut on a shared array copies it")
    {
        auto a = ac::shared<int[]>::create_copy_of({1, 2, 3}, res.aborting());
        auto b = a;
        auto m = a.make_mut();
        m[0] = 10;
        CHECK(a[0] == 10);
        CHECK(b[0] == 1);
        CHECK(res.allocations == 2);
    }

    SECTION("make_mut with weak handles moves the elements")
    {
        auto a = ac::shared<tracked[]>::create_defaulted(3, res.aborting());
        auto w = a.downgrade();
        auto m = a.make_mut();
        CHECK(m.size() == 3);
        CHECK(tracked::moves == 3);
        CHECK(tracked::live == 3);
        CHECK(!w.upgrade().has_value());
    }

    SECTION("raw round trip of arrays")
    {
        auto a = ac::shared<int[]>::create_copy_of({5, 6}, res.aborting());
        auto const* raw = ac::move(a).into_raw();
        CHECK(raw[1] == 6);
        auto b = ac::shared<int[]>::from_raw(raw);
        CHECK(b.size() == 2);
    }

    CHECK(tracked::live == 0);
    CHECK(res.live_blocks() == 0);
}

TEST("shared - array allocation failure")
{
    test::counting_resource res;
    res.fail_above_bytes = 64;

    auto r = ac::shared<ac::u64[], ac::resource_allocator>::try_create_defaulted(100, res.fallible());
    REQUIRE(r.has_error());
    CHECK(r.error().is_allocation_failure());

    auto overflow = ac::shared<ac::u64[], ac::resource_allocator>::try_create_defaulted(ac::max_isize / 4, res.fallible());
    REQUIRE(overflow.has_error());
    CHECK(overflow.error().is_capacity_overflow());
    CHECK(res.allocations == 0);
}

TEST("shared - uninitialized construction")
{
    test::counting_resource res;
    tracked::reset_counters();

    SECTION("single value written later")
    {
        auto u = ac::shared<tracked>::create_uninit(res.aborting());
        CHECK(u.size() == 1);
        CHECK(res.live_blocks() == 1);
        CHECK(tracked::live == 0);

        auto s = ac::move(u).write(21);
        CHECK(s->value == 21);
        CHECK(s.strong_count() == 1);
        CHECK(s.weak_count() == 0);
        CHECK(s.is_unique());
    }

    SECTION("array elements constructed in place")
    {
        auto u = ac::shared<std::string[]>::create_uninit(3, res.aborting());
        REQUIRE(u.size() == 3);
        for (auto i = 0; i < 3; ++i)
            new (ac::placement_new, u.data() + i) std::string(std::to_string(i));

        auto s = ac::move(u).assume_init();
        CHECK(s.size() == 3);
        CHECK(s[2] == "2");
    }

    SECTION("dropping without initializing runs no destructors")
    {
        {
            auto u = ac::shared<tracked>::create_uninit(res.aborting());
            (void)u;
        }
        CHECK(tracked::live == 0);
        CHECK(res.allocations == 1);
        CHECK(res.live_blocks() == 0);
    }

    SECTION("throwing write releases the block")
    {
        auto threw = false;
        try
        {
            (void)ac::shared<throws_on_construction>::create_uninit(res.aborting()).write(1);
        }
        catch (int)
        {
            threw = true;
        }
        CHECK(threw);
        CHECK(res.live_blocks() == 0);
    }

    SECTION("allocation failure is reported")
    {
        res.fail_all = true;
        auto r = ac::shared<tracked, ac::resource_allocator>::try_create_uninit(res.fallible());
        REQUIRE(r.has_error());
        CHECK(r.error().is_allocation_failure());

        auto arr = ac::shared<ac::u64[], ac::resource_allocator>::try_create_uninit(ac::max_isize / 4, res.fallible());
        REQUIRE(arr.has_error());
        CHECK(arr.error().is_capacity_overflow());
    }

    CHECK(tracked::live == 0);
    CHECK(res.live_blocks() == 0);
}

TEST("shared - zeroed construction")
{
    test::counting_resource res;

    SECTION("single value")
    {
        auto s = ac::shared<ac::u64>::create_zeroed(res.aborting()).assume_init();
        CHECK(*s == 0);
    }

    SECTION("array")
    {
        // reuse freed memory to make leftover bytes likely
        {
            auto dirty = ac::shared<ac::u32[]>::create_copy_of({7, 7, 7, 7, 7, 7, 7, 7}, res.aborting());
            (void)dirty;
        }

        auto s = ac::shared<ac::u32[]>::create_zeroed(8, res.aborting()).assume_init();
        REQUIRE(s.size() == 8);
        for (auto v : s.as_span())
            CHECK(v == 0);
    }

    SECTION("fallible variant")
    {
        auto r = ac::shared<ac::u32[], ac::resource_allocator>::try_create_zeroed(4, res.fallible());
        REQUIRE(r.has_value());
        auto s = ac::move(r).value().assume_init();
        CHECK(s[3] == 0);
    }

    CHECK(res.live_blocks() == 0);
}

TEST("shared - try_unwrap_with_allocator")
{
    test::counting_resource res;
    tracked::reset_counters();

    auto a = ac::shared<tracked>::create_in(res.aborting(), 12);

    SECTION("sole owner gets value and allocator")
    {
        auto r = ac::move(a).try_unwrap_with_allocator();
        REQUIRE(r.has_value());
        CHECK(r.value().value.value == 12);
        CHECK(r.value().allocator == res.aborting());
        CHECK(res.live_blocks() == 0);
    }

    SECTION("shared owner gets the handle back")
    {
        auto b = a;
        auto r = ac::move(a).try_unwrap_with_allocator();
        REQUIRE(r.has_error());
        CHECK(ac::shared<tracked>::ptr_eq(r.error(), b));
        CHECK(b.strong_count() == 2);
    }

    SECTION("weak handles keep the block")
    {
        auto w = a.downgrade();
        auto r = ac::move(a).try_unwrap_with_allocator();
        REQUIRE(r.has_value());
        CHECK(res.live_blocks() == 1);
        CHECK(w.allocator() == r.value().allocator);
    }
}

TEST("shared - ordering and hashing")
{
    auto a = ac::shared<int>::create_from(1);
    auto b = ac::shared<int>::create_from(2);
    auto a2 = ac::shared<int>::create_from(1);

    CHECK(a < b);
    CHECK(b > a);
    CHECK(a <= a2);
    CHECK((a <=> a2) == std::strong_ordering::equal);

    auto const h = std::hash<ac::shared<int>>{};
    CHECK(h(a) == h(a2));
    CHECK(h(a) == std::hash<int>{}(1));

    auto s1 = ac::shared<std::string>::create_from("x");
    auto s2 = ac::shared<std::string>::create_from("y");
    CHECK(s1 < s2);
    CHECK(std::hash<ac::shared<std::string>>{}(s1) == std::hash<std::string>{}("x"));

    static_assert(!std::three_way_comparable<ac::shared<tracked>>);
}

TEST("shared - handle size")
{
    static_assert(sizeof(ac::shared<int>) == sizeof(void*));
    static_assert(sizeof(ac::weak<int>) == sizeof(void*));
    static_assert(sizeof(ac::shared<int[]>) == sizeof(void*));
    static_assert(sizeof(ac::shared<std::string, ac::resource_allocator>) == sizeof(void*));
}
