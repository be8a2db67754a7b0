#include <alloc-core/impl/refcount.hh>

#include <nexus/test.hh>

#include "test-resources.hh"

#include <atomic>
#include <chrono>
#include <thread>

TEST("refcount - strong counter transitions")
{
    ac::impl::strong_counter c(1);

    c.increment();
    CHECK(c.load() == 2);

    CHECK(!c.decrement());
    CHECK(c.load() == 1);

    SECTION("claim and restore")
    {
        CHECK(c.try_claim_unique());
        CHECK(c.load() == 0);
        CHECK(!c.try_increment_if_live());
        c.restore_unique();
        CHECK(c.load() == 1);
    }

    SECTION("claim fails while shared")
    {
        c.increment();
        CHECK(!c.try_claim_unique());
        CHECK(!c.try_take_last());
        CHECK(c.load() == 2);
    }

    SECTION("last decrement")
    {
        CHECK(c.decrement());
        CHECK(c.load() == 0);
        CHECK(!c.try_increment_if_live());
    }

    SECTION("upgrade from a live count")
    {
        CHECK(c.try_increment_if_live());
        CHECK(c.load() == 2);
    }
}

TEST("refcount - publication")
{
    ac::impl::strong_counter c(0);
    CHECK(!c.try_increment_if_live());

    c.publish();
    CHECK(c.load() == 1);
    CHECK(c.try_increment_if_live());

    auto const info = test::capture_failure([&] { c.publish(); });
    REQUIRE(info.has_value());
    CHECK(info->message == "cyclic payload published twice");
}

TEST("refcount - weak counter locking")
{
    ac::impl::weak_counter w(1);

    SECTION("lock only succeeds at one")
    {
        CHECK(w.try_lock());
        CHECK(w.load_state().is_locked);
        CHECK(w.load_state().count == 0);
        CHECK(!w.try_lock());

        w.unlock();
        CHECK(!w.load_state().is_locked);
        CHECK(w.load_state().count == 1);
    }

    SECTION("lock fails with weak handles")
    {
        w.increment();
        CHECK(!w.try_lock());
        CHECK(w.load_state().count == 2);
    }

    SECTION("increment_unless_locked on an unlocked counter")
    {
        w.increment_unless_locked();
        CHECK(w.load_state().count == 2);
        CHECK(!w.decrement());
        CHECK(w.decrement());
    }

    SECTION("state decoding")
    {
        auto const locked = ac::impl::weak_counter::state::decode(ac::impl::locked_weak_count);
        CHECK(locked.is_locked);

        auto const plain = ac::impl::weak_counter::state::decode(7);
        CHECK(!plain.is_locked);
        CHECK(plain.count == 7);
    }
}

TEST("refcount - soft maximum")
{
    CHECK(ac::impl::max_refcount == ac::u64(ac::max_isize));

    SECTION("strong increments abort above it")
    {
        ac::impl::strong_counter c(ac::impl::max_refcount + 1);
        CHECK(test::reports_fatal("reference count overflow", [&] { c.increment(); }));
    }

    SECTION("upgrades abort above it")
    {
        ac::impl::strong_counter c(ac::impl::max_refcount + 1);
        CHECK(test::reports_fatal("reference count overflow", [&] { (void)c.try_increment_if_live(); }));
    }

    SECTION("weak increments abort above it")
    {
        ac::impl::weak_counter w(ac::impl::max_refcount + 1);
        CHECK(test::reports_fatal("reference count overflow", [&] { w.increment(); }));
    }

    SECTION("the maximum itself is still accepted")
    {
        ac::impl::strong_counter c(ac::impl::max_refcount);
        CHECK(!test::capture_failure([&] { c.increment(); }).has_value());
    }
}

TEST("refcount - downgrade spins until the exclusivity lock is released")
{
    ac::impl::weak_counter w(1);
    REQUIRE(w.try_lock());

    std::atomic<bool> done = false;
    std::thread downgrader(
        [&]
        {
            w.increment_unless_locked();
            done = true;
        });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(!done);
    CHECK(w.load_state().is_locked);

    w.unlock();
    downgrader.join();

    CHECK(done);
    CHECK(w.load_state().count == 2);

    // usable as a plain busy-wait hint as well
    ac::impl::spin_loop_hint();
}
