#pragma once

#include <alloc-core/alloc_error.hh>
#include <alloc-core/assert.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/layout.hh>

#include <atomic>
#include <limits>
#include <thread>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#include <immintrin.h>
#endif

// Atomic reference counters of the inner shared block.
//
// strong: number of ac::shared handles; the payload is alive while strong > 0.
// weak:   number of ac::weak handles plus ONE implicit unit held collectively by all strong handles;
//         the block itself is alive while weak > 0.
//
// The weak counter additionally has a "locked" state: the value u64 max is never a genuine count
// but a transient sentinel used while a strong handle checks whether it is the only handle at all.
// While locked, downgrade() spins. weak_counter::state decodes the raw value into those two states.
//
// Memory orderings (load-bearing, do not weaken):
// - increments are relaxed: a new handle can only be created from an existing one
// - decrements are release, and the thread that brings a counter to zero issues an acquire fence
//   before destroying the payload / releasing the block
// - upgrade and lock acquisition are acquire on success
// - unlock and publication of a cyclic payload are release
//
// Increments check the previous value against a soft maximum (isize max) and abort above it.
// The true range of u64 leaves ample headroom for the increments other threads may have
// performed before the abort takes effect, so the counter itself never wraps.

namespace ac::impl
{
/// Soft maximum of both counters
inline constexpr u64 max_refcount = u64(ac::max_isize);

/// Raw weak counter value marking the locked state
inline constexpr u64 locked_weak_count = std::numeric_limits<u64>::max();

/// Tells the CPU that the caller is busy-waiting on another core
inline void spin_loop_hint()
{
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    _mm_pause();
#elif defined(__aarch64__) && !defined(AC_COMPILER_MSVC)
    __asm__ __volatile__("yield");
#else
    std::this_thread::yield();
#endif
}

/// Aborts via ac::refcount_overflow if a counter was above the soft maximum before an increment
inline void guard_refcount(u64 previous)
{
    if (previous > max_refcount) [[unlikely]]
        ac::refcount_overflow();
}

struct strong_counter
{
    std::atomic<u64> value;

    explicit strong_counter(u64 initial) : value(initial) {}

    /// clone of a live handle
    void increment()
    {
        auto const previous = value.fetch_add(1, std::memory_order_relaxed);
        guard_refcount(previous);
    }

    /// upgrade from a weak handle: increments from any nonzero value, fails at zero
    [[nodiscard]] bool try_increment_if_live()
    {
        auto n = value.load(std::memory_order_relaxed);
        while (true)
        {
            if (n == 0)
                return false;

            guard_refcount(n);

            // acquire pairs with the release decrement of the last strong drop
            // and with the release publication of cyclic construction
            if (value.compare_exchange_weak(n, n + 1, std::memory_order_acquire, std::memory_order_relaxed))
                return true;
        }
    }

    /// drop of a strong handle, returns true if this was the last one
    /// When true is returned, all accesses of other (former) owners happen-before the caller's next access.
    [[nodiscard]] bool decrement()
    {
        if (value.fetch_sub(1, std::memory_order_release) != 1)
            return false;

        std::atomic_thread_fence(std::memory_order_acquire);
        return true;
    }

    /// copy-on-write: claims the payload by moving strong from 1 to 0
    /// On success no weak handle can upgrade until restore_unique() is called.
    [[nodiscard]] bool try_claim_unique()
    {
        u64 expected = 1;
        return value.compare_exchange_strong(expected, 0, std::memory_order_acquire, std::memory_order_relaxed);
    }

    /// reverses a successful try_claim_unique()
    void restore_unique() { value.store(1, std::memory_order_release); }

    /// try_unwrap: moves strong from 1 to 0, with an acquire fence on success
    [[nodiscard]] bool try_take_last()
    {
        u64 expected = 1;
        if (!value.compare_exchange_strong(expected, 0, std::memory_order_relaxed, std::memory_order_relaxed))
            return false;

        std::atomic_thread_fence(std::memory_order_acquire);
        return true;
    }

    /// cyclic construction: makes a fully initialized payload visible to upgrading weak handles
    void publish()
    {
        auto const previous = value.fetch_add(1, std::memory_order_release);
        AC_ASSERT_ALWAYS(previous == 0, "cyclic payload published twice");
    }

    [[nodiscard]] u64 load(std::memory_order order = std::memory_order_seq_cst) const { return value.load(order); }
};

struct weak_counter
{
    std::atomic<u64> value;

    /// Decoded raw value: either locked, or an ordinary count
    struct state
    {
        bool is_locked = false;
        u64 count = 0;

        [[nodiscard]] static state decode(u64 raw)
        {
            if (raw == locked_weak_count)
                return {true, 0};
            return {false, raw};
        }
    };

    explicit weak_counter(u64 initial) : value(initial) {}

    /// clone of a weak handle
    /// The counter cannot be locked here: locking requires weak == 1, i.e. no weak handle exists.
    void increment()
    {
        auto const previous = value.fetch_add(1, std::memory_order_relaxed);
        guard_refcount(previous);
    }

    /// downgrade of a strong handle: spins while the counter is locked
    void increment_unless_locked()
    {
        auto cur = value.load(std::memory_order_relaxed);
        while (true)
        {
            if (state::decode(cur).is_locked)
            {
                impl::spin_loop_hint();
                cur = value.load(std::memory_order_relaxed);
                continue;
            }

            guard_refcount(cur);

            // acquire pairs with the release of unlock() in the exclusivity check
            if (value.compare_exchange_weak(cur, cur + 1, std::memory_order_acquire, std::memory_order_relaxed))
                return;
        }
    }

    /// drop of a weak unit, returns true if the block must be released
    [[nodiscard]] bool decrement()
    {
        if (value.fetch_sub(1, std::memory_order_release) != 1)
            return false;

        std::atomic_thread_fence(std::memory_order_acquire);
        return true;
    }

    /// exclusivity check: 1 -> locked, only possible while no weak handle exists
    [[nodiscard]] bool try_lock()
    {
        u64 expected = 1;
        return value.compare_exchange_strong(expected, locked_weak_count, std::memory_order_acquire, std::memory_order_relaxed);
    }

    void unlock() { value.store(1, std::memory_order_release); }

    [[nodiscard]] state load_state(std::memory_order order = std::memory_order_seq_cst) const
    {
        return state::decode(value.load(order));
    }
};
} // namespace ac::impl
