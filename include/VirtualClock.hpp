#pragma once
#include <atomic>
#include <ctime>

// Time source for position estimates. Frozen at a fixed instant it lets a
// recorded situation be replayed against live boards (--fixed-time).
class VirtualClock
{
public:
    static void freeze(std::time_t t) noexcept
    {
        frozenAt.store(t, std::memory_order_relaxed);
        frozen.store(true, std::memory_order_relaxed);
    }

    static void release() noexcept
    {
        frozen.store(false, std::memory_order_relaxed);
    }

    static bool isFrozen() noexcept
    {
        return frozen.load(std::memory_order_relaxed);
    }

    static std::time_t now() noexcept
    {
        if (frozen.load(std::memory_order_relaxed))
            return frozenAt.load(std::memory_order_relaxed);
        return std::time(nullptr);
    }

private:
    static inline std::atomic<bool> frozen{false};
    static inline std::atomic<std::time_t> frozenAt{0};
};
