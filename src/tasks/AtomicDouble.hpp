#pragma once

#include <atomic>

namespace tasks
{

// Floating accumulator with get-and-add semantics for concurrent writers.
class AtomicDouble
{
public:
    explicit AtomicDouble(double initial = 0.0) noexcept
        : value_(initial)
    {
    }

    AtomicDouble(const AtomicDouble&) = delete;
    AtomicDouble& operator=(const AtomicDouble&) = delete;

    // Returns the value after the addition.
    double addAndGet(double delta) noexcept
    {
        double current = value_.load(std::memory_order_relaxed);
        double desired = current + delta;
        while (!value_.compare_exchange_weak(current, desired, std::memory_order_acq_rel, std::memory_order_relaxed))
        {
            desired = current + delta;
        }
        return desired;
    }

    double get() const noexcept { return value_.load(std::memory_order_acquire); }

    void set(double value) noexcept { value_.store(value, std::memory_order_release); }

private:
    std::atomic<double> value_;
};

} // namespace tasks
