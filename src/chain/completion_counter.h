#pragma once

#include <atomic>
#include <cstdint>

namespace Giftchain {

/**
 * Lock-free, monotonically increasing tally shared by all servants.
 *
 * Increment() is a release operation and Value() an acquire operation, so a thread
 * that reads a count also sees every chain mutation made before the matching increments.
 */
class CompletionCounter {
public:
    CompletionCounter() = default;

    // Returns the new value
    uint64_t Increment() {
        return count_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    uint64_t Value() const {
        return count_.load(std::memory_order_acquire);
    }

    CompletionCounter(const CompletionCounter&) = delete;
    CompletionCounter& operator=(const CompletionCounter&) = delete;

private:
    // Own cache line: every servant hammers it
    alignas(64) std::atomic<uint64_t> count_{0};
};

} // namespace Giftchain
