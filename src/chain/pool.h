#ifndef GIFTCHAIN_POOL_H_
#define GIFTCHAIN_POOL_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <absl/synchronization/mutex.h>

#include "common/config.h"

namespace Giftchain {

/**
 * Pool is the unordered bag of presents the servants draw from.
 *
 * Design:
 * - Items are shuffled once at construction so draw order does not follow identifier order
 * - A single mutex guards the bag; every access mutates, so there is no reader/writer split
 * - Take() never waits for data: an empty bag is reported immediately as std::nullopt
 * - The bag only shrinks; nothing is ever put back
 */
class Pool {
public:
    /**
     * Constructor
     * @param items Identifiers to place in the bag, in any order
     * @param seed Shuffle seed; 0 seeds from std::random_device
     */
    explicit Pool(std::vector<Item> items, uint64_t seed = 0);

    /**
     * Remove and return one remaining present
     * @return The present, or std::nullopt once the bag is empty
     *
     * Thread-safe. Two concurrent calls never return the same slot.
     */
    std::optional<Item> Take();

    /**
     * Presents still in the bag
     */
    size_t Size() const;
    bool Empty() const;

    /**
     * Number of presents the bag was built with
     */
    size_t InitialSize() const { return initial_size_; }

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

private:
    size_t initial_size_;

    mutable absl::Mutex mutex_;
    std::vector<Item> items_ ABSL_GUARDED_BY(mutex_);
};

// Every identifier in [1, max_item], ascending
std::vector<Item> RangeItems(Item max_item);

} // namespace Giftchain

#endif // GIFTCHAIN_POOL_H_
