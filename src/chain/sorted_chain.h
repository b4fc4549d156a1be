#ifndef GIFTCHAIN_SORTED_CHAIN_H_
#define GIFTCHAIN_SORTED_CHAIN_H_

#include <cstddef>
#include <optional>
#include <vector>

#include <absl/container/btree_set.h>
#include <absl/synchronization/mutex.h>

#include "common/config.h"

namespace Giftchain {

/**
 * SortedChain is the shared ascending chain of presents.
 *
 * Locking discipline:
 * - Contains(), Size(), Empty() and Snapshot() take the lock in shared mode and may
 *   run concurrently with each other
 * - Insert() and PopFront() take the lock in exclusive mode
 * - Insert() finds the position, rejects a duplicate and splices the new present
 *   inside one exclusive hold. Callers must not use Contains() as a gate for a later
 *   Insert(): two threads can both see the present missing.
 * - A present removed by PopFront() is remembered, and Insert() rejects it from then on.
 *   Each present is accepted at most once per chain.
 *
 * The chain is sorted and duplicate-free at every point another thread can observe it.
 * Storage is a B-tree, so "splicing" is a B-tree insert at the located position.
 */
class SortedChain {
public:
    /**
     * @param max_item Largest identifier the chain accepts. Identifiers outside
     *        [1, max_item] are an invariant violation and abort the process.
     */
    explicit SortedChain(Item max_item);

    /**
     * Insert a present at its ascending position
     * @return true if the chain changed, false if the present is on the chain or
     *         has already been removed by PopFront()
     */
    bool Insert(Item item);

    /**
     * Membership query under shared access. Informational only.
     */
    bool Contains(Item item) const;

    /**
     * Remove the smallest present. It can never be inserted again.
     * @return The removed present, or std::nullopt if the chain is empty
     */
    std::optional<Item> PopFront();

    size_t Size() const;
    bool Empty() const;

    /**
     * Copy of the chain in ascending order
     */
    std::vector<Item> Snapshot() const;

    Item MaxItem() const { return max_item_; }

    SortedChain(const SortedChain&) = delete;
    SortedChain& operator=(const SortedChain&) = delete;

private:
    const Item max_item_;

    mutable absl::Mutex mutex_;
    absl::btree_set<Item> items_ ABSL_GUARDED_BY(mutex_);
    // Presents taken off the head by PopFront()
    absl::btree_set<Item> removed_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Giftchain

#endif // GIFTCHAIN_SORTED_CHAIN_H_
