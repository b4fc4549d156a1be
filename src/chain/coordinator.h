#ifndef GIFTCHAIN_COORDINATOR_H_
#define GIFTCHAIN_COORDINATOR_H_

#include <cstdint>
#include <memory>
#include <vector>

#include "servant.h"

namespace Giftchain {

struct CoordinatorOptions {
    int servants = kDefaultServants;
    // 0 seeds the shuffle from std::random_device
    uint64_t seed = 0;
    bool thank_you_cards = false;
    int query_every = 0;
};

/**
 * Coordinator owns one run: it fills and shuffles the bag, builds the empty chain
 * and the counters, spawns the servants, joins them and exposes the outcome.
 */
class Coordinator {
public:
    /**
     * Bag holding every identifier in [1, max_item], drained by `servants` threads.
     *
     * Every constructor requires at least one present and at least one servant;
     * violating either aborts the process.
     */
    Coordinator(Item max_item, int servants);
    Coordinator(Item max_item, CoordinatorOptions options);

    /**
     * Bag holding exactly `items`, which must not be empty. Duplicates are allowed
     * here and are rejected by the chain during the run, also after the first copy
     * has been carded off the chain.
     */
    Coordinator(std::vector<Item> items, CoordinatorOptions options);

    /**
     * Spawn the servants and block until every one of them has finished.
     * May be called once.
     */
    void Run();

    // Successful insertions
    uint64_t FinalCount() const { return presents_added_->Value(); }
    uint64_t CardsWritten() const { return cards_written_->Value(); }
    uint64_t QueriesIssued() const { return queries_issued_->Value(); }

    /**
     * The chain in ascending order. Read it after Run() has returned.
     */
    std::vector<Item> Sequence() const { return chain_->Snapshot(); }
    std::shared_ptr<const SortedChain> Chain() const { return chain_; }

    /**
     * Check the chain and the counters against the distinct identifiers that went
     * into the bag. Logs every mismatch found.
     */
    bool Verify() const;

    // Distinct identifiers of the bag, ascending
    const std::vector<Item>& Expected() const { return expected_; }

    const std::vector<ServantStats>& Stats() const { return stats_; }
    bool HasRun() const { return ran_; }

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

private:
    const CoordinatorOptions options_;
    std::vector<Item> expected_;

    std::shared_ptr<Pool> pool_;
    std::shared_ptr<SortedChain> chain_;
    std::shared_ptr<CompletionCounter> presents_added_;
    std::shared_ptr<CompletionCounter> cards_written_;
    std::shared_ptr<CompletionCounter> queries_issued_;

    std::vector<ServantStats> stats_;
    bool ran_ = false;
};

} // namespace Giftchain

#endif // GIFTCHAIN_COORDINATOR_H_
