#ifndef GIFTCHAIN_SERVANT_H_
#define GIFTCHAIN_SERVANT_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <random>

#include "completion_counter.h"
#include "pool.h"
#include "sorted_chain.h"

namespace Giftchain {

/**
 * Shared handles every servant holds for the duration of a run.
 * The Coordinator creates them; the last holder to go away frees them.
 */
struct ServantHandles {
    std::shared_ptr<Pool> pool;
    std::shared_ptr<SortedChain> chain;
    std::shared_ptr<CompletionCounter> presents_added;
    std::shared_ptr<CompletionCounter> cards_written;
    std::shared_ptr<CompletionCounter> queries_issued;
};

struct ServantOptions {
    // Alternate AddPresent with WriteCard and stop only when bag and chain are both empty
    bool thank_you_cards = false;
    // Every n-th iteration asks whether a random present is on the chain. 0 = never.
    int query_every = 0;
    uint64_t query_seed = 0;
};

// What one servant did, read by the Coordinator after join
struct ServantStats {
    uint64_t presents_added = 0;
    uint64_t duplicates_rejected = 0;
    uint64_t cards_written = 0;
    uint64_t queries_issued = 0;
};

class Servant {
public:
    enum class State {
        kRunning,
        kDraining,
        kFinished
    };

    enum class Action {
        kAddPresent,
        kWriteCard
    };

    Servant(int id, ServantHandles handles, ServantOptions options = {});

    // Runs on the calling thread until the servant reaches kFinished
    void Run();

    State GetState() const { return state_.load(std::memory_order_acquire); }
    int Id() const { return id_; }

    // Only meaningful once the servant has finished and its thread is joined
    const ServantStats& Stats() const { return stats_; }

    Servant(const Servant&) = delete;
    Servant& operator=(const Servant&) = delete;

private:
    void DrainBag();
    void DrainBagWithCards();

    void AddPresent(Item item);
    void MaybeQueryChain();

    const int id_;
    ServantHandles handles_;
    const ServantOptions options_;

    std::atomic<State> state_{State::kRunning};
    ServantStats stats_;
    uint64_t iteration_ = 0;
    std::mt19937_64 query_rng_;
};

const char* StateName(Servant::State state);

} // namespace Giftchain

#endif // GIFTCHAIN_SERVANT_H_
