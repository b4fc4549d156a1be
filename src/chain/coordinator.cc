#include "coordinator.h"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <thread>

#include <glog/logging.h>

namespace Giftchain {

Coordinator::Coordinator(Item max_item, int servants)
    : Coordinator(max_item, CoordinatorOptions{servants}) {}

Coordinator::Coordinator(Item max_item, CoordinatorOptions options)
    : Coordinator(RangeItems(max_item), options) {}

Coordinator::Coordinator(std::vector<Item> items, CoordinatorOptions options)
    : options_(options),
      presents_added_(std::make_shared<CompletionCounter>()),
      cards_written_(std::make_shared<CompletionCounter>()),
      queries_issued_(std::make_shared<CompletionCounter>()) {
    CHECK_GE(options_.servants, 1) << "A run needs at least one servant";
    CHECK(!items.empty()) << "A run needs at least one present in the bag";
    CHECK_GE(options_.query_every, 0) << "query_every cannot be negative";

    expected_ = items;
    std::sort(expected_.begin(), expected_.end());
    expected_.erase(std::unique(expected_.begin(), expected_.end()), expected_.end());
    CHECK_GE(expected_.front(), Item{1}) << "Present ids start at 1";

    chain_ = std::make_shared<SortedChain>(expected_.back());
    pool_ = std::make_shared<Pool>(std::move(items), options_.seed);

    LOG(INFO) << "Coordinator ready: presents=" << pool_->InitialSize()
              << ", distinct=" << expected_.size()
              << ", servants=" << options_.servants
              << ", thank_you_cards=" << options_.thank_you_cards;
}

void Coordinator::Run() {
    CHECK(!ran_) << "Coordinator::Run may only be called once";
    ran_ = true;

    ServantHandles handles{pool_, chain_, presents_added_, cards_written_, queries_issued_};
    ServantOptions servant_options;
    servant_options.thank_you_cards = options_.thank_you_cards;
    servant_options.query_every = options_.query_every;
    servant_options.query_seed = options_.seed;

    std::vector<std::unique_ptr<Servant>> servants;
    servants.reserve(options_.servants);
    for (int i = 0; i < options_.servants; ++i) {
        servants.push_back(std::make_unique<Servant>(i, handles, servant_options));
    }

    auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> threads;
    threads.reserve(servants.size());
    for (auto& servant : servants) {
        threads.emplace_back(&Servant::Run, servant.get());
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    uint64_t added = 0;
    uint64_t cards = 0;
    stats_.clear();
    for (const auto& servant : servants) {
        CHECK(servant->GetState() == Servant::State::kFinished)
            << "Servant " << servant->Id() << " joined in state " << StateName(servant->GetState());
        stats_.push_back(servant->Stats());
        added += servant->Stats().presents_added;
        cards += servant->Stats().cards_written;
    }

    // Insertions and increments are paired one to one
    CHECK_EQ(added, presents_added_->Value()) << "Insert count and counter diverged";
    CHECK_EQ(cards, cards_written_->Value()) << "Card count and card counter diverged";
    CHECK(pool_->Empty()) << "Servants finished with presents left in the bag";

    LOG(INFO) << "All " << servants.size() << " servants joined after " << elapsed_ms
              << " ms: presents added=" << FinalCount()
              << ", cards written=" << CardsWritten()
              << ", chain size=" << chain_->Size();
}

bool Coordinator::Verify() const {
    if (!ran_) {
        LOG(ERROR) << "Verify called before Run";
        return false;
    }

    bool ok = true;
    const uint64_t distinct = expected_.size();

    if (FinalCount() != distinct) {
        LOG(ERROR) << "Counter is " << FinalCount() << ", expected " << distinct;
        ok = false;
    }

    if (options_.thank_you_cards) {
        if (CardsWritten() != distinct) {
            LOG(ERROR) << "Cards written is " << CardsWritten() << ", expected " << distinct;
            ok = false;
        }
        if (!chain_->Empty()) {
            LOG(ERROR) << "Chain still holds " << chain_->Size() << " presents after all cards";
            ok = false;
        }
        return ok;
    }

    std::vector<Item> sequence = chain_->Snapshot();
    if (sequence != expected_) {
        auto mismatch = std::mismatch(sequence.begin(), sequence.end(),
                                      expected_.begin(), expected_.end());
        LOG(ERROR) << "Chain does not match the bag: size " << sequence.size()
                   << " vs " << expected_.size() << ", first difference at index "
                   << std::distance(sequence.begin(), mismatch.first);
        ok = false;
    }
    if (!std::is_sorted(sequence.begin(), sequence.end()) ||
        std::adjacent_find(sequence.begin(), sequence.end()) != sequence.end()) {
        LOG(ERROR) << "Chain is not strictly ascending";
        ok = false;
    }

    return ok;
}

} // namespace Giftchain
