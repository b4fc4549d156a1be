#include "servant.h"

#include <glog/logging.h>

namespace Giftchain {

const char* StateName(Servant::State state) {
    switch (state) {
        case Servant::State::kRunning:
            return "Running";
        case Servant::State::kDraining:
            return "Draining";
        case Servant::State::kFinished:
            return "Finished";
    }
    return "Unknown";
}

Servant::Servant(int id, ServantHandles handles, ServantOptions options)
    : id_(id),
      handles_(std::move(handles)),
      options_(options),
      query_rng_(options.query_seed + static_cast<uint64_t>(id)) {
    CHECK(handles_.pool && handles_.chain && handles_.presents_added)
        << "Servant " << id_ << " needs a pool, a chain and a counter";
    if (options_.thank_you_cards) {
        CHECK(handles_.cards_written) << "Servant " << id_ << " writes cards but has no card counter";
    }
    if (options_.query_every > 0) {
        CHECK(handles_.queries_issued) << "Servant " << id_ << " queries but has no query counter";
    }
}

void Servant::Run() {
    state_.store(State::kRunning, std::memory_order_release);
    VLOG(1) << "Servant " << id_ << " started";

    if (options_.thank_you_cards) {
        DrainBagWithCards();
    } else {
        DrainBag();
    }

    state_.store(State::kFinished, std::memory_order_release);
    VLOG(1) << "Servant " << id_ << " finished: added=" << stats_.presents_added
            << ", cards=" << stats_.cards_written
            << ", duplicates=" << stats_.duplicates_rejected
            << ", queries=" << stats_.queries_issued;
}

void Servant::DrainBag() {
    while (true) {
        MaybeQueryChain();

        std::optional<Item> item = handles_.pool->Take();
        if (!item) {
            return;
        }
        state_.store(State::kDraining, std::memory_order_release);
        AddPresent(*item);
    }
}

void Servant::DrainBagWithCards() {
    Action next = Action::kAddPresent;

    while (true) {
        MaybeQueryChain();

        if (next == Action::kAddPresent) {
            next = Action::kWriteCard;

            std::optional<Item> item = handles_.pool->Take();
            if (item) {
                state_.store(State::kDraining, std::memory_order_release);
                AddPresent(*item);
                continue;
            }
            // The bag never refills, so an empty bag plus an empty chain means no work is left
            // for this servant. Presents still held by other servants are carded by them.
            if (handles_.chain->Empty()) {
                return;
            }
        } else {
            next = Action::kAddPresent;

            std::optional<Item> head = handles_.chain->PopFront();
            if (head) {
                handles_.cards_written->Increment();
                ++stats_.cards_written;
                VLOG(3) << "Servant " << id_ << " wrote a card for present " << *head;
                continue;
            }
            if (handles_.pool->Empty()) {
                return;
            }
        }
    }
}

void Servant::AddPresent(Item item) {
    if (handles_.chain->Insert(item)) {
        // Counted only after the insert is visible on the chain
        handles_.presents_added->Increment();
        ++stats_.presents_added;
        return;
    }

    ++stats_.duplicates_rejected;
    LOG(WARNING) << "Servant " << id_ << " drew present " << item
                 << " but it is already on the chain";
}

void Servant::MaybeQueryChain() {
    ++iteration_;
    if (options_.query_every <= 0 || iteration_ % options_.query_every != 0) {
        return;
    }

    std::uniform_int_distribution<Item> dist(1, handles_.chain->MaxItem());
    Item present = dist(query_rng_);
    bool on_chain = handles_.chain->Contains(present);
    handles_.queries_issued->Increment();
    ++stats_.queries_issued;

    VLOG(1) << "Servant " << id_ << ": present " << present
            << (on_chain ? " is" : " is not") << " on the chain";
}

} // namespace Giftchain
