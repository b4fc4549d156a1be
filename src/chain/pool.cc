#include "pool.h"

#include <algorithm>
#include <numeric>
#include <random>

#include <glog/logging.h>

namespace Giftchain {

namespace {

uint64_t ResolveSeed(uint64_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

} // namespace

Pool::Pool(std::vector<Item> items, uint64_t seed)
    : initial_size_(items.size()),
      items_(std::move(items)) {
    uint64_t resolved = ResolveSeed(seed);
    std::mt19937_64 rng(resolved);
    std::shuffle(items_.begin(), items_.end(), rng);

    VLOG(1) << "Pool initialized: " << initial_size_ << " presents, seed=" << resolved;
}

std::vector<Item> RangeItems(Item max_item) {
    std::vector<Item> items(max_item);
    std::iota(items.begin(), items.end(), Item{1});
    return items;
}

std::optional<Item> Pool::Take() {
    absl::MutexLock lock(&mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }

    // The bag is already shuffled, so the back is as arbitrary as any other slot
    Item item = items_.back();
    items_.pop_back();

    VLOG(3) << "Pool::Take: present=" << item << ", remaining=" << items_.size();
    return item;
}

size_t Pool::Size() const {
    absl::MutexLock lock(&mutex_);
    return items_.size();
}

bool Pool::Empty() const {
    absl::MutexLock lock(&mutex_);
    return items_.empty();
}

} // namespace Giftchain
