#include "sorted_chain.h"

#include <glog/logging.h>

namespace Giftchain {

SortedChain::SortedChain(Item max_item)
    : max_item_(max_item) {
    CHECK_GE(max_item_, Item{1}) << "SortedChain needs room for at least one present";
}

bool SortedChain::Insert(Item item) {
    CHECK_GE(item, Item{1}) << "Present id below the valid range";
    CHECK_LE(item, max_item_) << "Present id above the valid range";

    absl::WriterMutexLock lock(&mutex_);

    if (removed_.contains(item)) {
        VLOG(2) << "SortedChain::Insert: present " << item << " was already taken off the chain";
        return false;
    }

    // First present >= item
    auto pos = items_.lower_bound(item);
    if (pos != items_.end() && *pos == item) {
        VLOG(2) << "SortedChain::Insert: present " << item << " already on the chain";
        return false;
    }

    // Splice before pos, or append when pos is the end
    items_.insert(pos, item);
    VLOG(3) << "SortedChain::Insert: present=" << item << ", size=" << items_.size();
    return true;
}

bool SortedChain::Contains(Item item) const {
    absl::ReaderMutexLock lock(&mutex_);
    return items_.contains(item);
}

std::optional<Item> SortedChain::PopFront() {
    absl::WriterMutexLock lock(&mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    auto head = items_.begin();
    Item item = *head;
    items_.erase(head);
    removed_.insert(item);
    return item;
}

size_t SortedChain::Size() const {
    absl::ReaderMutexLock lock(&mutex_);
    return items_.size();
}

bool SortedChain::Empty() const {
    absl::ReaderMutexLock lock(&mutex_);
    return items_.empty();
}

std::vector<Item> SortedChain::Snapshot() const {
    absl::ReaderMutexLock lock(&mutex_);
    return std::vector<Item>(items_.begin(), items_.end());
}

} // namespace Giftchain
