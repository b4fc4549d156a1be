#include "temperature_channel.h"

#include <glog/logging.h>

namespace Giftchain {

void TemperatureChannel::Push(Recording recording) {
    queue_.enqueue(std::move(recording));
}

std::optional<Recording> TemperatureChannel::TryPop() {
    Recording recording;
    if (!queue_.try_dequeue(recording)) {
        return std::nullopt;
    }
    return recording;
}

std::optional<Recording> TemperatureChannel::PopFor(std::chrono::microseconds timeout) {
    Recording recording;
    if (!queue_.try_dequeue_for(recording, timeout)) {
        return std::nullopt;
    }
    return recording;
}

std::vector<Recording> TemperatureChannel::DrainAll() {
    std::vector<Recording> drained;
    Recording recording;
    while (queue_.try_dequeue(recording)) {
        drained.push_back(recording);
    }
    VLOG(3) << "TemperatureChannel::DrainAll: " << drained.size() << " readings";
    return drained;
}

} // namespace Giftchain
