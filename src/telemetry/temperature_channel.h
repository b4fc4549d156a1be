#ifndef GIFTCHAIN_TEMPERATURE_CHANNEL_H_
#define GIFTCHAIN_TEMPERATURE_CHANNEL_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "folly/concurrency/UnboundedQueue.h"

namespace Giftchain {

// One sensor reading
struct Recording {
    int64_t temperature = 0;
    std::chrono::steady_clock::time_point timestamp;
    int sensor_id = -1;
};

/**
 * Many-to-one channel of temperature readings.
 *
 * - Any number of producers may Push() at any time; Push() never blocks and the
 *   channel grows without bound while the consumer is busy
 * - Exactly one consumer thread may call TryPop(), PopFor() and DrainAll()
 * - Readings from one producer are delivered in the order they were pushed
 */
class TemperatureChannel {
public:
    TemperatureChannel() = default;

    void Push(Recording recording);

    // Consumer side
    std::optional<Recording> TryPop();
    std::optional<Recording> PopFor(std::chrono::microseconds timeout);
    std::vector<Recording> DrainAll();

    // Approximate while producers are active
    size_t Size() const { return queue_.size(); }
    bool Empty() const { return queue_.empty(); }

    TemperatureChannel(const TemperatureChannel&) = delete;
    TemperatureChannel& operator=(const TemperatureChannel&) = delete;

private:
    // MayBlock lets the consumer sleep in PopFor instead of spinning
    folly::UMPSCQueue<Recording, true> queue_;
};

} // namespace Giftchain

#endif // GIFTCHAIN_TEMPERATURE_CHANNEL_H_
