#ifndef GIFTCHAIN_SENSOR_H_
#define GIFTCHAIN_SENSOR_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include <absl/synchronization/mutex.h>

#include "temperature_channel.h"

namespace Giftchain {

struct SensorOptions {
    // Time between two readings (one simulated minute)
    std::chrono::microseconds interval{std::chrono::milliseconds(240)};
    int64_t min_temp = -100;
    int64_t max_temp = 70;
    uint64_t seed = 0;
};

/**
 * A sensor thread pushes one random reading onto the channel every interval
 * until it is stopped. It never waits on the channel.
 */
class Sensor {
public:
    Sensor(int id, std::shared_ptr<TemperatureChannel> channel, SensorOptions options);
    ~Sensor();

    void Start();
    // Wakes the sensor if it is sleeping and joins its thread
    void Stop();

    uint64_t ReadingsPushed() const { return readings_pushed_.load(std::memory_order_relaxed); }
    int Id() const { return id_; }

    Sensor(const Sensor&) = delete;
    Sensor& operator=(const Sensor&) = delete;

private:
    void SensorThread();

    const int id_;
    std::shared_ptr<TemperatureChannel> channel_;
    const SensorOptions options_;

    std::thread thread_;
    absl::Mutex mutex_;
    bool stop_requested_ ABSL_GUARDED_BY(mutex_) = false;
    std::atomic<uint64_t> readings_pushed_{0};
};

} // namespace Giftchain

#endif // GIFTCHAIN_SENSOR_H_
