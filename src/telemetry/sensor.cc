#include "sensor.h"

#include <random>

#include <absl/time/time.h>
#include <glog/logging.h>

namespace Giftchain {

Sensor::Sensor(int id, std::shared_ptr<TemperatureChannel> channel, SensorOptions options)
    : id_(id),
      channel_(std::move(channel)),
      options_(options) {
    CHECK(channel_) << "Sensor " << id_ << " has no channel";
    CHECK_LE(options_.min_temp, options_.max_temp) << "Sensor " << id_ << " has an empty range";
}

Sensor::~Sensor() {
    Stop();
}

void Sensor::Start() {
    if (thread_.joinable()) {
        LOG(WARNING) << "Sensor " << id_ << " already started";
        return;
    }
    {
        absl::MutexLock lock(&mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&Sensor::SensorThread, this);
}

void Sensor::Stop() {
    {
        absl::MutexLock lock(&mutex_);
        stop_requested_ = true;
    }
    if (thread_.joinable()) {
        thread_.join();
        VLOG(1) << "Sensor " << id_ << " stopped after " << ReadingsPushed() << " readings";
    }
}

void Sensor::SensorThread() {
    std::mt19937_64 rng(options_.seed != 0 ? options_.seed + static_cast<uint64_t>(id_)
                                           : std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(options_.min_temp, options_.max_temp);
    const absl::Duration interval = absl::FromChrono(options_.interval);

    while (true) {
        Recording recording;
        recording.temperature = dist(rng);
        recording.timestamp = std::chrono::steady_clock::now();
        recording.sensor_id = id_;
        channel_->Push(recording);
        readings_pushed_.fetch_add(1, std::memory_order_relaxed);

        absl::MutexLock lock(&mutex_);
        if (mutex_.AwaitWithTimeout(absl::Condition(&stop_requested_), interval)) {
            return;
        }
    }
}

} // namespace Giftchain
