#ifndef GIFTCHAIN_TEMPERATURE_MONITOR_H_
#define GIFTCHAIN_TEMPERATURE_MONITOR_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "common/config.h"
#include "report.h"
#include "sensor.h"
#include "temperature_channel.h"

namespace Giftchain {

struct MonitorOptions {
    int sensors = kDefaultSensors;
    // Simulated time runs this many times faster than wall-clock time
    int64_t speedup = kDefaultSpeedup;
    // Reports to produce before the monitor shuts itself down
    int reports = 1;
    int64_t min_temp = kDefaultMinTemp;
    int64_t max_temp = kDefaultMaxTemp;
    int window_minutes = kDefaultWindowMinutes;
    int top_n = kDefaultTopN;
    uint64_t seed = 0;
};

// Real duration of one simulated minute / hour under the given speedup
std::chrono::microseconds ScaledMinute(int64_t speedup);
std::chrono::microseconds ScaledHour(int64_t speedup);

/**
 * TemperatureMonitor runs the sensors and the single report thread.
 *
 * The report thread waits at most one simulated minute for a reading, drains whatever
 * else is queued, and once per simulated hour turns the collected readings into a
 * Report handed to the callback. After `reports` reports, or an hour without a single
 * reading, it stops the sensors.
 */
class TemperatureMonitor {
public:
    using ReportCallback = std::function<void(const Report&)>;

    TemperatureMonitor(MonitorOptions options, ReportCallback callback);
    ~TemperatureMonitor();

    // Spawn sensors and the report thread
    void Start();
    // Block until the report thread is done, then stop the sensors
    void Wait();
    // Start() + Wait()
    void Run();
    // Ask the report thread to finish early and wait for it
    void Stop();

    int ReportsGenerated() const { return reports_generated_.load(std::memory_order_acquire); }
    uint64_t ReadingsReceived() const { return readings_received_.load(std::memory_order_acquire); }
    std::shared_ptr<TemperatureChannel> Channel() const { return channel_; }

    TemperatureMonitor(const TemperatureMonitor&) = delete;
    TemperatureMonitor& operator=(const TemperatureMonitor&) = delete;

private:
    void ReportThread();
    void StopSensors();

    const MonitorOptions options_;
    ReportCallback callback_;
    std::shared_ptr<TemperatureChannel> channel_;

    std::vector<std::unique_ptr<Sensor>> sensors_;
    std::thread report_thread_;

    std::atomic<bool> stop_{false};
    std::atomic<int> reports_generated_{0};
    std::atomic<uint64_t> readings_received_{0};
};

} // namespace Giftchain

#endif // GIFTCHAIN_TEMPERATURE_MONITOR_H_
