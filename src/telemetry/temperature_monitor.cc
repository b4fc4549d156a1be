#include "temperature_monitor.h"

#include <glog/logging.h>

namespace Giftchain {

std::chrono::microseconds ScaledMinute(int64_t speedup) {
    CHECK_GE(speedup, 1) << "Speedup must be at least 1";
    return std::chrono::microseconds(kOneMinuteMs * 1000 / speedup);
}

std::chrono::microseconds ScaledHour(int64_t speedup) {
    CHECK_GE(speedup, 1) << "Speedup must be at least 1";
    return std::chrono::microseconds(kOneHourMs * 1000 / speedup);
}

TemperatureMonitor::TemperatureMonitor(MonitorOptions options, ReportCallback callback)
    : options_(options),
      callback_(std::move(callback)),
      channel_(std::make_shared<TemperatureChannel>()) {
    CHECK_GE(options_.sensors, 1) << "Monitor needs at least one sensor";
    CHECK_GE(options_.reports, 1) << "Monitor needs to produce at least one report";
    CHECK_GE(options_.top_n, 1) << "Reports list at least one reading per end";
    CHECK_GE(options_.window_minutes, 1) << "Swing window must be at least one minute";
}

TemperatureMonitor::~TemperatureMonitor() {
    Stop();
}

void TemperatureMonitor::Start() {
    CHECK(!report_thread_.joinable()) << "TemperatureMonitor already started";

    SensorOptions sensor_options;
    sensor_options.interval = ScaledMinute(options_.speedup);
    sensor_options.min_temp = options_.min_temp;
    sensor_options.max_temp = options_.max_temp;
    sensor_options.seed = options_.seed;

    for (int i = 0; i < options_.sensors; ++i) {
        sensors_.push_back(std::make_unique<Sensor>(i, channel_, sensor_options));
        sensors_.back()->Start();
    }
    LOG(INFO) << "The sensor threads have been created and are pushing readings onto the channel ("
              << options_.sensors << " sensors, minute=" << sensor_options.interval.count() << " us)";

    report_thread_ = std::thread(&TemperatureMonitor::ReportThread, this);
    LOG(INFO) << "The report thread has been created and is processing readings from the channel";
}

void TemperatureMonitor::Wait() {
    if (report_thread_.joinable()) {
        report_thread_.join();
    }
    StopSensors();
}

void TemperatureMonitor::Run() {
    Start();
    Wait();
}

void TemperatureMonitor::Stop() {
    stop_.store(true, std::memory_order_release);
    Wait();
}

void TemperatureMonitor::StopSensors() {
    for (auto& sensor : sensors_) {
        sensor->Stop();
    }
}

void TemperatureMonitor::ReportThread() {
    const auto minute = ScaledMinute(options_.speedup);
    const auto hour = ScaledHour(options_.speedup);
    const std::chrono::nanoseconds window = minute * options_.window_minutes;

    std::vector<Recording> pending;
    auto next_report_at = std::chrono::steady_clock::now() + hour;

    while (!stop_.load(std::memory_order_acquire) &&
           reports_generated_.load(std::memory_order_relaxed) < options_.reports) {
        if (std::chrono::steady_clock::now() >= next_report_at) {
            std::optional<Report> report = BuildReport(std::move(pending), options_.top_n, window);
            pending.clear();

            if (!report) {
                LOG(WARNING) << "No readings available to compare, report thread returning";
                return;
            }

            reports_generated_.fetch_add(1, std::memory_order_release);
            LOG(INFO) << "A new report has been generated (" << report->readings << " readings)";
            if (callback_) {
                callback_(*report);
            }
            next_report_at = std::chrono::steady_clock::now() + hour;
            continue;
        }

        // Never wait longer than a minute so the hour boundary is noticed on time
        std::optional<Recording> recording = channel_->PopFor(minute);
        if (!recording) {
            continue;
        }
        pending.push_back(*recording);
        std::vector<Recording> rest = channel_->DrainAll();
        pending.insert(pending.end(), rest.begin(), rest.end());
        readings_received_.fetch_add(1 + rest.size(), std::memory_order_release);
    }
}

} // namespace Giftchain
