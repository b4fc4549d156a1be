#include "report.h"

#include <algorithm>
#include <sstream>

#include <glog/logging.h>

namespace Giftchain {

std::optional<TemperatureSwing> FindLargestSwing(const std::vector<Recording>& by_time,
                                                 std::chrono::nanoseconds window) {
    std::optional<TemperatureSwing> result;

    for (size_t i = 0; i < by_time.size(); ++i) {
        const Recording& start = by_time[i];

        for (size_t j = i + 1; j < by_time.size(); ++j) {
            const Recording& end = by_time[j];
            if (end.timestamp - start.timestamp > window) {
                break;
            }

            int64_t diff = end.temperature - start.temperature;
            if (diff < 0) {
                diff = -diff;
            }
            if (!result || diff > result->difference) {
                result = TemperatureSwing{start, end, diff};
            }
        }
    }

    return result;
}

std::optional<Report> BuildReport(std::vector<Recording> recordings,
                                  size_t top_n,
                                  std::chrono::nanoseconds window) {
    if (recordings.empty()) {
        return std::nullopt;
    }

    Report report;
    report.readings = recordings.size();

    std::stable_sort(recordings.begin(), recordings.end(),
                     [](const Recording& a, const Recording& b) {
                         return a.temperature < b.temperature;
                     });

    size_t n = std::min(top_n, recordings.size());
    report.lowest.assign(recordings.begin(), recordings.begin() + n);
    report.highest.assign(recordings.rbegin(), recordings.rbegin() + n);

    std::stable_sort(recordings.begin(), recordings.end(),
                     [](const Recording& a, const Recording& b) {
                         return a.timestamp < b.timestamp;
                     });
    report.largest_swing = FindLargestSwing(recordings, window);

    VLOG(1) << "BuildReport: readings=" << report.readings
            << ", swing=" << (report.largest_swing ? report.largest_swing->difference : 0);
    return report;
}

std::string FormatReport(const Report& report) {
    std::ostringstream out;
    out << "Readings: " << report.readings << "\n";

    out << "Top " << report.lowest.size() << " lowest temps: ";
    for (size_t i = 0; i < report.lowest.size(); ++i) {
        out << (i ? ", " : "") << report.lowest[i].temperature;
    }
    out << "\n";

    out << "Top " << report.highest.size() << " highest temps: ";
    for (size_t i = 0; i < report.highest.size(); ++i) {
        out << (i ? ", " : "") << report.highest[i].temperature;
    }
    out << "\n";

    if (report.largest_swing) {
        const TemperatureSwing& swing = *report.largest_swing;
        auto apart_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            swing.end.timestamp - swing.start.timestamp).count();
        out << "Largest temperature difference: " << swing.difference
            << " (" << swing.start.temperature << " -> " << swing.end.temperature
            << ", " << apart_ms << " ms apart)\n";
    } else {
        out << "Largest temperature difference: n/a\n";
    }

    return out.str();
}

} // namespace Giftchain
