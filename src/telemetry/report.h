#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "temperature_channel.h"

namespace Giftchain {

// Pair of readings with the largest absolute temperature difference inside the window
struct TemperatureSwing {
    Recording start;
    Recording end;
    int64_t difference = 0;
};

struct Report {
    // Ascending, at most top_n entries. Equal temperatures may repeat.
    std::vector<Recording> lowest;
    // Descending, at most top_n entries
    std::vector<Recording> highest;
    // Empty when fewer than two readings fall inside one window
    std::optional<TemperatureSwing> largest_swing;
    size_t readings = 0;
};

/**
 * Scan readings ordered by timestamp. Only pairs at most `window` apart are compared;
 * on a tie the earliest pair found wins.
 */
std::optional<TemperatureSwing> FindLargestSwing(const std::vector<Recording>& by_time,
                                                 std::chrono::nanoseconds window);

/**
 * Build the hourly report from the readings collected during the hour.
 * @return std::nullopt if there are no readings
 */
std::optional<Report> BuildReport(std::vector<Recording> recordings,
                                  size_t top_n,
                                  std::chrono::nanoseconds window);

// Human-readable multi-line rendering for the CLI
std::string FormatReport(const Report& report);

} // namespace Giftchain
