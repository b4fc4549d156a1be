#pragma once

#include <cstdint>

namespace Giftchain {

/// Identifier of a present. Valid identifiers live in [1, max_item].
using Item = uint64_t;

/// Presents in the bag for the reference run
constexpr Item kDefaultMaxItem = 500000;
/// Servants draining the bag
constexpr int kDefaultServants = 4;

/// Temperature sensors feeding the monitor
constexpr int kDefaultSensors = 8;
/// Real milliseconds in a simulated minute / hour before speedup
constexpr int64_t kOneMinuteMs = 60000;
constexpr int64_t kOneHourMs = 3600000;
/// Simulated time runs this many times faster than wall-clock time
constexpr int64_t kDefaultSpeedup = 250;
/// Sensor reading range (inclusive)
constexpr int64_t kDefaultMinTemp = -100;
constexpr int64_t kDefaultMaxTemp = 70;
/// Largest-difference search window, in simulated minutes
constexpr int kDefaultWindowMinutes = 10;
/// Readings listed at each end of a report
constexpr int kDefaultTopN = 5;

} // namespace Giftchain
