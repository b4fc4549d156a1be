#include <gtest/gtest.h>
#include "telemetry/temperature_channel.h"

#include <chrono>
#include <map>
#include <thread>
#include <vector>

using namespace Giftchain;
using namespace std::chrono_literals;

namespace {

Recording Reading(int sensor, int64_t temperature) {
    Recording recording;
    recording.sensor_id = sensor;
    recording.temperature = temperature;
    recording.timestamp = std::chrono::steady_clock::now();
    return recording;
}

} // namespace

TEST(TemperatureChannelTest, EmptyChannel) {
    TemperatureChannel channel;
    EXPECT_TRUE(channel.Empty());
    EXPECT_FALSE(channel.TryPop().has_value());
    EXPECT_TRUE(channel.DrainAll().empty());
}

TEST(TemperatureChannelTest, PopForTimesOutWhenNothingArrives) {
    TemperatureChannel channel;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.PopFor(std::chrono::microseconds(20000)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST(TemperatureChannelTest, PopForWakesOnPush) {
    TemperatureChannel channel;
    std::thread producer([&channel]() {
        std::this_thread::sleep_for(5ms);
        channel.Push(Reading(0, 42));
    });

    auto recording = channel.PopFor(std::chrono::microseconds(2000000));
    producer.join();
    ASSERT_TRUE(recording.has_value());
    EXPECT_EQ(recording->temperature, 42);
}

TEST(TemperatureChannelTest, DrainAllReturnsEverythingQueued) {
    TemperatureChannel channel;
    for (int i = 0; i < 100; ++i) {
        channel.Push(Reading(0, i));
    }
    EXPECT_EQ(channel.Size(), 100u);

    std::vector<Recording> drained = channel.DrainAll();
    ASSERT_EQ(drained.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(drained[i].temperature, i);
    }
    EXPECT_TRUE(channel.Empty());
}

TEST(TemperatureChannelTest, ManyProducersKeepPerProducerOrder) {
    constexpr int kProducers = 8;
    constexpr int kPerProducer = 5000;
    TemperatureChannel channel;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&channel, p]() {
            for (int i = 0; i < kPerProducer; ++i) {
                channel.Push(Reading(p, i));
            }
        });
    }

    // Single consumer draining while producers are still pushing
    std::map<int, int64_t> last_seen;
    size_t received = 0;
    bool ordered = true;
    while (received < static_cast<size_t>(kProducers * kPerProducer)) {
        for (const Recording& r : channel.DrainAll()) {
            auto it = last_seen.find(r.sensor_id);
            if (it != last_seen.end() && r.temperature != it->second + 1) {
                ordered = false;
            }
            last_seen[r.sensor_id] = r.temperature;
            ++received;
        }
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_TRUE(ordered);
    EXPECT_EQ(received, static_cast<size_t>(kProducers * kPerProducer));
    for (int p = 0; p < kProducers; ++p) {
        EXPECT_EQ(last_seen[p], kPerProducer - 1);
    }
}
