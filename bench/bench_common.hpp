// bench/bench_common.hpp
// Shared benchmark scenarios and no-op collaborators.

#pragma once

#include "beacon/beacon.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

namespace beacon_bench {

struct BenchScenario {
    const char* name;
    size_t events_per_ping;
    size_t extras_per_event;
};

constexpr BenchScenario SCENARIOS[] = {
    {"small_ping", 10, 0},
    {"typical", 100, 2},
    {"full_ping", 500, 2},
    {"heavy_extras", 100, 10},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// Event carrying the given number of extras (at most 10).
inline beacon::TelemetryEvent make_event(size_t extras) {
    auto event = beacon::TelemetryEvent::create("action", "click", "browser_menu", "reload");
    for (size_t i = 0; i < extras; i++) {
        event.extra("key" + std::to_string(i), "value_for_benchmark_" + std::to_string(i));
    }
    return event;
}

// Counts stored pings and bytes, discards the payloads.
class NullStorage : public beacon::Storage {
public:
    void store(const beacon::Ping& ping) override {
        pings.fetch_add(1, std::memory_order_relaxed);
        bytes.fetch_add(ping.payload.size(), std::memory_order_relaxed);
    }

    std::atomic<size_t> pings{0};
    std::atomic<size_t> bytes{0};
};

class NullClient : public beacon::Client {
public:
    bool upload_ping(const beacon::BeaconConfig&, const std::string&,
                     const std::string&) override {
        return true;
    }
};

class NullScheduler : public beacon::Scheduler {
public:
    void schedule_upload(const beacon::BeaconConfig&) override {}
};

inline beacon::BeaconConfigBuilder bench_config(size_t max_events_per_ping) {
    return beacon::BeaconConfig::builder("beacon-bench")
        .app_version("1.0")
        .client_id("00000000-0000-4000-8000-000000000000")
        .max_events_per_ping(max_events_per_ping)
        .minimum_events_for_upload(1)
        .close_timeout(std::chrono::milliseconds(60000));
}

} // namespace beacon_bench
