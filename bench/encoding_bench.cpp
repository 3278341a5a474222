// bench/encoding_bench.cpp
// Payload serialization: single events and whole event pings.

#include <benchmark/benchmark.h>
#include "bench_common.hpp"

#include <string>

using namespace beacon;
using namespace beacon_bench;

// --- event to_json ---

static void BM_EventToJson(benchmark::State& state) {
    size_t scenario_idx = static_cast<size_t>(state.range(0));
    const auto& scenario = SCENARIOS[scenario_idx];
    auto event = make_event(scenario.extras_per_event);

    size_t bytes = 0;
    for (auto _ : state) {
        std::string json = event.to_json();
        bytes += json.size();
        benchmark::DoNotOptimize(json.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
    state.SetLabel(scenario.name);
}
BENCHMARK(BM_EventToJson)->DenseRange(0, SCENARIO_COUNT - 1);

// --- events ping build ---

static void BM_BuildEventPing(benchmark::State& state) {
    size_t scenario_idx = static_cast<size_t>(state.range(0));
    const auto& scenario = SCENARIOS[scenario_idx];
    auto config = std::make_shared<const BeaconConfig>(bench_config(100000).build());
    MobileEventPingBuilder builder(config);
    auto event = make_event(scenario.extras_per_event);

    size_t bytes = 0;
    for (auto _ : state) {
        state.PauseTiming();
        for (size_t i = 0; i < scenario.events_per_ping; i++) {
            builder.events_measurement().add(event);
        }
        state.ResumeTiming();

        Ping ping = builder.build();
        bytes += ping.payload.size();
        benchmark::DoNotOptimize(ping.payload.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
    state.SetItemsProcessed(state.iterations() *
                            static_cast<int64_t>(scenario.events_per_ping));
    state.SetLabel(scenario.name);
}
BENCHMARK(BM_BuildEventPing)->DenseRange(0, SCENARIO_COUNT - 1);

// --- core ping build ---

static void BM_BuildCorePing(benchmark::State& state) {
    auto config = std::make_shared<const BeaconConfig>(bench_config(100).build());
    CorePingBuilder builder(config);
    builder.default_search().set_provider([] { return std::string("google"); });

    for (auto _ : state) {
        builder.session_count().count_session();
        builder.searches().record_search(SearchesMeasurement::LOCATION_ACTIONBAR, "google");
        builder.searches().record_search(SearchesMeasurement::LOCATION_SUGGESTION, "bing");
        Ping ping = builder.build();
        benchmark::DoNotOptimize(ping.payload.data());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildCorePing);

// --- string escaping ---

static void BM_AppendEscaped(benchmark::State& state) {
    std::string clean(static_cast<size_t>(state.range(0)), 'x');
    std::string out;
    for (auto _ : state) {
        out.clear();
        json::append_string(out, clean);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AppendEscaped)->Arg(16)->Arg(80)->Arg(1024);

BENCHMARK_MAIN();
