// bench/hot_path_bench.cpp
// Caller-side cost of the public API: validation, interception and submission.

#include <benchmark/benchmark.h>
#include "bench_common.hpp"

#include <spdlog/spdlog.h>

using namespace beacon;
using namespace beacon_bench;

// Huge threshold so the benchmark measures batching, never promotion.
static std::shared_ptr<Telemetry> start(TelemetryHolder& holder, EventHandler handler = nullptr) {
    spdlog::set_level(spdlog::level::warn);
    auto config = std::make_shared<const BeaconConfig>(bench_config(100000000).build());
    auto telemetry = holder.initialize(config, std::make_shared<NullStorage>(),
                                       std::make_shared<NullClient>(),
                                       std::make_shared<NullScheduler>(), std::move(handler));
    telemetry->add_ping_builder(std::make_shared<MobileEventPingBuilder>(config));
    return telemetry;
}

// --- create ---

static void BM_CreateEvent(benchmark::State& state) {
    for (auto _ : state) {
        auto event = TelemetryEvent::create("action", "click", "browser_menu", "reload");
        benchmark::DoNotOptimize(event);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CreateEvent);

static void BM_CreateEventWithExtras(benchmark::State& state) {
    size_t extras = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        auto event = make_event(extras);
        benchmark::DoNotOptimize(event);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CreateEventWithExtras)->Arg(2)->Arg(10);

// --- record ---

static void BM_Record(benchmark::State& state) {
    TelemetryHolder holder;
    auto telemetry = start(holder);
    auto event = make_event(0);
    for (auto _ : state) {
        telemetry->record(event);
    }
    state.SetItemsProcessed(state.iterations());
    state.PauseTiming();
    holder.shutdown();
    state.ResumeTiming();
}
BENCHMARK(BM_Record);

static void BM_RecordThroughHolder(benchmark::State& state) {
    TelemetryHolder holder;
    start(holder);
    auto event = make_event(2);
    for (auto _ : state) {
        holder.record(event);
    }
    state.SetItemsProcessed(state.iterations());
    state.PauseTiming();
    holder.shutdown();
    state.ResumeTiming();
}
BENCHMARK(BM_RecordThroughHolder);

static void BM_RecordSuppressed(benchmark::State& state) {
    TelemetryHolder holder;
    auto telemetry = start(holder, [](const TelemetryEvent&) {
        return HandlerDecision::Suppress;
    });
    auto event = make_event(2);
    for (auto _ : state) {
        telemetry->record(event);
    }
    state.SetItemsProcessed(state.iterations());
    state.PauseTiming();
    holder.shutdown();
    state.ResumeTiming();
}
BENCHMARK(BM_RecordSuppressed);

// --- record burst ---

static void BM_RecordBurst(benchmark::State& state) {
    int64_t count = state.range(0);
    TelemetryHolder holder;
    auto telemetry = start(holder);
    auto event = make_event(2);
    for (auto _ : state) {
        for (int64_t i = 0; i < count; ++i) {
            telemetry->record(event);
        }
    }
    state.SetItemsProcessed(state.iterations() * count);
    state.PauseTiming();
    holder.shutdown();
    state.ResumeTiming();
}
BENCHMARK(BM_RecordBurst)->Arg(100)->Arg(1000)->Arg(10000);

// --- core operations ---

static void BM_RecordSearch(benchmark::State& state) {
    TelemetryHolder holder;
    auto telemetry = start(holder);
    telemetry->add_ping_builder(std::make_shared<CorePingBuilder>(telemetry->configuration()));
    for (auto _ : state) {
        telemetry->record_search(SearchesMeasurement::LOCATION_ACTIONBAR, "google");
    }
    state.SetItemsProcessed(state.iterations());
    state.PauseTiming();
    holder.shutdown();
    state.ResumeTiming();
}
BENCHMARK(BM_RecordSearch);

BENCHMARK_MAIN();
