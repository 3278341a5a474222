// Beacon: events, sessions, searches and the ping pipeline.
//
//   cmake -B build -DBEACON_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/beacon_events

#include "beacon/beacon.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace {

// Prints each stored ping instead of persisting it.
class LogStorage : public beacon::Storage {
public:
    void store(const beacon::Ping& ping) override {
        spdlog::info("[Storage] {} -> {}", ping.upload_path, ping.payload);
    }
};

// Logs the request it would send.
class LogClient : public beacon::Client {
public:
    bool upload_ping(const beacon::BeaconConfig& config, const std::string& path,
                     const std::string& payload) override {
        spdlog::info("[Client] POST {}{} ({} bytes, User-Agent: {})",
                     config.server_endpoint(), path, payload.size(), config.user_agent());
        return true;
    }
};

class LogScheduler : public beacon::Scheduler {
public:
    void schedule_upload(const beacon::BeaconConfig& config) override {
        spdlog::info("[Scheduler] Upload scheduled for {}", config.app_name());
    }
};

} // namespace

int main() {
    spdlog::set_level(spdlog::level::debug);

    auto config = std::make_shared<const beacon::BeaconConfig>(
        beacon::BeaconConfig::builder("beacon-demo")
            .app_version("1.0")
            .max_events_per_ping(3)
            .minimum_events_for_upload(1)
            .server_endpoint("https://telemetry.example.org")
            .on_error([](const beacon::BeaconError& e) {
                spdlog::warn("[Demo] Async failure: {}", e.what());
            })
            .build());

    // Drop anything the application tags as private.
    auto telemetry = beacon::initialize(
        config, std::make_shared<LogStorage>(), std::make_shared<LogClient>(),
        std::make_shared<LogScheduler>(),
        [](const beacon::TelemetryEvent& e) {
            return e.category() == "private" ? beacon::HandlerDecision::Suppress
                                             : beacon::HandlerDecision::Enqueue;
        });

    telemetry->add_ping_builder(std::make_shared<beacon::CorePingBuilder>(config))
             .add_ping_builder(std::make_shared<beacon::MobileEventPingBuilder>(config));

    telemetry->record_session_start();
    telemetry->record_search(beacon::SearchesMeasurement::LOCATION_ACTIONBAR, "duckduckgo");
    telemetry->set_default_search_provider([] { return std::string("duckduckgo"); });

    // Third event promotes a mobile-event ping.
    beacon::TelemetryEvent::create("action", "click", "back_button").queue();
    beacon::TelemetryEvent::create("action", "type_url", "search_bar")
        .extra("autocomplete", "true")
        .queue();
    beacon::TelemetryEvent::create("private", "open", "vault").queue();
    beacon::TelemetryEvent::create("action", "change", "setting", "dark_mode").queue();

    telemetry->record_session_end();
    telemetry->queue_ping(beacon::CorePingBuilder::TYPE)
             .schedule_upload();

    // Uploading belongs to the scheduled job; run one request by hand.
    auto client = telemetry->client();
    if (!client->upload_ping(*config, "/submit/telemetry/demo", "{}")) {
        spdlog::warn("[Demo] Upload failed");
    }

    // Drains the queue before returning.
    beacon::shutdown();
    return 0;
}
