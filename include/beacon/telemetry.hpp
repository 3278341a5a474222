// include/beacon/telemetry.hpp
// Telemetry orchestrator and its lifecycle holder.

#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "error.hpp"
#include "event.hpp"
#include "measurement.hpp"
#include "ping_builder.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace beacon {

// The telemetry orchestrator.
//
// Obtained from TelemetryHolder::initialize() (or beacon::initialize()).
// Every public method is callable from any thread. Guard checks run on the
// calling thread; anything touching builders, storage or the scheduler is
// submitted to a single worker and runs strictly in submission order.
// Submission is fire-and-forget: failures inside a unit are logged and
// delivered to BeaconConfig::on_error.
//
// Example:
//   auto telemetry = beacon::initialize(config, storage, client, scheduler);
//   telemetry->add_ping_builder(std::make_shared<MobileEventPingBuilder>(config));
//   TelemetryEvent::create("action", "click", "button").queue();
//   telemetry->queue_ping(MobileEventPingBuilder::TYPE).schedule_upload();
class Telemetry {
public:
    // Drains the worker. Must not run inside a unit: a unit may not hold the
    // last reference to its own Telemetry.
    ~Telemetry();

    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    // --- Ping builders ---

    // Register a builder under its type, replacing any previous one.
    // Visible to every unit submitted afterwards.
    Telemetry& add_ping_builder(std::shared_ptr<PingBuilder> builder);

    std::vector<std::shared_ptr<PingBuilder>> get_builders() const;

    // --- Events ---

    // Run the event through the application handler, then batch it on the
    // worker unless the handler suppressed it. Never throws BeaconError;
    // an exception from the application handler propagates.
    void record(const TelemetryEvent& event);

    // --- Pings ---

    // Build and store a ping of the given type if its builder can build.
    // No-op when collection is disabled.
    Telemetry& queue_ping(const std::string& ping_type);

    // Hand off to the scheduler. No-op when upload is disabled.
    Telemetry& schedule_upload();

    // --- Core ping measurements ---
    // All of these throw BeaconError (IllegalState) without a core builder.

    Telemetry& record_session_start();
    Telemetry& record_session_end();

    // Common locations are listed on SearchesMeasurement.
    Telemetry& record_search(const std::string& location, const std::string& identifier);

    // Applied even when collection is disabled.
    Telemetry& set_default_search_provider(DefaultSearchMeasurement::Provider provider);

    // --- Collaborators ---

    std::shared_ptr<Client> client() const;
    std::shared_ptr<Storage> storage() const;
    std::shared_ptr<const BeaconConfig> configuration() const;

    // --- Lifecycle ---

    // Block until the worker is idle, bounded by close_timeout.
    // Returns false on timeout.
    bool flush();

    bool is_shut_down() const noexcept;

    // Units run by the worker so far.
    uint64_t executed_tasks() const noexcept;

private:
    friend class TelemetryHolder;

    Telemetry(std::shared_ptr<const BeaconConfig> config, std::shared_ptr<Storage> storage,
              std::shared_ptr<Client> client, std::shared_ptr<Scheduler> scheduler,
              EventHandler handler);

    // Stop accepting work, drain the worker, release builders.
    // Throws BeaconError (IllegalState) when called from a unit.
    void shutdown();

    bool on_worker_thread() const noexcept;

    void queue_event(const TelemetryEvent& event);
    std::shared_ptr<CorePingBuilder> core_builder(const char* operation) const;
    void submit(const char* operation, std::function<void()> unit);

    struct Inner;
    std::unique_ptr<Inner> inner_;
};

enum class LifecycleState : uint8_t {
    Uninitialized = 0,
    Initialized   = 1,
};

// Owns at most one Telemetry at a time and guards its lifecycle:
// Uninitialized -> initialize() -> Initialized -> shutdown() -> Uninitialized.
class TelemetryHolder {
public:
    TelemetryHolder() = default;
    ~TelemetryHolder();

    TelemetryHolder(const TelemetryHolder&) = delete;
    TelemetryHolder& operator=(const TelemetryHolder&) = delete;

    // Throws BeaconError: AlreadyInitialized when initialized, Configuration
    // when any argument except handler is null.
    std::shared_ptr<Telemetry> initialize(std::shared_ptr<const BeaconConfig> config,
                                          std::shared_ptr<Storage> storage,
                                          std::shared_ptr<Client> client,
                                          std::shared_ptr<Scheduler> scheduler,
                                          EventHandler handler = nullptr);

    // Throws BeaconError (NotInitialized) when uninitialized.
    std::shared_ptr<Telemetry> get() const;

    // Silently drops the event when uninitialized.
    void record(const TelemetryEvent& event) const;

    // Drain all submitted work, then return to Uninitialized. Handles still
    // held by the application fail with ErrorKind::Closed afterwards.
    // Throws BeaconError (IllegalState) when called from inside a unit, e.g.
    // from Storage::store or Scheduler::schedule_upload; nothing changes.
    void shutdown();

    LifecycleState state() const;

    // Process-wide instance used by the free functions below.
    static TelemetryHolder& global();

private:
    mutable std::mutex mutex_;
    LifecycleState state_ = LifecycleState::Uninitialized;
    std::shared_ptr<Telemetry> instance_;
};

// --- Process-wide entry points (TelemetryHolder::global()) ---

std::shared_ptr<Telemetry> initialize(std::shared_ptr<const BeaconConfig> config,
                                      std::shared_ptr<Storage> storage,
                                      std::shared_ptr<Client> client,
                                      std::shared_ptr<Scheduler> scheduler,
                                      EventHandler handler = nullptr);
std::shared_ptr<Telemetry> get();
void record(const TelemetryEvent& event);
void shutdown();

} // namespace beacon
