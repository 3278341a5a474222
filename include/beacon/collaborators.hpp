// include/beacon/collaborators.hpp
// Interfaces of the components the orchestrator delegates to.

#pragma once

#include "config.hpp"
#include "event.hpp"
#include "ping.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace beacon {

// Durable ping storage. store() runs on the worker thread and may throw;
// the failure is reported through BeaconConfig::on_error.
class Storage {
public:
    virtual ~Storage() = default;
    virtual void store(const Ping& ping) = 0;
};

// Network client used by the upload scheduler. The orchestrator only
// exposes it through Telemetry::client().
class Client {
public:
    virtual ~Client() = default;

    // Upload a serialized ping. Returns true when the server accepted it.
    virtual bool upload_ping(const BeaconConfig& config, const std::string& path,
                             const std::string& payload) = 0;
};

// Decides when stored pings get uploaded. Discovers the pings itself.
class Scheduler {
public:
    virtual ~Scheduler() = default;
    virtual void schedule_upload(const BeaconConfig& config) = 0;
};

// Outcome of the application event handler.
enum class HandlerDecision : uint8_t {
    Enqueue  = 0,  // Apply default handling (batch the event)
    Suppress = 1,  // Handler consumed the event
};

// Optional application hook run synchronously on the recording thread.
using EventHandler = std::function<HandlerDecision(const TelemetryEvent&)>;

} // namespace beacon
