// include/beacon/event.hpp
// Behavioral event value object.

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace beacon {

// A single recorded user interaction: category, method, object, optional value
// and up to 10 string extras.
//
// The orchestrator only routes events. Field content matters to the events
// measurement, which serializes them into the ping.
//
// Example:
//   TelemetryEvent::create("action", "click", "back_button")
//       .extra("source", "toolbar")
//       .queue();
class TelemetryEvent {
public:
    // Throws BeaconError (Validation) on empty or over-long fields.
    static TelemetryEvent create(const std::string& category, const std::string& method,
                                 const std::string& object);
    static TelemetryEvent create(const std::string& category, const std::string& method,
                                 const std::string& object, const std::string& value);

    // Attach an extra. Throws BeaconError (Validation) on a bad key or when
    // the event already holds the maximum number of extras. Values are
    // truncated to 80 characters.
    TelemetryEvent& extra(const std::string& key, const std::string& value);

    // Record this event through the process-wide telemetry instance.
    // Dropped when telemetry is not initialized.
    void queue() const;

    const std::string& category() const noexcept { return category_; }
    const std::string& method() const noexcept { return method_; }
    const std::string& object() const noexcept { return object_; }
    bool has_value() const noexcept { return has_value_; }
    const std::string& value() const noexcept { return value_; }
    const std::map<std::string, std::string>& extras() const noexcept { return extras_; }

    // Milliseconds since process start at creation time.
    uint64_t timestamp() const noexcept { return timestamp_; }

    // [timestamp, category, method, object, value|null, {extras}]
    // The trailing elements are omitted when absent.
    std::string to_json() const;

private:
    TelemetryEvent(uint64_t timestamp, std::string category, std::string method,
                   std::string object);

    uint64_t timestamp_ = 0;
    std::string category_;
    std::string method_;
    std::string object_;
    bool has_value_ = false;
    std::string value_;
    std::map<std::string, std::string> extras_;
};

} // namespace beacon
