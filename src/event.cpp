// src/event.cpp
// TelemetryEvent construction, validation and serialization.

#include "beacon/event.hpp"
#include "beacon/error.hpp"
#include "beacon/json.hpp"
#include "beacon/telemetry.hpp"
#include "validation.hpp"

#include <chrono>

namespace beacon {

static uint64_t elapsed_ms() {
    static const auto process_start = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - process_start
        ).count()
    );
}

TelemetryEvent::TelemetryEvent(uint64_t timestamp, std::string category, std::string method,
                               std::string object)
    : timestamp_(timestamp), category_(std::move(category)), method_(std::move(method)),
      object_(std::move(object)) {}

TelemetryEvent TelemetryEvent::create(const std::string& category, const std::string& method,
                                      const std::string& object) {
    if (!validation::check_category(category)) {
        throw BeaconError::validation("category",
            category.empty() ? "is required" : "must be at most 30 characters");
    }
    if (!validation::check_method(method)) {
        throw BeaconError::validation("method",
            method.empty() ? "is required" : "must be at most 20 characters");
    }
    if (!validation::check_object(object)) {
        throw BeaconError::validation("object",
            object.empty() ? "is required" : "must be at most 20 characters");
    }
    return TelemetryEvent(elapsed_ms(), category, method, object);
}

TelemetryEvent TelemetryEvent::create(const std::string& category, const std::string& method,
                                      const std::string& object, const std::string& value) {
    TelemetryEvent event = create(category, method, object);
    event.has_value_ = true;
    event.value_ = validation::truncate(value, validation::MAX_LENGTH_VALUE);
    return event;
}

TelemetryEvent& TelemetryEvent::extra(const std::string& key, const std::string& value) {
    if (!validation::check_extra_key(key)) {
        throw BeaconError::validation("extra key",
            key.empty() ? "is required" : "must be at most 15 characters");
    }
    if (extras_.size() >= validation::MAX_EXTRA_KEYS && extras_.count(key) == 0) {
        throw BeaconError::validation("extras", "must contain at most 10 keys");
    }
    extras_[key] = validation::truncate(value, validation::MAX_LENGTH_EXTRA_VALUE);
    return *this;
}

void TelemetryEvent::queue() const {
    record(*this);
}

std::string TelemetryEvent::to_json() const {
    JsonArray array;
    array.push(static_cast<int64_t>(timestamp_))
         .push(category_)
         .push(method_)
         .push(object_);

    if (has_value_) {
        array.push(value_);
    } else if (!extras_.empty()) {
        array.push_null();
    }

    if (!extras_.empty()) {
        JsonObject object;
        for (const auto& [key, value] : extras_) {
            object.add(key, value);
        }
        array.push_raw(object.str());
    }

    return array.str();
}

} // namespace beacon
