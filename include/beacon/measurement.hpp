// include/beacon/measurement.hpp
// Stateful accumulators owned by ping builders.
//
// Measurements are not thread-safe. Once their builder is registered, they
// are touched only by units running on the telemetry worker.

#pragma once

#include "event.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace beacon {

class Measurement {
public:
    explicit Measurement(std::string field_name) : field_name_(std::move(field_name)) {}
    virtual ~Measurement() = default;

    // Key of this measurement in the ping payload.
    const std::string& field_name() const noexcept { return field_name_; }

    // Serialized JSON value for the next ping. Accumulating measurements
    // reset themselves.
    virtual std::string flush() = 0;

private:
    std::string field_name_;
};

// Accumulated events, flushed as an array of event arrays.
class EventsMeasurement : public Measurement {
public:
    EventsMeasurement() : Measurement("events") {}

    void add(const TelemetryEvent& event) { events_.push_back(event); }
    size_t count() const noexcept { return events_.size(); }

    // Resets the count to 0.
    std::string flush() override;

private:
    std::vector<TelemetryEvent> events_;
};

class SessionCountMeasurement : public Measurement {
public:
    SessionCountMeasurement() : Measurement("sessions") {}

    void count_session() { ++count_; }
    int64_t count() const noexcept { return count_; }
    std::string flush() override;

private:
    int64_t count_ = 0;
};

// Sum of whole seconds spent in completed sessions.
class SessionDurationMeasurement : public Measurement {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    SessionDurationMeasurement();
    explicit SessionDurationMeasurement(Clock clock);

    // Returns false (and changes nothing) if a session is already running.
    bool record_session_start();
    // Returns false (and changes nothing) if no session is running.
    bool record_session_end();

    bool session_running() const noexcept { return running_; }
    int64_t total_seconds() const noexcept { return total_seconds_; }
    std::string flush() override;

private:
    Clock clock_;
    std::chrono::steady_clock::time_point start_;
    bool running_ = false;
    int64_t total_seconds_ = 0;
};

// Search counts keyed by "<identifier>.<location>".
class SearchesMeasurement : public Measurement {
public:
    // Common locations: "actionbar", "listitem", "suggestion".
    static constexpr const char* LOCATION_ACTIONBAR  = "actionbar";
    static constexpr const char* LOCATION_LISTITEM   = "listitem";
    static constexpr const char* LOCATION_SUGGESTION = "suggestion";

    SearchesMeasurement() : Measurement("searches") {}

    void record_search(const std::string& location, const std::string& identifier);
    int64_t count(const std::string& location, const std::string& identifier) const;
    std::string flush() override;

private:
    std::map<std::string, int64_t> counts_;
};

class DefaultSearchMeasurement : public Measurement {
public:
    // Returns the identifier of the current default search engine.
    using Provider = std::function<std::string()>;

    DefaultSearchMeasurement() : Measurement("defaultSearch") {}

    void set_provider(Provider provider) { provider_ = std::move(provider); }
    bool has_provider() const noexcept { return static_cast<bool>(provider_); }

    // JSON null without a provider or when the provider returns "".
    std::string flush() override;

private:
    Provider provider_;
};

class ClientIdMeasurement : public Measurement {
public:
    // Empty client_id means a random v4 UUID, fixed for this measurement.
    explicit ClientIdMeasurement(const std::string& client_id);

    const std::string& client_id() const noexcept { return client_id_; }
    std::string flush() override;

private:
    std::string client_id_;
};

// Ping sequence number: 0 for the first ping, then +1 per flush.
class SequenceMeasurement : public Measurement {
public:
    SequenceMeasurement() : Measurement("seq") {}
    std::string flush() override;

private:
    int64_t next_ = 0;
};

// Fixed string value, e.g. locale or os.
class ConstantMeasurement : public Measurement {
public:
    ConstantMeasurement(std::string field_name, std::string value)
        : Measurement(std::move(field_name)), value_(std::move(value)) {}
    std::string flush() override;

private:
    std::string value_;
};

// Local date of the flush, "YYYY-MM-DD".
class CreatedDateMeasurement : public Measurement {
public:
    CreatedDateMeasurement() : Measurement("created") {}
    std::string flush() override;
};

// Local UTC offset in minutes at flush time.
class TimezoneOffsetMeasurement : public Measurement {
public:
    TimezoneOffsetMeasurement() : Measurement("tz") {}
    std::string flush() override;
};

} // namespace beacon
