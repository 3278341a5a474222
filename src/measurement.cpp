// src/measurement.cpp
// Measurement implementations.

#include "beacon/measurement.hpp"
#include "beacon/json.hpp"
#include "uuid.hpp"

#include <ctime>

namespace beacon {

static std::tm local_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    return tm;
}

// --- EventsMeasurement ---

std::string EventsMeasurement::flush() {
    JsonArray array;
    for (const auto& event : events_) {
        array.push_raw(event.to_json());
    }
    events_.clear();
    return array.str();
}

// --- SessionCountMeasurement ---

std::string SessionCountMeasurement::flush() {
    std::string out;
    json::append_int(out, count_);
    count_ = 0;
    return out;
}

// --- SessionDurationMeasurement ---

SessionDurationMeasurement::SessionDurationMeasurement()
    : SessionDurationMeasurement([] { return std::chrono::steady_clock::now(); }) {}

SessionDurationMeasurement::SessionDurationMeasurement(Clock clock)
    : Measurement("durations"), clock_(std::move(clock)) {}

bool SessionDurationMeasurement::record_session_start() {
    if (running_) return false;
    start_ = clock_();
    running_ = true;
    return true;
}

bool SessionDurationMeasurement::record_session_end() {
    if (!running_) return false;
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(clock_() - start_);
    total_seconds_ += elapsed.count();
    running_ = false;
    return true;
}

std::string SessionDurationMeasurement::flush() {
    std::string out;
    json::append_int(out, total_seconds_);
    total_seconds_ = 0;
    return out;
}

// --- SearchesMeasurement ---

void SearchesMeasurement::record_search(const std::string& location,
                                        const std::string& identifier) {
    ++counts_[identifier + "." + location];
}

int64_t SearchesMeasurement::count(const std::string& location,
                                   const std::string& identifier) const {
    auto it = counts_.find(identifier + "." + location);
    return it == counts_.end() ? 0 : it->second;
}

std::string SearchesMeasurement::flush() {
    JsonObject object;
    for (const auto& [key, count] : counts_) {
        object.add(key, count);
    }
    counts_.clear();
    return object.str();
}

// --- DefaultSearchMeasurement ---

std::string DefaultSearchMeasurement::flush() {
    if (!provider_) return "null";
    std::string identifier = provider_();
    return identifier.empty() ? "null" : json::quote(identifier);
}

// --- ClientIdMeasurement ---

ClientIdMeasurement::ClientIdMeasurement(const std::string& client_id)
    : Measurement("clientId"),
      client_id_(client_id.empty() ? generate_uuid() : client_id) {}

std::string ClientIdMeasurement::flush() {
    return json::quote(client_id_);
}

// --- SequenceMeasurement ---

std::string SequenceMeasurement::flush() {
    std::string out;
    json::append_int(out, next_++);
    return out;
}

// --- ConstantMeasurement ---

std::string ConstantMeasurement::flush() {
    return json::quote(value_);
}

// --- CreatedDateMeasurement ---

std::string CreatedDateMeasurement::flush() {
    std::tm tm = local_now();
    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &tm);
    return json::quote(date);
}

// --- TimezoneOffsetMeasurement ---

std::string TimezoneOffsetMeasurement::flush() {
    std::tm tm = local_now();
    std::string out;
    json::append_int(out, static_cast<int64_t>(tm.tm_gmtoff / 60));
    return out;
}

} // namespace beacon
