// include/beacon/ping_builder.hpp
// Ping builders: named units that assemble measurements into a Ping.

#pragma once

#include "config.hpp"
#include "measurement.hpp"
#include "ping.hpp"

#include <memory>
#include <string>
#include <vector>

namespace beacon {

// Base class for every ping type.
//
// build() writes {"v":<version>, <field>:<value>...} with one field per
// added measurement, in the order they were added, and flushes each of them.
class PingBuilder {
public:
    // Throws BeaconError (Configuration) when config is null or type empty.
    PingBuilder(std::shared_ptr<const BeaconConfig> config, std::string type, int version);
    virtual ~PingBuilder() = default;

    PingBuilder(const PingBuilder&) = delete;
    PingBuilder& operator=(const PingBuilder&) = delete;

    const std::string& type() const noexcept { return type_; }
    int version() const noexcept { return version_; }

    // Whether enough data has been collected. No side effects.
    virtual bool can_build() const { return true; }

    // Only call when can_build() is true.
    virtual Ping build();

protected:
    void add_measurement(std::shared_ptr<Measurement> measurement);
    const BeaconConfig& config() const noexcept { return *config_; }

private:
    std::string upload_path(const std::string& document_id) const;

    std::shared_ptr<const BeaconConfig> config_;
    std::string type_;
    int version_;
    std::vector<std::shared_ptr<Measurement>> measurements_;
};

// Session, search and environment summary.
class CorePingBuilder : public PingBuilder {
public:
    static constexpr const char* TYPE = "core";
    static constexpr int VERSION = 7;

    explicit CorePingBuilder(std::shared_ptr<const BeaconConfig> config);

    SessionCountMeasurement& session_count() noexcept { return *session_count_; }
    SessionDurationMeasurement& session_duration() noexcept { return *session_duration_; }
    SearchesMeasurement& searches() noexcept { return *searches_; }
    DefaultSearchMeasurement& default_search() noexcept { return *default_search_; }

private:
    std::shared_ptr<SessionCountMeasurement> session_count_;
    std::shared_ptr<SessionDurationMeasurement> session_duration_;
    std::shared_ptr<SearchesMeasurement> searches_;
    std::shared_ptr<DefaultSearchMeasurement> default_search_;
};

// Common base of the builders that accumulate recorded events.
// Buildable once minimum_events_for_upload events are held.
class EventsPingBuilderBase : public PingBuilder {
public:
    EventsMeasurement& events_measurement() noexcept { return *events_; }
    const EventsMeasurement& events_measurement() const noexcept { return *events_; }

    bool can_build() const override;

protected:
    EventsPingBuilderBase(std::shared_ptr<const BeaconConfig> config, std::string type, int version);

private:
    std::shared_ptr<EventsMeasurement> events_;
};

// Legacy event ping.
class EventPingBuilder : public EventsPingBuilderBase {
public:
    static constexpr const char* TYPE = "focus-event";
    static constexpr int VERSION = 1;

    explicit EventPingBuilder(std::shared_ptr<const BeaconConfig> config);
};

class MobileEventPingBuilder : public EventsPingBuilderBase {
public:
    static constexpr const char* TYPE = "mobile-event";
    static constexpr int VERSION = 1;

    explicit MobileEventPingBuilder(std::shared_ptr<const BeaconConfig> config);
};

} // namespace beacon
