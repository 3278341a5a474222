// src/ping_builder.cpp
// Ping assembly and the concrete builders.

#include "beacon/ping_builder.hpp"
#include "beacon/error.hpp"
#include "beacon/json.hpp"
#include "uuid.hpp"

#include <functional>

namespace beacon {

// Shared identification fields, in payload order.
static void add_environment(const BeaconConfig& config,
                            const std::function<void(std::shared_ptr<Measurement>)>& add) {
    add(std::make_shared<ClientIdMeasurement>(config.client_id()));
    add(std::make_shared<SequenceMeasurement>());
    add(std::make_shared<ConstantMeasurement>("locale", config.locale()));
    add(std::make_shared<ConstantMeasurement>("os", config.os()));
    add(std::make_shared<CreatedDateMeasurement>());
    add(std::make_shared<TimezoneOffsetMeasurement>());
}

// --- PingBuilder ---

PingBuilder::PingBuilder(std::shared_ptr<const BeaconConfig> config, std::string type,
                         int version)
    : config_(std::move(config)), type_(std::move(type)), version_(version) {
    if (!config_) {
        throw BeaconError::configuration("ping builder requires a configuration");
    }
    if (type_.empty()) {
        throw BeaconError::configuration("ping type is required");
    }
}

void PingBuilder::add_measurement(std::shared_ptr<Measurement> measurement) {
    measurements_.push_back(std::move(measurement));
}

std::string PingBuilder::upload_path(const std::string& document_id) const {
    return "/submit/telemetry/" + document_id + "/" + type_ + "/" + config_->app_name()
        + "/" + config_->app_version() + "/" + config_->update_channel()
        + "/" + config_->build_id();
}

Ping PingBuilder::build() {
    JsonObject payload;
    payload.add("v", version_);
    for (const auto& measurement : measurements_) {
        payload.add_raw(measurement->field_name(), measurement->flush());
    }

    Ping ping;
    ping.type = type_;
    ping.document_id = generate_uuid();
    ping.upload_path = upload_path(ping.document_id);
    ping.payload = payload.str();
    return ping;
}

// --- CorePingBuilder ---

CorePingBuilder::CorePingBuilder(std::shared_ptr<const BeaconConfig> config)
    : PingBuilder(std::move(config), TYPE, VERSION),
      session_count_(std::make_shared<SessionCountMeasurement>()),
      session_duration_(std::make_shared<SessionDurationMeasurement>()),
      searches_(std::make_shared<SearchesMeasurement>()),
      default_search_(std::make_shared<DefaultSearchMeasurement>()) {
    add_environment(this->config(), [this](std::shared_ptr<Measurement> m) {
        add_measurement(std::move(m));
    });
    add_measurement(session_count_);
    add_measurement(session_duration_);
    add_measurement(searches_);
    add_measurement(default_search_);
}

// --- EventsPingBuilderBase ---

EventsPingBuilderBase::EventsPingBuilderBase(std::shared_ptr<const BeaconConfig> config,
                                             std::string type, int version)
    : PingBuilder(std::move(config), std::move(type), version),
      events_(std::make_shared<EventsMeasurement>()) {
    add_environment(this->config(), [this](std::shared_ptr<Measurement> m) {
        add_measurement(std::move(m));
    });
    add_measurement(events_);
}

bool EventsPingBuilderBase::can_build() const {
    return events_->count() >= config().minimum_events_for_upload();
}

// --- Event ping types ---

EventPingBuilder::EventPingBuilder(std::shared_ptr<const BeaconConfig> config)
    : EventsPingBuilderBase(std::move(config), TYPE, VERSION) {}

MobileEventPingBuilder::MobileEventPingBuilder(std::shared_ptr<const BeaconConfig> config)
    : EventsPingBuilderBase(std::move(config), TYPE, VERSION) {}

} // namespace beacon
