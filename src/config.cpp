// src/config.cpp
// Configuration builder and presets.

#include "beacon/config.hpp"
#include "uuid.hpp"

namespace beacon {

// --- BeaconConfig presets ---

BeaconConfigBuilder BeaconConfig::builder(const std::string& app_name) {
    return BeaconConfigBuilder(app_name);
}

BeaconConfig BeaconConfig::production(const std::string& app_name) {
    return BeaconConfig::builder(app_name).build();
}

BeaconConfig BeaconConfig::development(const std::string& app_name) {
    return BeaconConfig::builder(app_name)
        .update_channel("development")
        .max_events_per_ping(10)
        .minimum_events_for_upload(1)
        .close_timeout(std::chrono::milliseconds(1000))
        .build();
}

// --- BeaconConfigBuilder ---

BeaconConfigBuilder::BeaconConfigBuilder(const std::string& app_name) {
    config_.app_name_ = app_name;
}

BeaconConfigBuilder& BeaconConfigBuilder::collection_enabled(bool enabled) {
    config_.collection_enabled_ = enabled;
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::upload_enabled(bool enabled) {
    config_.upload_enabled_ = enabled;
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::max_events_per_ping(size_t count) {
    config_.max_events_per_ping_ = count;
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::minimum_events_for_upload(size_t count) {
    config_.minimum_events_for_upload_ = count;
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::app_version(std::string version) {
    config_.app_version_ = std::move(version);
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::update_channel(std::string channel) {
    config_.update_channel_ = std::move(channel);
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::build_id(std::string build_id) {
    config_.build_id_ = std::move(build_id);
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::client_id(std::string client_id) {
    config_.client_id_ = std::move(client_id);
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::locale(std::string locale) {
    config_.locale_ = std::move(locale);
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::os(std::string os) {
    config_.os_ = std::move(os);
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::server_endpoint(std::string endpoint) {
    config_.server_endpoint_ = std::move(endpoint);
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::user_agent(std::string user_agent) {
    config_.user_agent_ = std::move(user_agent);
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::close_timeout(std::chrono::milliseconds timeout) {
    config_.close_timeout_ = timeout;
    return *this;
}

BeaconConfigBuilder& BeaconConfigBuilder::on_error(BeaconConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

BeaconConfig BeaconConfigBuilder::build() const {
    if (config_.app_name_.empty()) {
        throw BeaconError::configuration("appName is required");
    }
    if (config_.max_events_per_ping_ == 0) {
        throw BeaconError::configuration("maxEventsPerPing must be at least 1");
    }
    BeaconConfig config = config_;
    // One id per configuration: every ping type reports the same client.
    if (config.client_id_.empty()) {
        config.client_id_ = generate_uuid();
    }
    return config;
}

} // namespace beacon
