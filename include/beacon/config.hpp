// include/beacon/config.hpp
// Immutable per-session configuration with builder pattern.

#pragma once

#include "error.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace beacon {

class BeaconConfigBuilder;

// Configuration shared by the core and every ping builder.
//
// Read-only after build(). Held as std::shared_ptr<const BeaconConfig>.
class BeaconConfig {
public:
    // Receives failures of asynchronous units (storage, scheduler,
    // missing builders). Called on the worker thread.
    using ErrorCallback = std::function<void(const BeaconError&)>;

    static BeaconConfigBuilder builder(const std::string& app_name);

    static BeaconConfig production(const std::string& app_name);
    static BeaconConfig development(const std::string& app_name);

    bool collection_enabled() const noexcept { return collection_enabled_; }
    bool upload_enabled() const noexcept { return upload_enabled_; }
    size_t max_events_per_ping() const noexcept { return max_events_per_ping_; }
    size_t minimum_events_for_upload() const noexcept { return minimum_events_for_upload_; }

    const std::string& app_name() const noexcept { return app_name_; }
    const std::string& app_version() const noexcept { return app_version_; }
    const std::string& update_channel() const noexcept { return update_channel_; }
    const std::string& build_id() const noexcept { return build_id_; }
    const std::string& client_id() const noexcept { return client_id_; }
    const std::string& locale() const noexcept { return locale_; }
    const std::string& os() const noexcept { return os_; }
    const std::string& server_endpoint() const noexcept { return server_endpoint_; }
    const std::string& user_agent() const noexcept { return user_agent_; }
    std::chrono::milliseconds close_timeout() const noexcept { return close_timeout_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }

private:
    friend class BeaconConfigBuilder;

    bool collection_enabled_ = true;
    bool upload_enabled_ = true;
    size_t max_events_per_ping_ = 500;
    size_t minimum_events_for_upload_ = 3;

    std::string app_name_;
    std::string app_version_ = "unknown";
    std::string update_channel_ = "unknown";
    std::string build_id_ = "unknown";
    std::string client_id_;
    std::string locale_ = "en-US";
    std::string os_ = "Linux";
    std::string server_endpoint_ = "https://localhost:8443";
    std::string user_agent_ = "beacon/1.0";
    std::chrono::milliseconds close_timeout_{5000};
    ErrorCallback on_error_;
};

// Fluent builder for BeaconConfig.
class BeaconConfigBuilder {
public:
    explicit BeaconConfigBuilder(const std::string& app_name);

    BeaconConfigBuilder& collection_enabled(bool enabled);
    BeaconConfigBuilder& upload_enabled(bool enabled);
    BeaconConfigBuilder& max_events_per_ping(size_t count);
    BeaconConfigBuilder& minimum_events_for_upload(size_t count);
    BeaconConfigBuilder& app_version(std::string version);
    BeaconConfigBuilder& update_channel(std::string channel);
    BeaconConfigBuilder& build_id(std::string build_id);
    // Left empty, build() generates a random v4 UUID.
    BeaconConfigBuilder& client_id(std::string client_id);
    BeaconConfigBuilder& locale(std::string locale);
    BeaconConfigBuilder& os(std::string os);
    BeaconConfigBuilder& server_endpoint(std::string endpoint);
    BeaconConfigBuilder& user_agent(std::string user_agent);
    BeaconConfigBuilder& close_timeout(std::chrono::milliseconds timeout);
    BeaconConfigBuilder& on_error(BeaconConfig::ErrorCallback callback);

    // Build the config. Throws BeaconError on an empty app name or a zero
    // event threshold.
    BeaconConfig build() const;

private:
    BeaconConfig config_;
};

} // namespace beacon
