// include/beacon/error.hpp
// Single error class with kind enum, shared by sync guards and worker units.

#pragma once

#include <stdexcept>
#include <string>

namespace beacon {

enum class ErrorKind {
    Configuration,       // Invalid config or null collaborator
    Validation,          // Bad event field
    AlreadyInitialized,  // initialize() twice without shutdown()
    NotInitialized,      // get() while uninitialized
    IllegalState,        // Required ping builder not registered
    Closed,              // Stale handle used after shutdown()
    Task                 // Collaborator failure inside a worker unit
};

class BeaconError : public std::exception {
public:
    BeaconError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    BeaconError(ErrorKind kind, const std::string& field, const std::string& reason)
        : kind_(kind), message_("validation error: " + field + " " + reason),
          field_(field), reason_(reason) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& field() const noexcept { return field_; }
    const std::string& reason() const noexcept { return reason_; }

    static BeaconError configuration(std::string msg) {
        return BeaconError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static BeaconError validation(std::string field, std::string reason) {
        return BeaconError(ErrorKind::Validation, field, reason);
    }

    static BeaconError already_initialized() {
        return BeaconError(ErrorKind::AlreadyInitialized,
                           "telemetry can only be initialized once");
    }

    static BeaconError not_initialized() {
        return BeaconError(ErrorKind::NotInitialized, "telemetry is not initialized");
    }

    static BeaconError illegal_state(std::string msg) {
        return BeaconError(ErrorKind::IllegalState, "illegal state: " + msg);
    }

    static BeaconError closed() {
        return BeaconError(ErrorKind::Closed, "telemetry has been shut down");
    }

    static BeaconError task(std::string msg) {
        return BeaconError(ErrorKind::Task, "task failed: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string field_;
    std::string reason_;
};

} // namespace beacon
