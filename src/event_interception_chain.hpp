// src/event_interception_chain.hpp
// Application handler (may veto) followed by default handling.

#pragma once

#include "beacon/collaborators.hpp"
#include "beacon/event.hpp"

#include <functional>

namespace beacon {

class EventInterceptionChain {
public:
    using DefaultHandling = std::function<void(const TelemetryEvent&)>;

    // handler may be empty: every event then gets default handling.
    EventInterceptionChain(EventHandler handler, DefaultHandling default_handling)
        : handler_(std::move(handler)), default_handling_(std::move(default_handling)) {}

    // Runs on the recording thread. Returns the decision that was applied.
    HandlerDecision dispatch(const TelemetryEvent& event) const {
        HandlerDecision decision = handler_ ? handler_(event) : HandlerDecision::Enqueue;
        if (decision == HandlerDecision::Enqueue) {
            default_handling_(event);
        }
        return decision;
    }

    bool has_handler() const noexcept { return static_cast<bool>(handler_); }

private:
    EventHandler handler_;
    DefaultHandling default_handling_;
};

} // namespace beacon
