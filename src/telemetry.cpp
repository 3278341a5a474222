// src/telemetry.cpp
// Telemetry orchestrator and lifecycle holder.

#include "beacon/telemetry.hpp"
#include "event_interception_chain.hpp"
#include "ping_builder_registry.hpp"
#include "task_queue.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <future>

namespace beacon {

struct Telemetry::Inner {
    std::shared_ptr<const BeaconConfig> config;
    std::shared_ptr<Storage> storage;
    std::shared_ptr<Client> client;
    std::shared_ptr<Scheduler> scheduler;
    PingBuilderRegistry registry;
    std::unique_ptr<EventInterceptionChain> chain;
    std::atomic<bool> closed{false};
    // Declared last: joined before anything it runs against is destroyed.
    std::unique_ptr<TaskQueue> queue;

    void ensure_open() const {
        if (closed.load()) {
            throw BeaconError::closed();
        }
    }

    void report_failure(const BeaconError& err) const {
        spdlog::error("[Telemetry] Task failed: {}", err.what());
        const auto& on_error = config->on_error();
        if (!on_error) return;
        try {
            on_error(err);
        } catch (const std::exception& e) {
            spdlog::error("[Telemetry] on_error callback threw: {}", e.what());
        }
    }

    // --- Worker units ---

    // Append to the event builder, promote once the threshold is reached.
    void batch_event(const TelemetryEvent& event) {
        // mobile-event replaced focus-event; prefer it when both are registered.
        auto builder = registry.find(MobileEventPingBuilder::TYPE);
        if (!builder) {
            builder = registry.find(EventPingBuilder::TYPE);
        }
        if (!builder) {
            throw BeaconError::illegal_state(
                "expected a mobile-event or focus-event ping builder to queue events");
        }

        auto events_builder = std::dynamic_pointer_cast<EventsPingBuilderBase>(builder);
        if (!events_builder) {
            throw BeaconError::illegal_state(
                "ping builder '" + builder->type() + "' does not accumulate events");
        }

        auto& measurement = events_builder->events_measurement();
        measurement.add(event);
        if (measurement.count() >= config->max_events_per_ping()) {
            // Collection was checked before this unit was submitted.
            spdlog::debug("[Telemetry] {} events reached, promoting {} ping",
                          measurement.count(), builder->type());
            post_build(builder->type());
        }
    }

    void build_and_store(const std::string& ping_type) {
        auto builder = registry.find(ping_type);
        if (!builder) {
            throw BeaconError::illegal_state("no ping builder registered for '" + ping_type + "'");
        }

        if (!builder->can_build()) {
            // Not enough data collected yet.
            spdlog::debug("[Telemetry] {} ping not ready, skipping", ping_type);
            return;
        }

        Ping ping = builder->build();
        spdlog::debug("[Telemetry] Storing {} ping {}", ping.type, ping.document_id);
        storage->store(ping);
    }

    bool post_build(const std::string& ping_type) {
        return queue->post([this, ping_type] { build_and_store(ping_type); });
    }
};

Telemetry::Telemetry(std::shared_ptr<const BeaconConfig> config,
                     std::shared_ptr<Storage> storage, std::shared_ptr<Client> client,
                     std::shared_ptr<Scheduler> scheduler, EventHandler handler)
    : inner_(std::make_unique<Inner>()) {
    inner_->config = std::move(config);
    inner_->storage = std::move(storage);
    inner_->client = std::move(client);
    inner_->scheduler = std::move(scheduler);
    inner_->chain = std::make_unique<EventInterceptionChain>(
        std::move(handler), [this](const TelemetryEvent& e) { queue_event(e); });
    if (inner_->chain->has_handler()) {
        spdlog::debug("[Telemetry] Application event handler installed");
    }

    Inner* inner = inner_.get();
    inner_->queue = std::make_unique<TaskQueue>(
        [inner](const BeaconError& err) { inner->report_failure(err); });
}

Telemetry::~Telemetry() {
    shutdown();
}

void Telemetry::submit(const char* operation, std::function<void()> unit) {
    if (!inner_->queue->post(std::move(unit))) {
        spdlog::warn("[Telemetry] {} rejected: shutting down", operation);
        throw BeaconError::closed();
    }
}

// --- Ping builders ---

Telemetry& Telemetry::add_ping_builder(std::shared_ptr<PingBuilder> builder) {
    inner_->ensure_open();
    if (!builder) {
        throw BeaconError::configuration("ping builder must not be null");
    }
    spdlog::debug("[Telemetry] Registered {} ping builder", builder->type());
    inner_->registry.add(std::move(builder));
    return *this;
}

std::vector<std::shared_ptr<PingBuilder>> Telemetry::get_builders() const {
    inner_->ensure_open();
    return inner_->registry.snapshot();
}

// --- Events ---

void Telemetry::record(const TelemetryEvent& event) {
    if (inner_->closed.load()) {
        spdlog::debug("[Telemetry] Shut down, dropping event {}.{}",
                      event.category(), event.method());
        return;
    }
    if (inner_->chain->dispatch(event) == HandlerDecision::Suppress) {
        spdlog::debug("[Telemetry] Event {}.{} handled by application",
                      event.category(), event.method());
    }
}

void Telemetry::queue_event(const TelemetryEvent& event) {
    if (!inner_->config->collection_enabled()) {
        spdlog::debug("[Telemetry] Collection disabled, dropping event {}.{}",
                      event.category(), event.method());
        return;
    }

    Inner* inner = inner_.get();
    if (!inner->queue->post([inner, event] { inner->batch_event(event); })) {
        spdlog::debug("[Telemetry] Shut down, dropping event {}.{}",
                      event.category(), event.method());
    }
}

// --- Pings ---

Telemetry& Telemetry::queue_ping(const std::string& ping_type) {
    inner_->ensure_open();
    if (!inner_->config->collection_enabled()) {
        spdlog::debug("[Telemetry] Collection disabled, not queuing {} ping", ping_type);
        return *this;
    }

    if (!inner_->post_build(ping_type)) {
        spdlog::warn("[Telemetry] queuePing rejected: shutting down");
        throw BeaconError::closed();
    }
    return *this;
}

Telemetry& Telemetry::schedule_upload() {
    inner_->ensure_open();
    if (!inner_->config->upload_enabled()) {
        spdlog::debug("[Telemetry] Upload disabled, not scheduling");
        return *this;
    }

    Inner* inner = inner_.get();
    submit("scheduleUpload", [inner] {
        inner->scheduler->schedule_upload(*inner->config);
    });
    return *this;
}

// --- Core ping measurements ---

std::shared_ptr<CorePingBuilder> Telemetry::core_builder(const char* operation) const {
    auto builder = std::dynamic_pointer_cast<CorePingBuilder>(
        inner_->registry.find(CorePingBuilder::TYPE));
    if (!builder) {
        throw BeaconError::illegal_state(
            std::string(operation) + " requires a core ping builder");
    }
    return builder;
}

Telemetry& Telemetry::record_session_start() {
    inner_->ensure_open();
    if (!inner_->config->collection_enabled()) {
        return *this;
    }

    auto builder = core_builder("recordSessionStart");
    submit("recordSessionStart", [builder] {
        if (!builder->session_duration().record_session_start()) {
            spdlog::debug("[Telemetry] Session already started");
        }
        builder->session_count().count_session();
    });
    return *this;
}

Telemetry& Telemetry::record_session_end() {
    inner_->ensure_open();
    if (!inner_->config->collection_enabled()) {
        return *this;
    }

    auto builder = core_builder("recordSessionEnd");
    submit("recordSessionEnd", [builder] {
        if (!builder->session_duration().record_session_end()) {
            spdlog::debug("[Telemetry] Session end without a running session");
        }
    });
    return *this;
}

Telemetry& Telemetry::record_search(const std::string& location,
                                    const std::string& identifier) {
    inner_->ensure_open();
    if (!inner_->config->collection_enabled()) {
        return *this;
    }

    auto builder = core_builder("recordSearch");
    submit("recordSearch", [builder, location, identifier] {
        builder->searches().record_search(location, identifier);
    });
    return *this;
}

Telemetry& Telemetry::set_default_search_provider(DefaultSearchMeasurement::Provider provider) {
    inner_->ensure_open();

    auto builder = core_builder("setDefaultSearchProvider");
    submit("setDefaultSearchProvider", [builder, provider = std::move(provider)]() mutable {
        builder->default_search().set_provider(std::move(provider));
    });
    return *this;
}

// --- Collaborators ---

std::shared_ptr<Client> Telemetry::client() const {
    inner_->ensure_open();
    return inner_->client;
}

std::shared_ptr<Storage> Telemetry::storage() const {
    inner_->ensure_open();
    return inner_->storage;
}

std::shared_ptr<const BeaconConfig> Telemetry::configuration() const {
    inner_->ensure_open();
    return inner_->config;
}

// --- Lifecycle ---

bool Telemetry::flush() {
    if (inner_->closed.load()) {
        return true;
    }
    if (inner_->queue->on_worker_thread()) {
        spdlog::warn("[Telemetry] flush() called from a worker unit, ignoring");
        return false;
    }

    auto timeout = inner_->config->close_timeout();
    auto f = inner_->queue->send_flush();
    if (f.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("[Telemetry] flush timed out after {} ms", timeout.count());
        return false;
    }
    return true;
}

bool Telemetry::is_shut_down() const noexcept {
    return inner_->closed.load();
}

uint64_t Telemetry::executed_tasks() const noexcept {
    return inner_->queue->executed();
}

bool Telemetry::on_worker_thread() const noexcept {
    return inner_->queue->on_worker_thread();
}

void Telemetry::shutdown() {
    // The worker cannot wait for itself to drain.
    if (on_worker_thread()) {
        throw BeaconError::illegal_state("shutdown cannot be called from a telemetry unit");
    }
    bool first = !inner_->closed.exchange(true);
    // Drains everything already submitted, including follow-up promotions.
    inner_->queue->close();
    if (first) {
        inner_->registry.clear();
    }
}

// --- TelemetryHolder ---

TelemetryHolder::~TelemetryHolder() {
    shutdown();
}

std::shared_ptr<Telemetry> TelemetryHolder::initialize(std::shared_ptr<const BeaconConfig> config,
                                                       std::shared_ptr<Storage> storage,
                                                       std::shared_ptr<Client> client,
                                                       std::shared_ptr<Scheduler> scheduler,
                                                       EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == LifecycleState::Initialized) {
        throw BeaconError::already_initialized();
    }
    if (!config) throw BeaconError::configuration("configuration is required");
    if (!storage) throw BeaconError::configuration("storage is required");
    if (!client) throw BeaconError::configuration("client is required");
    if (!scheduler) throw BeaconError::configuration("scheduler is required");

    spdlog::info("[Telemetry] Initializing {} (collection={}, upload={}, maxEventsPerPing={})",
                 config->app_name(), config->collection_enabled(), config->upload_enabled(),
                 config->max_events_per_ping());

    instance_ = std::shared_ptr<Telemetry>(new Telemetry(
        std::move(config), std::move(storage), std::move(client), std::move(scheduler),
        std::move(handler)));
    state_ = LifecycleState::Initialized;
    return instance_;
}

std::shared_ptr<Telemetry> TelemetryHolder::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != LifecycleState::Initialized) {
        throw BeaconError::not_initialized();
    }
    return instance_;
}

void TelemetryHolder::record(const TelemetryEvent& event) const {
    std::shared_ptr<Telemetry> instance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instance = instance_;
    }
    if (instance) {
        instance->record(event);
    }
}

void TelemetryHolder::shutdown() {
    std::shared_ptr<Telemetry> instance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == LifecycleState::Uninitialized) {
            return;
        }
        instance = instance_;
    }
    if (instance->on_worker_thread()) {
        throw BeaconError::illegal_state("shutdown cannot be called from a telemetry unit");
    }

    spdlog::info("[Telemetry] Shutting down, draining queued work");
    instance->shutdown();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (instance_ == instance) {
            instance_.reset();
            state_ = LifecycleState::Uninitialized;
        }
    }
    spdlog::info("[Telemetry] Shutdown complete");
}

LifecycleState TelemetryHolder::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TelemetryHolder& TelemetryHolder::global() {
    // Never destroyed, so a worker still running at exit has a holder.
    static TelemetryHolder* holder = new TelemetryHolder();
    return *holder;
}

// --- Process-wide entry points ---

std::shared_ptr<Telemetry> initialize(std::shared_ptr<const BeaconConfig> config,
                                      std::shared_ptr<Storage> storage,
                                      std::shared_ptr<Client> client,
                                      std::shared_ptr<Scheduler> scheduler,
                                      EventHandler handler) {
    return TelemetryHolder::global().initialize(std::move(config), std::move(storage),
                                                std::move(client), std::move(scheduler),
                                                std::move(handler));
}

std::shared_ptr<Telemetry> get() {
    return TelemetryHolder::global().get();
}

void record(const TelemetryEvent& event) {
    TelemetryHolder::global().record(event);
}

void shutdown() {
    TelemetryHolder::global().shutdown();
}

} // namespace beacon
