// src/task_queue.hpp
// Single worker thread executing units strictly in submission order.

#pragma once

#include "beacon/error.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <variant>

namespace beacon {

using Task = std::function<void()>;

// A queued task. origin is the sequence number of the outside submission it
// descends from: follow-up units posted by a running unit inherit it.
struct Unit {
    Task task;
    uint64_t origin;
};

// Signals carry a per-request completion promise. A flush covers every
// origin up to and including covers.
struct FlushSignal {
    std::shared_ptr<std::promise<void>> completion;
    uint64_t covers;
};
struct CloseSignal {};

// Queue message: exactly one variant active at a time.
using QueueMessage = std::variant<Unit, FlushSignal, CloseSignal>;

// Multi-producer, single-consumer, unbounded FIFO work queue.
//
// A unit that throws does not stop the worker: the exception is handed to
// the failure handler and the next unit runs.
class TaskQueue {
public:
    using FailureHandler = std::function<void(const BeaconError&)>;

    explicit TaskQueue(FailureHandler on_failure);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Submit a unit (non-blocking). Returns false once close() has been
    // called, unless the caller is a unit running on the worker itself.
    bool post(Task task);

    // Completes once every unit submitted before it, and every unit those
    // units submit in turn, has run. Units submitted from other threads
    // afterwards are not waited for.
    std::future<void> send_flush();

    // Stop accepting work, run everything already queued, join the worker.
    // Idempotent.
    void close();

    bool accepting() const noexcept { return accepting_.load(); }
    bool on_worker_thread() const noexcept;
    uint64_t executed() const noexcept { return executed_.load(); }

private:
    void run();
    void execute(Unit& unit);
    void requeue(QueueMessage msg);
    bool has_unfinished_through(uint64_t origin) const;
    bool has_unfinished_tasks() const;
    void release_flushes(std::queue<QueueMessage>& messages);

    FailureHandler on_failure_;
    std::thread thread_;
    std::thread::id worker_id_;

    // Channel
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<QueueMessage> queue_;
    uint64_t last_origin_ = 0;
    std::map<uint64_t, size_t> unfinished_;  // origin -> units queued or running

    // Worker only: origin of the unit being executed.
    uint64_t current_origin_ = 0;

    std::mutex close_mutex_;
    std::atomic<bool> accepting_{true};
    std::atomic<uint64_t> executed_{0};
};

} // namespace beacon
