// src/task_queue.cpp
// Worker thread implementation.

#include "task_queue.hpp"

#include <exception>

namespace beacon {

TaskQueue::TaskQueue(FailureHandler on_failure)
    : on_failure_(std::move(on_failure)) {
    thread_ = std::thread(&TaskQueue::run, this);
    worker_id_ = thread_.get_id();
}

TaskQueue::~TaskQueue() {
    close();
}

bool TaskQueue::on_worker_thread() const noexcept {
    return std::this_thread::get_id() == worker_id_;
}

bool TaskQueue::post(Task task) {
    bool was_empty;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Units keep submitting follow-up work while the queue drains on close.
        if (!accepting_.load() && !on_worker_thread()) {
            return false;
        }
        // Follow-up units inherit the origin of the unit posting them.
        uint64_t origin = on_worker_thread() ? current_origin_ : ++last_origin_;
        was_empty = queue_.empty();
        queue_.push(Unit{std::move(task), origin});
        ++unfinished_[origin];
    }
    // Only wake the worker if it's likely sleeping (queue was empty)
    if (was_empty) {
        cv_.notify_one();
    }
    return true;
}

std::future<void> TaskQueue::send_flush() {
    auto p = std::make_shared<std::promise<void>>();
    auto f = p->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_.load()) {
            // Worker may already be gone: nothing left to wait for.
            p->set_value();
            return f;
        }
        queue_.push(FlushSignal{std::move(p), last_origin_});
    }
    cv_.notify_one();
    return f;
}

void TaskQueue::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accepting_.exchange(false)) {
            queue_.push(CloseSignal{});
            cv_.notify_one();
        }
    }
    if (thread_.joinable() && !on_worker_thread()) {
        thread_.join();
    }
}

void TaskQueue::requeue(QueueMessage msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(msg));
}

bool TaskQueue::has_unfinished_through(uint64_t origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !unfinished_.empty() && unfinished_.begin()->first <= origin;
}

bool TaskQueue::has_unfinished_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !unfinished_.empty();
}

void TaskQueue::release_flushes(std::queue<QueueMessage>& messages) {
    while (!messages.empty()) {
        if (auto* fs = std::get_if<FlushSignal>(&messages.front())) {
            if (fs->completion) fs->completion->set_value();
        }
        messages.pop();
    }
}

void TaskQueue::execute(Unit& unit) {
    current_origin_ = unit.origin;
    try {
        unit.task();
    } catch (const BeaconError& e) {
        if (on_failure_) on_failure_(e);
    } catch (const std::exception& e) {
        if (on_failure_) on_failure_(BeaconError::task(e.what()));
    } catch (...) {
        if (on_failure_) on_failure_(BeaconError::task("unknown exception"));
    }
    executed_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = unfinished_.find(unit.origin);
    if (--it->second == 0) {
        unfinished_.erase(it);
    }
}

void TaskQueue::run() {
    for (;;) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty(); });

        // Drain all pending messages
        std::queue<QueueMessage> local_queue;
        std::swap(local_queue, queue_);
        lock.unlock();

        while (!local_queue.empty()) {
            auto& msg = local_queue.front();
            if (auto* unit = std::get_if<Unit>(&msg)) {
                execute(*unit);
            } else if (auto* fs = std::get_if<FlushSignal>(&msg)) {
                // Work submitted by earlier units sits behind us: go again.
                if (has_unfinished_through(fs->covers)) {
                    requeue(std::move(*fs));
                } else if (fs->completion) {
                    fs->completion->set_value();
                }
            } else if (std::holds_alternative<CloseSignal>(msg)) {
                if (has_unfinished_tasks()) {
                    requeue(CloseSignal{});
                } else {
                    // Only signals can remain; nothing will be submitted again.
                    local_queue.pop();
                    release_flushes(local_queue);
                    std::lock_guard<std::mutex> guard(mutex_);
                    release_flushes(queue_);
                    return;
                }
            }
            local_queue.pop();
        }
    }
}

} // namespace beacon
