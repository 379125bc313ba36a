#include <carlink/core/event.hpp>
#include <carlink/core/logger.hpp>

namespace carlink::core {

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;

    running_ = true;
    stop_requested_ = false;
    worker_ = std::thread(&EventLoop::run, this);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }

    cv_.notify_one();

    // stop() dari dalam task: worker akan keluar sendiri, join dilakukan nanti
    if (worker_.get_id() == std::this_thread::get_id()) {
        return;
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_queue_.push(std::move(task));
    }
    cv_.notify_one();
}

TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        auto due = Clock::now() + delay;
        timers_.emplace(id, Timer{due, std::move(task)});
        deadlines_.emplace(due, id);
    }
    // Bangunkan worker supaya deadline baru ikut diperhitungkan
    cv_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }

    auto [first, last] = deadlines_.equal_range(it->second.due);
    for (auto d = first; d != last; ++d) {
        if (d->second == id) {
            deadlines_.erase(d);
            break;
        }
    }
    timers_.erase(it);
    return true;
}

std::size_t EventLoop::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

std::int64_t EventLoop::nowMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool EventLoop::processOne() {
    std::unique_lock<std::mutex> lock(mutex_);

    promoteDueTimers(Clock::now());
    if (task_queue_.empty()) {
        return false;
    }

    Task task = std::move(task_queue_.front());
    task_queue_.pop();

    // Proses task di luar lock
    lock.unlock();
    runTask(task);
    return true;
}

void EventLoop::processAll() {
    while (processOne()) {}
}

std::size_t EventLoop::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_queue_.size();
}

void EventLoop::promoteDueTimers(Clock::time_point now) {
    while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
        auto id = deadlines_.begin()->second;
        deadlines_.erase(deadlines_.begin());

        auto it = timers_.find(id);
        if (it == timers_.end()) continue;
        task_queue_.push(std::move(it->second.task));
        timers_.erase(it);
    }
}

void EventLoop::runTask(const Task& task) {
    try {
        task();
    }
    catch (const std::exception& e) {
        Logger::error("Error processing task: {}", e.what());
    }
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_requested_) {
        promoteDueTimers(Clock::now());

        if (task_queue_.empty()) {
            // Tunggu task baru, timer berikutnya, atau stop request
            if (deadlines_.empty()) {
                cv_.wait(lock);
            } else {
                auto next_due = deadlines_.begin()->first;
                cv_.wait_until(lock, next_due);
            }
            continue;
        }

        Task task = std::move(task_queue_.front());
        task_queue_.pop();

        // Release lock selama processing
        lock.unlock();
        runTask(task);
        lock.lock();
    }
}

} // namespace carlink::core
