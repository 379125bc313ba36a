#pragma once

#include <functional>
#include <memory>
#include <unordered_map>
#include <map>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <cstdint>
#include <condition_variable>

#include <carlink/core/error.hpp>

namespace carlink::core {

using Task = std::function<void()>;
using TimerId = std::uint64_t;

// Antarmuka penjadwal: semua state machine client berjalan di atas ini.
// Task dijalankan satu per satu, sesuai urutan post.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Jalankan task secepatnya (FIFO)
    virtual void post(Task task) = 0;

    // Jalankan task setelah delay; id dapat dipakai untuk cancel
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;

    // Batalkan timer; false jika sudah jalan atau tidak dikenal
    virtual bool cancel(TimerId id) = 0;

    // Jumlah timer yang belum jalan
    virtual std::size_t pendingTimers() const = 0;

    // Waktu sekarang dalam ms sejak epoch
    virtual std::int64_t nowMillis() const = 0;
};

// Event loop dengan satu worker thread, queue task dan timer
class EventLoop : public Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    EventLoop();
    ~EventLoop() override;

    // Non-copyable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();
    void stop();

    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TimerId id) override;
    std::size_t pendingTimers() const override;
    std::int64_t nowMillis() const override;

    // Proses satu task dari queue di thread pemanggil (tanpa worker)
    bool processOne();

    // Proses semua task yang ada di queue
    void processAll();

    bool isRunning() const noexcept { return running_; }

    std::size_t queueSize() const;

private:
    struct Timer {
        Clock::time_point due;
        Task task;
    };

    void run();

    // Pindahkan timer yang sudah jatuh tempo ke queue (mutex harus dipegang)
    void promoteDueTimers(Clock::time_point now);

    static void runTask(const Task& task);

    std::queue<Task> task_queue_;
    std::multimap<Clock::time_point, TimerId> deadlines_;
    std::unordered_map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    bool running_ = false;
    bool stop_requested_ = false;
};

inline std::unique_ptr<EventLoop> make_event_loop() {
    return std::make_unique<EventLoop>();
}

} // namespace carlink::core
