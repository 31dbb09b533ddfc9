#include "rlog/backend.hpp"

#include <algorithm>
#include <vector>

namespace rlog {

LoggerBackend::LoggerBackend() = default;

LoggerBackend::~LoggerBackend() {
    Stop();
}

void LoggerBackend::Post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(task));
    }
    wake_cv_.notify_one();
}

LoggerBackend::TimerId LoggerBackend::PostDelayed(std::chrono::milliseconds delay,
                                                  Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_.emplace(id, Timer{std::chrono::steady_clock::now() + delay,
                                  std::move(task)});
    }
    wake_cv_.notify_one();
    return id;
}

bool LoggerBackend::Cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(id) > 0;
}

size_t LoggerBackend::PendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void LoggerBackend::Start() {
#if RLOG_HAS_THREAD
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread(&LoggerBackend::WorkerLoop, this);
#endif
}

void LoggerBackend::Stop() {
#if RLOG_HAS_THREAD
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
#endif
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.clear();
    }
    while (Drain(64) > 0) {}
}

bool LoggerBackend::Running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void LoggerBackend::PromoteDueTimersLocked(std::chrono::steady_clock::time_point now) {
    // 按到期时间顺序入队
    std::vector<std::map<TimerId, Timer>::iterator> due;
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.due <= now) {
            due.push_back(it);
        }
    }
    std::sort(due.begin(), due.end(), [](const auto& a, const auto& b) {
        return a->second.due < b->second.due;
    });
    for (auto it : due) {
        ready_.push_back(std::move(it->second.task));
        timers_.erase(it);
    }
}

size_t LoggerBackend::Drain(size_t max_tasks) {
    size_t count = 0;
    while (count < max_tasks) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            PromoteDueTimersLocked(std::chrono::steady_clock::now());
            if (ready_.empty()) {
                break;
            }
            task = std::move(ready_.front());
            ready_.pop_front();
            busy_ = true;
        }
        task();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
        ++count;
    }
    return count;
}

void LoggerBackend::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_) {
        lock.unlock();
        while (Drain(64) > 0) {}
        return;
    }
    idle_cv_.wait(lock, [this] { return ready_.empty() && !busy_; });
}

#if RLOG_HAS_THREAD
void LoggerBackend::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        PromoteDueTimersLocked(std::chrono::steady_clock::now());
        if (ready_.empty()) {
            if (timers_.empty()) {
                wake_cv_.wait(lock);
            } else {
                auto next_due = timers_.begin()->second.due;
                for (const auto& kv : timers_) {
                    if (kv.second.due < next_due) next_due = kv.second.due;
                }
                wake_cv_.wait_until(lock, next_due);
            }
            continue;
        }

        Task task = std::move(ready_.front());
        ready_.pop_front();
        busy_ = true;
        lock.unlock();
        task();
        lock.lock();
        busy_ = false;
        idle_cv_.notify_all();
    }
}
#endif

} // namespace rlog
