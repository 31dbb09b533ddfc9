#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

#include "platform.hpp"

#if RLOG_HAS_THREAD
#include <thread>
#endif

namespace rlog
{

// Background executor for work the log-call path must not wait on:
// rotation, archive pruning and delayed stream reopen attempts.
class LoggerBackend
{
 public:
  using Task = std::function<void()>;
  using TimerId = uint64_t;
  static constexpr TimerId kNoTimer = 0;

  LoggerBackend();
  ~LoggerBackend();

  LoggerBackend(const LoggerBackend&) = delete;
  LoggerBackend& operator=(const LoggerBackend&) = delete;

  // 任意线程调用
  void Post(Task task);
  TimerId PostDelayed(std::chrono::milliseconds delay, Task task);
  // False if the timer already fired or never existed.
  bool Cancel(TimerId id);
  size_t PendingTimers() const;

  // 启动/停止后端线程
  void Start();
  void Stop();  // 等待线程退出，执行残留任务，丢弃未到期的定时器
  bool Running() const;

  // 无线程模式：手动执行已就绪的任务（含到期定时器）
  size_t Drain(size_t max_tasks = 64);

  // Returns once every task posted so far has run.
  void WaitIdle();

 private:
  struct Timer
  {
    std::chrono::steady_clock::time_point due;
    Task task;
  };

  mutable std::mutex mutex_;
  std::condition_variable wake_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> ready_;
  std::map<TimerId, Timer> timers_;
  TimerId next_timer_id_ = 1;
  bool running_ = false;
  bool busy_ = false;

#if RLOG_HAS_THREAD
  std::thread worker_;
  void WorkerLoop();
#endif

  // 将到期的定时器移入就绪队列（需持有 mutex_）
  void PromoteDueTimersLocked(std::chrono::steady_clock::time_point now);
};

}  // namespace rlog
