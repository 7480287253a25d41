#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/runtime/context.hpp"
#include "internal/scheduler/task.hpp"
#include "internal/util/time.hpp"

namespace vaultd::scheduler {

enum class TaskResult {
  kPending,
  kSuccess,
  kError,
};

std::string ToString(TaskResult result);

struct TaskState {
  int64_t                    last_run_at_ms = 0;
  TaskResult                 last_result    = TaskResult::kPending;
  std::optional<std::string> last_error;
};

struct TaskStatus {
  std::string name;
  std::string description;
  TaskState   state;
};

struct SchedulerStatus {
  bool                       running = false;
  std::optional<std::string> current_task;
  std::vector<TaskStatus>    tasks;
  std::optional<int64_t>     started_at_ms;
};

struct SchedulerOptions {
  std::chrono::milliseconds tick_interval{60000};

  // Wall clock used for due checks and hour-of-day checks.
  std::function<util::TimePoint()> clock = util::Now;

  // false: Start() runs the first tick inline and no worker thread is
  // created; the caller drives Tick().
  bool background = true;
};

/*
  Scheduler

  Serial task runner: at most one task per tick, tasks in registration
  order, never two tasks at once. A task is due when

    task.<key>.enabled == "true"
    task.<key>.interval > 0 (minutes) and has elapsed since its last run
    hour-of-day tasks only: local hour == task.<key>.hour and no run yet
    on the current local day

  Every transition is written to the daemon_status row. Failures are
  recorded in the task's state and never stop the loop.
*/
class Scheduler {
 public:
  Scheduler(runtime::Context& ctx, std::shared_ptr<db::Repository> repository, SchedulerOptions options = {});
  ~Scheduler();

  Scheduler(const Scheduler&)            = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Only valid while stopped.
  void Register(std::shared_ptr<Task> task);

  void Start();

  // Halts the timer and raises the context's cancellation flag. Does not
  // interrupt a running model call; use Join() to wait for the worker.
  void Stop();

  // Waits up to grace for the worker to finish. Returns false when it is
  // still busy; the thread is then detached.
  bool Join(std::chrono::milliseconds grace);

  // Runs at most one due task. Returns true when a task ran.
  bool Tick();

  SchedulerStatus Status() const;

  bool IsRunning() const {
    return running_.load();
  }

 private:
  struct Entry {
    std::shared_ptr<Task> task;
    TaskState             state;
  };

  void Loop();
  bool IsDue(const Entry& entry, util::TimePoint now) const;
  void Execute(size_t index);
  void PersistStatus(const std::string& state, const std::optional<std::string>& current_task);

  runtime::Context&               ctx_;
  std::shared_ptr<db::Repository> repository_;
  SchedulerOptions                options_;

  mutable std::mutex         mutex_; // guards entries_[*].state, current_task_, started_at_ms_
  std::vector<Entry>         entries_;
  std::optional<std::string> current_task_;
  std::optional<int64_t>     started_at_ms_;

  std::atomic<bool> running_{false};
  std::atomic<bool> busy_{false};

  std::thread             thread_;
  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
  bool                    worker_done_ = true;
};

} // namespace vaultd::scheduler
