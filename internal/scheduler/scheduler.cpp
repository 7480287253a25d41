#include "internal/scheduler/scheduler.hpp"

#include <unistd.h>

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

#include "internal/config/config_store.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/observability/logging.hpp"

namespace vaultd::scheduler {

using observability::IntField;
using observability::StringField;

std::string ToString(TaskResult result) {
  switch (result) {
    case TaskResult::kPending:
      return "pending";
    case TaskResult::kSuccess:
      return "success";
    case TaskResult::kError:
      return "error";
  }
  return "pending";
}

Scheduler::Scheduler(runtime::Context& ctx, std::shared_ptr<db::Repository> repository, SchedulerOptions options)
    : ctx_(ctx), repository_(std::move(repository)), options_(std::move(options)) {
  if (!repository_) {
    throw std::invalid_argument("scheduler requires repository");
  }
}

Scheduler::~Scheduler() {
  try {
    Stop();
    if (thread_.joinable()) thread_.join();
  } catch (const std::exception& e) {
    VAULTD_LOG_WARN("scheduler shutdown failed", {StringField("error", e.what())});
  }
}

void Scheduler::Register(std::shared_ptr<Task> task) {
  if (!task) {
    throw std::invalid_argument("scheduler: null task");
  }
  if (running_) {
    throw std::logic_error("scheduler: cannot register tasks while running");
  }

  std::lock_guard lock(mutex_);
  entries_.push_back(Entry{std::move(task), TaskState{}});
}

void Scheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }

  ctx_.cancel_requested = false;
  {
    std::lock_guard lock(mutex_);
    started_at_ms_ = util::ToUnixMillis(options_.clock());
  }
  PersistStatus("running", std::nullopt);

  size_t task_count = 0;
  {
    std::lock_guard lock(mutex_);
    task_count = entries_.size();
  }
  ctx_.log->Info("Scheduler started with " + std::to_string(task_count) + " tasks");

  if (!options_.background) {
    Tick();
    return;
  }

  if (thread_.joinable()) {
    // Worker from a previous run that outlived its grace period.
    thread_.detach();
  }
  {
    std::lock_guard lock(wake_mutex_);
    worker_done_ = false;
  }
  thread_ = std::thread(&Scheduler::Loop, this);
}

void Scheduler::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  ctx_.cancel_requested = true;
  wake_cv_.notify_all();

  {
    std::lock_guard lock(mutex_);
    started_at_ms_.reset();
  }
  PersistStatus("stopped", std::nullopt);
  ctx_.log->Info("Scheduler stopped");
}

bool Scheduler::Join(std::chrono::milliseconds grace) {
  if (!thread_.joinable()) {
    return true;
  }

  std::unique_lock lock(wake_mutex_);
  const bool done = wake_cv_.wait_for(lock, grace, [this] { return worker_done_; });
  lock.unlock();

  if (done) {
    thread_.join();
    return true;
  }

  VAULTD_LOG_WARN("scheduler worker still busy after grace period", {IntField("grace_ms", grace.count())});
  thread_.detach();
  return false;
}

void Scheduler::Loop() {
  while (running_) {
    try {
      Tick();
    } catch (const std::exception& e) {
      VAULTD_LOG_ERROR("scheduler tick failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, options_.tick_interval, [this] { return !running_; });
  }

  {
    std::lock_guard lock(wake_mutex_);
    worker_done_ = true;
  }
  wake_cv_.notify_all();
}

bool Scheduler::Tick() {
  if (!running_) {
    return false;
  }
  if (busy_.exchange(true)) {
    return false;
  }

  struct BusyReset {
    std::atomic<bool>& flag;
    ~BusyReset() {
      flag = false;
    }
  } reset{busy_};

  const auto now = options_.clock();

  size_t count = 0;
  {
    std::lock_guard lock(mutex_);
    count = entries_.size();
  }

  for (size_t i = 0; i < count; ++i) {
    Entry snapshot;
    {
      std::lock_guard lock(mutex_);
      snapshot = entries_[i];
    }
    if (!IsDue(snapshot, now)) {
      continue;
    }
    Execute(i);
    return true;
  }
  return false;
}

bool Scheduler::IsDue(const Entry& entry, util::TimePoint now) const {
  const std::string prefix = "task." + TaskConfigKey(entry.task->Name()) + ".";

  if (!ctx_.config->GetBool(prefix + "enabled")) {
    return false;
  }

  const double interval_minutes = ctx_.config->GetNumber(prefix + "interval");
  if (interval_minutes <= 0) {
    return false;
  }

  const int64_t now_ms     = util::ToUnixMillis(now);
  const int64_t elapsed_ms = now_ms - entry.state.last_run_at_ms;
  if (static_cast<double>(elapsed_ms) < interval_minutes * 60000.0) {
    return false;
  }

  if (entry.task->RunsAtHourOfDay()) {
    // an out-of-range or fractional hour never matches
    const double hour = ctx_.config->GetNumber(prefix + "hour");
    if (static_cast<double>(util::LocalHour(now)) != hour) {
      return false;
    }
    if (entry.state.last_run_at_ms > 0 && util::SameLocalDay(util::FromUnixMillis(entry.state.last_run_at_ms), now)) {
      return false;
    }
  }

  return true;
}

void Scheduler::Execute(size_t index) {
  std::shared_ptr<Task> task;
  {
    std::lock_guard lock(mutex_);
    task          = entries_[index].task;
    current_task_ = task->Name();
  }

  const std::string name = task->Name();
  PersistStatus("running", name);
  ctx_.log->Task(name, "Starting task: " + task->Description());

  const auto started = std::chrono::steady_clock::now();

  std::optional<std::string> summary;
  std::string                error;
  try {
    summary = task->Run(ctx_);
  } catch (const std::exception& e) {
    error = e.what();
  } catch (...) {
    error = "unknown error";
  }

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  const int64_t finished_ms = util::ToUnixMillis(options_.clock());

  {
    std::lock_guard lock(mutex_);
    auto& state          = entries_[index].state;
    state.last_run_at_ms = finished_ms;
    if (summary) {
      state.last_result = TaskResult::kSuccess;
      state.last_error.reset();
    } else {
      state.last_result = TaskResult::kError;
      state.last_error  = error;
    }
    current_task_.reset();
  }

  if (summary) {
    char seconds[32];
    std::snprintf(seconds, sizeof(seconds), "%.1f", static_cast<double>(elapsed_ms) / 1000.0);
    ctx_.log->Task(name, std::string("Completed in ") + seconds + "s: " + *summary, {IntField("duration_ms", elapsed_ms)});
  } else {
    ctx_.log->Error("Task " + name + " failed: " + error, {StringField("task", name)});
  }

  PersistStatus(running_ ? "running" : "stopped", std::nullopt);
}

void Scheduler::PersistStatus(const std::string& state, const std::optional<std::string>& current_task) {
  db::model::StatusRecord record;
  record.pid          = static_cast<int64_t>(::getpid());
  record.state        = state;
  record.current_task = current_task;
  {
    std::lock_guard lock(mutex_);
    record.started_at_ms = state == "running" ? started_at_ms_ : std::nullopt;
  }
  record.updated_at_ms = util::ToUnixMillis(util::Now());

  try {
    auto tx = repository_->Begin();
    if (auto r = repository_->UpsertStatus(*tx, record); !r) {
      VAULTD_LOG_WARN("status update failed", {StringField("error", r.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    VAULTD_LOG_WARN("status update failed", {StringField("error", e.what())});
  }
}

SchedulerStatus Scheduler::Status() const {
  SchedulerStatus out;
  out.running = running_.load();

  std::lock_guard lock(mutex_);
  out.current_task  = current_task_;
  out.started_at_ms = started_at_ms_;
  out.tasks.reserve(entries_.size());
  for (const auto& entry : entries_) {
    out.tasks.push_back(TaskStatus{entry.task->Name(), entry.task->Description(), entry.state});
  }
  return out;
}

} // namespace vaultd::scheduler
