#pragma once

#include <string>

#include "internal/runtime/context.hpp"

namespace vaultd::scheduler {

/*
  A unit of background work.

  Name and description are fixed for the task's lifetime. Run() returns a
  one-line summary; any exception marks the run as failed.
*/
class Task {
 public:
  virtual ~Task() = default;

  virtual std::string Name() const        = 0;
  virtual std::string Description() const = 0;

  // When true the task additionally waits for local hour == task.<key>.hour
  // and runs at most once per local calendar day.
  virtual bool RunsAtHourOfDay() const {
    return false;
  }

  virtual std::string Run(runtime::Context& ctx) = 0;
};

// "connection-finder" -> "connectionFinder"
std::string TaskConfigKey(const std::string& name);

} // namespace vaultd::scheduler
