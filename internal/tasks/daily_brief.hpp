#pragma once

#include "internal/scheduler/task.hpp"

namespace vaultd::tasks {

class DailyBrief final : public scheduler::Task {
 public:
  std::string Name() const override {
    return "daily-brief";
  }

  std::string Description() const override {
    return "Summarise the last day of note activity into a journal page";
  }

  bool RunsAtHourOfDay() const override {
    return true;
  }

  std::string Run(runtime::Context& ctx) override;
};

} // namespace vaultd::tasks
