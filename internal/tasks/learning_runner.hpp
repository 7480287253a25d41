#pragma once

#include "internal/scheduler/task.hpp"

namespace vaultd::tasks {

class LearningRunner final : public scheduler::Task {
 public:
  std::string Name() const override {
    return "learning-runner";
  }

  std::string Description() const override {
    return "Run the 7-step recursive learning protocol";
  }

  std::string Run(runtime::Context& ctx) override;
};

} // namespace vaultd::tasks
