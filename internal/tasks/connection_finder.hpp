#pragma once

#include "internal/scheduler/task.hpp"

namespace vaultd::tasks {

/*
  Asks the model for cross-references between pages and appends the
  ones that resolve to two distinct pages and are not linked yet.
*/
class ConnectionFinder final : public scheduler::Task {
 public:
  std::string Name() const override {
    return "connection-finder";
  }

  std::string Description() const override {
    return "Find connections between notes using AI";
  }

  std::string Run(runtime::Context& ctx) override;
};

} // namespace vaultd::tasks
