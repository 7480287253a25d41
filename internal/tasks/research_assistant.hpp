#pragma once

#include <string>
#include <vector>

#include "internal/scheduler/task.hpp"

namespace vaultd::tasks {

// "**title**\nrationale" per suggestion; heuristic lines when the reply
// has no usable suggestions[] array.
std::vector<std::string> SuggestionBlocks(const std::string& text);

class ResearchAssistant final : public scheduler::Task {
 public:
  std::string Name() const override {
    return "research-assistant";
  }

  std::string Description() const override {
    return "Suggest research directions from recent notes";
  }

  std::string Run(runtime::Context& ctx) override;
};

} // namespace vaultd::tasks
