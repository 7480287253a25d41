#pragma once

#include <string>
#include <vector>

#include "internal/scheduler/task.hpp"

namespace vaultd::tasks {

// First JSON array of strings in text, cleaned to lowercase hyphenated
// tags of 1..29 chars, at most 5.
std::vector<std::string> ParseTagList(const std::string& text);

/*
  Tags up to 10 untagged pages per run. Pages with 50 chars of text or
  less are left alone.
*/
class AutoOrganizer final : public scheduler::Task {
 public:
  std::string Name() const override {
    return "auto-organizer";
  }

  std::string Description() const override {
    return "Auto-tag and organize untagged pages";
  }

  std::string Run(runtime::Context& ctx) override;
};

} // namespace vaultd::tasks
