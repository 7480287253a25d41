#include "internal/tasks/registry.hpp"

#include "internal/tasks/auto_organizer.hpp"
#include "internal/tasks/connection_finder.hpp"
#include "internal/tasks/daily_brief.hpp"
#include "internal/tasks/learning_runner.hpp"
#include "internal/tasks/research_assistant.hpp"

namespace vaultd::tasks {

std::vector<std::shared_ptr<scheduler::Task>> BuiltinTasks() {
  return {
      std::make_shared<ConnectionFinder>(),
      std::make_shared<DailyBrief>(),
      std::make_shared<AutoOrganizer>(),
      std::make_shared<ResearchAssistant>(),
      std::make_shared<LearningRunner>(),
  };
}

} // namespace vaultd::tasks
