#pragma once

#include <memory>
#include <vector>

#include "internal/scheduler/task.hpp"

namespace vaultd::tasks {

// Built-in tasks in scheduling priority order.
std::vector<std::shared_ptr<scheduler::Task>> BuiltinTasks();

} // namespace vaultd::tasks
