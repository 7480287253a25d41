#include "internal/scheduler/task.hpp"

#include <cctype>

namespace vaultd::scheduler {

std::string TaskConfigKey(const std::string& name) {
  std::string key;
  key.reserve(name.size());
  for (size_t i = 0; i < name.size(); ++i) {
    const unsigned char next = i + 1 < name.size() ? static_cast<unsigned char>(name[i + 1]) : 0;
    if (name[i] == '-' && std::islower(next)) {
      key.push_back(static_cast<char>(std::toupper(next)));
      ++i;
      continue;
    }
    key.push_back(name[i]);
  }
  return key;
}

} // namespace vaultd::scheduler
