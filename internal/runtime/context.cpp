#include "internal/runtime/context.hpp"

#include "internal/config/config_store.hpp"

namespace vaultd::runtime {

std::optional<std::string> Context::ActiveVaultId() const {
  std::string id = config->Get("vault.activeId");
  if (id.empty()) return std::nullopt;
  return id;
}

} // namespace vaultd::runtime
