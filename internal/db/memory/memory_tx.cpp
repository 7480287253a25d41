#include "memory_tx.hpp"

#include <stdexcept>

namespace vaultd::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), tx_lock_(repo.tx_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("commit after rollback");
  }
  std::scoped_lock lock(repo_.mutex_);
  repo_.committed_ = std::move(working_);
  committed_       = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace vaultd::db::memory
