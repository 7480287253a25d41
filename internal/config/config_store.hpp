#pragma once

#include <map>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace vaultd::config {

/*
  Durable key/value configuration (daemon_config table).

  Reads never fail: a stored value wins, then the static defaults table,
  then "". Every read goes to the repository so edits made through the
  control surface or by another process are visible on the next tick.
*/
class ConfigStore {
 public:
  explicit ConfigStore(std::shared_ptr<db::Repository> repository);

  std::string Get(const std::string& key) const;

  // Leading-number parse; 0 when the value has no numeric prefix or is
  // not finite (nan, inf, overflow).
  double GetNumber(const std::string& key) const;

  // GetNumber truncated toward zero and clamped to [lo, hi].
  int GetInt(const std::string& key, int lo, int hi) const;

  bool GetBool(const std::string& key) const;

  void Set(const std::string& key, const std::string& value);

  // Applies all entries in one transaction.
  void SetMany(const std::map<std::string, std::string>& values);

  // Defaults overlaid with every stored entry.
  std::map<std::string, std::string> GetAll() const;

  static const std::map<std::string, std::string>& Defaults();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace vaultd::config
