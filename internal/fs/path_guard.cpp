#include "internal/fs/path_guard.hpp"

#include "internal/util/errors.hpp"

namespace vaultd::fs {

namespace {

std::filesystem::path Normalize(const std::filesystem::path& p) {
  auto normal = std::filesystem::absolute(p).lexically_normal();
  // "/a/b/" -> "/a/b" so the prefix test below sees one canonical form
  if (!normal.has_filename() && normal.has_relative_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

} // namespace

std::filesystem::path ResolvePath(const std::string& base_dir, const std::string& requested_path) {
  if (base_dir.empty()) {
    throw util::AccessDenied("No base directory configured. Set permissions.baseDir in daemon config.");
  }

  const auto base   = Normalize(base_dir);
  const auto target = Normalize(base / requested_path);

  const std::string base_str   = base.string();
  const std::string target_str = target.string();

  std::string prefix = base_str;
  if (prefix.empty() || prefix.back() != std::filesystem::path::preferred_separator) {
    prefix.push_back(std::filesystem::path::preferred_separator);
  }

  if (target_str != base_str && target_str.compare(0, prefix.size(), prefix) != 0) {
    throw util::AccessDenied("Path traversal blocked: \"" + requested_path + "\" resolves outside base directory");
  }

  return target;
}

std::string RelativeTo(const std::filesystem::path& base, const std::filesystem::path& target) {
  auto rel = target.lexically_relative(Normalize(base));
  return rel.empty() ? "." : rel.string();
}

} // namespace vaultd::fs
