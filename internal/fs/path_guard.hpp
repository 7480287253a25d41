#pragma once

#include <filesystem>
#include <string>

namespace vaultd::fs {

/*
  Resolves requested_path against base_dir and rejects anything that
  lands outside it.

  Both paths are made absolute and lexically normalised ("..", "." and
  duplicate separators collapse; symlinks are not followed). The result
  must equal the base or start with base + separator.

  Throws util::AccessDenied when base_dir is empty or the path escapes.
*/
std::filesystem::path ResolvePath(const std::string& base_dir, const std::string& requested_path);

// Path of target relative to base, for log lines.
std::string RelativeTo(const std::filesystem::path& base, const std::filesystem::path& target);

} // namespace vaultd::fs
