#include "internal/fs/sandboxed_fs.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/fs/path_guard.hpp"
#include "internal/util/errors.hpp"

namespace vaultd::fs {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

int64_t ToUnixMillis(std::filesystem::file_time_type ft) {
  // file_clock -> system_clock by offsetting both "now"s
  const auto system_now = std::chrono::system_clock::now();
  const auto file_now   = std::filesystem::file_time_type::clock::now();
  const auto as_system  = system_now + std::chrono::duration_cast<std::chrono::system_clock::duration>(ft - file_now);
  return std::chrono::duration_cast<std::chrono::milliseconds>(as_system.time_since_epoch()).count();
}

} // namespace

SandboxedFs::SandboxedFs(std::shared_ptr<security::PermissionGate> gate, std::shared_ptr<observability::EventLog> log)
    : gate_(std::move(gate)), log_(std::move(log)) {}

std::filesystem::path SandboxedFs::Resolve(const std::string& relative_path) const {
  gate_->AssertFileAccess();
  try {
    return ResolvePath(gate_->BaseDir(), relative_path);
  } catch (const util::AccessDenied& e) {
    gate_->Deny(e.what());
  }
}

std::string SandboxedFs::Read(const std::string& relative_path) {
  const auto target = Resolve(relative_path);

  std::ifstream in(target, std::ios::binary);
  if (!in) {
    throw util::NotFound("cannot read file: " + relative_path);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  std::string content = buffer.str();

  log_->Info("fs:read " + relative_path, {IntField("bytes", static_cast<int64_t>(content.size()))});
  return content;
}

uint64_t SandboxedFs::Write(const std::string& relative_path, const std::string& content) {
  const auto target = Resolve(relative_path);

  std::filesystem::create_directories(target.parent_path());

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open file for writing: " + relative_path);
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) {
    throw std::runtime_error("write failed: " + relative_path);
  }

  log_->Info("fs:write " + relative_path, {IntField("bytes", static_cast<int64_t>(content.size()))});
  return content.size();
}

std::vector<DirectoryEntry> SandboxedFs::List(const std::string& relative_path) {
  const auto target = Resolve(relative_path);

  std::error_code ec;
  if (!std::filesystem::is_directory(target, ec)) {
    throw util::NotFound("not a directory: " + relative_path);
  }

  std::vector<DirectoryEntry> entries;
  for (const auto& item : std::filesystem::directory_iterator(target)) {
    DirectoryEntry entry;
    entry.name = item.path().filename().string();

    std::error_code stat_ec;
    entry.is_directory = item.is_directory(stat_ec);

    // a dangling symlink or a racing delete only zeroes this entry
    const auto size = entry.is_directory ? 0 : item.file_size(stat_ec);
    if (!stat_ec) {
      const auto mtime = item.last_write_time(stat_ec);
      if (!stat_ec) {
        entry.size_bytes     = size;
        entry.modified_at_ms = ToUnixMillis(mtime);
      }
    }

    entries.push_back(std::move(entry));
  }

  log_->Info("fs:list " + relative_path, {IntField("entries", static_cast<int64_t>(entries.size()))});
  return entries;
}

bool SandboxedFs::Exists(const std::string& relative_path) {
  const auto      target = Resolve(relative_path);
  std::error_code ec;
  const bool      exists = std::filesystem::exists(target, ec);

  log_->Info("fs:exists " + relative_path, {BoolField("exists", exists)});
  return exists;
}

void SandboxedFs::Delete(const std::string& relative_path) {
  const auto target = Resolve(relative_path);

  // files only, never directories (the base directory resolves from ".")
  std::error_code ec;
  if (std::filesystem::is_directory(std::filesystem::symlink_status(target, ec))) {
    throw util::InvalidArgument("not a file: " + relative_path);
  }

  if (!std::filesystem::remove(target, ec)) {
    if (ec) throw std::runtime_error("delete failed: " + relative_path + ": " + ec.message());
    throw util::NotFound("no such file: " + relative_path);
  }

  log_->Info("fs:delete " + relative_path);
}

void SandboxedFs::EnsureDir(const std::string& relative_path) {
  const auto target = Resolve(relative_path);
  std::filesystem::create_directories(target);
  log_->Info("fs:mkdir " + relative_path);
}

} // namespace vaultd::fs
