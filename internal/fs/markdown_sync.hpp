#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/note_records.hpp"
#include "internal/db/notes_store.hpp"
#include "internal/fs/sandboxed_fs.hpp"
#include "internal/observability/event_log.hpp"

namespace vaultd::fs {

// ------------------------------------------------------------------
// Markdown rendering / parsing
// ------------------------------------------------------------------

// Filesystem-safe page file stem; never empty.
std::string SanitizeFilename(const std::string& title);

// <br> -> newline, other tags dropped, surrounding whitespace trimmed.
std::string StripHtml(const std::string& html);

std::string BlockToMarkdown(const db::model::BlockRecord& block);

// Full file text: front-matter, "# title", blocks in order.
std::string RenderPage(const db::model::PageRecord& page, const std::vector<db::model::BlockRecord>& blocks);

struct ParsedMarkdown {
  std::optional<std::string> id;
  std::optional<std::string> title;
  std::optional<std::string> created;

  bool journal  = false;
  bool favorite = false;
  bool pinned   = false;

  std::vector<std::string>           tags;
  std::map<std::string, std::string> properties;

  std::string body;
};

// Malformed front-matter entries are dropped one by one; the body is
// still split off.
ParsedMarkdown ParseMarkdown(const std::string& raw);

// Blank-line separated fragments; a leading "# " title line is dropped.
std::vector<std::string> MergeIntoBlocks(const std::string& body);

std::string DetectBlockType(const std::string& text);

// a0000, a0001, ...
std::string OrderKey(size_t index);

// Lowercased title; pages are matched by this name.
std::string PageName(const std::string& title);

// ------------------------------------------------------------------
// Vault <-> directory sync
// ------------------------------------------------------------------

struct ExportResult {
  uint64_t    exported = 0;
  std::string dir;
};

struct ImportResult {
  uint64_t imported = 0;
  uint64_t updated  = 0;
};

class MarkdownSync {
 public:
  static constexpr const char* kDefaultSubDir = "vault-notes";

  MarkdownSync(std::shared_ptr<SandboxedFs> fs, std::shared_ptr<db::NotesStore> notes, std::shared_ptr<observability::EventLog> log);

  // Writes <sanitized-title>.md for every page of the vault; names that
  // collide get a -2, -3, ... suffix so every page gets its own file.
  ExportResult Export(const std::string& vault_id, const std::string& sub_dir = "");

  // Reads every *.md file; pages whose front-matter id exists in the
  // vault are updated in place, the rest are created.
  ImportResult Import(const std::string& vault_id, const std::string& sub_dir = "");

 private:
  std::shared_ptr<SandboxedFs>             fs_;
  std::shared_ptr<db::NotesStore>          notes_;
  std::shared_ptr<observability::EventLog> log_;
};

} // namespace vaultd::fs
