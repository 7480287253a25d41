#include "internal/fs/markdown_sync.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace vaultd::fs {

using observability::IntField;
using observability::StringField;

namespace {

constexpr size_t kMaxFilenameLength = 200;

std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Repeat(const std::string& s, int count) {
  std::string out;
  for (int i = 0; i < count; ++i) out += s;
  return out;
}

std::string ReadWholeFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot read " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::optional<std::string> ScalarField(const YAML::Node& fm, const char* key) {
  const auto node = fm[key];
  if (!node || !node.IsScalar()) return std::nullopt;
  return node.Scalar();
}

bool BoolField(const YAML::Node& fm, const char* key) {
  auto value = ScalarField(fm, key);
  return value && *value == "true";
}

// Loads the whole block, falling back to one top-level entry at a time so a
// malformed entry only loses itself.
YAML::Node LoadFrontMatter(const std::string& text) {
  try {
    return YAML::Load(text);
  } catch (const YAML::Exception&) {
  }

  YAML::Node  merged(YAML::NodeType::Map);
  std::string entry;

  auto flush = [&] {
    if (!Trim(entry).empty()) {
      try {
        const YAML::Node node = YAML::Load(entry);
        if (node.IsMap()) {
          for (const auto& item : node) {
            if (item.first.IsScalar()) merged[item.first.Scalar()] = item.second;
          }
        }
      } catch (const YAML::Exception&) {
      }
    }
    entry.clear();
  };

  std::istringstream in(text);
  std::string        line;
  while (std::getline(in, line)) {
    // an unindented line starts the next top-level entry
    if (!line.empty() && !std::isspace(static_cast<unsigned char>(line[0]))) flush();
    entry += line;
    entry += "\n";
  }
  flush();

  return merged;
}

// <stem>.md, or <stem>-2.md, <stem>-3.md, ... when the name is taken.
// Compared case-insensitively for case-folding filesystems.
std::string UniqueFileName(const std::string& stem, std::set<std::string>& taken) {
  std::string candidate = stem;
  for (int n = 2; taken.contains(ToLower(candidate)); ++n) {
    candidate = stem + "-" + std::to_string(n);
  }
  taken.insert(ToLower(candidate));
  return candidate + ".md";
}

} // namespace

// ------------------------------------------------------------------
// Rendering
// ------------------------------------------------------------------

std::string SanitizeFilename(const std::string& title) {
  static const std::regex kForbidden(R"([/\\?%*:|"<>])");
  static const std::regex kWhitespace(R"(\s+)");
  static const std::regex kDashes("-+");

  std::string name = std::regex_replace(title, kForbidden, "-");
  name             = std::regex_replace(name, kWhitespace, "-");
  name             = std::regex_replace(name, kDashes, "-");

  if (!name.empty() && name.front() == '-') name.erase(0, 1);
  if (!name.empty() && name.back() == '-') name.pop_back();

  if (name.size() > kMaxFilenameLength) {
    size_t cut = kMaxFilenameLength;
    // do not split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(name[cut]) & 0xC0) == 0x80) --cut;
    name.resize(cut);
  }

  return name.empty() ? "untitled" : name;
}

std::string StripHtml(const std::string& html) {
  static const std::regex kBreak(R"(<br\s*/?>)", std::regex::icase);
  static const std::regex kTag("<[^>]+>");

  std::string text = std::regex_replace(html, kBreak, "\n");
  text             = std::regex_replace(text, kTag, "");
  return Trim(text);
}

std::string BlockToMarkdown(const db::model::BlockRecord& block) {
  const std::string text   = StripHtml(block.content);
  const std::string indent = Repeat("  ", std::max(block.indent, 0));
  const std::string& type  = block.type;

  if (type == "heading") return "## " + text + "\n";
  if (type == "code") return "```\n" + text + "\n```\n";
  if (type == "math") return "$$\n" + text + "\n$$\n";
  if (type == "quote") return indent + "> " + text + "\n";
  if (type == "callout") return indent + "> **Note:** " + text + "\n";
  if (type == "list-item") return indent + "- " + text;
  if (type == "numbered-item") return indent + "1. " + text;
  if (type == "todo") return indent + "- [ ] " + text;
  if (type == "divider") return "---\n";
  if (type == "image") return "![](" + text + ")\n";
  if (type == "toggle") return "<details><summary>" + text + "</summary></details>\n";
  return indent + text + "\n";
}

std::string RenderPage(const db::model::PageRecord& page, const std::vector<db::model::BlockRecord>& blocks) {
  YAML::Emitter fm;
  fm << YAML::BeginMap;
  fm << YAML::Key << "id" << YAML::Value << YAML::DoubleQuoted << page.id;
  fm << YAML::Key << "title" << YAML::Value << YAML::DoubleQuoted << page.title;
  fm << YAML::Key << "created" << YAML::Value << util::ToIso8601(util::FromUnixMillis(page.created_at_ms));
  fm << YAML::Key << "updated" << YAML::Value << util::ToIso8601(util::FromUnixMillis(page.updated_at_ms));
  fm << YAML::Key << "journal" << YAML::Value << page.is_journal;

  if (!page.tags.empty()) {
    fm << YAML::Key << "tags" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& tag : page.tags) fm << YAML::DoubleQuoted << tag;
    fm << YAML::EndSeq;
  }
  if (page.favorite) fm << YAML::Key << "favorite" << YAML::Value << true;
  if (page.pinned) fm << YAML::Key << "pinned" << YAML::Value << true;
  if (!page.properties.empty()) {
    fm << YAML::Key << "properties" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, value] : page.properties) {
      fm << YAML::Key << YAML::DoubleQuoted << key << YAML::Value << YAML::DoubleQuoted << value;
    }
    fm << YAML::EndMap;
  }
  fm << YAML::EndMap;

  if (!fm.good()) {
    throw std::runtime_error("cannot render front matter for page " + page.id + ": " + fm.GetLastError());
  }

  std::ostringstream out;
  out << "---\n" << fm.c_str() << "\n---\n\n";

  out << "# " << page.title << "\n\n";

  std::vector<db::model::BlockRecord> ordered = blocks;
  std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) { return a.order < b.order; });

  for (size_t i = 0; i < ordered.size(); ++i) {
    if (i > 0) out << "\n";
    out << BlockToMarkdown(ordered[i]);
  }
  out << "\n";

  return out.str();
}

// ------------------------------------------------------------------
// Parsing
// ------------------------------------------------------------------

ParsedMarkdown ParseMarkdown(const std::string& raw) {
  ParsedMarkdown parsed;

  // "---\n<yaml>\n---\n?<body>"
  if (!StartsWith(raw, "---\n")) {
    parsed.body = raw;
    return parsed;
  }
  const size_t close = raw.find("\n---", 3);
  if (close == std::string::npos || close < 3) {
    parsed.body = raw;
    return parsed;
  }

  const std::string yaml_text = close > 4 ? raw.substr(4, close - 4) : std::string();
  size_t            body_at   = close + 4;
  if (body_at < raw.size() && raw[body_at] == '\n') ++body_at;
  parsed.body = body_at < raw.size() ? raw.substr(body_at) : std::string();

  const YAML::Node fm = LoadFrontMatter(yaml_text);
  if (!fm.IsMap()) return parsed;

  parsed.id      = ScalarField(fm, "id");
  parsed.title   = ScalarField(fm, "title");
  parsed.created = ScalarField(fm, "created");

  parsed.journal  = BoolField(fm, "journal");
  parsed.favorite = BoolField(fm, "favorite");
  parsed.pinned   = BoolField(fm, "pinned");

  if (const auto tags = fm["tags"]; tags && tags.IsSequence()) {
    for (const auto& tag : tags) {
      if (tag.IsScalar()) parsed.tags.push_back(tag.Scalar());
    }
  }

  if (const auto properties = fm["properties"]; properties && properties.IsMap()) {
    for (const auto& entry : properties) {
      if (entry.second.IsScalar()) {
        parsed.properties[entry.first.Scalar()] = entry.second.Scalar();
      }
    }
  }

  return parsed;
}

std::vector<std::string> MergeIntoBlocks(const std::string& body) {
  std::vector<std::string> blocks;
  std::string              current;

  std::istringstream in(body);
  std::string        line;
  while (std::getline(in, line)) {
    if (StartsWith(line, "# ") && blocks.empty() && current.empty()) continue;

    if (Trim(line).empty()) {
      if (!Trim(current).empty()) blocks.push_back(Trim(current));
      current.clear();
    } else {
      if (!current.empty()) current += "\n";
      current += line;
    }
  }
  if (!Trim(current).empty()) blocks.push_back(Trim(current));

  return blocks;
}

std::string DetectBlockType(const std::string& text) {
  if (StartsWith(text, "## ") || StartsWith(text, "### ")) return "heading";
  if (StartsWith(text, "```")) return "code";
  if (StartsWith(text, "> ")) return "quote";
  if (StartsWith(text, "- [ ] ") || StartsWith(text, "- [x] ")) return "todo";
  if (StartsWith(text, "- ") || StartsWith(text, "* ")) return "list-item";
  return "paragraph";
}

std::string OrderKey(size_t index) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "a%04zu", index);
  return buffer;
}

std::string PageName(const std::string& title) {
  return ToLower(title);
}

// ------------------------------------------------------------------
// MarkdownSync
// ------------------------------------------------------------------

MarkdownSync::MarkdownSync(std::shared_ptr<SandboxedFs> fs, std::shared_ptr<db::NotesStore> notes, std::shared_ptr<observability::EventLog> log)
    : fs_(std::move(fs)), notes_(std::move(notes)), log_(std::move(log)) {}

ExportResult MarkdownSync::Export(const std::string& vault_id, const std::string& sub_dir) {
  const std::string dir_name = sub_dir.empty() ? kDefaultSubDir : sub_dir;
  const auto        target   = fs_->Resolve(dir_name);

  const auto pages  = notes_->ListPages(vault_id);
  const auto blocks = notes_->ListBlocks(vault_id);

  std::unordered_map<std::string, std::vector<db::model::BlockRecord>> blocks_by_page;
  for (const auto& block : blocks) {
    blocks_by_page[block.page_id].push_back(block);
  }

  std::filesystem::create_directories(target);

  ExportResult result;
  result.dir = target.string();

  std::set<std::string> taken;
  for (const auto& page : pages) {
    const auto path = target / UniqueFileName(SanitizeFilename(page.title), taken);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot write " + path.string());
    }
    out << RenderPage(page, blocks_by_page[page.id]);
    out.close();
    if (!out) {
      throw std::runtime_error("write failed: " + path.string());
    }

    ++result.exported;
  }

  log_->Info("fs:sync-export", {IntField("pages", static_cast<int64_t>(result.exported)), StringField("dir", dir_name)});
  return result;
}

ImportResult MarkdownSync::Import(const std::string& vault_id, const std::string& sub_dir) {
  const std::string dir_name = sub_dir.empty() ? kDefaultSubDir : sub_dir;
  const auto        target   = fs_->Resolve(dir_name);

  ImportResult result;

  std::error_code ec;
  if (!std::filesystem::is_directory(target, ec)) {
    return result;
  }

  std::vector<std::filesystem::path> files;
  for (const auto& item : std::filesystem::directory_iterator(target, ec)) {
    if (item.path().extension() == ".md") files.push_back(item.path());
  }
  std::sort(files.begin(), files.end());

  std::set<std::string> existing_ids;
  std::unordered_map<std::string, db::model::PageRecord> existing_pages;
  for (auto& page : notes_->ListPages(vault_id)) {
    existing_ids.insert(page.id);
    existing_pages.emplace(page.id, std::move(page));
  }

  for (const auto& file : files) {
    const ParsedMarkdown parsed = ParseMarkdown(ReadWholeFile(file));
    const int64_t        now    = util::ToUnixMillis(util::Now());

    const bool is_update = parsed.id && existing_ids.contains(*parsed.id);

    db::model::PageRecord page;
    if (is_update) {
      page = existing_pages.at(*parsed.id);
    } else {
      page.id       = util::NewId();
      page.vault_id = vault_id;
    }

    std::string title = parsed.title.value_or("");
    if (title.empty()) {
      title = file.stem().string();
      std::replace(title.begin(), title.end(), '-', ' ');
    }

    page.title      = title;
    page.name       = PageName(title);
    page.is_journal = parsed.journal;
    page.properties = parsed.properties;
    page.tags       = parsed.tags;
    page.favorite   = parsed.favorite;
    page.pinned     = parsed.pinned;

    util::TimePoint created;
    page.created_at_ms = parsed.created && util::ParseIso8601(*parsed.created, &created) ? util::ToUnixMillis(created) : now;
    page.updated_at_ms = now;

    std::vector<db::model::BlockRecord> blocks;
    const auto                          fragments = MergeIntoBlocks(parsed.body);
    for (size_t i = 0; i < fragments.size(); ++i) {
      db::model::BlockRecord block;
      block.id            = util::NewId();
      block.page_id       = page.id;
      block.type          = DetectBlockType(fragments[i]);
      block.content       = fragments[i];
      block.order         = OrderKey(i);
      block.created_at_ms = now;
      block.updated_at_ms = now;
      blocks.push_back(std::move(block));
    }

    notes_->SavePage(page, blocks);

    if (is_update) {
      ++result.updated;
    } else {
      ++result.imported;
    }
  }

  log_->Info("fs:sync-import",
             {IntField("imported", static_cast<int64_t>(result.imported)), IntField("updated", static_cast<int64_t>(result.updated)), StringField("dir", dir_name)});
  return result;
}

} // namespace vaultd::fs
