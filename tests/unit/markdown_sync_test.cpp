#include "internal/fs/markdown_sync.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/test_runtime.hpp"

namespace {

using vaultd::testing::AddPage;
using vaultd::testing::AddVault;
using vaultd::testing::MakeRuntime;
using vaultd::testing::MakeTempDir;

void TestSanitizeFilename() {
  using vaultd::fs::SanitizeFilename;

  assert(SanitizeFilename("Hello World") == "Hello-World");
  assert(SanitizeFilename("a/b\\c?d") == "a-b-c-d");
  assert(SanitizeFilename("  spaced   out  ") == "spaced-out");
  assert(SanitizeFilename("???") == "untitled");
  assert(SanitizeFilename("") == "untitled");
  assert(SanitizeFilename(std::string(300, 'x')).size() == 200);
}

void TestStripHtml() {
  using vaultd::fs::StripHtml;

  assert(StripHtml("<b>bold</b> text") == "bold text");
  assert(StripHtml("line one<br/>line two") == "line one\nline two");
  assert(StripHtml("  <p>padded</p>  ") == "padded");
}

void TestParseMarkdown() {
  const auto parsed = vaultd::fs::ParseMarkdown(
      "---\n"
      "id: \"p-1\"\n"
      "title: \"Reading list\"\n"
      "journal: false\n"
      "tags: [\"books\", \"todo\"]\n"
      "pinned: true\n"
      "properties:\n"
      "  status: \"open\"\n"
      "---\n"
      "\n"
      "# Reading list\n"
      "\n"
      "First paragraph.\n");

  assert(parsed.id && *parsed.id == "p-1");
  assert(parsed.title && *parsed.title == "Reading list");
  assert(!parsed.journal);
  assert(parsed.pinned);
  assert(parsed.tags.size() == 2 && parsed.tags[1] == "todo");
  assert(parsed.properties.at("status") == "open");

  const auto blocks = vaultd::fs::MergeIntoBlocks(parsed.body);
  assert(blocks.size() == 1);
  assert(blocks[0] == "First paragraph.");
}

void TestParseWithoutFrontMatter() {
  const auto parsed = vaultd::fs::ParseMarkdown("just text\n\nmore");
  assert(!parsed.id);
  assert(parsed.body == "just text\n\nmore");
}

void TestMalformedFrontMatterKeepsBody() {
  const auto parsed = vaultd::fs::ParseMarkdown("---\ntags: [unclosed\n---\nbody\n");
  assert(!parsed.id);
  assert(parsed.tags.empty());
  assert(parsed.body == "body\n");
}

void TestBadEntryOnlyLosesItself() {
  const auto parsed = vaultd::fs::ParseMarkdown(
      "---\n"
      "id: \"p-9\"\n"
      "title: \"Colon keys\"\n"
      "properties:\n"
      "  note: see: x\n"
      "tags: [\"books\"]\n"
      "---\n"
      "body\n");

  assert(parsed.id && *parsed.id == "p-9");
  assert(parsed.title && *parsed.title == "Colon keys");
  assert(parsed.tags == std::vector<std::string>{"books"});
  assert(parsed.properties.empty());
  assert(parsed.body == "body\n");
}

void TestMergeIntoBlocksAndTypes() {
  const auto blocks = vaultd::fs::MergeIntoBlocks("# Title\n\n## Section\n\n- item one\n- item two\n\n\n> quoted\n");
  assert(blocks.size() == 3);
  assert(vaultd::fs::DetectBlockType(blocks[0]) == "heading");
  assert(vaultd::fs::DetectBlockType(blocks[1]) == "list-item");
  assert(blocks[1] == "- item one\n- item two");
  assert(vaultd::fs::DetectBlockType(blocks[2]) == "quote");
  assert(vaultd::fs::DetectBlockType("- [ ] task") == "todo");
  assert(vaultd::fs::DetectBlockType("```\ncode\n```") == "code");
}

void TestOrderKeysSort() {
  assert(vaultd::fs::OrderKey(0) == "a0000");
  assert(vaultd::fs::OrderKey(12) == "a0012");
  assert(vaultd::fs::OrderKey(9) < vaultd::fs::OrderKey(10));
}

void TestExportThenImportUpdatesInPlace() {
  auto       rt  = MakeRuntime();
  const auto dir = MakeTempDir("markdown_sync");
  rt.ctx->config->SetMany({{"permissions.level", "file-access"}, {"permissions.baseDir", dir.string()}});

  AddVault(*rt.ctx, "v1");
  auto alpha = AddPage(*rt.ctx, "v1", "Alpha Notes", {"first block", "second block"});
  alpha.tags = {"research"};
  rt.ctx->notes->UpsertPage(alpha);
  AddPage(*rt.ctx, "v1", "Beta", {"beta body"});

  const auto exported = rt.ctx->sync->Export("v1");
  assert(exported.exported == 2);
  assert(std::filesystem::exists(dir / "vault-notes" / "Alpha-Notes.md"));
  assert(std::filesystem::exists(dir / "vault-notes" / "Beta.md"));

  const auto imported = rt.ctx->sync->Import("v1");
  assert(imported.updated == 2);
  assert(imported.imported == 0);

  const auto pages = rt.ctx->notes->ListPages("v1");
  assert(pages.size() == 2);

  const auto reloaded = rt.ctx->notes->GetPage(alpha.id);
  assert(reloaded);
  assert(reloaded->title == "Alpha Notes");
  assert(reloaded->tags == std::vector<std::string>{"research"});

  auto blocks = rt.ctx->notes->ListPageBlocks(alpha.id);
  std::sort(blocks.begin(), blocks.end(), [](const auto& a, const auto& b) { return a.order < b.order; });
  assert(blocks.size() == 2);
  assert(blocks[0].content == "first block");
  assert(blocks[1].content == "second block");
}

void TestCollidingTitlesGetSeparateFiles() {
  auto       rt  = MakeRuntime();
  const auto dir = MakeTempDir("markdown_collide");
  rt.ctx->config->SetMany({{"permissions.level", "file-access"}, {"permissions.baseDir", dir.string()}});

  AddVault(*rt.ctx, "source");
  AddPage(*rt.ctx, "source", "Meeting", {"monday"});
  AddPage(*rt.ctx, "source", "Meeting", {"tuesday"});
  AddPage(*rt.ctx, "source", "a/b", {"slash"});
  AddPage(*rt.ctx, "source", "a?b", {"question"});

  const auto exported = rt.ctx->sync->Export("source");
  assert(exported.exported == 4);

  const auto notes_dir = dir / "vault-notes";
  assert(std::filesystem::exists(notes_dir / "Meeting.md"));
  assert(std::filesystem::exists(notes_dir / "Meeting-2.md"));
  assert(std::filesystem::exists(notes_dir / "a-b.md"));
  assert(std::filesystem::exists(notes_dir / "a-b-2.md"));

  AddVault(*rt.ctx, "target");
  const auto imported = rt.ctx->sync->Import("target");
  assert(imported.imported == 4);

  const auto pages = rt.ctx->notes->ListPages("target");
  assert(pages.size() == 4);

  std::vector<std::string> titles;
  for (const auto& page : pages) titles.push_back(page.title);
  std::sort(titles.begin(), titles.end());
  assert((titles == std::vector<std::string>{"Meeting", "Meeting", "a/b", "a?b"}));
}

void TestYamlHostilePropertyKeyRoundTrips() {
  auto       rt  = MakeRuntime();
  const auto dir = MakeTempDir("markdown_hostile");
  rt.ctx->config->SetMany({{"permissions.level", "file-access"}, {"permissions.baseDir", dir.string()}});

  AddVault(*rt.ctx, "v1");
  auto page                    = AddPage(*rt.ctx, "v1", "Quotes: \"and\" colons", {"body"});
  page.tags                    = {"books"};
  page.properties["note: see"] = "x";
  page.properties["#hash"]     = "- dash";
  rt.ctx->notes->UpsertPage(page);

  assert(rt.ctx->sync->Export("v1").exported == 1);

  const auto imported = rt.ctx->sync->Import("v1");
  assert(imported.updated == 1);
  assert(imported.imported == 0);

  const auto pages = rt.ctx->notes->ListPages("v1");
  assert(pages.size() == 1);
  assert(pages[0].id == page.id);
  assert(pages[0].title == "Quotes: \"and\" colons");
  assert(pages[0].tags == std::vector<std::string>{"books"});
  assert(pages[0].properties.at("note: see") == "x");
  assert(pages[0].properties.at("#hash") == "- dash");
}

void TestImportIntoOtherVaultCreatesPages() {
  auto       rt  = MakeRuntime();
  const auto dir = MakeTempDir("markdown_import");
  rt.ctx->config->SetMany({{"permissions.level", "file-access"}, {"permissions.baseDir", dir.string()}});

  AddVault(*rt.ctx, "source");
  AddPage(*rt.ctx, "source", "Shared Page", {"body text"});
  (void)rt.ctx->sync->Export("source", "shared");

  AddVault(*rt.ctx, "target");
  const auto imported = rt.ctx->sync->Import("target", "shared");
  assert(imported.imported == 1);
  assert(imported.updated == 0);

  const auto pages = rt.ctx->notes->ListPages("target");
  assert(pages.size() == 1);
  assert(pages[0].title == "Shared Page");
  assert(pages[0].name == "shared page");
}

void TestImportUsesFileStemWhenTitleMissing() {
  auto       rt  = MakeRuntime();
  const auto dir = MakeTempDir("markdown_stem");
  rt.ctx->config->SetMany({{"permissions.level", "file-access"}, {"permissions.baseDir", dir.string()}});
  AddVault(*rt.ctx, "v1");

  std::filesystem::create_directories(dir / "vault-notes");
  std::ofstream(dir / "vault-notes" / "loose-thoughts.md") << "plain body\n";
  std::ofstream(dir / "vault-notes" / "ignored.txt") << "not markdown\n";

  const auto imported = rt.ctx->sync->Import("v1");
  assert(imported.imported == 1);

  const auto pages = rt.ctx->notes->ListPages("v1");
  assert(pages.size() == 1);
  assert(pages[0].title == "loose thoughts");
}

void TestImportOfMissingDirectoryIsEmpty() {
  auto       rt  = MakeRuntime();
  const auto dir = MakeTempDir("markdown_missing");
  rt.ctx->config->SetMany({{"permissions.level", "file-access"}, {"permissions.baseDir", dir.string()}});
  AddVault(*rt.ctx, "v1");

  const auto imported = rt.ctx->sync->Import("v1", "absent");
  assert(imported.imported == 0);
  assert(imported.updated == 0);
}

void TestSyncRequiresFileAccess() {
  auto rt = MakeRuntime();
  rt.ctx->config->Set("permissions.baseDir", MakeTempDir("markdown_denied").string());
  AddVault(*rt.ctx, "v1");

  bool denied = false;
  try {
    (void)rt.ctx->sync->Export("v1");
  } catch (const vaultd::util::AccessDenied&) {
    denied = true;
  }
  assert(denied);
}

} // namespace

int main() {
  TestSanitizeFilename();
  TestStripHtml();
  TestParseMarkdown();
  TestParseWithoutFrontMatter();
  TestMalformedFrontMatterKeepsBody();
  TestBadEntryOnlyLosesItself();
  TestMergeIntoBlocksAndTypes();
  TestOrderKeysSort();
  TestExportThenImportUpdatesInPlace();
  TestCollidingTitlesGetSeparateFiles();
  TestYamlHostilePropertyKeyRoundTrips();
  TestImportIntoOtherVaultCreatesPages();
  TestImportUsesFileStemWhenTitleMissing();
  TestImportOfMissingDirectoryIsEmpty();
  TestSyncRequiresFileAccess();

  std::cout << "vaultd_unit_markdown_sync: pass\n";
  return 0;
}
