#include <algorithm>
#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/tasks/auto_organizer.hpp"
#include "internal/tasks/connection_finder.hpp"
#include "internal/tasks/daily_brief.hpp"
#include "internal/tasks/learning_runner.hpp"
#include "internal/tasks/notes_corpus.hpp"
#include "internal/tasks/registry.hpp"
#include "internal/tasks/research_assistant.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/test_runtime.hpp"

namespace {

using vaultd::llm::GenerateRequest;
using vaultd::testing::AddPage;
using vaultd::testing::AddVault;
using vaultd::testing::FakeModel;
using vaultd::testing::MakeRuntime;
using vaultd::testing::UseModel;

int64_t NowMs() {
  return vaultd::util::ToUnixMillis(vaultd::util::Now());
}

std::optional<vaultd::db::model::PageRecord> FindPage(vaultd::runtime::Context& ctx, const std::string& vault_id, const std::string& title) {
  for (const auto& page : ctx.notes->ListPages(vault_id)) {
    if (page.title == title) return page;
  }
  return std::nullopt;
}

bool HasTag(const vaultd::db::model::PageRecord& page, const std::string& tag) {
  return std::find(page.tags.begin(), page.tags.end(), tag) != page.tags.end();
}

void TestRegistryOrder() {
  const auto tasks = vaultd::tasks::BuiltinTasks();
  assert(tasks.size() == 5);
  assert(tasks[0]->Name() == "connection-finder");
  assert(tasks[1]->Name() == "daily-brief");
  assert(tasks[2]->Name() == "auto-organizer");
  assert(tasks[3]->Name() == "research-assistant");
  assert(tasks[4]->Name() == "learning-runner");
  assert(tasks[1]->RunsAtHourOfDay());
  assert(!tasks[0]->RunsAtHourOfDay());
}

void TestEveryTaskNeedsAnActiveVault() {
  auto rt = MakeRuntime();
  // resolve_model is left empty: no task may reach the model
  for (const auto& task : vaultd::tasks::BuiltinTasks()) {
    assert(task->Run(*rt.ctx) == "No active vault");
  }
}

void TestCorpus() {
  using vaultd::tasks::BuildCorpus;
  using vaultd::tasks::Truncate;

  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  AddPage(*rt.ctx, "v1", "First", {"<b>bold</b> text", "", "second line"});

  const auto pages  = rt.ctx->notes->ListPages("v1");
  const auto blocks = rt.ctx->notes->ListBlocks("v1");
  assert(vaultd::tasks::PageText(pages[0].id, blocks) == "bold text\nsecond line");
  assert(BuildCorpus(pages, blocks) == "## First\nbold text\nsecond line");
  assert(BuildCorpus(pages, blocks, 8) == "## First");

  // "é" is two bytes; a cut inside it backs off to the boundary
  assert(Truncate("ab\xC3\xA9", 3) == "ab");
  assert(Truncate("ab\xC3\xA9", 4) == "ab\xC3\xA9");
}

// ------------------------------------------------------------------
// connection-finder
// ------------------------------------------------------------------

void TestConnectionFinderCreatesResolvedLinks() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  const auto alpha = AddPage(*rt.ctx, "v1", "Alpha", {"alpha notes"});
  const auto beta  = AddPage(*rt.ctx, "v1", "Beta", {"beta notes"});
  const auto gamma = AddPage(*rt.ctx, "v1", "Gamma", {"gamma notes"});

  vaultd::db::model::PageLinkRecord existing;
  existing.source_page_id  = alpha.id;
  existing.target_page_id  = beta.id;
  existing.source_block_id = "manual";
  rt.ctx->notes->AppendPageLinks({existing});

  const std::string long_relationship(300, 'r');
  auto              model = std::make_shared<FakeModel>([&](const GenerateRequest&) {
    return "Connections found:\n{\"connections\": ["
           "{\"sourcePageTitle\": \"Alpha\", \"targetPageTitle\": \"Beta\", \"relationship\": \"already linked\"},"
           "{\"sourcePageTitle\": \"beta\", \"targetPageTitle\": \"GAMMA\", \"relationship\": \"shared concept\"},"
           "{\"sourcePageTitle\": \"Alpha\", \"targetPageTitle\": \"alpha\", \"relationship\": \"self\"},"
           "{\"sourcePageTitle\": \"Unknown\", \"targetPageTitle\": \"Beta\", \"relationship\": \"dangling\"},"
           "{\"sourcePageTitle\": \"Gamma\", \"targetPageTitle\": \"Alpha\", \"relationship\": \"" +
           long_relationship + "\"}]}";
  });
  UseModel(*rt.ctx, model);

  vaultd::tasks::ConnectionFinder task;
  const auto summary = task.Run(*rt.ctx);
  assert(summary == "Found 5 connections, 3 resolved, 2 new links created");

  assert(model->requests.size() == 1);
  assert(model->requests[0].max_tokens == 2048);
  assert(model->requests[0].temperature == 0.4);
  assert(model->requests[0].user.find("## Gamma\ngamma notes") != std::string::npos);

  const auto links = rt.ctx->notes->ListPageLinks("v1");
  assert(links.size() == 3);

  bool saw_beta_gamma  = false;
  bool saw_gamma_alpha = false;
  for (const auto& link : links) {
    if (link.source_page_id == beta.id && link.target_page_id == gamma.id) {
      saw_beta_gamma = true;
      assert(link.source_block_id == "daemon-connection-finder");
      assert(link.context == "shared concept");
    }
    if (link.source_page_id == gamma.id && link.target_page_id == alpha.id) {
      saw_gamma_alpha = true;
      assert(link.context.size() == 200);
    }
  }
  assert(saw_beta_gamma);
  assert(saw_gamma_alpha);

  // a second pass finds nothing new
  assert(task.Run(*rt.ctx) == "Found 5 connections, 3 resolved, 0 new links created");
  assert(rt.ctx->notes->ListPageLinks("v1").size() == 3);
}

void TestConnectionFinderEdgeCases() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  AddPage(*rt.ctx, "v1", "Only", {"single page"});

  std::string reply = "not json at all";
  auto        model = std::make_shared<FakeModel>([&](const GenerateRequest&) { return reply; });
  UseModel(*rt.ctx, model);

  vaultd::tasks::ConnectionFinder task;
  assert(task.Run(*rt.ctx) == "Need at least 2 pages to find connections");
  assert(model->requests.empty());

  AddPage(*rt.ctx, "v1", "Second", {"another page"});
  assert(task.Run(*rt.ctx) == "Model response did not contain valid JSON");

  reply = "{\"connections\": []}";
  assert(task.Run(*rt.ctx) == "No new connections found");
}

void TestModelErrorsPropagateToScheduler() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  AddPage(*rt.ctx, "v1", "A", {"a"});
  AddPage(*rt.ctx, "v1", "B", {"b"});
  rt.ctx->resolve_model = []() -> std::shared_ptr<vaultd::llm::LanguageModel> {
    throw vaultd::util::ModelError("Ollama is not reachable and cloud fallback is disabled");
  };

  bool threw = false;
  try {
    (void)vaultd::tasks::ConnectionFinder().Run(*rt.ctx);
  } catch (const vaultd::util::ModelError&) {
    threw = true;
  }
  assert(threw);
}

// ------------------------------------------------------------------
// auto-organizer
// ------------------------------------------------------------------

void TestParseTagList() {
  using vaultd::tasks::ParseTagList;

  const auto tags = ParseTagList("Here you go: [\"Machine  Learning\", \"AI\", 5, \"   \", \"" + std::string(30, 'x') +
                                 "\", \" b \", \"c\", \"d\", \"e\"] hope that helps");
  assert((tags == std::vector<std::string>{"machine-learning", "ai", "b", "c", "d"}));

  assert(ParseTagList("no array here").empty());
  assert(ParseTagList("[\"unterminated").empty());
  assert(ParseTagList("[not, json]").empty());
}

void TestAutoOrganizerTagsUntaggedPages() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  const std::string long_text(80, 'w');
  auto              tagged = AddPage(*rt.ctx, "v1", "Already Tagged", {long_text});
  tagged.tags              = {"existing"};
  rt.ctx->notes->UpsertPage(tagged);
  AddPage(*rt.ctx, "v1", "Too Short", {"brief"});
  const auto topical = AddPage(*rt.ctx, "v1", "Topical", {long_text});
  const auto vague   = AddPage(*rt.ctx, "v1", "Vague", {long_text});

  auto model = std::make_shared<FakeModel>([](const GenerateRequest& request) {
    if (request.user.find("Title: Topical") != std::string::npos) return std::string("[\"Topic One\", \"second\"]");
    return std::string("I cannot decide");
  });
  UseModel(*rt.ctx, model);

  vaultd::tasks::AutoOrganizer task;
  assert(task.Run(*rt.ctx) == "Tagged 1/2 pages");
  assert(model->requests.size() == 2);
  assert(model->requests[0].max_tokens == 128);
  assert(model->requests[0].temperature == 0.3);

  const auto updated = rt.ctx->notes->GetPage(topical.id);
  assert((updated->tags == std::vector<std::string>{"topic-one", "second"}));
  assert(rt.ctx->notes->GetPage(vague.id)->tags.empty());
  assert(rt.ctx->notes->GetPage(tagged.id)->tags == std::vector<std::string>{"existing"});
}

void TestAutoOrganizerContinuesAfterModelError() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  const std::string long_text(80, 'w');
  AddPage(*rt.ctx, "v1", "Broken", {long_text});
  const auto fine = AddPage(*rt.ctx, "v1", "Fine", {long_text});

  auto model = std::make_shared<FakeModel>([](const GenerateRequest& request) -> std::string {
    if (request.user.find("Title: Broken") != std::string::npos) throw vaultd::util::ModelError("timeout");
    return "[\"ok\"]";
  });
  UseModel(*rt.ctx, model);

  assert(vaultd::tasks::AutoOrganizer().Run(*rt.ctx) == "Tagged 1/2 pages");
  assert(rt.ctx->notes->GetPage(fine.id)->tags == std::vector<std::string>{"ok"});
}

void TestAutoOrganizerNothingToDo() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  AddPage(*rt.ctx, "v1", "Short", {"tiny"});

  assert(vaultd::tasks::AutoOrganizer().Run(*rt.ctx) == "All pages are already tagged");
}

void TestAutoOrganizerBatchLimit() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  for (int i = 0; i < 12; ++i) {
    AddPage(*rt.ctx, "v1", "Page " + std::to_string(i), {std::string(60, 'z')});
  }

  auto model = std::make_shared<FakeModel>([](const GenerateRequest&) { return std::string("[\"bulk\"]"); });
  UseModel(*rt.ctx, model);

  assert(vaultd::tasks::AutoOrganizer().Run(*rt.ctx) == "Tagged 10/10 pages");
  assert(model->requests.size() == 10);
}

// ------------------------------------------------------------------
// research-assistant
// ------------------------------------------------------------------

void TestSuggestionBlocks() {
  using vaultd::tasks::SuggestionBlocks;

  const auto blocks = SuggestionBlocks(
      "{\"suggestions\": [{\"title\": \"Read about LRU\", \"rationale\": \"Your cache notes stop at FIFO.\"},"
      " {\"title\": \"Benchmark it\"}, {\"rationale\": \"no title\"}]}");
  assert(blocks.size() == 2);
  assert(blocks[0] == "**Read about LRU**\nYour cache notes stop at FIFO.");
  assert(blocks[1] == "**Benchmark it**");

  const auto fallback = SuggestionBlocks("- Investigate write-ahead logging in SQLite\n- ok\n");
  assert(fallback.size() == 1);
  assert(fallback[0] == "Investigate write-ahead logging in SQLite");

  assert(SuggestionBlocks("{\"suggestions\": []}").empty());
}

void TestResearchAssistantUsesRecentPages() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  for (int i = 0; i < 7; ++i) {
    AddPage(*rt.ctx, "v1", "Note " + std::to_string(i), {"content " + std::to_string(i)}, 1000 + i);
  }

  auto model = std::make_shared<FakeModel>([](const GenerateRequest&) {
    return std::string("{\"suggestions\": [{\"title\": \"One\", \"rationale\": \"r1\"}, {\"title\": \"Two\", \"rationale\": \"r2\"}]}");
  });
  UseModel(*rt.ctx, model);

  vaultd::tasks::ResearchAssistant task;
  assert(task.Run(*rt.ctx) == "Wrote 2 research suggestion(s)");

  const auto& user = model->requests[0].user;
  assert(model->requests[0].max_tokens == 1536);
  assert(model->requests[0].temperature == 0.6);
  assert(user.find("## Note 6") != std::string::npos);
  assert(user.find("## Note 2") != std::string::npos);
  assert(user.find("## Note 1") == std::string::npos);
  assert(user.find("## Note 0") == std::string::npos);

  const std::string title = "Research Suggestions " + vaultd::util::LocalDate(vaultd::util::Now());
  const auto        page  = FindPage(*rt.ctx, "v1", title);
  assert(page);
  assert(HasTag(*page, "auto-generated"));
  assert(HasTag(*page, "research-assistant"));
  assert(page->properties.at("source") == "daemon-research-assistant");
  assert(rt.ctx->notes->ListPageBlocks(page->id).size() == 2);

  // same-day rerun replaces the page and never reads generated pages back
  assert(task.Run(*rt.ctx) == "Wrote 2 research suggestion(s)");
  assert(rt.ctx->notes->ListPages("v1").size() == 8);
  assert(model->requests[1].user.find("Research Suggestions") == std::string::npos);
}

// ------------------------------------------------------------------
// daily-brief
// ------------------------------------------------------------------

void TestDailyBriefNeedsRecentActivity() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  AddPage(*rt.ctx, "v1", "Old", {"from long ago"}, 1000);

  assert(vaultd::tasks::DailyBrief().Run(*rt.ctx) == "No pages updated in the last 24 hours");
}

void TestDailyBriefWritesJournalPage() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");
  AddPage(*rt.ctx, "v1", "Old", {"from long ago"}, 1000);
  AddPage(*rt.ctx, "v1", "Fresh", {"edited this morning"}, NowMs());

  auto model = std::make_shared<FakeModel>([](const GenerateRequest&) {
    return std::string("The day was about caching.\n\nFresh got a new section.\n\n- follow up on eviction");
  });
  UseModel(*rt.ctx, model);

  vaultd::tasks::DailyBrief task;
  assert(task.Run(*rt.ctx) == "Daily brief written for 1 updated page(s)");
  assert(model->requests[0].max_tokens == 1024);
  assert(model->requests[0].temperature == 0.5);
  assert(model->requests[0].user.find("## Fresh") != std::string::npos);
  assert(model->requests[0].user.find("## Old") == std::string::npos);

  const std::string date  = vaultd::util::LocalDate(vaultd::util::Now());
  const auto        brief = FindPage(*rt.ctx, "v1", "Daily Brief " + date);
  assert(brief);
  assert(brief->is_journal);
  assert(brief->journal_date && *brief->journal_date == date);
  assert(HasTag(*brief, "daily-brief"));
  assert(rt.ctx->notes->ListPageBlocks(brief->id).size() == 3);

  // the brief itself is not summarised and a rerun replaces it
  assert(task.Run(*rt.ctx) == "Daily brief written for 1 updated page(s)");
  assert(model->requests[1].user.find("Daily Brief") == std::string::npos);
  assert(rt.ctx->notes->ListPages("v1").size() == 3);
}

// ------------------------------------------------------------------
// learning-runner
// ------------------------------------------------------------------

void TestLearningRunner() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  auto model = std::make_shared<FakeModel>([](const GenerateRequest& request) {
    if (request.system.find("shouldContinue") != std::string::npos) return std::string("{\"shouldContinue\": true}");
    return std::string("{\"insights\": [\"one\"]}");
  });
  UseModel(*rt.ctx, model);

  vaultd::tasks::LearningRunner task;
  assert(task.Run(*rt.ctx) == "No pages to learn from");
  assert(model->requests.empty());

  AddPage(*rt.ctx, "v1", "Topic", {"some notes"});
  rt.ctx->config->SetMany({{"task.learningRunner.depth", "deep"}, {"task.learningRunner.maxIterations", "0"}});

  // maxIterations below 1 still runs one pass
  assert(task.Run(*rt.ctx) == "Completed 1 iteration(s): 6 insights, 0 pages created");
  assert(model->requests.size() == 7);
  assert(model->requests[0].max_tokens == 4096);
  assert(model->requests[0].user.find("## Topic\nsome notes") != std::string::npos);

  rt.ctx->config->Set("task.learningRunner.maxIterations", "2");
  assert(task.Run(*rt.ctx) == "Completed 2 iteration(s): 12 insights, 0 pages created");

  // the model always asks to continue; the cap alone ends the run
  rt.ctx->config->Set("task.learningRunner.maxIterations", "nan");
  assert(task.Run(*rt.ctx) == "Completed 1 iteration(s): 6 insights, 0 pages created");

  const size_t before = model->requests.size();
  rt.ctx->config->Set("task.learningRunner.maxIterations", "1e10");
  assert(task.Run(*rt.ctx) == "Completed 100 iteration(s): 600 insights, 0 pages created");
  assert(model->requests.size() - before == 700);
}

} // namespace

int main() {
  TestRegistryOrder();
  TestEveryTaskNeedsAnActiveVault();
  TestCorpus();
  TestConnectionFinderCreatesResolvedLinks();
  TestConnectionFinderEdgeCases();
  TestModelErrorsPropagateToScheduler();
  TestParseTagList();
  TestAutoOrganizerTagsUntaggedPages();
  TestAutoOrganizerContinuesAfterModelError();
  TestAutoOrganizerNothingToDo();
  TestAutoOrganizerBatchLimit();
  TestSuggestionBlocks();
  TestResearchAssistantUsesRecentPages();
  TestDailyBriefNeedsRecentActivity();
  TestDailyBriefWritesJournalPage();
  TestLearningRunner();

  std::cout << "vaultd_unit_tasks: pass\n";
  return 0;
}
