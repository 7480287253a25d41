#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/notes_store.hpp"
#include "internal/exec/command_runner.hpp"
#include "internal/exec/process_launcher.hpp"
#include "internal/fs/markdown_sync.hpp"
#include "internal/fs/sandboxed_fs.hpp"
#include "internal/llm/language_model.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/runtime/context.hpp"
#include "internal/security/permission_gate.hpp"
#include "internal/util/uuid.hpp"

namespace vaultd::testing {

/*
  Runtime wired over the in-memory repository, as the factory does over
  sqlite.
*/
struct TestRuntime {
  std::shared_ptr<db::memory::MemoryRepository> repository;
  std::shared_ptr<runtime::Context>             ctx;
};

inline TestRuntime MakeRuntime(std::shared_ptr<exec::ProcessLauncher> launcher = nullptr) {
  TestRuntime rt;
  rt.repository = std::make_shared<db::memory::MemoryRepository>();

  auto config = std::make_shared<config::ConfigStore>(rt.repository);
  auto log    = std::make_shared<observability::EventLog>(rt.repository);
  auto notes  = std::make_shared<db::NotesStore>(rt.repository);
  auto gate   = std::make_shared<security::PermissionGate>(config, log);
  auto files  = std::make_shared<fs::SandboxedFs>(gate, log);

  if (!launcher) launcher = std::make_shared<exec::PosixProcessLauncher>();

  rt.ctx         = std::make_shared<runtime::Context>();
  rt.ctx->config = config;
  rt.ctx->log    = log;
  rt.ctx->notes  = notes;
  rt.ctx->gate   = gate;
  rt.ctx->fs     = files;
  rt.ctx->sync   = std::make_shared<fs::MarkdownSync>(files, notes, log);
  rt.ctx->shell  = std::make_shared<exec::CommandRunner>(gate, launcher, log);
  return rt;
}

// Fresh empty directory under the system temp dir.
inline std::filesystem::path MakeTempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "vaultd_tests" / (name + "-" + util::NewId());
  std::filesystem::create_directories(dir);
  return dir;
}

/*
  Scripted language model: every call is recorded and answered by reply.
*/
class FakeModel final : public llm::LanguageModel {
 public:
  using Reply = std::function<std::string(const llm::GenerateRequest&)>;

  explicit FakeModel(Reply reply) : reply_(std::move(reply)) {
  }

  std::string Generate(const llm::GenerateRequest& request) override {
    requests.push_back(request);
    return reply_(request);
  }

  std::string Describe() const override {
    return "fake/model";
  }

  std::vector<llm::GenerateRequest> requests;

 private:
  Reply reply_;
};

inline void UseModel(runtime::Context& ctx, std::shared_ptr<llm::LanguageModel> model) {
  ctx.resolve_model = [model] { return model; };
}

inline db::model::VaultRecord AddVault(runtime::Context& ctx, const std::string& id) {
  db::model::VaultRecord vault;
  vault.id   = id;
  vault.name = id;
  ctx.notes->UpsertVault(vault);
  ctx.config->Set("vault.activeId", id);
  return vault;
}

inline db::model::PageRecord AddPage(runtime::Context& ctx, const std::string& vault_id, const std::string& title,
                                     const std::vector<std::string>& blocks, int64_t updated_at_ms = 1000) {
  db::model::PageRecord page;
  page.id            = util::NewId();
  page.vault_id      = vault_id;
  page.title         = title;
  page.name          = fs::PageName(title);
  page.created_at_ms = updated_at_ms;
  page.updated_at_ms = updated_at_ms;

  std::vector<db::model::BlockRecord> records;
  for (size_t i = 0; i < blocks.size(); ++i) {
    db::model::BlockRecord block;
    block.id      = util::NewId();
    block.page_id = page.id;
    block.content = blocks[i];
    block.order   = fs::OrderKey(i);
    records.push_back(block);
  }
  ctx.notes->SavePage(page, records);
  return page;
}

} // namespace vaultd::testing
