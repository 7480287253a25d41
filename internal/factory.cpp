#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/config/config_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/notes_store.hpp"
#include "internal/db/sqlite/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/exec/command_runner.hpp"
#include "internal/exec/process_launcher.hpp"
#include "internal/fs/markdown_sync.hpp"
#include "internal/fs/sandboxed_fs.hpp"
#include "internal/grpc/control_server.hpp"
#include "internal/llm/model_resolver.hpp"
#include "internal/net/http_client.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/observability/logging.hpp"
#include "internal/security/permission_gate.hpp"
#include "internal/service/control_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/tasks/registry.hpp"

namespace vaultd::factory {

using namespace vaultd;

std::shared_ptr<db::Repository> BuildRepository(const vaultd::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && !database.sqlite().path().empty()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    VAULTD_LOG_INFO("database opened", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  VAULTD_LOG_WARN("no database path configured, state will not persist");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const vaultd::runtime::config::RuntimeConfig& config, std::function<void()> request_shutdown) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto config_store = std::make_shared<config::ConfigStore>(app.repository);
  auto event_log    = std::make_shared<observability::EventLog>(app.repository);
  auto notes        = std::make_shared<db::NotesStore>(app.repository);

  // ------------------------------------------------------------------
  // Gated effects
  // ------------------------------------------------------------------
  auto gate  = std::make_shared<security::PermissionGate>(config_store, event_log);
  auto files = std::make_shared<fs::SandboxedFs>(gate, event_log);
  auto sync  = std::make_shared<fs::MarkdownSync>(files, notes, event_log);
  auto shell = std::make_shared<exec::CommandRunner>(gate, std::make_shared<exec::PosixProcessLauncher>(), event_log);

  // ------------------------------------------------------------------
  // Language model
  // ------------------------------------------------------------------
  auto resolver = std::make_shared<llm::ModelResolver>(config_store, std::make_shared<net::CurlHttpClient>(), event_log);

  // ------------------------------------------------------------------
  // Context + scheduler
  // ------------------------------------------------------------------
  app.context                = std::make_shared<runtime::Context>();
  app.context->config        = config_store;
  app.context->log           = event_log;
  app.context->notes         = notes;
  app.context->gate          = gate;
  app.context->fs            = files;
  app.context->sync          = sync;
  app.context->shell         = shell;
  app.context->resolve_model = [resolver] { return resolver->Resolve(); };

  scheduler::SchedulerOptions options;
  options.tick_interval = std::chrono::milliseconds(config.scheduler().tick_interval_ms());

  app.scheduler = std::make_shared<scheduler::Scheduler>(*app.context, app.repository, options);
  for (auto& task : tasks::BuiltinTasks()) {
    app.scheduler->Register(std::move(task));
  }

  // ------------------------------------------------------------------
  // Control surface
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.runtime          = app.context;
  ctx.scheduler        = app.scheduler;
  ctx.request_shutdown = std::move(request_shutdown);

  auto control_service = std::make_shared<service::ControlService>(std::move(ctx));
  app.grpc_services.push_back(std::make_unique<grpc::ControlServer>(control_service));

  return app;
}

} // namespace vaultd::factory
