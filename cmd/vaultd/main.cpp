#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "vaultd/daemon/v1.hpp"

using vaultd::observability::IntField;
using vaultd::observability::StringField;
using vaultd::runtime::Server;

static volatile std::sig_atomic_t g_signalled = 0;
static std::atomic<bool>          g_shutdown_requested{false};

void HandleSignal(int) {
  g_signalled = 1;
}

void HandleTerminate() {
  if (auto ex = std::current_exception()) {
    try {
      std::rethrow_exception(ex);
    } catch (const std::exception& e) {
      VAULTD_LOG_ERROR("uncaught exception", {StringField("error", e.what())});
    } catch (...) {
      VAULTD_LOG_ERROR("uncaught non-standard exception");
    }
  } else {
    VAULTD_LOG_ERROR("terminate called without an active exception");
  }
  vaultd::observability::ShutdownLogging();
  std::abort();
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  vaultd [--config <config.yaml>]   run the daemon\n"
            << "  vaultd --status [--config <config.yaml>]\n"
            << "  vaultd --stop [--config <config.yaml>]\n"
            << "The control address can be overridden with VAULTD_ADDRESS.\n";
}

static std::string ControlAddress(const vaultd::runtime::config::RuntimeConfig& config) {
  if (const char* address = std::getenv("VAULTD_ADDRESS")) {
    if (*address != '\0') return address;
  }
  return config.server().bind_address();
}

// ------------------------------------------------------------
// Client mode
// ------------------------------------------------------------

static int RunClient(const std::string& address, bool stop) {
  using namespace vaultd::daemon::v1;

  auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  auto stub    = DaemonControlService::NewStub(channel);

  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(3));

  if (stop) {
    StopResponse resp;
    auto         status = stub->Stop(&context, StopRequest{}, &resp);
    if (!status.ok()) {
      std::cerr << "daemon not reachable at " << address << ": " << status.error_message() << "\n";
      return 1;
    }
    std::cout << resp.message() << "\n";
    return 0;
  }

  GetStatusResponse resp;
  auto              status = stub->GetStatus(&context, GetStatusRequest{}, &resp);
  if (!status.ok()) {
    std::cerr << "daemon not reachable at " << address << ": " << status.error_message() << "\n";
    return 1;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        print_status = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!print_status.ok()) {
    std::cerr << "failed to render status: " << print_status.message() << "\n";
    return 1;
  }
  std::cout << json;
  return 0;
}

// ------------------------------------------------------------
// Daemon mode
// ------------------------------------------------------------

static int RunDaemon(const vaultd::runtime::config::RuntimeConfig& config) {
  std::set_terminate(HandleTerminate);

  auto app = vaultd::factory::Build(config, [] { g_shutdown_requested = true; });

  Server server(ControlAddress(config), std::move(app.grpc_services));

  // Register signal handlers before starting server to avoid race window.
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  server.Start();
  app.scheduler->Start();
  VAULTD_LOG_INFO("vaultd started", {StringField("bind_address", ControlAddress(config))});

  while (!g_signalled && !g_shutdown_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  VAULTD_LOG_INFO("Shutting down vaultd");

  app.scheduler->Stop();
  const auto grace    = std::chrono::milliseconds(config.scheduler().shutdown_grace_ms());
  const bool finished = app.scheduler->Join(grace);

  server.Stop();

  if (!finished) {
    // The worker still references app; skip destructors.
    VAULTD_LOG_WARN("task still running after grace period, exiting", {IntField("grace_ms", grace.count())});
    vaultd::observability::ShutdownLogging();
    std::quick_exit(0);
  }

  vaultd::observability::ShutdownLogging();
  return 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  bool        status_mode = false;
  bool        stop_mode   = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--status") {
      status_mode = true;
    } else if (arg == "--stop") {
      stop_mode = true;
    } else {
      Usage();
      return 1;
    }
  }

  if (status_mode && stop_mode) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? vaultd::config::ConfigLoader::Defaults() : vaultd::config::ConfigLoader::LoadFromYaml(config_path);

    if (status_mode || stop_mode) {
      return RunClient(ControlAddress(config), stop_mode);
    }

    vaultd::observability::InitializeLogging(config);
    return RunDaemon(config);
  } catch (const std::exception& e) {
    VAULTD_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    vaultd::observability::ShutdownLogging();
    return 2;
  }
}
