#pragma once

#include <functional>
#include <memory>

namespace vaultd::runtime { struct Context; }
namespace vaultd::scheduler { class Scheduler; }

namespace vaultd::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<vaultd::runtime::Context>     runtime;
  std::shared_ptr<vaultd::scheduler::Scheduler> scheduler;

  // Begins process shutdown. Called from a detached timer thread.
  std::function<void()> request_shutdown;
};

} // namespace vaultd::service
