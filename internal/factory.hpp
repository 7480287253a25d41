#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/runtime/context.hpp"
#include "internal/scheduler/scheduler.hpp"

namespace vaultd::factory {

/*
  Application

  Owns every long-lived component of the daemon. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<runtime::Context>      context;
  std::shared_ptr<scheduler::Scheduler>  scheduler;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows concrete repository,
  launcher, HTTP and model types. Tasks are registered but the scheduler
  is not started.
*/
Application Build(const vaultd::runtime::config::RuntimeConfig& config, std::function<void()> request_shutdown);

// sqlite when database.sqlite.path is set, in-memory otherwise.
std::shared_ptr<db::Repository> BuildRepository(const vaultd::runtime::config::RuntimeConfig& config);

} // namespace vaultd::factory
