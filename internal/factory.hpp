#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace treasury::core {
class LedgerManager;
}
namespace treasury::db {
class Repository;
}

namespace treasury::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<core::LedgerManager>        manager;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows concrete repository types.
*/
Application Build(const treasury::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const treasury::runtime::config::RuntimeConfig& config);

} // namespace treasury::factory
