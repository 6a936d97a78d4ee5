#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace transfer::db {
class Repository;
}
namespace transfer::store {
class TransferProcessStore;
}
namespace transfer::core {
class TransferProcessManager;
}

namespace transfer::factory {

/*
  Application

  Owns all long-lived objects used by the daemon. The manager is built but
  not started; the caller starts it once the server is up.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<store::TransferProcessStore>  store;
  std::shared_ptr<core::TransferProcessManager> manager;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  This is the composition root of the application and the only place that
  knows concrete DB, provisioner, dispatcher and data flow types.
*/
Application Build(const transfer::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const transfer::runtime::config::RuntimeConfig& config);

} // namespace transfer::factory
