#pragma once

#include <memory>

namespace transfer::core {
class TransferProcessManager;
}
namespace transfer::store {
class TransferProcessStore;
}

namespace transfer::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<transfer::core::TransferProcessManager> manager;
  std::shared_ptr<transfer::store::TransferProcessStore>  store;
};

} // namespace transfer::service
