#include "data_flow_manager.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace transfer::flow {

void DataFlowManagerImpl::Register(std::shared_ptr<DataFlowController> controller) {
  if (!controller) {
    throw std::invalid_argument("data flow controller is null");
  }
  std::lock_guard lock(mutex_);
  controllers_.push_back(std::move(controller));
}

void DataFlowManagerImpl::Initiate(const transfer::manager::core::v1::DataRequest& request) {
  std::shared_ptr<DataFlowController> chosen;
  {
    std::lock_guard lock(mutex_);
    for (const auto& controller : controllers_) {
      if (controller->CanHandle(request)) {
        chosen = controller;
        break;
      }
    }
  }

  if (!chosen) {
    throw util::InvalidState("no data flow controller for request " + request.id() + " (destination type '" +
                             request.data_destination().type() + "')");
  }
  chosen->Initiate(request);
}

} // namespace transfer::flow
