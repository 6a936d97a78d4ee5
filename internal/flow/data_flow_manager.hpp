#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "transfer/manager/core/v1/types.pb.h"

namespace transfer::flow {

/*
  Starts moving data for a provider-side request. Synchronous; throws on
  failure.
*/
class DataFlowManager {
 public:
  virtual ~DataFlowManager() = default;

  virtual void Initiate(const transfer::manager::core::v1::DataRequest& request) = 0;
};

// One way of moving data, chosen per request.
class DataFlowController {
 public:
  virtual ~DataFlowController() = default;

  virtual bool CanHandle(const transfer::manager::core::v1::DataRequest& request) const = 0;

  virtual void Initiate(const transfer::manager::core::v1::DataRequest& request) = 0;
};

// Hands the request to the first registered controller that accepts it.
class DataFlowManagerImpl final : public DataFlowManager {
 public:
  void Register(std::shared_ptr<DataFlowController> controller);

  void Initiate(const transfer::manager::core::v1::DataRequest& request) override;

 private:
  std::mutex                                       mutex_;
  std::vector<std::shared_ptr<DataFlowController>> controllers_;
};

} // namespace transfer::flow
