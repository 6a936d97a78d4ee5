#pragma once

#include <filesystem>

#include "data_flow_manager.hpp"

namespace transfer::flow {

/*
  Copies a local file to a local destination.

  Source: data_entry.catalog_address {type: file, path}, inside source_root.
  Destination: data_destination {type: file, path}, inside destination_root.
  Relative paths resolve against their root. A path that leaves its root,
  lexically or through a symlink, is refused with util::InvalidState. Parent
  directories are created and an existing destination is overwritten.
*/
class FileCopyFlowController final : public DataFlowController {
 public:
  // Throws util::ConfigurationError when either root is empty.
  FileCopyFlowController(std::filesystem::path source_root, std::filesystem::path destination_root);

  bool CanHandle(const transfer::manager::core::v1::DataRequest& request) const override;

  void Initiate(const transfer::manager::core::v1::DataRequest& request) override;

 private:
  std::filesystem::path source_root_;
  std::filesystem::path destination_root_;
};

} // namespace transfer::flow
