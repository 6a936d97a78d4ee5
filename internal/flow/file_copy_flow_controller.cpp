#include "file_copy_flow_controller.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace transfer::flow {

using transfer::manager::core::v1::DataAddress;
using transfer::manager::core::v1::DataRequest;

namespace {

constexpr const char* kFileType = "file";

const std::string* PathOf(const DataAddress& address) {
  if (address.type() != kFileType) return nullptr;
  auto it = address.properties().find("path");
  if (it == address.properties().end() || it->second.empty()) return nullptr;
  return &it->second;
}

std::filesystem::path NormalRoot(const std::filesystem::path& root, const char* name) {
  if (root.empty()) {
    throw util::ConfigurationError(std::string("file copy flow: ") + name + " is required");
  }
  auto normal = std::filesystem::absolute(root).lexically_normal();
  if (!normal.has_filename() && normal.has_relative_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

bool Within(const std::filesystem::path& root, const std::filesystem::path& path) {
  const auto rel = path.lexically_relative(root);
  return !rel.empty() && rel != "." && *rel.begin() != "..";
}

// Resolves `requested` under `root` and refuses anything that lands outside it.
std::filesystem::path Confine(const std::filesystem::path& root, const std::string& requested, const char* role) {
  std::filesystem::path candidate(requested);
  if (candidate.is_relative()) {
    candidate = root / candidate;
  }
  candidate = candidate.lexically_normal();

  if (!Within(root, candidate)) {
    throw util::InvalidState(std::string(role) + " path " + requested + " is outside " + root.string());
  }
  // symlinks inside the root may still point elsewhere
  if (!Within(std::filesystem::weakly_canonical(root), std::filesystem::weakly_canonical(candidate))) {
    throw util::InvalidState(std::string(role) + " path " + requested + " resolves outside " + root.string());
  }
  return candidate;
}

} // namespace

FileCopyFlowController::FileCopyFlowController(std::filesystem::path source_root, std::filesystem::path destination_root)
    : source_root_(NormalRoot(source_root, "source_root")),
      destination_root_(NormalRoot(destination_root, "destination_root")) {}

bool FileCopyFlowController::CanHandle(const DataRequest& request) const {
  return PathOf(request.data_entry().catalog_address()) != nullptr && PathOf(request.data_destination()) != nullptr;
}

void FileCopyFlowController::Initiate(const DataRequest& request) {
  const auto* source      = PathOf(request.data_entry().catalog_address());
  const auto* destination = PathOf(request.data_destination());
  if (!source || !destination) {
    throw std::invalid_argument("file copy needs file source and destination paths");
  }

  const auto from = Confine(source_root_, *source, "source");
  const auto to   = Confine(destination_root_, *destination, "destination");

  if (!std::filesystem::is_regular_file(from)) {
    throw std::runtime_error("source file not found: " + from.string());
  }
  std::filesystem::create_directories(to.parent_path());
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);

  TRANSFER_LOG_INFO("Copied file", {observability::StringField("process_id", request.process_id()),
                                    observability::StringField("from", from.string()),
                                    observability::StringField("to", to.string())});
}

} // namespace transfer::flow
