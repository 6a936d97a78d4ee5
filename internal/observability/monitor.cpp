#include "internal/observability/monitor.hpp"

#include "internal/observability/logging.hpp"

namespace transfer::observability {

void LogMonitor::Info(std::string_view message) {
  TRANSFER_LOG_INFO(message);
}

void LogMonitor::Warn(std::string_view message) {
  TRANSFER_LOG_WARN(message);
}

void LogMonitor::Severe(std::string_view message, const std::exception& error) {
  TRANSFER_LOG_CRITICAL(message, {StringField("error", error.what())});
}

} // namespace transfer::observability
