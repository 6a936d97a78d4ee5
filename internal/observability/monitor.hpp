#pragma once

#include <exception>
#include <string_view>

namespace transfer::observability {

/*
  Event sink handed to long-running components.

  Severe is reserved for failures that lose work or stop a worker.
*/
class Monitor {
 public:
  virtual ~Monitor() = default;

  virtual void Info(std::string_view message) = 0;
  virtual void Warn(std::string_view message) = 0;
  virtual void Severe(std::string_view message, const std::exception& error) = 0;
};

// Forwards to the process-wide spdlog logger.
class LogMonitor final : public Monitor {
 public:
  void Info(std::string_view message) override;
  void Warn(std::string_view message) override;
  void Severe(std::string_view message, const std::exception& error) override;
};

} // namespace transfer::observability
