#pragma once

#include <string>

namespace freya::core {

/// Logger interface used by the engine, the job runner and the controller.
/// The spdlog-backed implementation lives in infra; tests pass nullptr or a
/// recording fake.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace freya::core
